/**
 * @file run_length.h
 * @brief Minimal persisted layout for a chunk: (run_length, value) pairs
 *
 * Runs are listed in flattened-index order (see flattenIndex()) and their
 * lengths sum to the volume's cell count. A run never exceeds 65535 cells;
 * longer stretches are split into consecutive runs with the same value.
 * Byte form is 4 bytes per run, both fields little-endian u16.
 */

#pragma once

#include <cstdint>
#include <vector>
#include "voxel_types.h"

class VoxelVolume;

struct BlockRun {
    uint16_t runLength;
    BlockId value;

    bool operator==(const BlockRun& other) const {
        return runLength == other.runLength && value == other.value;
    }
};

/**
 * @brief Encodes a volume into runs
 */
std::vector<BlockRun> encodeRuns(const VoxelVolume& volume);

/**
 * @brief Rebuilds a volume from runs
 *
 * The volume is reset first. Runs with zero length are rejected.
 *
 * @return False if the run lengths do not sum to volume.cellCount(); the
 *         volume is left uniform air in that case
 */
bool decodeRuns(const std::vector<BlockRun>& runs, VoxelVolume& volume);

std::vector<uint8_t> serializeRuns(const std::vector<BlockRun>& runs);

/**
 * @brief Parses the byte form
 * @return False if the byte count is not a multiple of 4
 */
bool deserializeRuns(const std::vector<uint8_t>& bytes, std::vector<BlockRun>& runs);
