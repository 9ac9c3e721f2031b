/**
 * @file run_length.cpp
 * @brief Run-length encoding of voxel volumes
 */

#include "run_length.h"
#include "voxel_volume.h"
#include "logger.h"

#include <algorithm>
#include <limits>

namespace {
constexpr uint32_t MAX_RUN = std::numeric_limits<uint16_t>::max();
}

std::vector<BlockRun> encodeRuns(const VoxelVolume& volume) {
    std::vector<BlockRun> runs;

    if (volume.isUniform()) {
        uint32_t remaining = static_cast<uint32_t>(volume.cellCount());
        while (remaining > 0) {
            uint32_t length = std::min(remaining, MAX_RUN);
            runs.push_back({static_cast<uint16_t>(length), volume.value()});
            remaining -= length;
        }
        return runs;
    }

    std::vector<BlockId> cells;
    volume.decompress(cells);

    BlockId current = cells[0];
    uint32_t length = 0;
    for (BlockId id : cells) {
        if (id == current && length < MAX_RUN) {
            ++length;
            continue;
        }
        runs.push_back({static_cast<uint16_t>(length), current});
        current = id;
        length = 1;
    }
    runs.push_back({static_cast<uint16_t>(length), current});

    return runs;
}

bool decodeRuns(const std::vector<BlockRun>& runs, VoxelVolume& volume) {
    volume.reset(BlockID::AIR);

    const int size = volume.size();
    const uint64_t total = static_cast<uint64_t>(volume.cellCount());

    uint64_t sum = 0;
    for (const BlockRun& run : runs) {
        if (run.runLength == 0) {
            Logger::warning("RunLength") << "Rejecting run list with a zero-length run";
            return false;
        }
        sum += run.runLength;
    }
    if (sum != total) {
        Logger::warning("RunLength") << "Run lengths sum to " << sum << ", expected " << total;
        return false;
    }

    // Common case: a single value fills the chunk
    if (runs.size() == 1 || (runs.front().runLength == total)) {
        volume.reset(runs.front().value);
        return true;
    }

    int index = 0;
    for (const BlockRun& run : runs) {
        if (run.value == BlockID::AIR) {
            index += run.runLength;
            continue;
        }
        for (int i = 0; i < run.runLength; ++i, ++index) {
            volume.set(unflattenIndex(index, size), run.value);
        }
    }

    return true;
}

std::vector<uint8_t> serializeRuns(const std::vector<BlockRun>& runs) {
    std::vector<uint8_t> bytes;
    bytes.reserve(runs.size() * 4);
    for (const BlockRun& run : runs) {
        bytes.push_back(static_cast<uint8_t>(run.runLength & 0xFF));
        bytes.push_back(static_cast<uint8_t>(run.runLength >> 8));
        bytes.push_back(static_cast<uint8_t>(run.value & 0xFF));
        bytes.push_back(static_cast<uint8_t>(run.value >> 8));
    }
    return bytes;
}

bool deserializeRuns(const std::vector<uint8_t>& bytes, std::vector<BlockRun>& runs) {
    runs.clear();
    if (bytes.size() % 4 != 0) {
        return false;
    }

    runs.reserve(bytes.size() / 4);
    for (size_t i = 0; i < bytes.size(); i += 4) {
        BlockRun run;
        run.runLength = static_cast<uint16_t>(bytes[i] | (bytes[i + 1] << 8));
        run.value = static_cast<BlockId>(bytes[i + 2] | (bytes[i + 3] << 8));
        runs.push_back(run);
    }
    return true;
}
