/**
 * @file voxel_types.h
 * @brief Block ids and chunk geometry shared by storage, meshing and scheduling
 */

#pragma once

#include <cstdint>
#include <glm/glm.hpp>

/// Material identifier stored in every voxel cell
using BlockId = uint16_t;

// Reserved block ids
namespace BlockID {
    constexpr BlockId AIR = 0;            ///< Empty space, never meshed
    constexpr BlockId NULL_ID = 0xFFFF;   ///< Unknown/unloaded neighbor (distinct from air)
}

inline bool isAir(BlockId id) { return id == BlockID::AIR; }

// Chunk geometry used by the mesher and the pipeline
namespace ChunkGeometry {
    constexpr int SIZE = 32;                      ///< Cells per chunk edge (power of two)
    constexpr int SIZE_BIT_SHIFT = 5;             ///< log2(SIZE)
    constexpr int SIZE_BIT_MASK = SIZE - 1;
    constexpr int SIZE_SQUARED = SIZE * SIZE;
    constexpr int SIZE_CUBED = SIZE * SIZE * SIZE;

    static_assert((1 << SIZE_BIT_SHIFT) == SIZE, "SIZE_BIT_SHIFT must match SIZE");
}

/**
 * @brief Flattens a local cell coordinate (x fastest, then z, then y)
 *
 * @param size Edge length of the cube being indexed
 */
inline int flattenIndex(int x, int y, int z, int size) {
    return x + (z * size) + (y * size * size);
}

inline int flattenIndex(const glm::ivec3& p, int size) {
    return flattenIndex(p.x, p.y, p.z, size);
}

/**
 * @brief Inverse of flattenIndex()
 */
inline glm::ivec3 unflattenIndex(int index, int size) {
    int x = index % size;
    int z = (index / size) % size;
    int y = index / (size * size);
    return glm::ivec3(x, y, z);
}

/**
 * @brief True when p lies in [0, size) on every axis
 */
inline bool containsPoint(const glm::ivec3& p, int size) {
    return p.x >= 0 && p.x < size && p.y >= 0 && p.y < size && p.z >= 0 && p.z < size;
}
