/**
 * @file mesh_data.h
 * @brief Packed vertex/UV words and the per-chunk mesh buffers
 *
 * Vertex layout (one uint32_t per vertex):
 *   bits 0-5   local X (0-32, the far chunk face is 32)
 *   bits 6-11  local Y
 *   bits 12-17 local Z
 *   bits 18-20 direction index (see Direction)
 *
 * UV layout (one uint32_t per vertex):
 *   bits 0-5   U in tiles (0-32)
 *   bits 6-11  V in tiles
 *   bits 12-27 texture layer
 *   0xFFFFFFFF = no UV rule for this face; the consumer picks a fallback
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>
#include "direction.h"

struct PackedVertex {
    static constexpr uint32_t POSITION_BITS = 6;
    static constexpr uint32_t POSITION_MASK = (1u << POSITION_BITS) - 1;
    static constexpr uint32_t DIRECTION_SHIFT = 18;
    static constexpr uint32_t DIRECTION_MASK = 0x7;

    static inline uint32_t pack(const glm::ivec3& localPosition, Direction direction) {
        return (static_cast<uint32_t>(localPosition.x) & POSITION_MASK)
             | ((static_cast<uint32_t>(localPosition.y) & POSITION_MASK) << POSITION_BITS)
             | ((static_cast<uint32_t>(localPosition.z) & POSITION_MASK) << (POSITION_BITS * 2))
             | ((static_cast<uint32_t>(directionIndex(direction)) & DIRECTION_MASK) << DIRECTION_SHIFT);
    }

    static inline glm::ivec3 position(uint32_t word) {
        return glm::ivec3(static_cast<int>(word & POSITION_MASK),
                          static_cast<int>((word >> POSITION_BITS) & POSITION_MASK),
                          static_cast<int>((word >> (POSITION_BITS * 2)) & POSITION_MASK));
    }

    static inline Direction direction(uint32_t word) {
        return directionFromIndex(static_cast<int>((word >> DIRECTION_SHIFT) & DIRECTION_MASK));
    }
};

struct PackedUV {
    static constexpr uint32_t COORD_BITS = 6;
    static constexpr uint32_t COORD_MASK = (1u << COORD_BITS) - 1;
    static constexpr uint32_t LAYER_SHIFT = 12;
    static constexpr uint32_t LAYER_MASK = 0xFFFF;
    static constexpr uint32_t NONE = 0xFFFFFFFFu;

    static inline uint32_t pack(const glm::ivec2& uv, uint16_t layer) {
        return (static_cast<uint32_t>(uv.x) & COORD_MASK)
             | ((static_cast<uint32_t>(uv.y) & COORD_MASK) << COORD_BITS)
             | ((static_cast<uint32_t>(layer) & LAYER_MASK) << LAYER_SHIFT);
    }

    static inline glm::ivec2 uv(uint32_t word) {
        return glm::ivec2(static_cast<int>(word & COORD_MASK),
                          static_cast<int>((word >> COORD_BITS) & COORD_MASK));
    }

    static inline uint16_t layer(uint32_t word) {
        return static_cast<uint16_t>((word >> LAYER_SHIFT) & LAYER_MASK);
    }
};

/**
 * @brief Geometry produced by one mesh pass
 *
 * vertices and uvs are parallel arrays (4 entries per quad). Opaque and
 * transparent quads share the vertex arrays but have separate index lists so
 * the consumer can draw them in separate passes.
 */
struct MeshData {
    std::vector<uint32_t> vertices;
    std::vector<uint32_t> uvs;
    std::vector<uint32_t> opaqueIndices;
    std::vector<uint32_t> transparentIndices;

    /// Empties all arrays, keeping capacity for reuse
    void clear();

    bool empty() const { return vertices.empty(); }

    size_t quadCount() const { return vertices.size() / 4; }
    size_t triangleCount() const { return (opaqueIndices.size() + transparentIndices.size()) / 3; }

    /// Number of quads facing a given direction
    size_t quadCount(Direction direction) const;
};
