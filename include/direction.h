/**
 * @file direction.h
 * @brief The six axis-aligned face directions with precomputed axis metadata
 *
 * Direction order is +X, +Y, +Z, -X, -Y, -Z, so `index % 3` is the axis and
 * `index >= 3` marks a negative face. Each descriptor carries the two tangent
 * axes the greedy mesher extends along, in the order they are tried.
 */

#pragma once

#include <array>
#include <cstdint>
#include <glm/glm.hpp>

enum class Direction : uint8_t {
    POS_X = 0,
    POS_Y = 1,
    POS_Z = 2,
    NEG_X = 3,
    NEG_Y = 4,
    NEG_Z = 5
};

constexpr int DIRECTION_COUNT = 6;

/**
 * @brief Static description of one face direction
 */
struct FaceDescriptor {
    Direction direction;
    int axis;            ///< 0 = X, 1 = Y, 2 = Z
    int sign;            ///< +1 or -1
    int tangentA;        ///< First tangent axis tried during greedy extension
    int tangentB;        ///< Second tangent axis
    glm::ivec3 normal;   ///< Outward unit normal
    Direction inverse;   ///< Opposite face
    uint8_t bit;         ///< Bit in a FaceVisitMask cell entry

    bool isPositive() const { return sign > 0; }
};

/// Descriptors indexed by static_cast<int>(Direction)
extern const std::array<FaceDescriptor, DIRECTION_COUNT> FACE_DESCRIPTORS;

inline const FaceDescriptor& faceDescriptor(Direction direction) {
    return FACE_DESCRIPTORS[static_cast<size_t>(direction)];
}

inline int directionIndex(Direction direction) {
    return static_cast<int>(direction);
}

inline Direction directionFromIndex(int index) {
    return static_cast<Direction>(index);
}

const char* directionToString(Direction direction);
