/**
 * @file direction.cpp
 * @brief Face descriptor table
 */

#include "direction.h"

const std::array<FaceDescriptor, DIRECTION_COUNT> FACE_DESCRIPTORS = {{
    // direction       axis sign tA tB  normal                    inverse          bit
    { Direction::POS_X, 0,  1,  1, 2, glm::ivec3( 1,  0,  0), Direction::NEG_X, 1u << 0 },
    { Direction::POS_Y, 1,  1,  2, 0, glm::ivec3( 0,  1,  0), Direction::NEG_Y, 1u << 1 },
    { Direction::POS_Z, 2,  1,  0, 1, glm::ivec3( 0,  0,  1), Direction::NEG_Z, 1u << 2 },
    { Direction::NEG_X, 0, -1,  1, 2, glm::ivec3(-1,  0,  0), Direction::POS_X, 1u << 3 },
    { Direction::NEG_Y, 1, -1,  2, 0, glm::ivec3( 0, -1,  0), Direction::POS_Y, 1u << 4 },
    { Direction::NEG_Z, 2, -1,  0, 1, glm::ivec3( 0,  0, -1), Direction::POS_Z, 1u << 5 },
}};

const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::POS_X: return "+X";
        case Direction::POS_Y: return "+Y";
        case Direction::POS_Z: return "+Z";
        case Direction::NEG_X: return "-X";
        case Direction::NEG_Y: return "-Y";
        case Direction::NEG_Z: return "-Z";
        default:               return "?";
    }
}
