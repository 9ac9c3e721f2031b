/**
 * @file face_visit_mask.h
 * @brief Per-cell, per-direction "already covered" bits for one mesh pass
 *
 * One byte per cell; bit i corresponds to Direction i (see FaceDescriptor::bit).
 * The mask is pooled with the mesher's scratch buffers and cleared at the
 * start of every pass rather than reallocated.
 */

#pragma once

#include <cstdint>
#include <vector>
#include "direction.h"

class FaceVisitMask {
public:
    explicit FaceVisitMask(int cellCount = 0) : m_bits(static_cast<size_t>(cellCount), 0) {}

    /**
     * @brief Clears every bit, resizing to cellCount if needed
     */
    void reset(int cellCount);

    bool isVisited(int index, Direction direction) const {
        return (m_bits[static_cast<size_t>(index)] & faceDescriptor(direction).bit) != 0;
    }

    void markVisited(int index, Direction direction) {
        m_bits[static_cast<size_t>(index)] |= faceDescriptor(direction).bit;
    }

    /// Raw 6-bit entry for a cell
    uint8_t entry(int index) const { return m_bits[static_cast<size_t>(index)]; }

    int cellCount() const { return static_cast<int>(m_bits.size()); }

    /// True if no bit is set (used to verify pooled masks were cleared)
    bool isClear() const;

private:
    std::vector<uint8_t> m_bits;
};
