#include "face_visit_mask.h"

#include <algorithm>

void FaceVisitMask::reset(int cellCount) {
    if (m_bits.size() != static_cast<size_t>(cellCount)) {
        m_bits.assign(static_cast<size_t>(cellCount), 0);
        return;
    }
    std::fill(m_bits.begin(), m_bits.end(), static_cast<uint8_t>(0));
}

bool FaceVisitMask::isClear() const {
    return std::all_of(m_bits.begin(), m_bits.end(), [](uint8_t bits) { return bits == 0; });
}
