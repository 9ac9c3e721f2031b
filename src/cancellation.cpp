/**
 * @file cancellation.cpp
 * @brief Cancellation source and token linking
 */

#include "cancellation.h"

CancellationToken CancellationToken::linkedWith(const CancellationToken& other) const {
    CancellationToken linked;
    linked.m_flags.reserve(m_flags.size() + other.m_flags.size());
    linked.m_flags.insert(linked.m_flags.end(), m_flags.begin(), m_flags.end());
    for (const auto& flag : other.m_flags) {
        bool duplicate = false;
        for (const auto& existing : m_flags) {
            if (existing == flag) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            linked.m_flags.push_back(flag);
        }
    }
    return linked;
}

CancellationSource::CancellationSource()
    : m_flag(std::make_shared<std::atomic<bool>>(false))
{
}

void CancellationSource::requestCancel() {
    m_flag->store(true, std::memory_order_release);
}

bool CancellationSource::isCancellationRequested() const {
    return m_flag->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
    CancellationToken token;
    token.m_flags.push_back(m_flag);
    return token;
}
