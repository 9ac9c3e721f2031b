/**
 * @file cancellation.h
 * @brief Cooperative cancellation flags threaded through jobs and hot loops
 *
 * A CancellationSource owns a flag; the CancellationToken handed to a job is a
 * read-only view of one or more flags (typically the job's own flag linked
 * with the scheduler-wide shutdown flag). Hot loops poll the token once per
 * cell, so cancellation takes effect within one cell of work.
 */

#pragma once

#include <atomic>
#include <memory>
#include <vector>

class CancellationToken {
public:
    /// A token that is never canceled
    CancellationToken() = default;

    /**
     * @brief True once any linked source has requested cancellation
     */
    bool isCancellationRequested() const {
        for (const auto& flag : m_flags) {
            if (flag->load(std::memory_order_acquire)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Returns a token canceled when either this or other is canceled
     */
    CancellationToken linkedWith(const CancellationToken& other) const;

    /// True if no source can ever cancel this token
    bool canBeCanceled() const { return !m_flags.empty(); }

private:
    friend class CancellationSource;

    std::vector<std::shared_ptr<const std::atomic<bool>>> m_flags;
};

class CancellationSource {
public:
    CancellationSource();

    void requestCancel();
    bool isCancellationRequested() const;
    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};
