/**
 * @file buffer_pool.h
 * @brief Capacity-bounded pool of reusable heap objects
 *
 * Used for the mesher's scratch memory, MeshData buffers and chunk volumes,
 * all of which are expensive to allocate per chunk.
 *
 * Usage:
 *   BufferPool<MeshData> pool(64);
 *   auto mesh = pool.acquire();
 *   // ... fill mesh ...
 *   mesh->clear();
 *   pool.release(std::move(mesh));
 *
 * Callers reset a buffer before releasing it; the pool does not inspect
 * contents. Releases beyond capacity are freed instead of retained.
 *
 * Thread Safety:
 *   Thread-safe for concurrent acquire/release operations.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "logger.h"

struct BufferPoolStats {
    size_t available = 0;   ///< Buffers currently waiting in the pool
    size_t created = 0;     ///< Buffers allocated because the pool was empty
    size_t reused = 0;      ///< Acquires served from the pool
    size_t dropped = 0;     ///< Releases freed because the pool was full
};

template <typename T>
class BufferPool {
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    /**
     * @param capacity Most buffers kept for reuse (0 keeps none)
     * @param factory Creates a fresh buffer when the pool is empty
     */
    explicit BufferPool(size_t capacity, Factory factory = Factory())
        : m_capacity(capacity)
        , m_factory(std::move(factory)) {
        if (!m_factory) {
            m_factory = [] { return std::make_unique<T>(); };
        }
    }

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * @brief Returns a pooled buffer, or a new one if none is available
     */
    std::unique_ptr<T> acquire() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_available.empty()) {
                std::unique_ptr<T> buffer = std::move(m_available.back());
                m_available.pop_back();
                m_stats.reused++;
                return buffer;
            }
            m_stats.created++;
        }
        return m_factory();
    }

    /**
     * @brief Returns a buffer for reuse; the caller has already reset it
     * @return False if the pool was full and the buffer was freed
     */
    bool release(std::unique_ptr<T>&& buffer) {
        if (!buffer) {
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_available.size() < m_capacity) {
                m_available.push_back(std::move(buffer));
                return true;
            }
            m_stats.dropped++;
        }

        // Freed and logged outside the lock
        buffer.reset();
        Logger::debug("BufferPool") << "Pool full (" << m_capacity << "), dropping released buffer";
        return false;
    }

    /**
     * @brief Pre-allocates buffers up to count (never beyond capacity)
     */
    void reserve(size_t count) {
        std::lock_guard<std::mutex> lock(m_mutex);
        while (m_available.size() < count && m_available.size() < m_capacity) {
            m_available.push_back(m_factory());
        }
    }

    /// Frees every pooled buffer
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_available.clear();
    }

    size_t capacity() const { return m_capacity; }

    size_t available() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_available.size();
    }

    BufferPoolStats stats() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        BufferPoolStats stats = m_stats;
        stats.available = m_available.size();
        return stats;
    }

private:
    const size_t m_capacity;
    Factory m_factory;

    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<T>> m_available;
    BufferPoolStats m_stats;
};
