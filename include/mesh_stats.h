/**
 * @file mesh_stats.h
 * @brief Rolling timing statistics for mesh jobs
 *
 * Two windows are kept: pre-meshing (volume decompression and setup) and
 * meshing. Only jobs that were not canceled report samples.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

/**
 * @brief Fixed-size window of timing samples in milliseconds
 */
class RollingAverage {
public:
    explicit RollingAverage(size_t window = 30) : m_window(window == 0 ? 1 : window) {}

    void add(double sample);

    /// Mean of the samples in the window, or 0 if empty
    double average() const;

    size_t count() const { return m_samples.size(); }
    size_t window() const { return m_window; }
    void clear();

private:
    size_t m_window;
    std::deque<double> m_samples;
    double m_sum = 0.0;
};

struct MeshTimingSnapshot {
    double averagePreMeshMs = 0.0;
    double averageMeshMs = 0.0;
    size_t samples = 0;
    size_t totalRecorded = 0;
};

/**
 * @brief Thread-safe collector shared by all mesh jobs
 */
class MeshStats {
public:
    static constexpr size_t DEFAULT_WINDOW = 30;

    explicit MeshStats(size_t window = DEFAULT_WINDOW);

    void record(double preMeshMs, double meshMs);

    double averagePreMeshMs() const;
    double averageMeshMs() const;
    MeshTimingSnapshot snapshot() const;
    void reset();

private:
    mutable std::mutex m_mutex;
    RollingAverage m_preMesh;
    RollingAverage m_mesh;
    size_t m_totalRecorded = 0;
};

/**
 * @brief Stopwatch measuring milliseconds since construction or restart()
 */
class Stopwatch {
public:
    Stopwatch() : m_start(std::chrono::steady_clock::now()) {}

    void restart() { m_start = std::chrono::steady_clock::now(); }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - m_start).count();
    }

private:
    std::chrono::steady_clock::time_point m_start;
};
