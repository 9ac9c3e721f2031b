#include "mesh_stats.h"

void RollingAverage::add(double sample) {
    m_samples.push_back(sample);
    m_sum += sample;
    if (m_samples.size() > m_window) {
        m_sum -= m_samples.front();
        m_samples.pop_front();
    }
}

double RollingAverage::average() const {
    if (m_samples.empty()) {
        return 0.0;
    }
    return m_sum / static_cast<double>(m_samples.size());
}

void RollingAverage::clear() {
    m_samples.clear();
    m_sum = 0.0;
}

MeshStats::MeshStats(size_t window)
    : m_preMesh(window)
    , m_mesh(window) {
}

void MeshStats::record(double preMeshMs, double meshMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preMesh.add(preMeshMs);
    m_mesh.add(meshMs);
    m_totalRecorded++;
}

double MeshStats::averagePreMeshMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_preMesh.average();
}

double MeshStats::averageMeshMs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mesh.average();
}

MeshTimingSnapshot MeshStats::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    MeshTimingSnapshot snapshot;
    snapshot.averagePreMeshMs = m_preMesh.average();
    snapshot.averageMeshMs = m_mesh.average();
    snapshot.samples = m_mesh.count();
    snapshot.totalRecorded = m_totalRecorded;
    return snapshot;
}

void MeshStats::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preMesh.clear();
    m_mesh.clear();
    m_totalRecorded = 0;
}
