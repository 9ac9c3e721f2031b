/**
 * @file neighbor_resolver.cpp
 * @brief Neighbor lookups across chunk boundaries
 */

#include "neighbor_resolver.h"
#include "voxel_volume.h"

BlockId NeighborSet::blockAcross(Direction direction, const glm::ivec3& localPoint) const {
    const VoxelVolume* neighbor = get(direction);
    if (!neighbor) {
        return BlockID::NULL_ID;
    }

    const FaceDescriptor& face = faceDescriptor(direction);
    const int size = neighbor->size();

    // Wrap the stepped coordinate onto the neighbor's opposite face
    glm::ivec3 translated = localPoint;
    translated[face.axis] = (translated[face.axis] + face.sign + size) % size;

    if (!containsPoint(translated, size)) {
        return BlockID::NULL_ID;
    }
    return neighbor->get(translated);
}

size_t NeighborSet::loadedCount() const {
    size_t count = 0;
    for (const auto& volume : volumes) {
        if (volume) {
            ++count;
        }
    }
    return count;
}

void NeighborResolver::addVolume(const glm::ivec3& chunkOrigin, VolumePtr volume) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_volumes[chunkOrigin] = std::move(volume);
}

void NeighborResolver::removeVolume(const glm::ivec3& chunkOrigin) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_volumes.erase(chunkOrigin);
}

VolumePtr NeighborResolver::volumeAt(const glm::ivec3& chunkOrigin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_volumes.find(chunkOrigin);
    return (it != m_volumes.end()) ? it->second : nullptr;
}

NeighborSet NeighborResolver::neighborsOf(const glm::ivec3& chunkOrigin) const {
    NeighborSet neighbors;

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
        auto it = m_volumes.find(neighborOrigin(chunkOrigin, face.direction, m_chunkSize));
        if (it != m_volumes.end()) {
            neighbors.set(face.direction, it->second);
        }
    }
    return neighbors;
}

glm::ivec3 NeighborResolver::neighborOrigin(const glm::ivec3& chunkOrigin, Direction direction, int chunkSize) {
    return chunkOrigin + faceDescriptor(direction).normal * chunkSize;
}
