/**
 * @file neighbor_resolver.h
 * @brief Supplies the six face-adjacent chunk volumes of a chunk
 *
 * Chunk origins are world cell coordinates of a chunk's minimum corner, so
 * they are multiples of ChunkGeometry::SIZE. A missing neighbor is not an
 * error: lookups across that face return BlockID::NULL_ID, which the mesher
 * treats as exposed so the border of loaded space is still closed.
 */

#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <glm/glm.hpp>
#include "direction.h"
#include "voxel_types.h"

class VoxelVolume;

using VolumePtr = std::shared_ptr<const VoxelVolume>;

/**
 * @brief Hash for chunk origins used as map keys
 */
struct ChunkOriginHash {
    size_t operator()(const glm::ivec3& origin) const {
        size_t h = std::hash<int>()(origin.x);
        h ^= std::hash<int>()(origin.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<int>()(origin.z) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

/**
 * @brief Up to six neighbor volumes keyed by face direction
 *
 * Holds shared ownership so a neighbor stays alive for the duration of a
 * mesh pass even if its chunk is unloaded meanwhile.
 */
struct NeighborSet {
    std::array<VolumePtr, DIRECTION_COUNT> volumes;

    const VoxelVolume* get(Direction direction) const {
        return volumes[static_cast<size_t>(direction)].get();
    }

    void set(Direction direction, VolumePtr volume) {
        volumes[static_cast<size_t>(direction)] = std::move(volume);
    }

    /**
     * @brief Reads the cell facing a boundary cell of the current chunk
     *
     * @param direction Face being tested
     * @param localPoint Boundary cell in the current chunk; stepping along
     *        direction leaves the chunk
     * @return Neighbor id, or BlockID::NULL_ID when the neighbor is absent
     */
    BlockId blockAcross(Direction direction, const glm::ivec3& localPoint) const;

    size_t loadedCount() const;

    void clear() { volumes.fill(nullptr); }
};

/**
 * @brief Interface for anything that knows where chunks are
 */
class NeighborProvider {
public:
    virtual ~NeighborProvider() = default;

    virtual NeighborSet neighborsOf(const glm::ivec3& chunkOrigin) const = 0;
};

/**
 * @brief Thread-safe map from chunk origin to volume
 *
 * Used directly by tests and tools; ChunkPipeline provides the same
 * interface from its own chunk table.
 */
class NeighborResolver : public NeighborProvider {
public:
    explicit NeighborResolver(int chunkSize = ChunkGeometry::SIZE) : m_chunkSize(chunkSize) {}

    void addVolume(const glm::ivec3& chunkOrigin, VolumePtr volume);
    void removeVolume(const glm::ivec3& chunkOrigin);
    VolumePtr volumeAt(const glm::ivec3& chunkOrigin) const;

    NeighborSet neighborsOf(const glm::ivec3& chunkOrigin) const override;

    /// Origin of the chunk adjacent across a face
    static glm::ivec3 neighborOrigin(const glm::ivec3& chunkOrigin, Direction direction, int chunkSize);

private:
    int m_chunkSize;
    mutable std::mutex m_mutex;
    std::unordered_map<glm::ivec3, VolumePtr, ChunkOriginHash> m_volumes;
};
