/**
 * @file chunk_mesh_job.cpp
 * @brief Mesh job execution and pool plumbing
 */

#include "chunk_mesh_job.h"

#include <stdexcept>
#include <string>

MeshingPools::MeshingPools(size_t scratchCapacity, size_t meshCapacity, size_t volumeCapacity)
    : m_scratch(scratchCapacity)
    , m_meshes(meshCapacity)
    , m_volumes(volumeCapacity) {
}

void MeshingPools::releaseMeshData(std::unique_ptr<MeshData> mesh) {
    if (!mesh) {
        return;
    }
    mesh->clear();
    m_meshes.release(std::move(mesh));
}

std::shared_ptr<VoxelVolume> MeshingPools::acquireVolume() {
    std::unique_ptr<VoxelVolume> volume = m_volumes.acquire();
    if (!volume->isUniform() || !isAir(volume->value())) {
        volume->reset(BlockID::AIR);
    }
    return std::shared_ptr<VoxelVolume>(std::move(volume));
}

bool MeshingPools::releaseVolume(std::shared_ptr<VoxelVolume>& volume) {
    if (!volume) {
        return true;
    }
    if (volume.use_count() != 1) {
        return false;
    }

    // Sole owner: move the tree storage into a pooled holder
    auto holder = std::make_unique<VoxelVolume>(std::move(*volume));
    volume.reset();
    holder->reset(BlockID::AIR);
    m_volumes.release(std::move(holder));
    return true;
}

ChunkMeshJob::ChunkMeshJob(VolumePtr volume, NeighborSet neighbors, const glm::ivec3& chunkOrigin,
                           CancellationToken cancel, const MeshingContext& context)
    : m_volume(std::move(volume))
    , m_neighbors(std::move(neighbors))
    , m_chunkOrigin(chunkOrigin)
    , m_cancel(std::move(cancel))
    , m_context(context) {
}

bool ChunkMeshJob::execute(const CancellationToken& cancel) {
    const CancellationToken token = cancel.linkedWith(m_cancel);
    MeshingPools& pools = *m_context.pools;

    std::unique_ptr<MeshScratch> scratch = pools.scratch().acquire();
    std::unique_ptr<MeshData> mesh = pools.meshes().acquire();

    m_meshResult = m_context.mesher->mesh(*m_volume, m_neighbors, m_chunkOrigin, *scratch, *mesh, token);

    scratch->clear();
    pools.scratch().release(std::move(scratch));

    switch (m_meshResult.status) {
        case MeshStatus::CANCELED:
            pools.releaseMeshData(std::move(mesh));
            return false;

        case MeshStatus::INVALID_INPUT:
            pools.releaseMeshData(std::move(mesh));
            throw std::invalid_argument(std::string("mesher reported ") + meshStatusToString(m_meshResult.status)
                                        + ": chunk volume size of " + std::to_string(m_volume->size())
                                        + " is not supported");

        case MeshStatus::COMPLETED:
            if (m_context.stats) {
                m_context.stats->record(m_meshResult.preMeshMs, m_meshResult.meshMs);
            }
            break;

        case MeshStatus::SKIPPED_UNIFORM_AIR:
            break;
    }

    publish(std::move(mesh));
    return true;
}

std::shared_ptr<ChunkMeshJob> beginMesh(VolumePtr volume, NeighborSet neighbors, const glm::ivec3& chunkOrigin,
                                        const CancellationToken& cancel, const MeshingContext& context) {
    return std::make_shared<ChunkMeshJob>(std::move(volume), std::move(neighbors), chunkOrigin, cancel, context);
}
