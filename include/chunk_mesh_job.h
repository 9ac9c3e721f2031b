/**
 * @file chunk_mesh_job.h
 * @brief Background job that meshes one chunk volume
 *
 * Usage:
 * @code
 *   MeshingPools pools(16, 64, 128);
 *   GreedyMesher mesher(catalog);
 *   MeshingContext context{&mesher, &pools, &stats};
 *
 *   auto job = beginMesh(volume, resolver.neighborsOf(origin), origin, CancellationToken(), context);
 *   JobHandle handle;
 *   if (scheduler.submit(job, handle) && handle.wait() == JobStatus::COMPLETED) {
 *       std::unique_ptr<MeshData> mesh = job->takeResult();
 *       // ... upload ...
 *       pools.releaseMeshData(std::move(mesh));
 *   }
 * @endcode
 */

#pragma once

#include <memory>
#include <glm/glm.hpp>
#include "buffer_pool.h"
#include "cancellation.h"
#include "greedy_mesher.h"
#include "job_scheduler.h"
#include "mesh_data.h"
#include "mesh_stats.h"
#include "neighbor_resolver.h"
#include "voxel_volume.h"

/**
 * @brief Pools shared by every mesh job of one scheduler
 */
class MeshingPools {
public:
    MeshingPools(size_t scratchCapacity, size_t meshCapacity, size_t volumeCapacity);

    BufferPool<MeshScratch>& scratch() { return m_scratch; }
    BufferPool<MeshData>& meshes() { return m_meshes; }
    BufferPool<VoxelVolume>& volumes() { return m_volumes; }

    /// Clears a consumed mesh and returns it to the pool
    void releaseMeshData(std::unique_ptr<MeshData> mesh);

    /// A pooled volume holding uniform air
    std::shared_ptr<VoxelVolume> acquireVolume();

    /**
     * @brief Returns a volume to the pool once nothing else references it
     *
     * @return False (volume untouched) while other owners remain
     */
    bool releaseVolume(std::shared_ptr<VoxelVolume>& volume);

private:
    BufferPool<MeshScratch> m_scratch;
    BufferPool<MeshData> m_meshes;
    BufferPool<VoxelVolume> m_volumes;
};

/**
 * @brief Collaborators a mesh job borrows; all must outlive the job
 */
struct MeshingContext {
    const GreedyMesher* mesher = nullptr;
    MeshingPools* pools = nullptr;
    MeshStats* stats = nullptr;          ///< Optional
};

class ChunkMeshJob : public ResultJob<MeshData> {
public:
    ChunkMeshJob(VolumePtr volume, NeighborSet neighbors, const glm::ivec3& chunkOrigin,
                 CancellationToken cancel, const MeshingContext& context);

    /**
     * @brief Meshes the volume into a pooled MeshData
     *
     * The MeshData is published only on completion; a canceled pass clears
     * it and returns it to the pool.
     *
     * @throws std::invalid_argument if the volume size is unsupported
     */
    bool execute(const CancellationToken& cancel) override;

    const char* name() const override { return "ChunkMeshJob"; }

    const glm::ivec3& chunkOrigin() const { return m_chunkOrigin; }
    const VolumePtr& volume() const { return m_volume; }

    /// Outcome of the last pass; valid once the job finished
    const MeshResult& meshResult() const { return m_meshResult; }

private:
    VolumePtr m_volume;
    NeighborSet m_neighbors;
    glm::ivec3 m_chunkOrigin;
    CancellationToken m_cancel;
    MeshingContext m_context;
    MeshResult m_meshResult;
};

/**
 * @brief Creates the mesh job for one chunk
 *
 * The job observes `cancel` in addition to the token the scheduler supplies.
 * Submit the returned job to a JobScheduler and take the MeshData with
 * takeResult() once it completed.
 */
std::shared_ptr<ChunkMeshJob> beginMesh(VolumePtr volume, NeighborSet neighbors, const glm::ivec3& chunkOrigin,
                                        const CancellationToken& cancel, const MeshingContext& context);
