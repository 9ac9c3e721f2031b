/**
 * @file chunk_pipeline.h
 * @brief Per-chunk generation/meshing state machine driven by tick()
 *
 * Every loaded chunk walks through
 *
 *   TERRAIN -> AWAITING_TERRAIN -> MESH -> AWAITING_MESH -> MESHED
 *
 * one step per tick() at most. Terrain generation and meshing run as jobs on
 * the JobScheduler; tick() only submits jobs and collects finished ones, so
 * it never blocks on work.
 *
 * Rules:
 * - A chunk does nothing while a loaded face-neighbor is in an earlier state,
 *   so neighbors get their terrain before a chunk is meshed against them.
 * - Uniform-air chunks skip the mesher and deliver an empty mesh.
 * - Block edits are queued and applied only in MESHED, never while a terrain
 *   or mesh job for the chunk is outstanding. Applying an edit flags the
 *   chunk for remeshing, plus every neighbor sharing the edited border.
 * - Volumes are shared read-only with mesh jobs of neighboring chunks. An
 *   edit on a volume still referenced by such a job clones it first
 *   (copy-on-write), so jobs always read a consistent snapshot.
 *
 * Thread Safety:
 *   Public methods are serialized by an internal mutex. Consumer callbacks
 *   run inside tick() on the caller's thread and must not call back into
 *   the pipeline.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>
#include "cancellation.h"
#include "chunk_mesh_job.h"
#include "job_scheduler.h"
#include "neighbor_resolver.h"
#include "voxel_types.h"

enum class ChunkState {
    TERRAIN,
    AWAITING_TERRAIN,
    MESH,
    AWAITING_MESH,
    MESHED
};

const char* chunkStateToString(ChunkState state);

/**
 * @brief Fills a freshly loaded chunk volume (uniform air on entry)
 *
 * Called on scheduler threads; implementations must be thread-safe.
 */
class TerrainSource {
public:
    virtual ~TerrainSource() = default;

    /**
     * @return False if generation stopped because cancel was requested
     */
    virtual bool generate(const glm::ivec3& chunkOrigin, VoxelVolume& volume, const CancellationToken& cancel) = 0;
};

/**
 * @brief Receives finished meshes (typically uploads them to the GPU)
 *
 * The consumer owns each MeshData it receives and should hand it back with
 * ChunkPipeline::releaseMeshData() when done.
 */
class MeshConsumer {
public:
    virtual ~MeshConsumer() = default;

    virtual void onMeshReady(const glm::ivec3& chunkOrigin, std::unique_ptr<MeshData> mesh) = 0;

    virtual void onChunkUnloaded(const glm::ivec3& chunkOrigin) { (void)chunkOrigin; }
};

struct PipelineCounters {
    size_t chunks = 0;
    size_t meshedChunks = 0;
    size_t pendingEdits = 0;
    uint64_t meshesDelivered = 0;
    uint64_t editsApplied = 0;
    uint64_t terrainRetries = 0;
    uint64_t meshRetries = 0;
    uint64_t copyOnWriteClones = 0;
};

class ChunkPipeline : public NeighborProvider {
public:
    /**
     * All collaborators must outlive the pipeline. The scheduler must be
     * running for chunks to make progress.
     */
    ChunkPipeline(JobScheduler& scheduler, MeshingPools& pools, const GreedyMesher& mesher,
                  TerrainSource& terrain, MeshConsumer& consumer, MeshStats* stats = nullptr);

    /// Cancels outstanding jobs and waits for them
    ~ChunkPipeline() override;

    ChunkPipeline(const ChunkPipeline&) = delete;
    ChunkPipeline& operator=(const ChunkPipeline&) = delete;

    /**
     * @brief Starts tracking a chunk in state TERRAIN
     * @return False if the origin is not chunk-aligned or already loaded
     */
    bool loadChunk(const glm::ivec3& chunkOrigin);

    /**
     * @brief Cancels the chunk's jobs and forgets it
     *
     * Its volume returns to the pool once no job references it. Neighbors
     * with terrain are flagged so their border is closed again.
     */
    bool unloadChunk(const glm::ivec3& chunkOrigin);

    /**
     * @brief Advances every chunk by at most one state
     */
    void tick();

    /**
     * @brief Queues a block edit
     *
     * @return False if the chunk is not loaded, has no terrain yet, the id
     *         is NULL_ID, or the cell already holds id
     */
    bool placeBlock(const glm::ivec3& globalPosition, BlockId id);

    bool removeBlock(const glm::ivec3& globalPosition) { return placeBlock(globalPosition, BlockID::AIR); }

    /// Current id at a world cell, or NULL_ID if the chunk has no terrain
    BlockId blockAt(const glm::ivec3& globalPosition) const;

    /// Marks a chunk for remeshing on a later tick
    bool flagForRemesh(const glm::ivec3& chunkOrigin);

    bool isLoaded(const glm::ivec3& chunkOrigin) const;
    std::optional<ChunkState> stateOf(const glm::ivec3& chunkOrigin) const;

    /// True when every chunk is MESHED with no queued edits or remesh flags
    bool allMeshed() const;

    size_t chunkCount() const;
    PipelineCounters counters() const;

    /// Volumes of face-neighbors that have terrain
    NeighborSet neighborsOf(const glm::ivec3& chunkOrigin) const override;

    /// Returns a consumed mesh to the pool
    void releaseMeshData(std::unique_ptr<MeshData> mesh);

    /// Origin of the chunk containing a world cell
    static glm::ivec3 chunkOriginOf(const glm::ivec3& globalPosition);

private:
    struct BlockEdit {
        glm::ivec3 globalPosition;
        BlockId id;
    };

    struct ChunkRecord {
        glm::ivec3 origin;
        ChunkState state = ChunkState::TERRAIN;
        std::shared_ptr<VoxelVolume> volume;
        CancellationSource cancel;
        JobHandle terrainJob;
        JobHandle meshJob;
        std::shared_ptr<ChunkMeshJob> meshJobPtr;
        std::deque<BlockEdit> pendingEdits;
        bool updateMesh = false;
    };

    using ChunkMap = std::unordered_map<glm::ivec3, std::unique_ptr<ChunkRecord>, ChunkOriginHash>;

    void advance(ChunkRecord& chunk);
    void beginTerrain(ChunkRecord& chunk);
    void collectTerrain(ChunkRecord& chunk);
    void beginMeshing(ChunkRecord& chunk);
    void collectMesh(ChunkRecord& chunk);
    void applyEdits(ChunkRecord& chunk);
    void applyEdit(ChunkRecord& chunk, const BlockEdit& edit);
    void flagBorderNeighbors(const ChunkRecord& chunk, const glm::ivec3& localPosition);

    bool neighborLags(const ChunkRecord& chunk) const;
    bool hasTerrain(const ChunkRecord& chunk) const;
    ChunkRecord* findChunk(const glm::ivec3& chunkOrigin) const;
    NeighborSet neighborsOfLocked(const glm::ivec3& chunkOrigin) const;

    void processRetired();

    JobScheduler& m_scheduler;
    MeshingPools& m_pools;
    TerrainSource& m_terrain;
    MeshConsumer& m_consumer;
    MeshingContext m_meshingContext;

    mutable std::mutex m_mutex;
    ChunkMap m_chunks;
    std::vector<std::unique_ptr<ChunkRecord>> m_retired;   ///< Unloaded, waiting for jobs to release volumes
    PipelineCounters m_counters;
};
