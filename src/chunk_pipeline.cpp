/**
 * @file chunk_pipeline.cpp
 * @brief Chunk lifecycle: terrain jobs, mesh jobs, deferred edits
 */

#include "chunk_pipeline.h"
#include "logger.h"

#include <string>

namespace {

const char* LOG_CHANNEL = "ChunkPipeline";

/**
 * @brief Runs a TerrainSource against one chunk volume
 */
class TerrainJob : public Job {
public:
    TerrainJob(std::shared_ptr<VoxelVolume> volume, TerrainSource& source, const glm::ivec3& chunkOrigin,
               CancellationToken chunkCancel)
        : m_volume(std::move(volume))
        , m_source(source)
        , m_chunkOrigin(chunkOrigin)
        , m_chunkCancel(std::move(chunkCancel)) {
    }

    bool execute(const CancellationToken& cancel) override {
        return m_source.generate(m_chunkOrigin, *m_volume, cancel.linkedWith(m_chunkCancel));
    }

    const char* name() const override { return "TerrainJob"; }

private:
    std::shared_ptr<VoxelVolume> m_volume;
    TerrainSource& m_source;
    glm::ivec3 m_chunkOrigin;
    CancellationToken m_chunkCancel;
};

int floorToChunk(int coordinate) {
    int remainder = coordinate % ChunkGeometry::SIZE;
    if (remainder < 0) {
        remainder += ChunkGeometry::SIZE;
    }
    return coordinate - remainder;
}

bool isChunkAligned(const glm::ivec3& origin) {
    return origin.x % ChunkGeometry::SIZE == 0
        && origin.y % ChunkGeometry::SIZE == 0
        && origin.z % ChunkGeometry::SIZE == 0;
}

} // namespace

const char* chunkStateToString(ChunkState state) {
    switch (state) {
        case ChunkState::TERRAIN: return "terrain";
        case ChunkState::AWAITING_TERRAIN: return "awaiting terrain";
        case ChunkState::MESH: return "mesh";
        case ChunkState::AWAITING_MESH: return "awaiting mesh";
        case ChunkState::MESHED: return "meshed";
    }
    return "unknown";
}

ChunkPipeline::ChunkPipeline(JobScheduler& scheduler, MeshingPools& pools, const GreedyMesher& mesher,
                             TerrainSource& terrain, MeshConsumer& consumer, MeshStats* stats)
    : m_scheduler(scheduler)
    , m_pools(pools)
    , m_terrain(terrain)
    , m_consumer(consumer) {
    m_meshingContext.mesher = &mesher;
    m_meshingContext.pools = &pools;
    m_meshingContext.stats = stats;
}

ChunkPipeline::~ChunkPipeline() {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& entry : m_chunks) {
        entry.second->cancel.requestCancel();
        m_retired.push_back(std::move(entry.second));
    }
    m_chunks.clear();

    for (auto& chunk : m_retired) {
        chunk->terrainJob.wait();
        chunk->meshJob.wait();
        chunk->terrainJob = JobHandle();
        chunk->meshJob = JobHandle();
        if (chunk->meshJobPtr) {
            m_pools.releaseMeshData(chunk->meshJobPtr->takeResult());
            chunk->meshJobPtr.reset();
        }
        if (!m_pools.releaseVolume(chunk->volume)) {
            chunk->volume.reset();  // A worker still holds it; it is freed with the job
        }
    }
    m_retired.clear();
}

glm::ivec3 ChunkPipeline::chunkOriginOf(const glm::ivec3& globalPosition) {
    return glm::ivec3(floorToChunk(globalPosition.x), floorToChunk(globalPosition.y), floorToChunk(globalPosition.z));
}

bool ChunkPipeline::loadChunk(const glm::ivec3& chunkOrigin) {
    if (!isChunkAligned(chunkOrigin)) {
        Logger::warning(LOG_CHANNEL) << "Chunk origin (" << chunkOrigin.x << ", " << chunkOrigin.y << ", "
                                     << chunkOrigin.z << ") is not aligned to " << ChunkGeometry::SIZE;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_chunks.count(chunkOrigin)) {
        return false;
    }

    auto chunk = std::make_unique<ChunkRecord>();
    chunk->origin = chunkOrigin;
    m_chunks.emplace(chunkOrigin, std::move(chunk));
    return true;
}

bool ChunkPipeline::unloadChunk(const glm::ivec3& chunkOrigin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_chunks.find(chunkOrigin);
    if (it == m_chunks.end()) {
        return false;
    }

    std::unique_ptr<ChunkRecord> chunk = std::move(it->second);
    m_chunks.erase(it);

    chunk->cancel.requestCancel();
    chunk->pendingEdits.clear();

    // Neighbors now border unloaded space
    for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
        ChunkRecord* neighbor = findChunk(NeighborResolver::neighborOrigin(chunkOrigin, face.direction, ChunkGeometry::SIZE));
        if (neighbor && hasTerrain(*neighbor)) {
            neighbor->updateMesh = true;
        }
    }

    m_retired.push_back(std::move(chunk));
    m_consumer.onChunkUnloaded(chunkOrigin);
    processRetired();
    return true;
}

void ChunkPipeline::tick() {
    std::lock_guard<std::mutex> lock(m_mutex);

    for (auto& entry : m_chunks) {
        advance(*entry.second);
    }
    processRetired();
}

void ChunkPipeline::advance(ChunkRecord& chunk) {
    if (neighborLags(chunk)) {
        return;
    }

    switch (chunk.state) {
        case ChunkState::TERRAIN:
            beginTerrain(chunk);
            break;
        case ChunkState::AWAITING_TERRAIN:
            collectTerrain(chunk);
            break;
        case ChunkState::MESH:
            beginMeshing(chunk);
            break;
        case ChunkState::AWAITING_MESH:
            collectMesh(chunk);
            break;
        case ChunkState::MESHED:
            applyEdits(chunk);
            if (chunk.updateMesh) {
                chunk.state = ChunkState::MESH;
            }
            break;
    }
}

void ChunkPipeline::beginTerrain(ChunkRecord& chunk) {
    if (!chunk.volume || chunk.volume.use_count() > 1) {
        chunk.volume = m_pools.acquireVolume();
    } else {
        chunk.volume->reset(BlockID::AIR);
    }

    auto job = std::make_shared<TerrainJob>(chunk.volume, m_terrain, chunk.origin, chunk.cancel.token());
    JobHandle handle;
    if (!m_scheduler.submit(job, handle)) {
        return;  // Backpressure: retry next tick
    }

    chunk.terrainJob = handle;
    chunk.state = ChunkState::AWAITING_TERRAIN;
}

void ChunkPipeline::collectTerrain(ChunkRecord& chunk) {
    if (!chunk.terrainJob.isFinished()) {
        return;
    }

    const JobStatus status = chunk.terrainJob.status();
    const std::string error = chunk.terrainJob.error();
    chunk.terrainJob = JobHandle();

    if (status != JobStatus::COMPLETED) {
        m_counters.terrainRetries++;
        Logger::warning(LOG_CHANNEL) << "Terrain for chunk (" << chunk.origin.x << ", " << chunk.origin.y << ", "
                                     << chunk.origin.z << ") " << jobStatusToString(status)
                                     << (error.empty() ? "" : ": ") << error << "; retrying";
        chunk.state = ChunkState::TERRAIN;
        return;
    }

    chunk.state = ChunkState::MESH;

    // Neighbors meshed earlier treated this chunk as unloaded
    for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
        ChunkRecord* neighbor = findChunk(NeighborResolver::neighborOrigin(chunk.origin, face.direction, ChunkGeometry::SIZE));
        if (neighbor && neighbor->state == ChunkState::MESHED) {
            neighbor->updateMesh = true;
        }
    }
}

void ChunkPipeline::beginMeshing(ChunkRecord& chunk) {
    if (chunk.volume->isUniform() && isAir(chunk.volume->value())) {
        std::unique_ptr<MeshData> empty = m_pools.meshes().acquire();
        empty->clear();
        m_consumer.onMeshReady(chunk.origin, std::move(empty));
        m_counters.meshesDelivered++;
        chunk.updateMesh = false;
        chunk.state = ChunkState::MESHED;
        return;
    }

    auto job = beginMesh(chunk.volume, neighborsOfLocked(chunk.origin), chunk.origin, chunk.cancel.token(),
                         m_meshingContext);
    JobHandle handle;
    if (!m_scheduler.submit(job, handle)) {
        return;  // Backpressure: retry next tick
    }

    chunk.meshJob = handle;
    chunk.meshJobPtr = std::move(job);
    chunk.updateMesh = false;
    chunk.state = ChunkState::AWAITING_MESH;
}

void ChunkPipeline::collectMesh(ChunkRecord& chunk) {
    if (!chunk.meshJob.isFinished()) {
        return;
    }

    const JobStatus status = chunk.meshJob.status();
    std::shared_ptr<ChunkMeshJob> job = std::move(chunk.meshJobPtr);
    chunk.meshJob = JobHandle();

    if (status != JobStatus::COMPLETED) {
        m_counters.meshRetries++;
        Logger::warning(LOG_CHANNEL) << "Mesh for chunk (" << chunk.origin.x << ", " << chunk.origin.y << ", "
                                     << chunk.origin.z << ") " << jobStatusToString(status) << "; retrying";
        chunk.state = ChunkState::MESH;
        return;
    }

    std::unique_ptr<MeshData> mesh = job->takeResult();
    if (mesh) {
        m_consumer.onMeshReady(chunk.origin, std::move(mesh));
        m_counters.meshesDelivered++;
    }
    chunk.state = ChunkState::MESHED;
}

void ChunkPipeline::applyEdits(ChunkRecord& chunk) {
    while (!chunk.pendingEdits.empty()) {
        BlockEdit edit = chunk.pendingEdits.front();
        chunk.pendingEdits.pop_front();
        applyEdit(chunk, edit);
    }
}

void ChunkPipeline::applyEdit(ChunkRecord& chunk, const BlockEdit& edit) {
    const glm::ivec3 local = edit.globalPosition - chunk.origin;
    if (chunk.volume->get(local) == edit.id) {
        return;
    }

    // A neighbor's mesh job may still read this volume
    if (chunk.volume.use_count() > 1) {
        std::shared_ptr<VoxelVolume> clone = m_pools.acquireVolume();
        *clone = *chunk.volume;
        chunk.volume = std::move(clone);
        m_counters.copyOnWriteClones++;
    }

    chunk.volume->set(local, edit.id);
    m_counters.editsApplied++;
    chunk.updateMesh = true;
    flagBorderNeighbors(chunk, local);
}

void ChunkPipeline::flagBorderNeighbors(const ChunkRecord& chunk, const glm::ivec3& localPosition) {
    for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
        const int coordinate = localPosition[face.axis];
        const bool onBorder = face.isPositive() ? (coordinate == ChunkGeometry::SIZE - 1) : (coordinate == 0);
        if (!onBorder) {
            continue;
        }

        ChunkRecord* neighbor = findChunk(NeighborResolver::neighborOrigin(chunk.origin, face.direction, ChunkGeometry::SIZE));
        if (neighbor && hasTerrain(*neighbor)) {
            neighbor->updateMesh = true;
        }
    }
}

bool ChunkPipeline::placeBlock(const glm::ivec3& globalPosition, BlockId id) {
    if (id == BlockID::NULL_ID) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const glm::ivec3 origin = chunkOriginOf(globalPosition);
    ChunkRecord* chunk = findChunk(origin);
    if (!chunk || !hasTerrain(*chunk)) {
        return false;
    }

    // Compare against the newest queued edit for this cell, if any
    BlockId current = chunk->volume->get(globalPosition - origin);
    for (auto it = chunk->pendingEdits.rbegin(); it != chunk->pendingEdits.rend(); ++it) {
        if (it->globalPosition == globalPosition) {
            current = it->id;
            break;
        }
    }
    if (current == id) {
        return false;
    }

    chunk->pendingEdits.push_back(BlockEdit{globalPosition, id});
    return true;
}

BlockId ChunkPipeline::blockAt(const glm::ivec3& globalPosition) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    const glm::ivec3 origin = chunkOriginOf(globalPosition);
    const ChunkRecord* chunk = findChunk(origin);
    if (!chunk || !hasTerrain(*chunk)) {
        return BlockID::NULL_ID;
    }
    return chunk->volume->get(globalPosition - origin);
}

bool ChunkPipeline::flagForRemesh(const glm::ivec3& chunkOrigin) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ChunkRecord* chunk = findChunk(chunkOrigin);
    if (!chunk) {
        return false;
    }
    chunk->updateMesh = true;
    return true;
}

bool ChunkPipeline::isLoaded(const glm::ivec3& chunkOrigin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return findChunk(chunkOrigin) != nullptr;
}

std::optional<ChunkState> ChunkPipeline::stateOf(const glm::ivec3& chunkOrigin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const ChunkRecord* chunk = findChunk(chunkOrigin);
    if (!chunk) {
        return std::nullopt;
    }
    return chunk->state;
}

bool ChunkPipeline::allMeshed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_chunks) {
        const ChunkRecord& chunk = *entry.second;
        if (chunk.state != ChunkState::MESHED || chunk.updateMesh || !chunk.pendingEdits.empty()) {
            return false;
        }
    }
    return true;
}

size_t ChunkPipeline::chunkCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_chunks.size();
}

PipelineCounters ChunkPipeline::counters() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    PipelineCounters counters = m_counters;
    counters.chunks = m_chunks.size();
    counters.meshedChunks = 0;
    counters.pendingEdits = 0;
    for (const auto& entry : m_chunks) {
        if (entry.second->state == ChunkState::MESHED) {
            counters.meshedChunks++;
        }
        counters.pendingEdits += entry.second->pendingEdits.size();
    }
    return counters;
}

NeighborSet ChunkPipeline::neighborsOf(const glm::ivec3& chunkOrigin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return neighborsOfLocked(chunkOrigin);
}

void ChunkPipeline::releaseMeshData(std::unique_ptr<MeshData> mesh) {
    m_pools.releaseMeshData(std::move(mesh));
}

NeighborSet ChunkPipeline::neighborsOfLocked(const glm::ivec3& chunkOrigin) const {
    NeighborSet neighbors;
    for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
        const ChunkRecord* neighbor = findChunk(NeighborResolver::neighborOrigin(chunkOrigin, face.direction, ChunkGeometry::SIZE));
        if (neighbor && hasTerrain(*neighbor)) {
            neighbors.set(face.direction, neighbor->volume);
        }
    }
    return neighbors;
}

bool ChunkPipeline::neighborLags(const ChunkRecord& chunk) const {
    for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
        const ChunkRecord* neighbor = findChunk(NeighborResolver::neighborOrigin(chunk.origin, face.direction, ChunkGeometry::SIZE));
        if (neighbor && neighbor->state < chunk.state) {
            return true;
        }
    }
    return false;
}

bool ChunkPipeline::hasTerrain(const ChunkRecord& chunk) const {
    return chunk.state >= ChunkState::MESH;
}

ChunkPipeline::ChunkRecord* ChunkPipeline::findChunk(const glm::ivec3& chunkOrigin) const {
    auto it = m_chunks.find(chunkOrigin);
    return (it != m_chunks.end()) ? it->second.get() : nullptr;
}

void ChunkPipeline::processRetired() {
    for (auto it = m_retired.begin(); it != m_retired.end();) {
        ChunkRecord& chunk = **it;

        const bool terrainRunning = chunk.terrainJob.valid() && !chunk.terrainJob.isFinished();
        const bool meshRunning = chunk.meshJob.valid() && !chunk.meshJob.isFinished();
        if (terrainRunning || meshRunning) {
            ++it;
            continue;
        }

        chunk.terrainJob = JobHandle();
        chunk.meshJob = JobHandle();
        if (chunk.meshJobPtr) {
            m_pools.releaseMeshData(chunk.meshJobPtr->takeResult());
            chunk.meshJobPtr.reset();
        }

        if (!m_pools.releaseVolume(chunk.volume)) {
            ++it;  // Still read by a neighbor's mesh job
            continue;
        }
        it = m_retired.erase(it);
    }
}
