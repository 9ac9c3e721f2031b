/**
 * @file main.cpp
 * @brief Benchmark driver for the meshing pipeline
 *
 * Streams an N x 1 x N area of chunks through the pipeline:
 * - Loads settings from config.ini and block definitions from YAML
 * - Generates a layered height field (stone, dirt, grass, water)
 * - Ticks until every chunk is meshed, then applies a batch of edits
 * - Logs quad counts, scheduler counters and average meshing times
 *
 * Usage: greedyvox_bench [config.ini] [blocks.yaml] [--area N] [--edits N] [--debug]
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <glm/glm.hpp>

#include "block_registry.h"
#include "chunk_mesh_job.h"
#include "chunk_pipeline.h"
#include "config.h"
#include "greedy_mesher.h"
#include "job_scheduler.h"
#include "logger.h"
#include "mesh_stats.h"
#include "pipeline_settings.h"

namespace {

const char* DEFAULT_BLOCKS = R"(
blocks:
  - name: stone
    texture: 1
  - name: dirt
    texture: 2
  - name: grass
    texture: 2
    textures: {top: 3, sides: 4}
  - name: water
    transparent: true
    texture: 5
)";

/**
 * @brief Rolling hills with a water level
 */
class LayeredTerrain : public TerrainSource {
public:
    LayeredTerrain(BlockId stone, BlockId dirt, BlockId grass, BlockId water)
        : m_stone(stone), m_dirt(dirt), m_grass(grass), m_water(water) {}

    bool generate(const glm::ivec3& chunkOrigin, VoxelVolume& volume, const CancellationToken& cancel) override {
        const int size = volume.size();
        for (int z = 0; z < size; z++) {
            for (int x = 0; x < size; x++) {
                if (cancel.isCancellationRequested()) {
                    return false;
                }

                const int worldX = chunkOrigin.x + x;
                const int worldZ = chunkOrigin.z + z;
                const int height = surfaceHeight(worldX, worldZ);

                for (int y = 0; y < size; y++) {
                    const int worldY = chunkOrigin.y + y;
                    BlockId id = BlockID::AIR;
                    if (worldY < height - 3) {
                        id = m_stone;
                    } else if (worldY < height) {
                        id = m_dirt;
                    } else if (worldY == height) {
                        id = (height <= WATER_LEVEL) ? m_dirt : m_grass;
                    } else if (worldY <= WATER_LEVEL) {
                        id = m_water;
                    }
                    if (id != BlockID::AIR) {
                        volume.set(x, y, z, id);
                    }
                }
            }
        }
        return true;
    }

    static int surfaceHeight(int worldX, int worldZ) {
        double wave = std::sin(worldX * 0.11) * 4.0 + std::cos(worldZ * 0.07) * 5.0
                    + std::sin((worldX + worldZ) * 0.031) * 3.0;
        return BASE_HEIGHT + static_cast<int>(std::floor(wave));
    }

private:
    static constexpr int BASE_HEIGHT = 16;
    static constexpr int WATER_LEVEL = 13;

    BlockId m_stone;
    BlockId m_dirt;
    BlockId m_grass;
    BlockId m_water;
};

/**
 * @brief Counts delivered geometry and hands buffers straight back
 */
class CountingConsumer : public MeshConsumer {
public:
    explicit CountingConsumer(MeshingPools& pools) : m_pools(pools) {}

    void onMeshReady(const glm::ivec3& chunkOrigin, std::unique_ptr<MeshData> mesh) override {
        (void)chunkOrigin;
        m_meshes++;
        m_quads += mesh->quadCount();
        m_transparentTriangles += mesh->transparentIndices.size() / 3;
        m_pools.releaseMeshData(std::move(mesh));
    }

    uint64_t meshes() const { return m_meshes; }
    uint64_t quads() const { return m_quads; }
    uint64_t transparentTriangles() const { return m_transparentTriangles; }

private:
    MeshingPools& m_pools;
    uint64_t m_meshes = 0;
    uint64_t m_quads = 0;
    uint64_t m_transparentTriangles = 0;
};

/**
 * @brief Ticks the pipeline until it settles or the timeout passes
 * @return Number of ticks, or -1 on timeout
 */
int runUntilMeshed(ChunkPipeline& pipeline, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int ticks = 0;
    while (!pipeline.allMeshed()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return -1;
        }
        pipeline.tick();
        ticks++;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return ticks;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config.ini";
    std::string blocksPath;
    int area = 6;
    int editCount = 64;
    bool debug = false;

    // Parse command line arguments
    int positional = 0;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--area" && i + 1 < argc) {
            area = std::max(1, std::atoi(argv[++i]));
        } else if (arg == "--edits" && i + 1 < argc) {
            editCount = std::max(0, std::atoi(argv[++i]));
        } else if (arg == "-debug" || arg == "--debug") {
            debug = true;
        } else if (positional == 0) {
            configPath = arg;
            positional++;
        } else if (positional == 1) {
            blocksPath = arg;
            positional++;
        } else {
            Logger::warning() << "Ignoring argument: " << arg;
        }
    }

    try {
        Config config;
        if (!config.loadFromFile(configPath)) {
            Logger::warning() << "Failed to load " << configPath << ", using default values";
        }

        PipelineSettings settings = PipelineSettings::fromConfig(config);
        if (debug) {
            settings.logLevel = LogLevel::DEBUG;
        }
        settings.applyLogging();

        BlockCatalog catalog;
        bool blocksLoaded = blocksPath.empty() ? catalog.loadFromYamlString(DEFAULT_BLOCKS)
                                               : catalog.loadFromFile(blocksPath);
        if (!blocksLoaded) {
            Logger::error() << "Failed to load block definitions";
            return 1;
        }

        const BlockId stone = catalog.idOf("stone");
        const BlockId dirt = catalog.idOf("dirt");
        const BlockId grass = catalog.idOf("grass");
        const BlockId water = catalog.idOf("water");
        if (stone == BlockID::NULL_ID || dirt == BlockID::NULL_ID || grass == BlockID::NULL_ID
            || water == BlockID::NULL_ID) {
            Logger::error() << "Block definitions must include stone, dirt, grass and water";
            return 1;
        }

        JobScheduler scheduler(settings.scheduler);
        MeshingPools pools(settings.scratchCapacity, settings.meshCapacity, settings.volumeCapacity);
        GreedyMesher mesher(catalog, settings.meshing);
        MeshStats stats;
        LayeredTerrain terrain(stone, dirt, grass, water);
        CountingConsumer consumer(pools);

        scheduler.start();

        {
            ChunkPipeline pipeline(scheduler, pools, mesher, terrain, consumer, &stats);

            for (int cz = 0; cz < area; cz++) {
                for (int cx = 0; cx < area; cx++) {
                    pipeline.loadChunk(glm::ivec3(cx * ChunkGeometry::SIZE, 0, cz * ChunkGeometry::SIZE));
                }
            }

            Logger::info() << "Streaming " << pipeline.chunkCount() << " chunks ("
                           << threadingModeToString(settings.scheduler.mode) << ", "
                           << scheduler.workerCount() << " workers)";

            Stopwatch stopwatch;
            int ticks = runUntilMeshed(pipeline, std::chrono::seconds(120));
            if (ticks < 0) {
                Logger::error() << "Timed out waiting for the initial mesh pass";
                scheduler.shutdown();
                return 1;
            }
            Logger::info() << "Initial pass: " << consumer.meshes() << " meshes, " << consumer.quads()
                           << " quads, " << ticks << " ticks, " << stopwatch.elapsedMs() << " ms";

            // Dig a trench along the chunk borders to exercise neighbor remeshing
            int placed = 0;
            const int worldExtent = area * ChunkGeometry::SIZE;
            for (int i = 0; i < editCount; i++) {
                const int x = (i * 7) % worldExtent;
                const int z = ChunkGeometry::SIZE - ((i % 2 == 0) ? 1 : 0);
                const int y = LayeredTerrain::surfaceHeight(x, z);
                if (pipeline.removeBlock(glm::ivec3(x, y, z))) {
                    placed++;
                }
            }

            stopwatch.restart();
            const uint64_t meshesBefore = consumer.meshes();
            ticks = runUntilMeshed(pipeline, std::chrono::seconds(60));
            if (ticks < 0) {
                Logger::error() << "Timed out waiting for the edit pass";
                scheduler.shutdown();
                return 1;
            }

            PipelineCounters counters = pipeline.counters();
            Logger::info() << "Edit pass: " << placed << " edits queued, " << counters.editsApplied << " applied, "
                           << (consumer.meshes() - meshesBefore) << " remeshes, "
                           << counters.copyOnWriteClones << " copy-on-write clones, "
                           << stopwatch.elapsedMs() << " ms";
        }

        SchedulerCounters jobCounters = scheduler.counters();
        MeshTimingSnapshot timing = stats.snapshot();
        Logger::info() << "Jobs: " << jobCounters.submitted << " submitted, " << jobCounters.rejected
                       << " rejected, " << jobCounters.completed << " completed, " << jobCounters.canceled
                       << " canceled, " << jobCounters.failed << " failed";
        Logger::info() << "Average pre-mesh " << timing.averagePreMeshMs << " ms, mesh "
                       << timing.averageMeshMs << " ms (last " << timing.samples << " of "
                       << timing.totalRecorded << " jobs)";
        Logger::info() << "Transparent triangles: " << consumer.transparentTriangles();

        scheduler.shutdown();
    } catch (const std::exception& e) {
        Logger::error() << "Fatal: " << e.what();
        return 1;
    }

    return 0;
}
