/**
 * @file greedy_mesher.h
 * @brief Builds quad geometry for one chunk volume with greedy face merging
 *
 * Faces between a block and the cell it faces are emitted as follows:
 * - Opaque block: emitted when the facing cell is transparent, air, or
 *   NULL_ID (unloaded neighbor). Emitting a positive face also marks the
 *   facing cell's opposite face as done.
 * - Transparent block: emitted when the facing cell holds a different id, so
 *   water is culled against water but not against glass or stone.
 *
 * Adjacent faces with the same block and the same emit decision are merged:
 * first along the direction's first tangent axis, then whole rows along the
 * second tangent axis.
 *
 * The mesher itself is stateless and may be shared by worker threads; all
 * per-pass memory lives in MeshScratch and MeshData, which come from pools.
 */

#pragma once

#include <cstddef>
#include <vector>
#include <glm/glm.hpp>
#include "block_registry.h"
#include "cancellation.h"
#include "face_visit_mask.h"
#include "mesh_data.h"
#include "neighbor_resolver.h"
#include "voxel_types.h"

class VoxelVolume;

struct MeshingOptions {
    bool greedyExtension = true;   ///< False emits one quad per exposed cell face
};

enum class MeshStatus {
    COMPLETED,
    CANCELED,             ///< Output was cleared
    SKIPPED_UNIFORM_AIR,  ///< Nothing to mesh; output is empty
    INVALID_INPUT         ///< Volume or neighbor sizes unsupported
};

const char* meshStatusToString(MeshStatus status);

struct MeshResult {
    MeshStatus status = MeshStatus::COMPLETED;
    size_t cellsVisited = 0;   ///< Cells processed by the main loop
    size_t quads = 0;
    double preMeshMs = 0.0;    ///< Decompression and mask setup
    double meshMs = 0.0;       ///< Face traversal and emission
};

/**
 * @brief Reusable per-pass working memory
 */
struct MeshScratch {
    std::vector<BlockId> cells;   ///< Decompressed volume
    FaceVisitMask mask;

    /// Empties the scratch before it goes back to a pool
    void clear() {
        cells.clear();
        mask.reset(0);
    }
};

class GreedyMesher {
public:
    /// Largest volume edge the packed vertex format can address
    static constexpr int MAX_VOLUME_SIZE = 32;

    explicit GreedyMesher(const BlockRegistry& registry, MeshingOptions options = MeshingOptions());

    /**
     * @brief Meshes one volume
     *
     * @param volume Chunk contents (read only)
     * @param neighbors Face-adjacent volumes; absent ones read as NULL_ID
     * @param chunkOrigin World cell of the chunk's minimum corner, passed to UV rules
     * @param scratch Working memory, overwritten
     * @param out Receives the geometry; cleared first. Left empty unless COMPLETED
     * @param cancel Polled once per cell
     */
    MeshResult mesh(const VoxelVolume& volume, const NeighborSet& neighbors, const glm::ivec3& chunkOrigin,
                    MeshScratch& scratch, MeshData& out,
                    const CancellationToken& cancel = CancellationToken()) const;

    const MeshingOptions& options() const { return m_options; }

private:
    struct Pass;

    bool shouldEmit(const Pass& pass, const glm::ivec3& cell, BlockId id, bool transparent,
                    const FaceDescriptor& face) const;
    bool canMerge(const Pass& pass, const glm::ivec3& cell, BlockId id, bool transparent,
                  const FaceDescriptor& face) const;
    void coverCell(Pass& pass, const glm::ivec3& cell, bool transparent, const FaceDescriptor& face) const;
    void emitQuad(Pass& pass, const glm::ivec3& cell, BlockId id, bool transparent,
                  const FaceDescriptor& face, int width, int height) const;

    const BlockRegistry& m_registry;
    MeshingOptions m_options;
};
