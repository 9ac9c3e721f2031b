/**
 * @file greedy_mesher.cpp
 * @brief Greedy face merging over a decompressed chunk volume
 */

#include "greedy_mesher.h"
#include "mesh_stats.h"
#include "voxel_volume.h"

#include <cassert>

// State shared by the helpers during one mesh() call
struct GreedyMesher::Pass {
    int size;
    const std::vector<BlockId>& cells;
    FaceVisitMask& mask;
    const NeighborSet& neighbors;
    glm::ivec3 chunkOrigin;
    MeshData& out;
    size_t quads;
};

const char* meshStatusToString(MeshStatus status) {
    switch (status) {
        case MeshStatus::COMPLETED: return "completed";
        case MeshStatus::CANCELED: return "canceled";
        case MeshStatus::SKIPPED_UNIFORM_AIR: return "skipped (uniform air)";
        case MeshStatus::INVALID_INPUT: return "invalid input";
    }
    return "unknown";
}

GreedyMesher::GreedyMesher(const BlockRegistry& registry, MeshingOptions options)
    : m_registry(registry)
    , m_options(options) {
}

MeshResult GreedyMesher::mesh(const VoxelVolume& volume, const NeighborSet& neighbors, const glm::ivec3& chunkOrigin,
                              MeshScratch& scratch, MeshData& out, const CancellationToken& cancel) const {
    MeshResult result;
    out.clear();

    const int size = volume.size();
    bool validSizes = size <= MAX_VOLUME_SIZE;
    for (const VolumePtr& neighbor : neighbors.volumes) {
        if (neighbor && neighbor->size() != size) {
            validSizes = false;
        }
    }
    assert(validSizes && "volume and neighbors must share a supported size");
    if (!validSizes) {
        result.status = MeshStatus::INVALID_INPUT;
        return result;
    }

    // Uniform air has no faces at all
    if (volume.isUniform() && isAir(volume.value())) {
        result.status = MeshStatus::SKIPPED_UNIFORM_AIR;
        return result;
    }

    Stopwatch stopwatch;
    if (!volume.decompress(scratch.cells, &cancel)) {
        result.status = MeshStatus::CANCELED;
        return result;
    }
    scratch.mask.reset(volume.cellCount());
    result.preMeshMs = stopwatch.elapsedMs();
    stopwatch.restart();

    Pass pass{size, scratch.cells, scratch.mask, neighbors, chunkOrigin, out, 0};

    // y, z, x order walks the flattened array sequentially
    int index = 0;
    for (int y = 0; y < size; y++) {
        for (int z = 0; z < size; z++) {
            for (int x = 0; x < size; x++, index++) {
                if (cancel.isCancellationRequested()) {
                    out.clear();
                    result.status = MeshStatus::CANCELED;
                    return result;
                }
                ++result.cellsVisited;

                const BlockId id = pass.cells[static_cast<size_t>(index)];
                if (isAir(id)) {
                    continue;
                }

                const glm::ivec3 cell(x, y, z);
                const bool transparent = m_registry.isTransparent(id);

                for (const FaceDescriptor& face : FACE_DESCRIPTORS) {
                    if (pass.mask.isVisited(index, face.direction)) {
                        continue;
                    }
                    if (!shouldEmit(pass, cell, id, transparent, face)) {
                        continue;
                    }

                    coverCell(pass, cell, transparent, face);

                    int width = 1;
                    int height = 1;
                    if (m_options.greedyExtension) {
                        // Extend along the first tangent axis
                        glm::ivec3 next = cell;
                        next[face.tangentA] += 1;
                        while (next[face.tangentA] < size && canMerge(pass, next, id, transparent, face)) {
                            coverCell(pass, next, transparent, face);
                            ++width;
                            next[face.tangentA] += 1;
                        }

                        // Then add whole rows along the second tangent axis
                        while (cell[face.tangentB] + height < size) {
                            glm::ivec3 rowStart = cell;
                            rowStart[face.tangentB] += height;

                            bool rowMatches = true;
                            for (int i = 0; i < width && rowMatches; i++) {
                                glm::ivec3 probe = rowStart;
                                probe[face.tangentA] += i;
                                rowMatches = canMerge(pass, probe, id, transparent, face);
                            }
                            if (!rowMatches) {
                                break;
                            }

                            for (int i = 0; i < width; i++) {
                                glm::ivec3 probe = rowStart;
                                probe[face.tangentA] += i;
                                coverCell(pass, probe, transparent, face);
                            }
                            ++height;
                        }
                    }

                    emitQuad(pass, cell, id, transparent, face, width, height);
                }
            }
        }
    }

    result.quads = pass.quads;
    result.meshMs = stopwatch.elapsedMs();
    result.status = MeshStatus::COMPLETED;
    return result;
}

bool GreedyMesher::shouldEmit(const Pass& pass, const glm::ivec3& cell, BlockId id, bool transparent,
                              const FaceDescriptor& face) const {
    const glm::ivec3 facing = cell + face.normal;

    BlockId facingId;
    if (containsPoint(facing, pass.size)) {
        facingId = pass.cells[static_cast<size_t>(flattenIndex(facing, pass.size))];
    } else {
        facingId = pass.neighbors.blockAcross(face.direction, cell);
    }

    if (transparent) {
        return facingId != id;
    }
    return facingId == BlockID::NULL_ID || isAir(facingId) || m_registry.isTransparent(facingId);
}

bool GreedyMesher::canMerge(const Pass& pass, const glm::ivec3& cell, BlockId id, bool transparent,
                            const FaceDescriptor& face) const {
    const int index = flattenIndex(cell, pass.size);
    if (pass.mask.isVisited(index, face.direction)) {
        return false;
    }
    if (pass.cells[static_cast<size_t>(index)] != id) {
        return false;
    }
    return shouldEmit(pass, cell, id, transparent, face);
}

void GreedyMesher::coverCell(Pass& pass, const glm::ivec3& cell, bool transparent, const FaceDescriptor& face) const {
    pass.mask.markVisited(flattenIndex(cell, pass.size), face.direction);

    // The facing cell never needs its mirrored face
    if (!transparent && face.isPositive()) {
        const glm::ivec3 facing = cell + face.normal;
        if (containsPoint(facing, pass.size)) {
            pass.mask.markVisited(flattenIndex(facing, pass.size), face.inverse);
        }
    }
}

void GreedyMesher::emitQuad(Pass& pass, const glm::ivec3& cell, BlockId id, bool transparent,
                            const FaceDescriptor& face, int width, int height) const {
    // Corners lie on the face plane: origin, +width, +width+height, +height
    glm::ivec3 base = cell;
    if (face.isPositive()) {
        base[face.axis] += 1;
    }
    glm::ivec3 alongA(0);
    glm::ivec3 alongB(0);
    alongA[face.tangentA] = width;
    alongB[face.tangentB] = height;

    const glm::ivec3 corners[4] = {base, base + alongA, base + alongA + alongB, base + alongB};

    UVQuad uvQuad;
    const bool hasUV = m_registry.getUV(id, pass.chunkOrigin + cell, face.direction, glm::ivec2(width, height), uvQuad);

    const uint32_t first = static_cast<uint32_t>(pass.out.vertices.size());
    for (int i = 0; i < 4; i++) {
        pass.out.vertices.push_back(PackedVertex::pack(corners[i], face.direction));
        pass.out.uvs.push_back(hasUV ? PackedUV::pack(uvQuad.corners[i], uvQuad.layer) : PackedUV::NONE);
    }

    // Tangent A x tangent B points along +axis, so negative faces flip winding
    std::vector<uint32_t>& indices = transparent ? pass.out.transparentIndices : pass.out.opaqueIndices;
    if (face.isPositive()) {
        indices.insert(indices.end(), {first, first + 1, first + 2, first, first + 2, first + 3});
    } else {
        indices.insert(indices.end(), {first, first + 2, first + 1, first, first + 3, first + 2});
    }
    ++pass.quads;
}
