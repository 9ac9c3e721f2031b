/**
 * @file voxel_volume.h
 * @brief Sparse octree storing one block id per cell of a cubic chunk
 *
 * Nodes live in a flat arena and refer to their children by index. A branch
 * owns a contiguous block of 8 children; octant bits are x = 1, z = 2, y = 4
 * relative to the node's center.
 *
 * Invariant: a node is a leaf iff every cell in its sub-volume holds the same
 * id. set() splits leaves on the way down and collapses branches whose eight
 * children are equal leaves on the way back up, so sparse edits never leave
 * redundant branches behind.
 *
 * Thread safety: none. A volume is owned by the job currently mutating it;
 * meshing jobs only read neighbor volumes (see ChunkPipeline copy-on-write).
 */

#pragma once

#include <cstdint>
#include <functional>
#include <vector>
#include <glm/glm.hpp>
#include "voxel_types.h"

class CancellationToken;

class VoxelVolume {
public:
    /**
     * @brief Creates a uniform volume
     *
     * @param size Edge length in cells, must be a power of two
     * @param initialValue Id held by every cell
     * @throws std::invalid_argument if size is not a positive power of two
     */
    explicit VoxelVolume(int size = ChunkGeometry::SIZE, BlockId initialValue = BlockID::AIR);

    VoxelVolume(const VoxelVolume&) = default;
    VoxelVolume& operator=(const VoxelVolume&) = default;
    VoxelVolume(VoxelVolume&&) noexcept = default;
    VoxelVolume& operator=(VoxelVolume&&) noexcept = default;

    // ========== Point Access ==========

    /**
     * @brief Reads the id at a local point
     *
     * Out-of-range points assert in debug builds and return BlockID::NULL_ID
     * in release builds.
     */
    BlockId get(const glm::ivec3& point) const;
    BlockId get(int x, int y, int z) const { return get(glm::ivec3(x, y, z)); }

    /**
     * @brief Writes an id at a local point
     *
     * Writing the value a uniform subtree already holds is a no-op and does
     * not allocate. Out-of-range points assert in debug builds and are
     * ignored in release builds.
     *
     * @return True if the tree was mutated
     */
    bool set(const glm::ivec3& point, BlockId id);
    bool set(int x, int y, int z, BlockId id) { return set(glm::ivec3(x, y, z), id); }

    // ========== Whole-Volume Queries ==========

    /// True if every cell holds the same id (root is a leaf)
    bool isUniform() const { return m_nodes[ROOT].firstChild == NO_CHILDREN; }

    /// Root value; meaningful when isUniform() is true
    BlockId value() const { return m_nodes[ROOT].value; }

    int size() const { return m_size; }
    int cellCount() const { return m_size * m_size * m_size; }

    /// Number of live nodes (leaves and branches)
    size_t nodeCount() const { return m_nodes.size() - m_freeBlocks.size() * 8; }

    /// Incremented on every mutation; unchanged by no-op writes
    uint64_t version() const { return m_version; }

    /**
     * @brief Makes the volume uniform again, keeping arena capacity
     *
     * Used when a volume is returned to a pool and reused for another chunk.
     */
    void reset(BlockId value);

    /**
     * @brief Expands the tree into a flat array of size() cubed ids
     *
     * Indexing follows flattenIndex(). Uniform leaves are written as blocks.
     *
     * @param out Resized to cellCount()
     * @param cancel Polled once per leaf; may be null
     * @return False if canceled before completion (out is then incomplete)
     */
    bool decompress(std::vector<BlockId>& out, const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Visits every live node depth-first
     *
     * The visitor receives the node's minimum corner, edge length, whether it
     * is a leaf, and its value (leaves only).
     */
    void visitNodes(const std::function<void(const glm::ivec3& origin, int size, bool leaf, BlockId value)>& visitor) const;

private:
    static constexpr uint32_t ROOT = 0;
    static constexpr uint32_t NO_CHILDREN = 0xFFFFFFFFu;
    static constexpr int MAX_DEPTH = 32;

    struct Node {
        BlockId value;
        uint32_t firstChild;   ///< Index of 8 contiguous children, or NO_CHILDREN
    };

    bool isLeaf(uint32_t node) const { return m_nodes[node].firstChild == NO_CHILDREN; }

    uint32_t allocateChildren(BlockId value);
    void releaseChildren(uint32_t firstChild);
    bool tryCollapse(uint32_t node);

    bool fillRegion(uint32_t node, const glm::ivec3& origin, int size,
                    std::vector<BlockId>& out, const CancellationToken* cancel) const;

    int m_size;
    std::vector<Node> m_nodes;
    std::vector<uint32_t> m_freeBlocks;   ///< Reusable child blocks
    uint64_t m_version = 0;
};
