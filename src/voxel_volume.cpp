/**
 * @file voxel_volume.cpp
 * @brief Arena-backed octree with split-on-write and bottom-up collapse
 */

#include "voxel_volume.h"
#include "cancellation.h"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>

namespace {

// Octant bits: x -> 1, z -> 2, y -> 4
inline int octantOf(const glm::ivec3& local, int half) {
    int octant = 0;
    if (local.x >= half) octant += 1;
    if (local.z >= half) octant += 2;
    if (local.y >= half) octant += 4;
    return octant;
}

inline glm::ivec3 octantOffset(int octant, int half) {
    return glm::ivec3((octant & 1) ? half : 0,
                      (octant & 4) ? half : 0,
                      (octant & 2) ? half : 0);
}

} // namespace

VoxelVolume::VoxelVolume(int size, BlockId initialValue)
    : m_size(size)
{
    if (size <= 0 || (size & (size - 1)) != 0) {
        throw std::invalid_argument("VoxelVolume size must be a power of two, got " + std::to_string(size));
    }

    m_nodes.push_back(Node{initialValue, NO_CHILDREN});
}

BlockId VoxelVolume::get(const glm::ivec3& point) const {
    assert(containsPoint(point, m_size) && "VoxelVolume::get point out of bounds");
    if (!containsPoint(point, m_size)) {
        return BlockID::NULL_ID;
    }

    uint32_t node = ROOT;
    glm::ivec3 local = point;
    int size = m_size;

    while (!isLeaf(node)) {
        int half = size / 2;
        int octant = octantOf(local, half);
        local -= octantOffset(octant, half);
        node = m_nodes[node].firstChild + static_cast<uint32_t>(octant);
        size = half;
    }

    return m_nodes[node].value;
}

bool VoxelVolume::set(const glm::ivec3& point, BlockId id) {
    assert(containsPoint(point, m_size) && "VoxelVolume::set point out of bounds");
    if (!containsPoint(point, m_size)) {
        return false;
    }

    uint32_t path[MAX_DEPTH];
    int depth = 0;

    uint32_t node = ROOT;
    glm::ivec3 local = point;
    int size = m_size;

    while (true) {
        if (isLeaf(node) && m_nodes[node].value == id) {
            // Uniform subtree already holds the id; nothing to do
            return false;
        }

        if (size == 1) {
            m_nodes[node].value = id;
            break;
        }

        if (isLeaf(node)) {
            // allocateChildren may grow the arena, so index rather than hold a reference
            uint32_t children = allocateChildren(m_nodes[node].value);
            m_nodes[node].firstChild = children;
        }

        path[depth++] = node;

        int half = size / 2;
        int octant = octantOf(local, half);
        local -= octantOffset(octant, half);
        node = m_nodes[node].firstChild + static_cast<uint32_t>(octant);
        size = half;
    }

    // Unwind: a parent can only collapse if the child below it just did
    for (int i = depth - 1; i >= 0; --i) {
        if (!tryCollapse(path[i])) {
            break;
        }
    }

    ++m_version;
    return true;
}

void VoxelVolume::reset(BlockId value) {
    m_nodes.clear();
    m_freeBlocks.clear();
    m_nodes.push_back(Node{value, NO_CHILDREN});
    ++m_version;
}

bool VoxelVolume::decompress(std::vector<BlockId>& out, const CancellationToken* cancel) const {
    out.resize(static_cast<size_t>(cellCount()));
    return fillRegion(ROOT, glm::ivec3(0), m_size, out, cancel);
}

void VoxelVolume::visitNodes(const std::function<void(const glm::ivec3&, int, bool, BlockId)>& visitor) const {
    struct Pending {
        uint32_t node;
        glm::ivec3 origin;
        int size;
    };

    std::vector<Pending> stack;
    stack.push_back({ROOT, glm::ivec3(0), m_size});

    while (!stack.empty()) {
        Pending current = stack.back();
        stack.pop_back();

        bool leaf = isLeaf(current.node);
        visitor(current.origin, current.size, leaf, leaf ? m_nodes[current.node].value : BlockID::NULL_ID);

        if (!leaf) {
            int half = current.size / 2;
            for (int octant = 7; octant >= 0; --octant) {
                stack.push_back({m_nodes[current.node].firstChild + static_cast<uint32_t>(octant),
                                 current.origin + octantOffset(octant, half), half});
            }
        }
    }
}

uint32_t VoxelVolume::allocateChildren(BlockId value) {
    uint32_t first;
    if (!m_freeBlocks.empty()) {
        first = m_freeBlocks.back();
        m_freeBlocks.pop_back();
    } else {
        first = static_cast<uint32_t>(m_nodes.size());
        m_nodes.resize(m_nodes.size() + 8);
    }

    for (uint32_t i = 0; i < 8; ++i) {
        m_nodes[first + i] = Node{value, NO_CHILDREN};
    }
    return first;
}

void VoxelVolume::releaseChildren(uint32_t firstChild) {
    m_freeBlocks.push_back(firstChild);
}

bool VoxelVolume::tryCollapse(uint32_t node) {
    uint32_t first = m_nodes[node].firstChild;
    if (first == NO_CHILDREN) {
        return false;
    }

    BlockId firstValue = m_nodes[first].value;
    for (uint32_t i = 0; i < 8; ++i) {
        const Node& child = m_nodes[first + i];
        if (child.firstChild != NO_CHILDREN || child.value != firstValue) {
            return false;
        }
    }

    m_nodes[node].value = firstValue;
    m_nodes[node].firstChild = NO_CHILDREN;
    releaseChildren(first);
    return true;
}

bool VoxelVolume::fillRegion(uint32_t node, const glm::ivec3& origin, int size,
                             std::vector<BlockId>& out, const CancellationToken* cancel) const {
    if (cancel && cancel->isCancellationRequested()) {
        return false;
    }

    if (isLeaf(node)) {
        BlockId value = m_nodes[node].value;
        for (int y = origin.y; y < origin.y + size; ++y) {
            for (int z = origin.z; z < origin.z + size; ++z) {
                auto rowStart = out.begin() + flattenIndex(origin.x, y, z, m_size);
                std::fill(rowStart, rowStart + size, value);
            }
        }
        return true;
    }

    int half = size / 2;
    uint32_t first = m_nodes[node].firstChild;
    for (int octant = 0; octant < 8; ++octant) {
        if (!fillRegion(first + static_cast<uint32_t>(octant), origin + octantOffset(octant, half), half, out, cancel)) {
            return false;
        }
    }
    return true;
}
