/**
 * @file block_registry.h
 * @brief Block properties consumed by the mesher, with a YAML-backed catalog
 *
 * The mesher only needs two answers per block id: is it transparent, and
 * which texture covers a given face. BlockRegistry is that interface;
 * BlockCatalog is the concrete registry loaded from YAML definitions.
 *
 * Example YAML:
 * @code
 * blocks:
 *   - name: stone
 *     texture: 1
 *   - name: grass
 *     texture: 3
 *     textures: {top: 2, bottom: 4}
 *   - name: water
 *     id: 9
 *     transparent: true
 *     texture: 7
 * @endcode
 */

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <glm/glm.hpp>
#include "direction.h"
#include "voxel_types.h"

namespace YAML {
class Node;
}

/**
 * @brief Texture coordinates for one emitted quad
 *
 * Corners follow the mesher's vertex order: origin, +width, +width+height,
 * +height. Coordinates are in tiles, so a 4x2 merged quad spans (0,0)-(4,2)
 * and a repeating texture tiles across it.
 */
struct UVQuad {
    uint16_t layer = 0;                   ///< Texture array layer / atlas cell
    std::array<glm::ivec2, 4> corners{};
};

/**
 * @brief Block properties needed while meshing
 *
 * Implementations must be safe for concurrent reads from worker threads.
 */
class BlockRegistry {
public:
    virtual ~BlockRegistry() = default;

    /**
     * @brief True if faces behind this block can be seen (air, glass, water)
     */
    virtual bool isTransparent(BlockId id) const = 0;

    /**
     * @brief Resolves the texture of one face
     *
     * @param id Block id
     * @param globalPosition World cell of the quad's origin
     * @param direction Face direction
     * @param tileScale Quad size in cells (width, height)
     * @param out Filled on success
     * @return False if no UV rule applies (the face is still emitted)
     */
    virtual bool getUV(BlockId id, const glm::ivec3& globalPosition, Direction direction,
                       const glm::ivec2& tileScale, UVQuad& out) const = 0;
};

/**
 * @brief Definition of one block type
 */
struct BlockDefinition {
    BlockId id = BlockID::NULL_ID;
    std::string name;
    bool transparent = false;

    /// Texture layer per face; empty optional = no texture for that face
    std::array<std::optional<uint16_t>, DIRECTION_COUNT> faceTextures{};

    /// Optional override evaluated per face and position
    std::function<std::optional<uint16_t>(const glm::ivec3&, Direction)> uvRule;
};

/**
 * @brief Registry of block definitions
 *
 * Air is always registered as id 0 (transparent, no texture). NULL_ID is
 * reserved and never assigned. Register all blocks before meshing starts;
 * after that the catalog is read-only and safe to share across workers.
 */
class BlockCatalog : public BlockRegistry {
public:
    using UVRule = std::function<std::optional<uint16_t>(const glm::ivec3&, Direction)>;

    BlockCatalog();

    /**
     * @brief Registers a block using the same texture on every face
     * @return Assigned id, or BlockID::NULL_ID if the name is taken or ids ran out
     */
    BlockId registerBlock(const std::string& name, bool transparent, std::optional<uint16_t> texture);

    /**
     * @brief Registers a block whose textures come from a rule
     */
    BlockId registerBlock(const std::string& name, bool transparent, UVRule rule);

    /**
     * @brief Loads definitions from YAML text
     *
     * Blocks with an explicit `id` are placed first; the rest receive ids
     * after the highest explicit one.
     *
     * @return False on a parse error; entries already loaded are kept
     */
    bool loadFromYamlString(const std::string& text);
    bool loadFromFile(const std::string& path);

    /// Id for a name, or BlockID::NULL_ID
    BlockId idOf(const std::string& name) const;

    /// Definition for an id, or null
    const BlockDefinition* find(BlockId id) const;

    size_t count() const { return m_nameToId.size(); }

    bool isTransparent(BlockId id) const override;
    bool getUV(BlockId id, const glm::ivec3& globalPosition, Direction direction,
               const glm::ivec2& tileScale, UVQuad& out) const override;

private:
    BlockId insert(BlockDefinition def);
    bool loadDocument(const YAML::Node& root);

    std::vector<BlockDefinition> m_defs;   ///< Indexed by id; gaps have NULL_ID
    std::unordered_map<std::string, BlockId> m_nameToId;
};
