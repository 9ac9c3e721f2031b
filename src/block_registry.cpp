/**
 * @file block_registry.cpp
 * @brief BlockCatalog implementation
 *
 * Loading follows two passes: blocks with an explicit `id` are placed first,
 * then the remaining blocks are auto-assigned ids starting after the highest
 * explicit one.
 */

#include "block_registry.h"
#include "logger.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace {

const char* LOG_CHANNEL = "BlockCatalog";

// Face names used in block definitions, mapped to Direction
struct FaceName {
    const char* name;
    Direction direction;
};

const FaceName FACE_NAMES[] = {
    {"right", Direction::POS_X},
    {"top", Direction::POS_Y},
    {"back", Direction::POS_Z},
    {"left", Direction::NEG_X},
    {"bottom", Direction::NEG_Y},
    {"front", Direction::NEG_Z},
};

bool isHorizontal(Direction direction) {
    return faceDescriptor(direction).axis != 1;
}

/**
 * @brief Builds a definition from one YAML block node (id not assigned)
 */
BlockDefinition parseDefinition(const YAML::Node& node) {
    BlockDefinition def;
    def.name = node["name"].as<std::string>();

    if (node["transparent"]) {
        def.transparent = node["transparent"].as<bool>();
    }

    if (node["texture"]) {
        uint16_t layer = node["texture"].as<uint16_t>();
        def.faceTextures.fill(layer);
    }

    YAML::Node textures = node["textures"];
    if (textures && textures.IsMap()) {
        if (textures["sides"]) {
            uint16_t layer = textures["sides"].as<uint16_t>();
            for (const FaceName& face : FACE_NAMES) {
                if (isHorizontal(face.direction)) {
                    def.faceTextures[directionIndex(face.direction)] = layer;
                }
            }
        }
        for (const FaceName& face : FACE_NAMES) {
            if (textures[face.name]) {
                def.faceTextures[directionIndex(face.direction)] = textures[face.name].as<uint16_t>();
            }
        }
    }
    return def;
}

} // namespace

BlockCatalog::BlockCatalog() {
    BlockDefinition air;
    air.id = BlockID::AIR;
    air.name = "air";
    air.transparent = true;
    insert(std::move(air));
}

BlockId BlockCatalog::registerBlock(const std::string& name, bool transparent, std::optional<uint16_t> texture) {
    BlockDefinition def;
    def.name = name;
    def.transparent = transparent;
    def.faceTextures.fill(texture);
    return insert(std::move(def));
}

BlockId BlockCatalog::registerBlock(const std::string& name, bool transparent, UVRule rule) {
    BlockDefinition def;
    def.name = name;
    def.transparent = transparent;
    def.uvRule = std::move(rule);
    return insert(std::move(def));
}

BlockId BlockCatalog::insert(BlockDefinition def) {
    if (m_nameToId.count(def.name)) {
        Logger::warning(LOG_CHANNEL) << "Duplicate block name '" << def.name << "'; skipping";
        return BlockID::NULL_ID;
    }

    // Auto-assign the next free id
    if (def.id == BlockID::NULL_ID) {
        def.id = static_cast<BlockId>(m_defs.size());
    }
    if (def.id == BlockID::NULL_ID) {
        Logger::error(LOG_CHANNEL) << "Block id space exhausted; cannot register '" << def.name << "'";
        return BlockID::NULL_ID;
    }

    if (def.id < m_defs.size() && m_defs[def.id].id != BlockID::NULL_ID) {
        Logger::warning(LOG_CHANNEL) << "Block id " << def.id << " already used by '"
                                     << m_defs[def.id].name << "'; skipping '" << def.name << "'";
        return BlockID::NULL_ID;
    }

    if (def.id >= m_defs.size()) {
        m_defs.resize(static_cast<size_t>(def.id) + 1);
    }

    const BlockId id = def.id;
    m_nameToId[def.name] = id;
    Logger::debug(LOG_CHANNEL) << "Registered block: " << def.name << " (ID " << id << ")";
    m_defs[id] = std::move(def);
    return id;
}

bool BlockCatalog::loadFromYamlString(const std::string& text) {
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAll(text);
    } catch (const YAML::Exception& e) {
        Logger::warning(LOG_CHANNEL) << "Error parsing block YAML: " << e.what();
        return false;
    }

    bool ok = true;
    for (const YAML::Node& doc : documents) {
        ok = loadDocument(doc) && ok;
    }
    return ok;
}

bool BlockCatalog::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warning(LOG_CHANNEL) << "Could not open block file: " << path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Logger::info(LOG_CHANNEL) << "Loading blocks from " << path;
    return loadFromYamlString(buffer.str());
}

bool BlockCatalog::loadDocument(const YAML::Node& root) {
    // Either a single block or a `blocks:` sequence
    std::vector<YAML::Node> nodes;
    if (root.IsMap() && root["blocks"]) {
        YAML::Node blocks = root["blocks"];
        if (!blocks.IsSequence()) {
            Logger::warning(LOG_CHANNEL) << "'blocks' must be a sequence";
            return false;
        }
        for (const YAML::Node& node : blocks) {
            nodes.push_back(node);
        }
    } else if (root.IsMap()) {
        nodes.push_back(root);
    } else if (root.IsNull()) {
        return true;
    } else {
        Logger::warning(LOG_CHANNEL) << "Block document is neither a map nor a 'blocks' list";
        return false;
    }

    std::vector<BlockDefinition> pending;
    int highestExplicitId = static_cast<int>(m_defs.size()) - 1;
    bool ok = true;

    // PASS 1: explicit ids
    for (const YAML::Node& node : nodes) {
        if (!node.IsMap() || !node["name"]) {
            Logger::warning(LOG_CHANNEL) << "Block entry missing 'name'";
            ok = false;
            continue;
        }

        try {
            BlockDefinition def = parseDefinition(node);
            if (!node["id"]) {
                pending.push_back(std::move(def));
                continue;
            }

            int id = node["id"].as<int>();
            if (id <= BlockID::AIR || id >= BlockID::NULL_ID) {
                Logger::warning(LOG_CHANNEL) << "Block '" << def.name << "' has reserved or invalid id " << id;
                ok = false;
                continue;
            }
            def.id = static_cast<BlockId>(id);
            if (insert(std::move(def)) == BlockID::NULL_ID) {
                ok = false;
                continue;
            }
            highestExplicitId = std::max(highestExplicitId, id);
        } catch (const YAML::Exception& e) {
            Logger::warning(LOG_CHANNEL) << "Invalid block entry: " << e.what();
            ok = false;
        }
    }

    // PASS 2: auto-assigned ids after the highest explicit one
    int nextId = highestExplicitId + 1;
    for (BlockDefinition& def : pending) {
        if (nextId >= BlockID::NULL_ID) {
            Logger::error(LOG_CHANNEL) << "Block id space exhausted; cannot register '" << def.name << "'";
            ok = false;
            continue;
        }
        def.id = static_cast<BlockId>(nextId);
        if (insert(std::move(def)) == BlockID::NULL_ID) {
            ok = false;
            continue;
        }
        ++nextId;
    }

    Logger::info(LOG_CHANNEL) << "Catalog holds " << count() << " blocks";
    return ok;
}

BlockId BlockCatalog::idOf(const std::string& name) const {
    auto it = m_nameToId.find(name);
    return (it != m_nameToId.end()) ? it->second : BlockID::NULL_ID;
}

const BlockDefinition* BlockCatalog::find(BlockId id) const {
    if (id >= m_defs.size() || m_defs[id].id == BlockID::NULL_ID) {
        return nullptr;
    }
    return &m_defs[id];
}

bool BlockCatalog::isTransparent(BlockId id) const {
    const BlockDefinition* def = find(id);
    return def && def->transparent;
}

bool BlockCatalog::getUV(BlockId id, const glm::ivec3& globalPosition, Direction direction,
                         const glm::ivec2& tileScale, UVQuad& out) const {
    const BlockDefinition* def = find(id);
    if (!def) {
        return false;
    }

    std::optional<uint16_t> layer = def->uvRule ? def->uvRule(globalPosition, direction)
                                                : def->faceTextures[directionIndex(direction)];
    if (!layer) {
        return false;
    }

    // Tile coordinates so the texture repeats once per cell
    out.layer = *layer;
    out.corners[0] = glm::ivec2(0, 0);
    out.corners[1] = glm::ivec2(tileScale.x, 0);
    out.corners[2] = glm::ivec2(tileScale.x, tileScale.y);
    out.corners[3] = glm::ivec2(0, tileScale.y);
    return true;
}
