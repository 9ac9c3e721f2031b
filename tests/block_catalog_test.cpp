/**
 * @file block_catalog_test.cpp
 * @brief Tests for block registration and YAML block definitions
 *
 * Tests:
 * 1. Built-in air and programmatic registration
 * 2. YAML id assignment (explicit first, then auto)
 * 3. Per-face textures
 * 4. Malformed input
 */

#include "test_utils.h"
#include "block_registry.h"

#include <cstdio>
#include <fstream>

namespace {

uint16_t layerOf(const BlockCatalog& catalog, BlockId id, Direction direction) {
    UVQuad quad;
    if (!catalog.getUV(id, glm::ivec3(0), direction, glm::ivec2(1, 1), quad)) {
        throw std::runtime_error(std::string("no texture for face ") + directionToString(direction));
    }
    return quad.layer;
}

} // namespace

// ============================================================
// Test 1: Registration
// ============================================================

TEST(AirIsAlwaysRegistered) {
    BlockCatalog catalog;
    ASSERT_EQ(catalog.count(), 1u);
    ASSERT_EQ(catalog.idOf("air"), BlockID::AIR);
    ASSERT_TRUE(catalog.isTransparent(BlockID::AIR));

    UVQuad quad;
    ASSERT_FALSE(catalog.getUV(BlockID::AIR, glm::ivec3(0), Direction::POS_Y, glm::ivec2(1, 1), quad));
}

TEST(RegisterAssignsSequentialIds) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;

    BlockId stone = catalog.registerBlock("stone", false, std::optional<uint16_t>(1));
    BlockId glass = catalog.registerBlock("glass", true, std::optional<uint16_t>(2));
    ASSERT_EQ(stone, 1);
    ASSERT_EQ(glass, 2);
    ASSERT_FALSE(catalog.isTransparent(stone));
    ASSERT_TRUE(catalog.isTransparent(glass));

    ASSERT_EQ(catalog.registerBlock("stone", true, std::optional<uint16_t>(3)), BlockID::NULL_ID);
    ASSERT_EQ(capture.count(LogLevel::WARNING, "Duplicate"), 1u);
    ASSERT_FALSE(catalog.isTransparent(stone));
}

TEST(UnknownIdsAreOpaqueWithoutTexture) {
    BlockCatalog catalog;
    UVQuad quad;
    ASSERT_FALSE(catalog.isTransparent(BlockID::NULL_ID));
    ASSERT_FALSE(catalog.isTransparent(42));
    ASSERT_FALSE(catalog.getUV(42, glm::ivec3(0), Direction::POS_X, glm::ivec2(1, 1), quad));
    ASSERT_NULL(catalog.find(42));
}

TEST(UVCornersScaleWithQuadSize) {
    BlockCatalog catalog;
    BlockId stone = catalog.registerBlock("stone", false, std::optional<uint16_t>(6));

    UVQuad quad;
    ASSERT_TRUE(catalog.getUV(stone, glm::ivec3(5, 5, 5), Direction::NEG_Z, glm::ivec2(4, 2), quad));
    ASSERT_EQ(quad.layer, 6);
    ASSERT_TRUE(quad.corners[0] == glm::ivec2(0, 0));
    ASSERT_TRUE(quad.corners[1] == glm::ivec2(4, 0));
    ASSERT_TRUE(quad.corners[2] == glm::ivec2(4, 2));
    ASSERT_TRUE(quad.corners[3] == glm::ivec2(0, 2));
}

// ============================================================
// Test 2: YAML Id Assignment
// ============================================================

TEST(ExplicitIdsComeFirst) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    ASSERT_TRUE(catalog.loadFromYamlString(R"(
blocks:
  - name: stone
    texture: 1
  - name: water
    id: 9
    transparent: true
    texture: 7
  - name: dirt
    texture: 2
)"));

    ASSERT_EQ(catalog.count(), 4u);
    ASSERT_EQ(catalog.idOf("water"), 9);
    ASSERT_EQ(catalog.idOf("stone"), 10);
    ASSERT_EQ(catalog.idOf("dirt"), 11);
    ASSERT_TRUE(catalog.isTransparent(9));
    ASSERT_NULL(catalog.find(5));
}

TEST(SingleBlockDocumentsAreAccepted) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    ASSERT_TRUE(catalog.loadFromYamlString(R"(
name: glass
transparent: true
texture: 3
---
name: sand
texture: 4
)"));

    ASSERT_EQ(catalog.count(), 3u);
    ASSERT_EQ(catalog.idOf("glass"), 1);
    ASSERT_EQ(catalog.idOf("sand"), 2);
    ASSERT_TRUE(catalog.isTransparent(catalog.idOf("glass")));
    ASSERT_EQ(catalog.find(catalog.idOf("sand"))->name, "sand");
}

TEST(LaterLoadsContinueAfterExistingIds) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    catalog.registerBlock("stone", false, std::optional<uint16_t>(1));
    catalog.registerBlock("dirt", false, std::optional<uint16_t>(2));

    ASSERT_TRUE(catalog.loadFromYamlString("name: gravel\ntexture: 5\n"));
    ASSERT_EQ(catalog.idOf("gravel"), 3);
}

// ============================================================
// Test 3: Face Textures
// ============================================================

TEST(FaceNamesMapToDirections) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    ASSERT_TRUE(catalog.loadFromYamlString(R"(
blocks:
  - name: grass
    texture: 3
    textures: {top: 2, bottom: 4, sides: 5, front: 6}
)"));

    BlockId grass = catalog.idOf("grass");
    ASSERT_EQ(layerOf(catalog, grass, Direction::POS_Y), 2);
    ASSERT_EQ(layerOf(catalog, grass, Direction::NEG_Y), 4);
    ASSERT_EQ(layerOf(catalog, grass, Direction::POS_X), 5);
    ASSERT_EQ(layerOf(catalog, grass, Direction::NEG_X), 5);
    ASSERT_EQ(layerOf(catalog, grass, Direction::POS_Z), 5);
    ASSERT_EQ(layerOf(catalog, grass, Direction::NEG_Z), 6);
}

TEST(TextureDefaultsToEveryFace) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    ASSERT_TRUE(catalog.loadFromYamlString("name: log\ntexture: 8\ntextures: {top: 9}\n"));

    BlockId log = catalog.idOf("log");
    ASSERT_EQ(layerOf(catalog, log, Direction::POS_Y), 9);
    ASSERT_EQ(layerOf(catalog, log, Direction::NEG_Y), 8);
    ASSERT_EQ(layerOf(catalog, log, Direction::POS_X), 8);
}

TEST(BlockWithoutTextureHasNoUV) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    ASSERT_TRUE(catalog.loadFromYamlString("name: barrier\n"));

    UVQuad quad;
    ASSERT_FALSE(catalog.getUV(catalog.idOf("barrier"), glm::ivec3(0), Direction::POS_Y, glm::ivec2(1, 1), quad));
}

// ============================================================
// Test 4: Malformed Input
// ============================================================

TEST(ParseErrorKeepsExistingBlocks) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    catalog.registerBlock("stone", false, std::optional<uint16_t>(1));

    ASSERT_FALSE(catalog.loadFromYamlString("blocks: [ {name: broken"));
    ASSERT_EQ(catalog.count(), 2u);
    ASSERT_GE(capture.count(LogLevel::WARNING, "parsing"), 1u);
}

TEST(InvalidEntriesAreSkipped) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    bool ok = catalog.loadFromYamlString(R"(
blocks:
  - texture: 1
  - name: reserved
    id: 0
  - name: stone
    id: 3
  - name: copy
    id: 3
  - name: dirt
)");

    ASSERT_FALSE(ok);
    ASSERT_EQ(catalog.idOf("reserved"), BlockID::NULL_ID);
    ASSERT_EQ(catalog.idOf("copy"), BlockID::NULL_ID);
    ASSERT_EQ(catalog.idOf("stone"), 3);
    ASSERT_EQ(catalog.idOf("dirt"), 4);
}

TEST(BlocksKeyMustBeSequence) {
    LogCapture capture(LogLevel::WARNING);
    BlockCatalog catalog;
    ASSERT_FALSE(catalog.loadFromYamlString("blocks: stone\n"));
    ASSERT_EQ(catalog.count(), 1u);
}

TEST(LoadsFromFile) {
    LogCapture capture(LogLevel::WARNING);
    const std::string path = "block_catalog_test_blocks.yaml";
    {
        std::ofstream out(path);
        out << "blocks:\n  - name: stone\n    texture: 1\n  - name: leaves\n    transparent: true\n";
    }

    BlockCatalog catalog;
    ASSERT_TRUE(catalog.loadFromFile(path));
    std::remove(path.c_str());

    ASSERT_EQ(catalog.idOf("stone"), 1);
    ASSERT_TRUE(catalog.isTransparent(catalog.idOf("leaves")));

    BlockCatalog missing;
    ASSERT_FALSE(missing.loadFromFile("does_not_exist.yaml"));
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
