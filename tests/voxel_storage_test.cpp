/**
 * @file voxel_storage_test.cpp
 * @brief Correctness tests for the sparse octree and the run-length layout
 *
 * Tests:
 * 1. Point reads/writes and uniform collapse
 * 2. Version bumps only on real mutations
 * 3. Leaf iff uniform after random edits
 * 4. Decompression order and cancellation
 * 5. Run-length encode/decode and byte form
 */

#include "test_utils.h"
#include "cancellation.h"
#include "run_length.h"
#include "voxel_volume.h"

#include <random>

namespace {

/**
 * @brief Checks that every leaf is uniform and no branch could collapse
 */
void verifyCanonicalTree(const VoxelVolume& volume) {
    std::vector<BlockId> cells;
    ASSERT_TRUE(volume.decompress(cells));
    const int size = volume.size();

    volume.visitNodes([&](const glm::ivec3& origin, int nodeSize, bool leaf, BlockId value) {
        BlockId first = cells[static_cast<size_t>(flattenIndex(origin, size))];
        bool uniform = true;
        for (int y = 0; y < nodeSize && uniform; y++) {
            for (int z = 0; z < nodeSize && uniform; z++) {
                for (int x = 0; x < nodeSize && uniform; x++) {
                    glm::ivec3 p = origin + glm::ivec3(x, y, z);
                    if (cells[static_cast<size_t>(flattenIndex(p, size))] != first) {
                        uniform = false;
                    }
                }
            }
        }

        if (leaf) {
            ASSERT_TRUE(uniform);
            ASSERT_EQ(value, first);
        } else {
            ASSERT_FALSE(uniform);
        }
    });
}

} // namespace

// ============================================================
// Test 1: Point Access
// ============================================================

TEST(VolumeStartsUniform) {
    VoxelVolume volume(8, 7);
    ASSERT_TRUE(volume.isUniform());
    ASSERT_EQ(volume.value(), 7);
    ASSERT_EQ(volume.get(3, 4, 5), 7);
    ASSERT_EQ(volume.nodeCount(), 1u);
    ASSERT_EQ(volume.cellCount(), 512);
}

TEST(VolumeRejectsNonPowerOfTwo) {
    ASSERT_THROWS(VoxelVolume(12), std::invalid_argument);
    ASSERT_THROWS(VoxelVolume(0), std::invalid_argument);
}

TEST(SetThenGetReturnsValue) {
    VoxelVolume volume(16);
    ASSERT_TRUE(volume.set(1, 2, 3, 5));
    ASSERT_TRUE(volume.set(15, 15, 15, 9));

    ASSERT_EQ(volume.get(1, 2, 3), 5);
    ASSERT_EQ(volume.get(15, 15, 15), 9);
    ASSERT_EQ(volume.get(0, 0, 0), BlockID::AIR);
    ASSERT_FALSE(volume.isUniform());
}

TEST(WritingBackOriginalValueCollapses) {
    VoxelVolume volume(32);
    volume.set(10, 20, 30, 4);
    ASSERT_GT(volume.nodeCount(), 1u);

    volume.set(10, 20, 30, BlockID::AIR);
    ASSERT_TRUE(volume.isUniform());
    ASSERT_EQ(volume.value(), BlockID::AIR);
    ASSERT_EQ(volume.nodeCount(), 1u);
}

TEST(FillingEveryCellCollapsesToRoot) {
    VoxelVolume volume(4);
    for (int y = 0; y < 4; y++) {
        for (int z = 0; z < 4; z++) {
            for (int x = 0; x < 4; x++) {
                volume.set(x, y, z, 3);
            }
        }
    }
    ASSERT_TRUE(volume.isUniform());
    ASSERT_EQ(volume.value(), 3);
    ASSERT_EQ(volume.nodeCount(), 1u);
}

// ============================================================
// Test 2: Versioning
// ============================================================

TEST(NoOpWriteKeepsVersion) {
    VoxelVolume volume(8);
    uint64_t initial = volume.version();

    ASSERT_FALSE(volume.set(2, 2, 2, BlockID::AIR));
    ASSERT_EQ(volume.version(), initial);
    ASSERT_EQ(volume.nodeCount(), 1u);

    ASSERT_TRUE(volume.set(2, 2, 2, 6));
    uint64_t afterWrite = volume.version();
    ASSERT_GT(afterWrite, initial);

    ASSERT_FALSE(volume.set(2, 2, 2, 6));
    ASSERT_EQ(volume.version(), afterWrite);
}

TEST(ResetReturnsToUniform) {
    VoxelVolume volume(8);
    volume.set(1, 1, 1, 2);
    volume.set(6, 6, 6, 3);
    volume.reset(BlockID::AIR);

    ASSERT_TRUE(volume.isUniform());
    ASSERT_EQ(volume.get(1, 1, 1), BlockID::AIR);
    ASSERT_EQ(volume.nodeCount(), 1u);
}

// ============================================================
// Test 3: Canonical Tree Under Random Edits
// ============================================================

TEST(LeafIffUniformUnderRandomEdits) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> coord(0, 7);
    std::uniform_int_distribution<int> value(0, 2);

    VoxelVolume volume(8);
    std::vector<BlockId> expected(512, BlockID::AIR);

    for (int round = 0; round < 20; round++) {
        for (int i = 0; i < 200; i++) {
            glm::ivec3 p(coord(rng), coord(rng), coord(rng));
            BlockId id = static_cast<BlockId>(value(rng));
            volume.set(p, id);
            expected[static_cast<size_t>(flattenIndex(p, 8))] = id;
        }
        verifyCanonicalTree(volume);

        std::vector<BlockId> cells;
        ASSERT_TRUE(volume.decompress(cells));
        ASSERT_TRUE(cells == expected);
    }
}

// ============================================================
// Test 4: Decompression
// ============================================================

TEST(DecompressUsesFlattenedOrder) {
    VoxelVolume volume(4);
    volume.set(1, 2, 3, 8);

    std::vector<BlockId> cells;
    ASSERT_TRUE(volume.decompress(cells));
    ASSERT_EQ(cells.size(), 64u);
    ASSERT_EQ(cells[static_cast<size_t>(1 + 3 * 4 + 2 * 16)], 8);

    int nonAir = 0;
    for (BlockId id : cells) {
        if (id != BlockID::AIR) {
            nonAir++;
        }
    }
    ASSERT_EQ(nonAir, 1);
}

TEST(DecompressStopsWhenCanceled) {
    VoxelVolume volume(8);
    volume.set(0, 0, 0, 1);

    CancellationSource source;
    source.requestCancel();
    CancellationToken token = source.token();

    std::vector<BlockId> cells;
    ASSERT_FALSE(volume.decompress(cells, &token));
}

TEST(CopyIsIndependent) {
    VoxelVolume original(8);
    original.set(4, 4, 4, 2);

    VoxelVolume copy = original;
    copy.set(4, 4, 4, 5);

    ASSERT_EQ(original.get(4, 4, 4), 2);
    ASSERT_EQ(copy.get(4, 4, 4), 5);
}

// ============================================================
// Test 5: Run-Length Layout
// ============================================================

TEST(UniformVolumeEncodesToSingleRun) {
    VoxelVolume volume(32, 3);
    std::vector<BlockRun> runs = encodeRuns(volume);
    ASSERT_EQ(runs.size(), 1u);
    ASSERT_EQ(runs[0].runLength, 32768);
    ASSERT_EQ(runs[0].value, 3);
}

TEST(RunsFollowFlattenedOrder) {
    VoxelVolume volume(4);
    volume.set(0, 0, 0, 2);
    volume.set(1, 0, 0, 2);
    volume.set(3, 3, 3, 5);

    std::vector<BlockRun> runs = encodeRuns(volume);
    ASSERT_EQ(runs.size(), 3u);
    ASSERT_TRUE((runs[0] == BlockRun{2, 2}));
    ASSERT_TRUE((runs[1] == BlockRun{61, BlockID::AIR}));
    ASSERT_TRUE((runs[2] == BlockRun{1, 5}));

    VoxelVolume decoded(4);
    ASSERT_TRUE(decodeRuns(runs, decoded));
    ASSERT_EQ(decoded.get(1, 0, 0), 2);
    ASSERT_EQ(decoded.get(3, 3, 3), 5);
    ASSERT_EQ(decoded.get(2, 0, 0), BlockID::AIR);
}

TEST(DecodeRejectsWrongTotal) {
    VoxelVolume volume(4);
    volume.set(0, 0, 0, 9);

    std::vector<BlockRun> runs = {{10, 1}, {10, 2}};
    ASSERT_FALSE(decodeRuns(runs, volume));
    ASSERT_TRUE(volume.isUniform());
    ASSERT_EQ(volume.value(), BlockID::AIR);

    std::vector<BlockRun> zeroLength = {{0, 1}, {64, 2}};
    ASSERT_FALSE(decodeRuns(zeroLength, volume));
}

TEST(DecodedVolumeIsCanonical) {
    VoxelVolume source(8);
    for (int y = 0; y < 4; y++) {
        for (int z = 0; z < 8; z++) {
            for (int x = 0; x < 8; x++) {
                source.set(x, y, z, 1);
            }
        }
    }
    source.set(5, 6, 7, 2);

    VoxelVolume decoded(8);
    ASSERT_TRUE(decodeRuns(encodeRuns(source), decoded));
    verifyCanonicalTree(decoded);
    ASSERT_EQ(decoded.nodeCount(), source.nodeCount());
    ASSERT_EQ(decoded.get(5, 6, 7), 2);
    ASSERT_EQ(decoded.get(0, 3, 0), 1);
}

TEST(RunBytesAreLittleEndian) {
    std::vector<BlockRun> runs = {{0x0102, 0x0304}};
    std::vector<uint8_t> bytes = serializeRuns(runs);
    ASSERT_EQ(bytes.size(), 4u);
    ASSERT_EQ(bytes[0], 0x02);
    ASSERT_EQ(bytes[1], 0x01);
    ASSERT_EQ(bytes[2], 0x04);
    ASSERT_EQ(bytes[3], 0x03);

    std::vector<BlockRun> parsed;
    ASSERT_TRUE(deserializeRuns(bytes, parsed));
    ASSERT_EQ(parsed.size(), 1u);
    ASSERT_TRUE(parsed[0] == runs[0]);

    bytes.push_back(0);
    ASSERT_FALSE(deserializeRuns(bytes, parsed));
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
