#include <gtest/gtest.h>

#include "terrain/terrain_generator.h"

namespace {

terrain::TerrainGenerator makeGenerator(unsigned seed = 42u) {
    return terrain::TerrainGenerator(terrain::WorldgenProfile{}, seed);
}

} // namespace

TEST(TerrainGeneratorTest, GenerationIsDeterministic) {
    const terrain::TerrainGenerator a = makeGenerator();
    const terrain::TerrainGenerator b = makeGenerator();

    for (const glm::ivec3 coord : {glm::ivec3(0), glm::ivec3(-3, 0, 7), glm::ivec3(12, -1, -5), glm::ivec3(1, 1, 1)}) {
        EXPECT_EQ(a.generate(coord).blocks(), b.generate(coord).blocks());
        EXPECT_EQ(a.generate(coord).blocks(), a.generate(coord).blocks());
    }
}

TEST(TerrainGeneratorTest, DifferentSeedsProduceDifferentSurfaces) {
    const terrain::TerrainGenerator a = makeGenerator(1u);
    const terrain::TerrainGenerator b = makeGenerator(2u);

    bool anyDifference = false;
    for (int x = 0; x < 64 && !anyDifference; ++x) {
        anyDifference = a.surfaceHeight(x, x * 3) != b.surfaceHeight(x, x * 3);
    }
    EXPECT_TRUE(anyDifference);
}

TEST(TerrainGeneratorTest, BelowWorldFloorAndHighChunksAreAir) {
    const terrain::TerrainGenerator generator = makeGenerator();
    EXPECT_FALSE(generator.generate(glm::ivec3(0, -1, 0)).hasSolidBlocks());
    EXPECT_FALSE(generator.generate(glm::ivec3(4, 3, -2)).hasSolidBlocks());
    EXPECT_TRUE(generator.generate(glm::ivec3(0, 0, 0)).hasSolidBlocks());
}

TEST(TerrainGeneratorTest, ColumnsFollowGrassDirtStoneLayering) {
    const terrain::TerrainGenerator generator = makeGenerator();
    const terrain::WorldgenProfile& profile = generator.profile();
    const Chunk chunk = generator.generate(glm::ivec3(0));

    for (int z = 0; z < kChunkSizeZ; ++z) {
        for (int x = 0; x < kChunkSizeX; ++x) {
            const int height = generator.surfaceHeight(x, z);
            ASSERT_GE(height, 1);
            ASSERT_LE(height, profile.maxHeight);

            for (int y = 0; y < kChunkSizeY; ++y) {
                const BlockType block = chunk.blockAt(x, y, z);
                if (y >= height) {
                    EXPECT_EQ(block, BlockType::Air);
                } else if (y == height - 1) {
                    EXPECT_EQ(block, BlockType::Grass);
                } else if (y >= height - 1 - profile.dirtDepth) {
                    EXPECT_EQ(block, BlockType::Dirt);
                } else {
                    EXPECT_EQ(block, BlockType::Stone);
                }
            }
        }
    }
}

TEST(TerrainGeneratorTest, BlockForHeightHandlesWorldFloor) {
    const terrain::TerrainGenerator generator = makeGenerator();
    EXPECT_EQ(generator.blockForHeight(-1, 10), BlockType::Air);
    EXPECT_EQ(generator.blockForHeight(9, 10), BlockType::Grass);
    EXPECT_EQ(generator.blockForHeight(8, 10), BlockType::Dirt);
    EXPECT_EQ(generator.blockForHeight(6, 10), BlockType::Dirt);
    EXPECT_EQ(generator.blockForHeight(5, 10), BlockType::Stone);
    EXPECT_EQ(generator.blockForHeight(10, 10), BlockType::Air);
}
