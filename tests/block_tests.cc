#include <gtest/gtest.h>

#include "block.h"
#include "chunk.h"

namespace {

void ExpectNear(const glm::vec3& lhs, const glm::vec3& rhs) {
    EXPECT_NEAR(lhs.x, rhs.x, 1e-5f);
    EXPECT_NEAR(lhs.y, rhs.y, 1e-5f);
    EXPECT_NEAR(lhs.z, rhs.z, 1e-5f);
}

} // namespace

TEST(BlockTest, OnlyAirIsNotSolid) {
    EXPECT_FALSE(isSolid(BlockType::Air));
    EXPECT_TRUE(isSolid(BlockType::Grass));
    EXPECT_TRUE(isSolid(BlockType::Dirt));
    EXPECT_TRUE(isSolid(BlockType::Stone));
}

TEST(BlockTest, FaceTransformPlacesQuadCentreHalfUnitAlongNormal) {
    for (Face face : kAllFaces) {
        const glm::mat4 transform = faceTransform(face);
        const glm::vec3 normal(faceOffset(face));

        const glm::vec4 centre = transform * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
        ExpectNear(glm::vec3(centre), normal * 0.5f);

        // The quad's local +Z normal must end up on the face normal.
        const glm::vec4 rotatedNormal = transform * glm::vec4(0.0f, 0.0f, 1.0f, 0.0f);
        ExpectNear(glm::vec3(rotatedNormal), normal);
    }
}

TEST(BlockTest, SideFacesExcludeTopAndBottom) {
    EXPECT_TRUE(isSideFace(Face::Front));
    EXPECT_TRUE(isSideFace(Face::Back));
    EXPECT_TRUE(isSideFace(Face::Left));
    EXPECT_TRUE(isSideFace(Face::Right));
    EXPECT_FALSE(isSideFace(Face::Top));
    EXPECT_FALSE(isSideFace(Face::Bottom));
}

TEST(ChunkCoordTest, NegativeWorldPositionsFloorIntoLowerChunks) {
    EXPECT_EQ(worldToChunkCoord(glm::ivec3(-1, 0, 16)), glm::ivec3(-1, 0, 1));
    EXPECT_EQ(worldToChunkCoord(glm::ivec3(-16, -17, 15)), glm::ivec3(-1, -2, 0));
    EXPECT_EQ(worldToChunkCoord(glm::vec3(-0.5f, 0.2f, 31.9f)), glm::ivec3(-1, 0, 1));
    EXPECT_EQ(worldToLocalCoord(glm::ivec3(-1, 17, -16)), glm::ivec3(15, 1, 0));
}

TEST(ChunkTest, StartsEmptyAndTracksSolidBlocks) {
    Chunk chunk(glm::ivec3(2, 0, -3));
    EXPECT_FALSE(chunk.hasSolidBlocks());
    EXPECT_EQ(chunk.origin(), glm::ivec3(32, 0, -48));

    chunk.setBlock(1, 2, 3, BlockType::Stone);
    EXPECT_TRUE(chunk.hasSolidBlocks());
    EXPECT_EQ(chunk.solidBlockCount(), 1u);
    EXPECT_EQ(chunk.blockAt(1, 2, 3), BlockType::Stone);
    EXPECT_EQ(chunk.blockAtOrAir(-1, 2, 3), BlockType::Air);
}
