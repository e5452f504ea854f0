#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <tuple>

#include "chunk_manager.h"
#include "fake_gpu_device.h"
#include "mesh_builder.h"
#include "terrain/terrain_generator.h"

namespace {

using CoordSet = std::set<std::tuple<int, int, int>>;

CoordSet toSet(const std::vector<glm::ivec3>& coords) {
    CoordSet set;
    for (const glm::ivec3& c : coords) {
        set.emplace(c.x, c.y, c.z);
    }
    return set;
}

CoordSet chebyshevBall(const glm::ivec3& centre, int radius) {
    CoordSet set;
    for (int y = -radius; y <= radius; ++y) {
        for (int z = -radius; z <= radius; ++z) {
            for (int x = -radius; x <= radius; ++x) {
                set.emplace(centre.x + x, centre.y + y, centre.z + z);
            }
        }
    }
    return set;
}

class ChunkManagerTest : public ::testing::Test {
protected:
    FakeGpuDevice device;
    terrain::TerrainGenerator generator{terrain::WorldgenProfile{}, 42u};
};

} // namespace

TEST_F(ChunkManagerTest, RadiusOneAroundOriginLoadsTwentySevenChunks) {
    ChunkManager manager(device, generator, 1);
    manager.update(glm::ivec3(0));

    EXPECT_EQ(manager.loadedCount(), 27u);
    EXPECT_EQ(toSet(manager.loadedCoords()), chebyshevBall(glm::ivec3(0), 1));

    // Terrain lives entirely in the y = 0 layer; the other layers are air and get no buffer.
    EXPECT_EQ(device.liveInstanceBuffers.size(), 9u);
    EXPECT_EQ(manager.drawList(glm::vec3(0.0f)).size(), 9u);
}

TEST_F(ChunkManagerTest, LoadedSetMatchesChebyshevBallForAnyCentre) {
    ChunkManager manager(device, generator, 2);
    for (const glm::ivec3 centre : {glm::ivec3(3, -1, -7), glm::ivec3(-20, 4, 2), glm::ivec3(-19, 4, 2)}) {
        manager.update(centre);
        EXPECT_EQ(toSet(manager.loadedCoords()), chebyshevBall(centre, 2));
        EXPECT_EQ(manager.loadedCount(), 125u);
    }
}

TEST_F(ChunkManagerTest, JumpingFiveChunksReplacesEveryChunk) {
    ChunkManager manager(device, generator, 1);
    manager.update(glm::ivec3(0));
    const auto oldBuffers = device.liveInstanceBuffers;
    manager.sampleStats();

    manager.update(glm::ivec3(5, 0, 0));

    const ChunkStreamingStats stats = manager.sampleStats();
    EXPECT_EQ(stats.evictedChunks, 27);
    EXPECT_EQ(stats.generatedChunks, 27);
    EXPECT_EQ(stats.meshedChunks, 27);
    EXPECT_EQ(stats.loadedChunks, 27);
    EXPECT_EQ(toSet(manager.loadedCoords()), chebyshevBall(glm::ivec3(5, 0, 0), 1));

    for (const auto& [id, count] : oldBuffers) {
        EXPECT_EQ(device.liveInstanceBuffers.count(id), 0u);
    }
    EXPECT_EQ(device.destroyedInstanceBuffers.size(), oldBuffers.size());
}

TEST_F(ChunkManagerTest, StayingInPlaceDoesNoWork) {
    ChunkManager manager(device, generator, 1);
    manager.update(glm::vec3(1.0f, 2.0f, 3.0f));
    manager.sampleStats();

    manager.update(glm::vec3(15.0f, 10.0f, 0.5f));
    const ChunkStreamingStats stats = manager.sampleStats();
    EXPECT_EQ(stats.generatedChunks, 0);
    EXPECT_EQ(stats.meshedChunks, 0);
    EXPECT_EQ(stats.evictedChunks, 0);
}

TEST_F(ChunkManagerTest, BufferSizesMatchVisibleFaceCounts) {
    ChunkManager manager(device, generator, 1);
    manager.update(glm::ivec3(0));

    for (const ChunkDrawItem& item : manager.drawList(glm::vec3(0.0f))) {
        const Chunk chunk = generator.generate(item.coord);
        EXPECT_EQ(item.instanceCount, countVisibleFaces(chunk));
        EXPECT_EQ(item.instances.sizeBytes, countVisibleFaces(chunk) * sizeof(BlockFaceInstance));
        EXPECT_EQ(device.liveInstanceBuffers.at(item.instances.id), item.instanceCount);
    }
}

TEST_F(ChunkManagerTest, AllAirNeighbourhoodCreatesNoBuffers) {
    ChunkManager manager(device, generator, 1);
    manager.update(glm::ivec3(0, 10, 0));

    EXPECT_EQ(manager.loadedCount(), 27u);
    EXPECT_TRUE(device.liveInstanceBuffers.empty());
    EXPECT_TRUE(manager.drawList(glm::vec3(0.0f, 170.0f, 0.0f)).empty());
}

TEST_F(ChunkManagerTest, DrawListIsSortedNearestFirst) {
    ChunkManager manager(device, generator, 2);
    const glm::vec3 camera(40.0f, 12.0f, -5.0f);
    manager.update(camera);

    const std::vector<ChunkDrawItem> items = manager.drawList(camera);
    ASSERT_FALSE(items.empty());
    float previous = -1.0f;
    for (const ChunkDrawItem& item : items) {
        const glm::vec3 centre = glm::vec3(chunkOrigin(item.coord)) + glm::vec3(8.0f);
        const glm::vec3 delta = centre - camera;
        const float distance = glm::dot(delta, delta);
        EXPECT_GE(distance, previous);
        previous = distance;
    }
}

TEST_F(ChunkManagerTest, DirtyChunkIsRemeshedWithFreshBuffer) {
    ChunkManager manager(device, generator, 1);
    manager.update(glm::ivec3(0));
    manager.sampleStats();
    const std::size_t destroyedBefore = device.destroyedInstanceBuffers.size();

    manager.markDirty(glm::ivec3(0));
    manager.markDirty(glm::ivec3(40, 0, 0)); // not loaded, ignored
    manager.update(glm::ivec3(0));

    const ChunkStreamingStats stats = manager.sampleStats();
    EXPECT_EQ(stats.meshedChunks, 1);
    EXPECT_EQ(stats.uploadedChunks, 1);
    EXPECT_EQ(stats.generatedChunks, 0);
    EXPECT_EQ(device.destroyedInstanceBuffers.size(), destroyedBefore + 1);
    EXPECT_EQ(device.liveInstanceBuffers.size(), 9u);

    manager.markAllDirty();
    manager.update(glm::ivec3(0));
    EXPECT_EQ(manager.sampleStats().meshedChunks, 27);
}

TEST_F(ChunkManagerTest, AllocationFailurePropagatesAndKeepsMapConsistent) {
    ChunkManager manager(device, generator, 1);
    device.failInstanceAllocationsAfter = 4;

    EXPECT_THROW(manager.update(glm::ivec3(0)), GpuError);

    EXPECT_LT(manager.loadedCount(), 27u);
    EXPECT_EQ(device.liveInstanceBuffers.size(), 4u);
    const std::vector<ChunkDrawItem> items = manager.drawList(glm::vec3(0.0f));
    EXPECT_EQ(items.size(), device.liveInstanceBuffers.size());
    for (const ChunkDrawItem& item : items) {
        EXPECT_TRUE(manager.isLoaded(item.coord));
        EXPECT_EQ(device.liveInstanceBuffers.count(item.instances.id), 1u);
    }

    device.failInstanceAllocationsAfter = -1;
    manager.update(glm::ivec3(0));
    EXPECT_EQ(manager.loadedCount(), 27u);
    EXPECT_EQ(device.liveInstanceBuffers.size(), 9u);
}

TEST_F(ChunkManagerTest, ViewRadiusIsClampedAndAppliedOnNextUpdate) {
    ChunkManager manager(device, generator, 1);
    manager.setViewRadius(-3);
    EXPECT_EQ(manager.viewRadius(), 0);
    manager.setViewRadius(kMaxViewRadius + 10);
    EXPECT_EQ(manager.viewRadius(), kMaxViewRadius);

    manager.setViewRadius(0);
    manager.update(glm::ivec3(2, 0, 2));
    EXPECT_EQ(manager.loadedCount(), 1u);
    EXPECT_TRUE(manager.isLoaded(glm::ivec3(2, 0, 2)));
}

TEST_F(ChunkManagerTest, BlockLookupGoesThroughLoadedChunks) {
    ChunkManager manager(device, generator, 0);
    manager.update(glm::ivec3(0));

    const int height = generator.surfaceHeight(5, 9);
    EXPECT_EQ(manager.blockAt(glm::ivec3(5, height - 1, 9)), BlockType::Grass);
    EXPECT_EQ(manager.blockAt(glm::ivec3(5, height, 9)), BlockType::Air);
    EXPECT_FALSE(manager.blockAt(glm::ivec3(-1, 0, 0)).has_value());
}

TEST_F(ChunkManagerTest, ClearAndDestructionReleaseEveryBuffer) {
    {
        ChunkManager manager(device, generator, 1);
        manager.update(glm::ivec3(0));
        manager.clear();
        EXPECT_EQ(manager.loadedCount(), 0u);
        EXPECT_TRUE(device.liveInstanceBuffers.empty());

        manager.update(glm::ivec3(1, 0, 0));
        EXPECT_FALSE(device.liveInstanceBuffers.empty());
    }
    EXPECT_TRUE(device.liveInstanceBuffers.empty());
}
