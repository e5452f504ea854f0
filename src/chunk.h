#pragma once
// chunk.h
// Fixed-size block grid addressed by chunk coordinate, plus world/chunk coordinate helpers.

#include <cstddef>
#include <vector>

#include <glm/glm.hpp>

#include "block.h"

inline constexpr int kChunkEdgeLength = 16;
inline constexpr int kChunkSizeX = kChunkEdgeLength;
inline constexpr int kChunkSizeY = kChunkEdgeLength;
inline constexpr int kChunkSizeZ = kChunkEdgeLength;
inline constexpr int kChunkBlockCount = kChunkSizeX * kChunkSizeY * kChunkSizeZ;

int floorDiv(int value, int divisor) noexcept;

glm::ivec3 worldToChunkCoord(const glm::ivec3& worldPos) noexcept;
glm::ivec3 worldToChunkCoord(const glm::vec3& worldPos) noexcept;
glm::ivec3 worldToLocalCoord(const glm::ivec3& worldPos) noexcept;
glm::ivec3 chunkOrigin(const glm::ivec3& chunkCoord) noexcept;

inline bool isInsideChunk(int x, int y, int z) noexcept
{
    return x >= 0 && x < kChunkSizeX &&
           y >= 0 && y < kChunkSizeY &&
           z >= 0 && z < kChunkSizeZ;
}

inline std::size_t blockIndex(int x, int y, int z) noexcept
{
    return static_cast<std::size_t>(y) * (kChunkSizeX * kChunkSizeZ) +
           static_cast<std::size_t>(z) * kChunkSizeX +
           static_cast<std::size_t>(x);
}

class Chunk
{
public:
    explicit Chunk(const glm::ivec3& coord);

    const glm::ivec3& coord() const noexcept { return coord_; }
    glm::ivec3 origin() const noexcept { return chunkOrigin(coord_); }

    BlockType blockAt(int x, int y, int z) const noexcept;

    // Air outside the chunk bounds.
    BlockType blockAtOrAir(int x, int y, int z) const noexcept;

    void setBlock(int x, int y, int z, BlockType block) noexcept;

    bool hasSolidBlocks() const noexcept;
    std::size_t solidBlockCount() const noexcept;

    const std::vector<BlockType>& blocks() const noexcept { return blocks_; }

private:
    glm::ivec3 coord_;
    std::vector<BlockType> blocks_;
};
