#include "chunk.h"

#include <algorithm>
#include <cmath>

int floorDiv(int value, int divisor) noexcept
{
    int quotient = value / divisor;
    int remainder = value % divisor;
    if ((remainder != 0) && ((remainder < 0) != (divisor < 0)))
    {
        --quotient;
    }
    return quotient;
}

glm::ivec3 worldToChunkCoord(const glm::ivec3& worldPos) noexcept
{
    return {
        floorDiv(worldPos.x, kChunkSizeX),
        floorDiv(worldPos.y, kChunkSizeY),
        floorDiv(worldPos.z, kChunkSizeZ)
    };
}

glm::ivec3 worldToChunkCoord(const glm::vec3& worldPos) noexcept
{
    const glm::ivec3 block(static_cast<int>(std::floor(worldPos.x)),
                           static_cast<int>(std::floor(worldPos.y)),
                           static_cast<int>(std::floor(worldPos.z)));
    return worldToChunkCoord(block);
}

glm::ivec3 worldToLocalCoord(const glm::ivec3& worldPos) noexcept
{
    return worldPos - chunkOrigin(worldToChunkCoord(worldPos));
}

glm::ivec3 chunkOrigin(const glm::ivec3& chunkCoord) noexcept
{
    return {
        chunkCoord.x * kChunkSizeX,
        chunkCoord.y * kChunkSizeY,
        chunkCoord.z * kChunkSizeZ
    };
}

Chunk::Chunk(const glm::ivec3& coord)
    : coord_(coord),
      blocks_(kChunkBlockCount, BlockType::Air)
{
}

BlockType Chunk::blockAt(int x, int y, int z) const noexcept
{
    return blocks_[blockIndex(x, y, z)];
}

BlockType Chunk::blockAtOrAir(int x, int y, int z) const noexcept
{
    if (!isInsideChunk(x, y, z))
    {
        return BlockType::Air;
    }
    return blocks_[blockIndex(x, y, z)];
}

void Chunk::setBlock(int x, int y, int z, BlockType block) noexcept
{
    blocks_[blockIndex(x, y, z)] = block;
}

bool Chunk::hasSolidBlocks() const noexcept
{
    return std::any_of(blocks_.begin(), blocks_.end(), [](BlockType block) { return isSolid(block); });
}

std::size_t Chunk::solidBlockCount() const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(blocks_.begin(), blocks_.end(), [](BlockType block) { return isSolid(block); }));
}
