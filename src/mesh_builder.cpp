#include "mesh_builder.h"

namespace
{
inline glm::ivec3 localFromIndex(int index) noexcept
{
    const int x = index % kChunkSizeX;
    const int z = (index / kChunkSizeX) % kChunkSizeZ;
    const int y = index / (kChunkSizeX * kChunkSizeZ);
    return {x, y, z};
}
} // namespace

bool isFaceVisible(const Chunk& chunk, int x, int y, int z, Face face) noexcept
{
    const glm::ivec3& offset = faceOffset(face);
    const int nx = x + offset.x;
    const int ny = y + offset.y;
    const int nz = z + offset.z;
    if (!isInsideChunk(nx, ny, nz))
    {
        return true;
    }
    return !isSolid(chunk.blockAt(nx, ny, nz));
}

FaceInstanceRange::Iterator::Iterator(const Chunk* chunk, int blockIndex)
    : chunk_(chunk),
      block_(blockIndex),
      face_(0)
{
    seekVisible();
}

FaceInstanceRange::Iterator& FaceInstanceRange::Iterator::operator++()
{
    ++face_;
    seekVisible();
    return *this;
}

FaceInstanceRange::Iterator FaceInstanceRange::Iterator::operator++(int)
{
    Iterator previous = *this;
    ++(*this);
    return previous;
}

void FaceInstanceRange::Iterator::seekVisible()
{
    if (chunk_ == nullptr)
    {
        block_ = kChunkBlockCount;
        face_ = 0;
        return;
    }

    const glm::ivec3 origin = chunk_->origin();
    while (block_ < kChunkBlockCount)
    {
        const BlockType block = chunk_->blocks()[static_cast<std::size_t>(block_)];
        if (isSolid(block))
        {
            const glm::ivec3 local = localFromIndex(block_);
            for (; face_ < static_cast<int>(kFaceCount); ++face_)
            {
                const Face face = static_cast<Face>(face_);
                if (isFaceVisible(*chunk_, local.x, local.y, local.z, face))
                {
                    current_.position = glm::vec3(origin + local) + glm::vec3(0.5f);
                    current_.face = static_cast<std::uint32_t>(face);
                    current_.blockType = static_cast<std::uint32_t>(block);
                    return;
                }
            }
        }
        ++block_;
        face_ = 0;
    }

    face_ = 0;
}

FaceInstanceRange::Iterator FaceInstanceRange::begin() const
{
    return Iterator(chunk_, 0);
}

FaceInstanceRange::Iterator FaceInstanceRange::end() const
{
    return Iterator(chunk_, kChunkBlockCount);
}

std::vector<BlockFaceInstance> buildInstances(const Chunk& chunk)
{
    std::vector<BlockFaceInstance> instances;
    for (const BlockFaceInstance& instance : FaceInstanceRange(chunk))
    {
        instances.push_back(instance);
    }
    return instances;
}

std::size_t countVisibleFaces(const Chunk& chunk) noexcept
{
    std::size_t count = 0;
    for (int index = 0; index < kChunkBlockCount; ++index)
    {
        if (!isSolid(chunk.blocks()[static_cast<std::size_t>(index)]))
        {
            continue;
        }
        const glm::ivec3 local = localFromIndex(index);
        for (Face face : kAllFaces)
        {
            if (isFaceVisible(chunk, local.x, local.y, local.z, face))
            {
                ++count;
            }
        }
    }
    return count;
}
