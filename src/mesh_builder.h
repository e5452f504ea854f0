#pragma once
// mesh_builder.h
// Turns a chunk's block grid into per-face instance records for instanced quad drawing.
//
// Culling policy: a face is skipped only when the adjacent cell inside the same chunk is solid.
// Faces on the chunk boundary are always emitted, whatever the neighbouring chunk holds.

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include <glm/glm.hpp>

#include "chunk.h"

// Matches the per-instance vertex layout: instance_pos (3 x f32), face (u32), block_type (u32).
struct BlockFaceInstance
{
    glm::vec3 position{0.0f}; // world-space block centre
    std::uint32_t face{0};
    std::uint32_t blockType{0};
};

static_assert(sizeof(BlockFaceInstance) == 20, "BlockFaceInstance must stay tightly packed");

bool isFaceVisible(const Chunk& chunk, int x, int y, int z, Face face) noexcept;

// Lazy view over the visible faces of a chunk. Every begin() restarts the walk; the chunk
// must outlive the range and is never modified.
class FaceInstanceRange
{
public:
    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = BlockFaceInstance;
        using difference_type = std::ptrdiff_t;
        using pointer = const BlockFaceInstance*;
        using reference = const BlockFaceInstance&;

        Iterator() = default;
        Iterator(const Chunk* chunk, int blockIndex);

        reference operator*() const noexcept { return current_; }
        pointer operator->() const noexcept { return &current_; }

        Iterator& operator++();
        Iterator operator++(int);

        bool operator==(const Iterator& other) const noexcept
        {
            return block_ == other.block_ && face_ == other.face_;
        }

        bool operator!=(const Iterator& other) const noexcept
        {
            return !(*this == other);
        }

    private:
        void seekVisible();

        const Chunk* chunk_{nullptr};
        int block_{kChunkBlockCount};
        int face_{0};
        BlockFaceInstance current_{};
    };

    explicit FaceInstanceRange(const Chunk& chunk) noexcept
        : chunk_(&chunk)
    {
    }

    Iterator begin() const;
    Iterator end() const;

private:
    const Chunk* chunk_;
};

std::vector<BlockFaceInstance> buildInstances(const Chunk& chunk);
std::size_t countVisibleFaces(const Chunk& chunk) noexcept;
