#pragma once
// atlas.h
// Maps (block type, face) pairs onto tiles of the shared block texture atlas.

#include <array>
#include <cstdint>

#include <glm/glm.hpp>

#include "block.h"

struct AtlasRect
{
    glm::vec2 base{0.0f};
    glm::vec2 size{1.0f};
};

class AtlasLayout
{
public:
    using FaceTiles = std::array<std::uint32_t, kFaceCount>;

    // Every entry starts at tile 0.
    AtlasLayout(int columns, int rows);

    // 2x2 grid: grass top, grass side, dirt, stone.
    static AtlasLayout makeDefault();

    int columns() const noexcept { return columns_; }
    int rows() const noexcept { return rows_; }
    std::uint32_t tileCount() const noexcept;

    // Throws std::runtime_error when the tile lies outside the grid.
    void setTile(BlockType block, Face face, std::uint32_t tile);
    void setAllFaces(BlockType block, std::uint32_t tile);
    void setSideFaces(BlockType block, std::uint32_t tile);

    // Total over every block id; ids outside the table use tile 0.
    std::uint32_t tileFor(std::uint32_t blockType, Face face) const noexcept;
    std::uint32_t tileFor(BlockType block, Face face) const noexcept;

    AtlasRect tileRect(std::uint32_t tile) const noexcept;
    AtlasRect atlasRect(std::uint32_t blockType, Face face) const noexcept;

    // localUv is the quad corner in [0,1]^2 with v pointing up the quad. Side faces flip v so
    // the top image row lands on the world-up edge.
    glm::vec2 atlasUv(std::uint32_t blockType, Face face, const glm::vec2& localUv) const noexcept;

    const std::array<FaceTiles, kBlockTypeCount>& table() const noexcept { return tiles_; }

private:
    int columns_{2};
    int rows_{2};
    std::array<FaceTiles, kBlockTypeCount> tiles_{};
};
