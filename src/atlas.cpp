#include "atlas.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

AtlasLayout::AtlasLayout(int columns, int rows)
    : columns_(columns),
      rows_(rows)
{
    if (columns_ <= 0 || rows_ <= 0)
    {
        std::ostringstream oss;
        oss << "Invalid atlas grid " << columns_ << "x" << rows_;
        throw std::runtime_error(oss.str());
    }

    for (auto& faces : tiles_)
    {
        faces.fill(0u);
    }
}

AtlasLayout AtlasLayout::makeDefault()
{
    AtlasLayout layout(2, 2);
    layout.setTile(BlockType::Grass, Face::Top, 0u);
    layout.setSideFaces(BlockType::Grass, 1u);
    layout.setTile(BlockType::Grass, Face::Bottom, 2u);
    layout.setAllFaces(BlockType::Dirt, 2u);
    layout.setAllFaces(BlockType::Stone, 3u);
    return layout;
}

std::uint32_t AtlasLayout::tileCount() const noexcept
{
    return static_cast<std::uint32_t>(columns_) * static_cast<std::uint32_t>(rows_);
}

void AtlasLayout::setTile(BlockType block, Face face, std::uint32_t tile)
{
    if (tile >= tileCount())
    {
        std::ostringstream oss;
        oss << "Atlas tile " << tile << " for " << blockTypeName(block) << "/" << faceName(face)
            << " is outside the " << columns_ << "x" << rows_ << " grid";
        throw std::runtime_error(oss.str());
    }
    tiles_[toIndex(block)][toIndex(face)] = tile;
}

void AtlasLayout::setAllFaces(BlockType block, std::uint32_t tile)
{
    for (Face face : kAllFaces)
    {
        setTile(block, face, tile);
    }
}

void AtlasLayout::setSideFaces(BlockType block, std::uint32_t tile)
{
    for (Face face : {Face::Front, Face::Back, Face::Left, Face::Right})
    {
        setTile(block, face, tile);
    }
}

std::uint32_t AtlasLayout::tileFor(std::uint32_t blockType, Face face) const noexcept
{
    if (blockType >= kBlockTypeCount || toIndex(face) >= kFaceCount)
    {
        return 0u;
    }
    return tiles_[blockType][toIndex(face)];
}

std::uint32_t AtlasLayout::tileFor(BlockType block, Face face) const noexcept
{
    return tileFor(static_cast<std::uint32_t>(block), face);
}

AtlasRect AtlasLayout::tileRect(std::uint32_t tile) const noexcept
{
    const std::uint32_t clamped = std::min(tile, tileCount() - 1u);
    const std::uint32_t column = clamped % static_cast<std::uint32_t>(columns_);
    const std::uint32_t row = clamped / static_cast<std::uint32_t>(columns_);

    AtlasRect rect;
    rect.size = glm::vec2(1.0f / static_cast<float>(columns_), 1.0f / static_cast<float>(rows_));
    rect.base = glm::vec2(static_cast<float>(column), static_cast<float>(row)) * rect.size;
    return rect;
}

AtlasRect AtlasLayout::atlasRect(std::uint32_t blockType, Face face) const noexcept
{
    return tileRect(tileFor(blockType, face));
}

glm::vec2 AtlasLayout::atlasUv(std::uint32_t blockType, Face face, const glm::vec2& localUv) const noexcept
{
    glm::vec2 uv = glm::clamp(localUv, glm::vec2(0.0f), glm::vec2(1.0f));
    if (isSideFace(face))
    {
        uv.y = 1.0f - uv.y;
    }

    const AtlasRect rect = atlasRect(blockType, face);
    return rect.base + uv * rect.size;
}
