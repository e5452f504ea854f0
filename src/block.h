#pragma once
// block.h
// Block types and the six cube face orientations shared by meshing, atlas mapping and the shader.

#include <array>
#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

enum class BlockType : std::uint8_t
{
    Air = 0,
    Grass = 1,
    Dirt = 2,
    Stone = 3,
    Count
};

constexpr std::size_t toIndex(BlockType block) noexcept
{
    return static_cast<std::size_t>(block);
}

constexpr std::size_t kBlockTypeCount = toIndex(BlockType::Count);

inline bool isSolid(BlockType block) noexcept
{
    return block != BlockType::Air;
}

const char* blockTypeName(BlockType block) noexcept;

// Face ids are part of the GPU instance layout; do not reorder.
enum class Face : std::uint8_t
{
    Front = 0, // +Z
    Back,      // -Z
    Left,      // -X
    Right,     // +X
    Top,       // +Y
    Bottom,    // -Y
    Count
};

constexpr std::size_t toIndex(Face face) noexcept
{
    return static_cast<std::size_t>(face);
}

constexpr std::size_t kFaceCount = toIndex(Face::Count);

inline constexpr std::array<Face, kFaceCount> kAllFaces = {
    Face::Front, Face::Back, Face::Left, Face::Right, Face::Top, Face::Bottom
};

inline const std::array<glm::ivec3, kFaceCount> kFaceOffsets = {
    glm::ivec3{0, 0, 1},
    glm::ivec3{0, 0, -1},
    glm::ivec3{-1, 0, 0},
    glm::ivec3{1, 0, 0},
    glm::ivec3{0, 1, 0},
    glm::ivec3{0, -1, 0}
};

inline const glm::ivec3& faceOffset(Face face) noexcept
{
    return kFaceOffsets[toIndex(face)];
}

constexpr bool isSideFace(Face face) noexcept
{
    return face != Face::Top && face != Face::Bottom;
}

const char* faceName(Face face) noexcept;

// Maps the unit quad (centred at the origin, facing +Z) onto the given cube face of a
// block centred at the origin: rotation onto the face normal, then 0.5 along that normal.
glm::mat4 faceTransform(Face face);
