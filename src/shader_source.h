#pragma once
// shader_source.h
// GLSL for the block pipeline. Vertex layout, uniform block and sampler unit are fixed:
//   location 0  position    vec3  (per vertex)
//   location 1  tex_coords  vec2  (per vertex)
//   location 2  instance_pos vec3 (per instance)
//   location 3  face        uint  (per instance)
//   location 4  block_type  uint  (per instance)
//   uniform block "Camera" at binding 0: mat4 view_proj
//   sampler2D u_atlas on texture unit 0
// Face transforms and the atlas tile table are emitted from the C++ tables.

#include <array>
#include <cstdint>
#include <string>

#include <glm/glm.hpp>

#include "atlas.h"

inline constexpr std::uint32_t kPositionLocation = 0;
inline constexpr std::uint32_t kTexCoordLocation = 1;
inline constexpr std::uint32_t kInstancePositionLocation = 2;
inline constexpr std::uint32_t kInstanceFaceLocation = 3;
inline constexpr std::uint32_t kInstanceBlockTypeLocation = 4;
inline constexpr std::uint32_t kCameraUniformBinding = 0;
inline constexpr std::uint32_t kAtlasTextureUnit = 0;

inline constexpr const char* kCameraUniformBlockName = "Camera";
inline constexpr const char* kAtlasSamplerName = "u_atlas";

struct QuadVertex
{
    glm::vec3 position;
    glm::vec2 texCoords;
};

inline constexpr std::uint32_t kFaceQuadVertexCount = 6;

// Unit quad centred at the origin facing +Z, as two counter-clockwise triangles.
const std::array<QuadVertex, kFaceQuadVertexCount>& faceQuadVertices();

std::string buildBlockVertexShader(const AtlasLayout& atlas);
std::string buildBlockFragmentShader();
