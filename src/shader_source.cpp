#include "shader_source.h"

#include <iomanip>
#include <sstream>

#include "block.h"

namespace
{

void appendMat4(std::ostringstream& out, const glm::mat4& m)
{
    out << "mat4(";
    for (int column = 0; column < 4; ++column)
    {
        for (int row = 0; row < 4; ++row)
        {
            if (column != 0 || row != 0)
            {
                out << ", ";
            }
            out << m[column][row];
        }
    }
    out << ")";
}

} // namespace

const std::array<QuadVertex, kFaceQuadVertexCount>& faceQuadVertices()
{
    static const std::array<QuadVertex, kFaceQuadVertexCount> vertices = {{
        {{-0.5f, -0.5f, 0.0f}, {0.0f, 0.0f}},
        {{0.5f, -0.5f, 0.0f}, {1.0f, 0.0f}},
        {{0.5f, 0.5f, 0.0f}, {1.0f, 1.0f}},
        {{0.5f, 0.5f, 0.0f}, {1.0f, 1.0f}},
        {{-0.5f, 0.5f, 0.0f}, {0.0f, 1.0f}},
        {{-0.5f, -0.5f, 0.0f}, {0.0f, 0.0f}},
    }};
    return vertices;
}

std::string buildBlockVertexShader(const AtlasLayout& atlas)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(6);

    out << "#version 330 core\n"
        << "layout(location = " << kPositionLocation << ") in vec3 position;\n"
        << "layout(location = " << kTexCoordLocation << ") in vec2 tex_coords;\n"
        << "layout(location = " << kInstancePositionLocation << ") in vec3 instance_pos;\n"
        << "layout(location = " << kInstanceFaceLocation << ") in uint face;\n"
        << "layout(location = " << kInstanceBlockTypeLocation << ") in uint block_type;\n"
        << "\n"
        << "layout(std140) uniform " << kCameraUniformBlockName << "\n"
        << "{\n"
        << "    mat4 view_proj;\n"
        << "};\n"
        << "\n";

    out << "const mat4 kFaceTransforms[" << kFaceCount << "] = mat4[" << kFaceCount << "](\n";
    for (std::size_t i = 0; i < kFaceCount; ++i)
    {
        out << "    ";
        appendMat4(out, faceTransform(kAllFaces[i]));
        out << (i + 1 < kFaceCount ? ",\n" : "\n");
    }
    out << ");\n\n";

    const auto& table = atlas.table();
    const std::size_t tileEntries = kBlockTypeCount * kFaceCount;
    out << "const uint kBlockTypeCount = " << kBlockTypeCount << "u;\n"
        << "const uint kAtlasColumns = " << atlas.columns() << "u;\n"
        << "const vec2 kTileSize = vec2(" << 1.0f / static_cast<float>(atlas.columns()) << ", "
        << 1.0f / static_cast<float>(atlas.rows()) << ");\n"
        << "const uint kTileTable[" << tileEntries << "] = uint[" << tileEntries << "](";
    for (std::size_t block = 0; block < kBlockTypeCount; ++block)
    {
        for (std::size_t face = 0; face < kFaceCount; ++face)
        {
            if (block != 0 || face != 0)
            {
                out << ", ";
            }
            out << table[block][face] << "u";
        }
    }
    out << ");\n\n";

    out << "out vec2 v_uv;\n"
        << "\n"
        << "void main()\n"
        << "{\n"
        << "    uint faceIndex = min(face, " << (kFaceCount - 1) << "u);\n"
        << "    uint tile = 0u;\n"
        << "    if (block_type < kBlockTypeCount)\n"
        << "    {\n"
        << "        tile = kTileTable[block_type * " << kFaceCount << "u + faceIndex];\n"
        << "    }\n"
        << "    vec2 local = clamp(tex_coords, 0.0, 1.0);\n"
        << "    if (faceIndex < " << toIndex(Face::Top) << "u)\n"
        << "    {\n"
        << "        local.y = 1.0 - local.y;\n"
        << "    }\n"
        << "    vec2 base = vec2(float(tile % kAtlasColumns), float(tile / kAtlasColumns)) * kTileSize;\n"
        << "    v_uv = base + local * kTileSize;\n"
        << "    vec4 local_pos = kFaceTransforms[faceIndex] * vec4(position, 1.0);\n"
        << "    gl_Position = view_proj * vec4(local_pos.xyz + instance_pos, 1.0);\n"
        << "}\n";

    return out.str();
}

std::string buildBlockFragmentShader()
{
    std::ostringstream out;
    out << "#version 330 core\n"
        << "in vec2 v_uv;\n"
        << "uniform sampler2D " << kAtlasSamplerName << ";\n"
        << "out vec4 frag_color;\n"
        << "\n"
        << "void main()\n"
        << "{\n"
        << "    frag_color = texture(" << kAtlasSamplerName << ", v_uv);\n"
        << "}\n";
    return out.str();
}
