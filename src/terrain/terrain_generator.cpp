#include "terrain/terrain_generator.h"

#include <algorithm>
#include <cmath>
#include <random>

#include <glm/gtc/noise.hpp>

namespace terrain
{

TerrainGenerator::TerrainGenerator(const WorldgenProfile& profile, unsigned seed)
    : profile_(profile),
      seed_(seed)
{
    std::mt19937 rng(seed_);
    std::uniform_real_distribution<float> dist(-1000.0f, 1000.0f);
    for (auto& offset : octaveOffsets_)
    {
        offset = {dist(rng), dist(rng)};
    }
}

float TerrainGenerator::fbm(float x, float z) const noexcept
{
    const FbmSettings& settings = profile_.surfaceNoise;

    float amplitude = 1.0f;
    float frequency = settings.frequency;
    float value = 0.0f;
    float normalization = 0.0f;

    const int octaveCount = std::min<int>(settings.octaves, static_cast<int>(octaveOffsets_.size()));
    for (int i = 0; i < octaveCount; ++i)
    {
        const glm::vec2 sample{x * frequency + octaveOffsets_[i].x,
                               z * frequency + octaveOffsets_[i].y};
        value += glm::perlin(sample) * amplitude;
        normalization += amplitude;

        amplitude *= settings.gain;
        frequency *= settings.lacunarity;
    }

    if (normalization > 0.0f)
    {
        value /= normalization;
    }

    return value;
}

int TerrainGenerator::surfaceHeight(int worldX, int worldZ) const noexcept
{
    const float noise = fbm(static_cast<float>(worldX), static_cast<float>(worldZ));
    const float height = static_cast<float>(profile_.baseHeight) +
                         noise * static_cast<float>(profile_.heightVariation);
    const int rounded = static_cast<int>(std::lround(height));
    return std::clamp(rounded, 1, std::max(profile_.maxHeight, 1));
}

BlockType TerrainGenerator::blockForHeight(int worldY, int surfaceHeight) const noexcept
{
    if (worldY < 0 || worldY >= surfaceHeight)
    {
        return BlockType::Air;
    }
    if (worldY == surfaceHeight - 1)
    {
        return BlockType::Grass;
    }
    if (worldY >= surfaceHeight - 1 - profile_.dirtDepth)
    {
        return BlockType::Dirt;
    }
    return BlockType::Stone;
}

Chunk TerrainGenerator::generate(const glm::ivec3& chunkCoord) const
{
    Chunk chunk(chunkCoord);
    const glm::ivec3 origin = chunk.origin();

    const int minWorldY = origin.y;
    const int maxWorldY = origin.y + kChunkSizeY - 1;
    if (maxWorldY < 0 || minWorldY >= std::max(profile_.maxHeight, 1))
    {
        return chunk;
    }

    for (int z = 0; z < kChunkSizeZ; ++z)
    {
        for (int x = 0; x < kChunkSizeX; ++x)
        {
            const int height = surfaceHeight(origin.x + x, origin.z + z);
            const int top = std::min(height - 1, maxWorldY);
            for (int worldY = std::max(minWorldY, 0); worldY <= top; ++worldY)
            {
                chunk.setBlock(x, worldY - minWorldY, z, blockForHeight(worldY, height));
            }
        }
    }

    return chunk;
}

} // namespace terrain
