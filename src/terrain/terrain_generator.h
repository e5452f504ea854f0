#pragma once

#include <array>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "chunk.h"
#include "terrain/worldgen_profile.h"

namespace terrain
{

// Height-field terrain: grass cap, a few layers of dirt, stone down to the world floor at y = 0.
// Output depends only on the chunk coordinate, the profile and the seed.
class TerrainGenerator
{
public:
    TerrainGenerator(const WorldgenProfile& profile, unsigned seed);

    [[nodiscard]] Chunk generate(const glm::ivec3& chunkCoord) const;

    // Number of solid blocks in the column; the grass block sits at surfaceHeight - 1.
    [[nodiscard]] int surfaceHeight(int worldX, int worldZ) const noexcept;

    [[nodiscard]] BlockType blockForHeight(int worldY, int surfaceHeight) const noexcept;

    unsigned seed() const noexcept { return seed_; }
    const WorldgenProfile& profile() const noexcept { return profile_; }

private:
    float fbm(float x, float z) const noexcept;

    WorldgenProfile profile_;
    unsigned seed_{0};
    std::array<glm::vec2, 16> octaveOffsets_{};
};

} // namespace terrain
