#pragma once

#include <filesystem>
#include <optional>

namespace terrain
{

struct FbmSettings
{
    float frequency{1.0f};
    int octaves{1};
    float gain{0.5f};
    float lacunarity{2.0f};
};

struct WorldgenProfile
{
    std::optional<unsigned> seedOverride{};
    FbmSettings surfaceNoise{0.03f, 4, 0.5f, 2.0f};
    int baseHeight{8};
    int heightVariation{5};
    int maxHeight{14};
    int dirtDepth{3};

    [[nodiscard]] unsigned effectiveSeed(unsigned fallback) const noexcept
    {
        return seedOverride.value_or(fallback);
    }

    static WorldgenProfile load(const std::filesystem::path& path);
};

} // namespace terrain
