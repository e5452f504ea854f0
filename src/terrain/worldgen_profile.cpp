#include "terrain/worldgen_profile.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <toml++/toml.h>

namespace terrain
{
namespace
{
float readFloat(const toml::table& table, std::string_view key, float fallback)
{
    if (auto value = table[key].value<double>())
    {
        return static_cast<float>(*value);
    }
    return fallback;
}

int readInt(const toml::table& table, std::string_view key, int fallback)
{
    if (auto value = table[key].value<std::int64_t>())
    {
        return static_cast<int>(*value);
    }
    return fallback;
}

void applyFbmSettings(const toml::table& noiseTable,
                      FbmSettings& settings,
                      const std::filesystem::path& filePath)
{
    settings.frequency = readFloat(noiseTable, "frequency", settings.frequency);
    settings.gain = readFloat(noiseTable, "gain", settings.gain);
    settings.lacunarity = readFloat(noiseTable, "lacunarity", settings.lacunarity);
    settings.octaves = readInt(noiseTable, "octaves", settings.octaves);

    if (settings.frequency < 0.0f || !std::isfinite(settings.frequency))
    {
        std::ostringstream oss;
        oss << "Noise frequency in " << filePath << " must be non-negative";
        throw std::runtime_error(oss.str());
    }

    if (settings.octaves <= 0)
    {
        std::ostringstream oss;
        oss << "Noise octaves in " << filePath << " must be positive";
        throw std::runtime_error(oss.str());
    }

    if (!std::isfinite(settings.gain) || !std::isfinite(settings.lacunarity))
    {
        std::ostringstream oss;
        oss << "Noise parameters in " << filePath << " must be finite";
        throw std::runtime_error(oss.str());
    }
}

void requirePositive(int value, std::string_view key, const std::filesystem::path& filePath)
{
    if (value <= 0)
    {
        std::ostringstream oss;
        oss << "'" << key << "' in " << filePath << " must be positive";
        throw std::runtime_error(oss.str());
    }
}

} // namespace

WorldgenProfile WorldgenProfile::load(const std::filesystem::path& path)
{
    WorldgenProfile profile{};
    if (!std::filesystem::exists(path))
    {
        return profile;
    }

    toml::table table = toml::parse_file(path.string());

    if (auto seedValue = table["seed"].value<std::int64_t>())
    {
        if (*seedValue < 0 || *seedValue > static_cast<std::int64_t>(std::numeric_limits<unsigned>::max()))
        {
            std::ostringstream oss;
            oss << "Seed value out of range in " << path;
            throw std::runtime_error(oss.str());
        }
        profile.seedOverride = static_cast<unsigned>(*seedValue);
    }

    profile.baseHeight = readInt(table, "base_height", profile.baseHeight);
    profile.heightVariation = readInt(table, "height_variation", profile.heightVariation);
    profile.maxHeight = readInt(table, "max_height", profile.maxHeight);
    profile.dirtDepth = readInt(table, "dirt_depth", profile.dirtDepth);

    requirePositive(profile.baseHeight, "base_height", path);
    requirePositive(profile.maxHeight, "max_height", path);
    if (profile.heightVariation < 0)
    {
        std::ostringstream oss;
        oss << "'height_variation' in " << path << " must not be negative";
        throw std::runtime_error(oss.str());
    }
    if (profile.dirtDepth < 0)
    {
        std::ostringstream oss;
        oss << "'dirt_depth' in " << path << " must not be negative";
        throw std::runtime_error(oss.str());
    }

    if (const toml::table* noiseTable = table["noise"].as_table())
    {
        applyFbmSettings(*noiseTable, profile.surfaceNoise, path);
    }

    return profile;
}

} // namespace terrain
