#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "app_config.h"
#include "terrain/worldgen_profile.h"

namespace {

// Writes a TOML file into the temp directory and removes it at scope exit.
class TempToml {
public:
    explicit TempToml(const std::string& contents) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("chunkcraft_config_test_" + std::to_string(counter.fetch_add(1)) + ".toml");
        std::ofstream out(path_);
        out << contents;
    }

    ~TempToml() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST(AppConfigTest, MissingFileYieldsDefaults) {
    const AppConfig config = AppConfig::load("does/not/exist/settings.toml");
    EXPECT_EQ(config.window.width, 1280);
    EXPECT_EQ(config.viewRadius, kDefaultViewRadius);
    EXPECT_EQ(config.renderer.maxSurfaceRetries, kDefaultMaxSurfaceRetries);
    EXPECT_FLOAT_EQ(config.renderer.clearColor.g, 0.2f);
    EXPECT_EQ(config.atlas.tileFor(BlockType::Stone, Face::Top), 3u);
    EXPECT_FALSE(config.camera.hasStartY);
}

TEST(AppConfigTest, ReadsOverridesFromEveryTable) {
    const TempToml file(R"(
[window]
width = 640
height = 360
vsync = false
title = "Test"

[world]
view_radius = 4

[camera]
move_speed = 2.5
fov_degrees = 70.0
start_y = 40.0

[renderer]
atlas_path = "custom.png"
max_surface_retries = 3
clear_color = [0.0, 0.5, 1.0]

[atlas]
columns = 4
rows = 2

[atlas.tiles.grass]
all = 5
top = 4

[atlas.tiles.stone]
side = 7
)");

    const AppConfig config = AppConfig::load(file.path());
    EXPECT_EQ(config.window.width, 640);
    EXPECT_FALSE(config.window.vsync);
    EXPECT_EQ(config.window.title, "Test");
    EXPECT_EQ(config.viewRadius, 4);
    EXPECT_FLOAT_EQ(config.camera.moveSpeed, 2.5f);
    EXPECT_FLOAT_EQ(config.camera.fovDegrees, 70.0f);
    EXPECT_TRUE(config.camera.hasStartY);
    EXPECT_FLOAT_EQ(config.camera.start.y, 40.0f);
    EXPECT_EQ(config.renderer.atlasPath, std::filesystem::path("custom.png"));
    EXPECT_EQ(config.renderer.maxSurfaceRetries, 3);
    EXPECT_FLOAT_EQ(config.renderer.clearColor.b, 1.0f);
    EXPECT_FLOAT_EQ(config.renderer.clearColor.a, 1.0f);

    EXPECT_EQ(config.atlas.columns(), 4);
    EXPECT_EQ(config.atlas.tileFor(BlockType::Grass, Face::Top), 4u);
    EXPECT_EQ(config.atlas.tileFor(BlockType::Grass, Face::Left), 5u);
    EXPECT_EQ(config.atlas.tileFor(BlockType::Stone, Face::Front), 7u);
    EXPECT_EQ(config.atlas.tileFor(BlockType::Stone, Face::Top), 3u);
}

TEST(AppConfigTest, RejectsInvalidValues) {
    const TempToml radius("[world]\nview_radius = 999\n");
    EXPECT_THROW(AppConfig::load(radius.path()), std::runtime_error);

    const TempToml tile("[atlas.tiles.dirt]\nall = 4\n");
    EXPECT_THROW(AppConfig::load(tile.path()), std::runtime_error);

    const TempToml block("[atlas.tiles.lava]\nall = 1\n");
    EXPECT_THROW(AppConfig::load(block.path()), std::runtime_error);

    const TempToml color("[renderer]\nclear_color = [2.0, 0.0, 0.0]\n");
    EXPECT_THROW(AppConfig::load(color.path()), std::runtime_error);

    const TempToml lens("[camera]\nnear_plane = 10.0\nfar_plane = 1.0\n");
    EXPECT_THROW(AppConfig::load(lens.path()), std::runtime_error);

    const TempToml syntax("[window\nwidth = 1\n");
    EXPECT_THROW(AppConfig::load(syntax.path()), std::runtime_error);
}

TEST(WorldgenProfileTest, LoadsSeedAndNoiseSettings) {
    const TempToml file(R"(
seed = 1234
base_height = 6
height_variation = 2
max_height = 12
dirt_depth = 1

[noise]
frequency = 0.1
octaves = 2
)");

    const terrain::WorldgenProfile profile = terrain::WorldgenProfile::load(file.path());
    EXPECT_EQ(profile.effectiveSeed(42u), 1234u);
    EXPECT_EQ(profile.baseHeight, 6);
    EXPECT_EQ(profile.maxHeight, 12);
    EXPECT_EQ(profile.dirtDepth, 1);
    EXPECT_FLOAT_EQ(profile.surfaceNoise.frequency, 0.1f);
    EXPECT_EQ(profile.surfaceNoise.octaves, 2);
    EXPECT_FLOAT_EQ(profile.surfaceNoise.gain, 0.5f);
}

TEST(WorldgenProfileTest, MissingFileKeepsDefaultsAndFallbackSeed) {
    const terrain::WorldgenProfile profile = terrain::WorldgenProfile::load("does/not/exist/worldgen.toml");
    EXPECT_EQ(profile.effectiveSeed(42u), 42u);
    EXPECT_EQ(profile.baseHeight, 8);
}

TEST(WorldgenProfileTest, RejectsInvalidValues) {
    const TempToml octaves("[noise]\noctaves = 0\n");
    EXPECT_THROW(terrain::WorldgenProfile::load(octaves.path()), std::runtime_error);

    const TempToml seed("seed = -5\n");
    EXPECT_THROW(terrain::WorldgenProfile::load(seed.path()), std::runtime_error);

    const TempToml depth("dirt_depth = -1\n");
    EXPECT_THROW(terrain::WorldgenProfile::load(depth.path()), std::runtime_error);
}
