#pragma once
// app_config.h
// Runtime settings read from assets/settings.toml. Missing file or keys keep the defaults;
// invalid values throw std::runtime_error naming the file and key.

#include <filesystem>
#include <string>

#include <glm/glm.hpp>

#include "atlas.h"
#include "chunk_manager.h"
#include "frame_loop.h"

struct WindowSettings
{
    int width{1280};
    int height{720};
    bool vsync{true};
    std::string title{"ChunkCraft"};
};

struct CameraSettings
{
    float moveSpeed{8.0f};
    float lookSensitivity{0.12f};
    float fovDegrees{45.0f};
    float nearPlane{0.1f};
    float farPlane{100.0f};
    // Unset start height places the camera a few blocks above the terrain surface.
    glm::vec3 start{0.0f, 0.0f, 0.0f};
    bool hasStartY{false};
};

struct RendererSettings
{
    std::filesystem::path atlasPath{"assets/block_atlas.png"};
    int maxSurfaceRetries{kDefaultMaxSurfaceRetries};
    glm::vec4 clearColor{0.1f, 0.2f, 0.3f, 1.0f};
};

struct AppConfig
{
    WindowSettings window{};
    int viewRadius{kDefaultViewRadius};
    CameraSettings camera{};
    RendererSettings renderer{};
    AtlasLayout atlas{AtlasLayout::makeDefault()};

    static AppConfig load(const std::filesystem::path& path);
};
