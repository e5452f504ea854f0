#include "app_config.h"

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <toml++/toml.h>

namespace
{

[[noreturn]] void throwInvalid(const std::filesystem::path& path, std::string_view key, std::string_view reason)
{
    std::ostringstream oss;
    oss << "'" << key << "' in " << path << " " << reason;
    throw std::runtime_error(oss.str());
}

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

void applyWindow(const toml::table& table, WindowSettings& window, const std::filesystem::path& path)
{
    window.width = readInt(table, "width", window.width);
    window.height = readInt(table, "height", window.height);
    window.vsync = table["vsync"].value_or(window.vsync);
    if (auto title = table["title"].value<std::string>())
    {
        window.title = *title;
    }

    if (window.width <= 0)
    {
        throwInvalid(path, "window.width", "must be positive");
    }
    if (window.height <= 0)
    {
        throwInvalid(path, "window.height", "must be positive");
    }
}

void applyCamera(const toml::table& table, CameraSettings& camera, const std::filesystem::path& path)
{
    camera.moveSpeed = readFloat(table, "move_speed", camera.moveSpeed);
    camera.lookSensitivity = readFloat(table, "look_sensitivity", camera.lookSensitivity);
    camera.fovDegrees = readFloat(table, "fov_degrees", camera.fovDegrees);
    camera.nearPlane = readFloat(table, "near_plane", camera.nearPlane);
    camera.farPlane = readFloat(table, "far_plane", camera.farPlane);
    camera.start.x = readFloat(table, "start_x", camera.start.x);
    camera.start.z = readFloat(table, "start_z", camera.start.z);
    if (auto startY = table["start_y"].value<double>())
    {
        camera.start.y = static_cast<float>(*startY);
        camera.hasStartY = true;
    }

    if (!(camera.moveSpeed >= 0.0f) || !std::isfinite(camera.moveSpeed))
    {
        throwInvalid(path, "camera.move_speed", "must be a non-negative number");
    }
    if (!std::isfinite(camera.lookSensitivity))
    {
        throwInvalid(path, "camera.look_sensitivity", "must be finite");
    }
    if (!(camera.fovDegrees > 0.0f && camera.fovDegrees < 180.0f))
    {
        throwInvalid(path, "camera.fov_degrees", "must lie in (0, 180)");
    }
    if (!(camera.nearPlane > 0.0f) || !(camera.farPlane > camera.nearPlane))
    {
        throwInvalid(path, "camera.near_plane", "must be positive and below far_plane");
    }
}

void applyRenderer(const toml::table& table, RendererSettings& renderer, const std::filesystem::path& path)
{
    if (auto atlasPath = table["atlas_path"].value<std::string>())
    {
        renderer.atlasPath = *atlasPath;
    }
    renderer.maxSurfaceRetries = readInt(table, "max_surface_retries", renderer.maxSurfaceRetries);
    if (renderer.maxSurfaceRetries < 0)
    {
        throwInvalid(path, "renderer.max_surface_retries", "must not be negative");
    }

    if (const toml::array* color = table["clear_color"].as_array())
    {
        if (color->size() != 3 && color->size() != 4)
        {
            throwInvalid(path, "renderer.clear_color", "must hold 3 or 4 numbers");
        }
        glm::vec4 parsed(1.0f);
        for (std::size_t i = 0; i < color->size(); ++i)
        {
            auto component = (*color)[i].value<double>();
            if (!component || *component < 0.0 || *component > 1.0)
            {
                throwInvalid(path, "renderer.clear_color", "components must lie in [0, 1]");
            }
            parsed[static_cast<glm::length_t>(i)] = static_cast<float>(*component);
        }
        renderer.clearColor = parsed;
    }
}

std::uint32_t readTile(const toml::node_view<const toml::node>& node, std::string_view key,
                       const std::filesystem::path& path)
{
    auto value = node.value<std::int64_t>();
    if (!value || *value < 0)
    {
        throwInvalid(path, key, "must be a non-negative tile index");
    }
    return static_cast<std::uint32_t>(*value);
}

AtlasLayout parseAtlas(const toml::table& table, const AtlasLayout& defaults, const std::filesystem::path& path)
{
    const int columns = readInt(table, "columns", defaults.columns());
    const int rows = readInt(table, "rows", defaults.rows());
    if (columns <= 0 || rows <= 0)
    {
        throwInvalid(path, "atlas.columns/rows", "must be positive");
    }

    AtlasLayout layout(columns, rows);
    // Keep the default assignments where they still fit the grid.
    for (std::size_t block = 0; block < kBlockTypeCount; ++block)
    {
        for (Face face : kAllFaces)
        {
            const std::uint32_t tile = defaults.tileFor(static_cast<std::uint32_t>(block), face);
            if (tile < layout.tileCount())
            {
                layout.setTile(static_cast<BlockType>(block), face, tile);
            }
        }
    }

    const toml::table* tiles = table["tiles"].as_table();
    if (tiles == nullptr)
    {
        return layout;
    }

    for (std::size_t block = 0; block < kBlockTypeCount; ++block)
    {
        const BlockType blockType = static_cast<BlockType>(block);
        const toml::table* entry = (*tiles)[blockTypeName(blockType)].as_table();
        if (entry == nullptr)
        {
            continue;
        }

        const std::string prefix = std::string("atlas.tiles.") + blockTypeName(blockType);
        try
        {
            if (entry->contains("all"))
            {
                layout.setAllFaces(blockType, readTile((*entry)["all"], prefix + ".all", path));
            }
            if (entry->contains("side"))
            {
                layout.setSideFaces(blockType, readTile((*entry)["side"], prefix + ".side", path));
            }
            if (entry->contains("top"))
            {
                layout.setTile(blockType, Face::Top, readTile((*entry)["top"], prefix + ".top", path));
            }
            if (entry->contains("bottom"))
            {
                layout.setTile(blockType, Face::Bottom, readTile((*entry)["bottom"], prefix + ".bottom", path));
            }
        }
        catch (const std::runtime_error& ex)
        {
            std::ostringstream oss;
            oss << ex.what() << " (" << path << ")";
            throw std::runtime_error(oss.str());
        }
    }

    for (auto&& [key, node] : *tiles)
    {
        bool known = false;
        for (std::size_t block = 0; block < kBlockTypeCount; ++block)
        {
            known = known || key.str() == blockTypeName(static_cast<BlockType>(block));
        }
        if (!known)
        {
            throwInvalid(path, std::string("atlas.tiles.") + std::string(key.str()), "names an unknown block type");
        }
    }

    return layout;
}

} // namespace

AppConfig AppConfig::load(const std::filesystem::path& path)
{
    AppConfig config{};
    if (!std::filesystem::exists(path))
    {
        return config;
    }

    toml::table table = toml::parse_file(path.string());

    if (const toml::table* window = table["window"].as_table())
    {
        applyWindow(*window, config.window, path);
    }

    if (const toml::table* world = table["world"].as_table())
    {
        config.viewRadius = readInt(*world, "view_radius", config.viewRadius);
        if (config.viewRadius < 0 || config.viewRadius > kMaxViewRadius)
        {
            std::ostringstream reason;
            reason << "must lie in [0, " << kMaxViewRadius << "]";
            throwInvalid(path, "world.view_radius", reason.str());
        }
    }

    if (const toml::table* camera = table["camera"].as_table())
    {
        applyCamera(*camera, config.camera, path);
    }

    if (const toml::table* renderer = table["renderer"].as_table())
    {
        applyRenderer(*renderer, config.renderer, path);
    }

    if (const toml::table* atlas = table["atlas"].as_table())
    {
        config.atlas = parseAtlas(*atlas, config.atlas, path);
    }

    return config;
}
