#pragma once

#include <vector>

#include <glm/glm.hpp>

// Decoded RGBA8 image, rows top to bottom.
struct LoadedImage
{
    std::vector<unsigned char> pixels;
    glm::ivec2 size{0};

    bool empty() const noexcept { return pixels.empty(); }
};

LoadedImage loadImage(const char* path);
