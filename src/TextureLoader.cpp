#include "TextureLoader.h"

#include <cstddef>
#include <iostream>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

LoadedImage loadImage(const char* path)
{
    LoadedImage image{};

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_set_flip_vertically_on_load(false);
    unsigned char* data = stbi_load(path, &width, &height, &channels, STBI_rgb_alpha);

    if (!data)
    {
        std::cerr << "Failed to load texture: " << path << " (" << stbi_failure_reason() << ")" << std::endl;
        return image;
    }

    const std::size_t byteCount = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
    image.pixels.assign(data, data + byteCount);
    image.size = glm::ivec2(width, height);
    stbi_image_free(data);

    std::cout << "Loaded texture: " << path << " (" << image.size.x << "x" << image.size.y << ")" << std::endl;

    return image;
}
