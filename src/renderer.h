#pragma once

#include <glm/glm.hpp>

#include "atlas.h"
#include "gpu_device.h"

class Camera;
class ChunkManager;

inline const glm::vec4 kDefaultClearColor{0.1f, 0.2f, 0.3f, 1.0f};

// Draws every loaded chunk with one instanced call each. Owns the pipeline, the camera
// uniform buffer and the atlas texture; chunk buffers stay with the ChunkManager.
class Renderer
{
public:
    Renderer(GpuDevice& device, const AtlasLayout& atlas, const LoadedImage& atlasImage,
             const glm::vec4& clearColor = kDefaultClearColor);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Returns the acquisition failure untouched when the frame could not begin; nothing is
    // recorded in that case.
    FrameStatus render(const Camera& camera, const ChunkManager& chunks);

    void resize(int width, int height);

    int lastDrawCount() const noexcept { return lastDrawCount_; }

private:
    GpuDevice& device_;
    glm::vec4 clearColor_;
    GpuPipeline pipeline_{};
    GpuBuffer cameraUniform_{};
    GpuTexture atlasTexture_{};
    int lastDrawCount_{0};
};
