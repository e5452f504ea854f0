#pragma once
// frame_loop.h
// One cooperative frame: surface resize, camera, chunk streaming, then rendering. Surface
// acquisition failures are retried on later frames up to a budget.

#include <glm/glm.hpp>

#include "camera.h"
#include "gpu_device.h"

class ChunkManager;
class Renderer;

inline constexpr int kDefaultMaxSurfaceRetries = 120;

struct FrameInput
{
    float deltaSeconds{0.0f};
    CameraInput camera{};
    glm::ivec2 framebufferSize{0};
};

class FrameLoop
{
public:
    FrameLoop(Camera& camera, ChunkManager& chunks, Renderer& renderer,
              int maxSurfaceRetries = kDefaultMaxSurfaceRetries);

    // Throws std::runtime_error once more than maxSurfaceRetries consecutive frames failed to
    // acquire the surface. GpuError from chunk uploads propagates unchanged.
    FrameStatus tick(const FrameInput& input);

    int consecutiveSurfaceFailures() const noexcept { return consecutiveFailures_; }
    long long framesRendered() const noexcept { return framesRendered_; }

private:
    void reconfigure(const glm::ivec2& size);

    Camera& camera_;
    ChunkManager& chunks_;
    Renderer& renderer_;
    int maxSurfaceRetries_{kDefaultMaxSurfaceRetries};
    glm::ivec2 surfaceSize_{-1};
    bool reconfigurePending_{false};
    int consecutiveFailures_{0};
    long long framesRendered_{0};
};
