#include "frame_loop.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include "chunk_manager.h"
#include "renderer.h"

FrameLoop::FrameLoop(Camera& camera, ChunkManager& chunks, Renderer& renderer, int maxSurfaceRetries)
    : camera_(camera),
      chunks_(chunks),
      renderer_(renderer),
      maxSurfaceRetries_(maxSurfaceRetries < 0 ? 0 : maxSurfaceRetries)
{
}

void FrameLoop::reconfigure(const glm::ivec2& size)
{
    surfaceSize_ = size;
    renderer_.resize(size.x, size.y);
    camera_.setAspect(size.x, size.y);
    reconfigurePending_ = false;
}

FrameStatus FrameLoop::tick(const FrameInput& input)
{
    if (input.framebufferSize != surfaceSize_ || reconfigurePending_)
    {
        reconfigure(input.framebufferSize);
    }

    camera_.update(input.camera, input.deltaSeconds);
    chunks_.update(camera_.position());

    // Minimised window: nothing to present, not a failure.
    if (surfaceSize_.x <= 0 || surfaceSize_.y <= 0)
    {
        return FrameStatus::SurfaceOutdated;
    }

    const FrameStatus status = renderer_.render(camera_, chunks_);
    if (status == FrameStatus::Ok)
    {
        if (consecutiveFailures_ > 0)
        {
            std::cout << "[FrameLoop] Surface recovered after " << consecutiveFailures_ << " failed frame(s)"
                      << std::endl;
        }
        consecutiveFailures_ = 0;
        ++framesRendered_;
        return status;
    }

    ++consecutiveFailures_;
    std::cerr << "[FrameLoop] Frame skipped: " << frameStatusName(status) << " (" << consecutiveFailures_ << "/"
              << maxSurfaceRetries_ << ")" << std::endl;
    if (consecutiveFailures_ > maxSurfaceRetries_)
    {
        throw std::runtime_error("Surface could not be acquired after " + std::to_string(consecutiveFailures_) +
                                 " consecutive frames");
    }
    reconfigurePending_ = true;
    return status;
}
