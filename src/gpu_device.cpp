#include "gpu_device.h"

const char* frameStatusName(FrameStatus status) noexcept
{
    switch (status)
    {
        case FrameStatus::Ok:
            return "ok";
        case FrameStatus::SurfaceLost:
            return "surface lost";
        case FrameStatus::SurfaceOutdated:
            return "surface outdated";
    }
    return "unknown";
}
