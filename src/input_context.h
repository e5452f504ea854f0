#pragma once

#include <glm/glm.hpp>

#include "camera.h"

struct GLFWwindow;

// Stored as the GLFW window user pointer. Callbacks accumulate between frames; the frame
// loop drains them once per tick.
struct InputContext
{
    float lastX{0.0f};
    float lastY{0.0f};
    bool firstMouse{true};
    glm::vec2 pendingLook{0.0f};
    glm::ivec2 framebufferSize{0};
};

void framebufferSizeCallback(GLFWwindow* window, int width, int height);
void mouseCallback(GLFWwindow* window, double xpos, double ypos);

// Samples WASD/Space/Shift and consumes the accumulated look delta.
CameraInput pollCameraInput(GLFWwindow* window, InputContext& inputContext);
