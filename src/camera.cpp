#include "camera.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

#include "chunk.h"

namespace
{
constexpr float kEpsilon = 1e-6f;
}

Camera::Camera(const glm::vec3& position, float yaw, float pitch)
    : position_(position),
      yaw_(yaw),
      pitch_(std::clamp(pitch, -kMaxPitchDegrees, kMaxPitchDegrees))
{
    updateVectors();
}

const glm::vec3& Camera::front() const noexcept
{
    return front_;
}

const glm::vec3& Camera::up() const noexcept
{
    return up_;
}

const glm::vec3& Camera::right() const noexcept
{
    return right_;
}

const glm::vec3& Camera::worldUp() const noexcept
{
    return worldUp_;
}

void Camera::update(const CameraInput& input, float dt)
{
    if (input.lookDelta.x != 0.0f || input.lookDelta.y != 0.0f)
    {
        yaw_ += input.lookDelta.x * lookSensitivity;
        pitch_ += input.lookDelta.y * lookSensitivity;
        pitch_ = std::clamp(pitch_, -kMaxPitchDegrees, kMaxPitchDegrees);
        updateVectors();
    }

    glm::vec3 direction = front_ * input.forward + right_ * input.right + worldUp_ * input.up;
    if (glm::length(direction) > kEpsilon && dt > 0.0f)
    {
        position_ += glm::normalize(direction) * moveSpeed * dt;
        dirty_ = true;
    }
}

void Camera::setPosition(const glm::vec3& position)
{
    position_ = position;
    dirty_ = true;
}

void Camera::setOrientation(float yaw, float pitch)
{
    yaw_ = yaw;
    pitch_ = std::clamp(pitch, -kMaxPitchDegrees, kMaxPitchDegrees);
    updateVectors();
}

void Camera::setAspect(int width, int height)
{
    if (width <= 0 || height <= 0)
    {
        return;
    }
    aspect_ = static_cast<float>(width) / static_cast<float>(height);
    dirty_ = true;
}

void Camera::setLens(float fovDegrees, float nearPlane, float farPlane)
{
    fovDegrees_ = fovDegrees;
    nearPlane_ = nearPlane;
    farPlane_ = farPlane;
    dirty_ = true;
}

glm::ivec3 Camera::chunkCoord() const noexcept
{
    return worldToChunkCoord(position_);
}

const glm::mat4& Camera::viewProjection() const
{
    if (dirty_)
    {
        const glm::mat4 view = glm::lookAt(position_, position_ + front_, up_);
        const glm::mat4 projection = glm::perspective(glm::radians(fovDegrees_), aspect_, nearPlane_, farPlane_);
        viewProj_ = projection * view;
        dirty_ = false;
    }
    return viewProj_;
}

void Camera::updateVectors()
{
    const float yawRad = glm::radians(yaw_);
    const float pitchRad = glm::radians(pitch_);

    glm::vec3 direction;
    direction.x = std::cos(yawRad) * std::cos(pitchRad);
    direction.y = std::sin(pitchRad);
    direction.z = std::sin(yawRad) * std::cos(pitchRad);
    front_ = glm::normalize(direction);

    glm::vec3 rightCandidate = glm::cross(front_, worldUp_);
    if (glm::length(rightCandidate) < kEpsilon)
    {
        rightCandidate = glm::vec3(1.0f, 0.0f, 0.0f);
    }
    else
    {
        rightCandidate = glm::normalize(rightCandidate);
    }
    right_ = rightCandidate;
    up_ = glm::normalize(glm::cross(right_, front_));
    dirty_ = true;
}
