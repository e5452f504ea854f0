#pragma once

#include <glm/glm.hpp>

inline constexpr float kDefaultFovDegrees = 45.0f;
inline constexpr float kNearPlane = 0.1f;
inline constexpr float kFarPlane = 100.0f;
inline constexpr float kMaxPitchDegrees = 89.0f;

// Per-frame movement request. Axes are in [-1, 1]; look delta is in raw input units
// (pixels for a mouse), positive y looks up.
struct CameraInput
{
    float forward{0.0f};
    float right{0.0f};
    float up{0.0f};
    glm::vec2 lookDelta{0.0f};
};

class Camera
{
public:
    Camera() = default;
    Camera(const glm::vec3& position, float yaw, float pitch);

    void update(const CameraInput& input, float dt);

    void setPosition(const glm::vec3& position);
    void setOrientation(float yaw, float pitch);
    void setAspect(int width, int height);
    void setLens(float fovDegrees, float nearPlane, float farPlane);

    float moveSpeed{8.0f};
    float lookSensitivity{0.12f};

    const glm::vec3& position() const noexcept { return position_; }
    float yaw() const noexcept { return yaw_; }
    float pitch() const noexcept { return pitch_; }
    float aspect() const noexcept { return aspect_; }
    float fovDegrees() const noexcept { return fovDegrees_; }

    const glm::vec3& front() const noexcept;
    const glm::vec3& up() const noexcept;
    const glm::vec3& right() const noexcept;
    const glm::vec3& worldUp() const noexcept;

    glm::ivec3 chunkCoord() const noexcept;

    // Recomputed on the first read after any change to position, orientation, aspect or lens.
    const glm::mat4& viewProjection() const;
    bool viewProjectionStale() const noexcept { return dirty_; }

private:
    void updateVectors();

    glm::vec3 position_{0.0f, 20.0f, 0.0f};
    float yaw_{-90.0f};
    float pitch_{0.0f};
    float fovDegrees_{kDefaultFovDegrees};
    float nearPlane_{kNearPlane};
    float farPlane_{kFarPlane};
    float aspect_{16.0f / 9.0f};

    glm::vec3 front_{0.0f, 0.0f, -1.0f};
    glm::vec3 up_{0.0f, 1.0f, 0.0f};
    glm::vec3 right_{1.0f, 0.0f, 0.0f};
    glm::vec3 worldUp_{0.0f, 1.0f, 0.0f};

    mutable glm::mat4 viewProj_{1.0f};
    mutable bool dirty_{true};
};
