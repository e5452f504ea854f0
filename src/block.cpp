#include "block.h"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

const char* blockTypeName(BlockType block) noexcept
{
    switch (block)
    {
        case BlockType::Air:
            return "air";
        case BlockType::Grass:
            return "grass";
        case BlockType::Dirt:
            return "dirt";
        case BlockType::Stone:
            return "stone";
        case BlockType::Count:
            break;
    }
    return "unknown";
}

const char* faceName(Face face) noexcept
{
    switch (face)
    {
        case Face::Front:
            return "front";
        case Face::Back:
            return "back";
        case Face::Left:
            return "left";
        case Face::Right:
            return "right";
        case Face::Top:
            return "top";
        case Face::Bottom:
            return "bottom";
        case Face::Count:
            break;
    }
    return "unknown";
}

glm::mat4 faceTransform(Face face)
{
    const glm::vec3 normal(faceOffset(face));
    const glm::mat4 translation = glm::translate(glm::mat4(1.0f), normal * 0.5f);

    const glm::vec3 yAxis(0.0f, 1.0f, 0.0f);
    const glm::vec3 xAxis(1.0f, 0.0f, 0.0f);
    const float halfPi = glm::half_pi<float>();

    glm::mat4 rotation(1.0f);
    switch (face)
    {
        case Face::Front:
            break;
        case Face::Back:
            rotation = glm::rotate(glm::mat4(1.0f), glm::pi<float>(), yAxis);
            break;
        case Face::Left:
            rotation = glm::rotate(glm::mat4(1.0f), -halfPi, yAxis);
            break;
        case Face::Right:
            rotation = glm::rotate(glm::mat4(1.0f), halfPi, yAxis);
            break;
        case Face::Top:
            rotation = glm::rotate(glm::mat4(1.0f), -halfPi, xAxis);
            break;
        case Face::Bottom:
            rotation = glm::rotate(glm::mat4(1.0f), halfPi, xAxis);
            break;
        case Face::Count:
            break;
    }

    return translation * rotation;
}
