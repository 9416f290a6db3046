#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <string>

#include "mmdv/core/result.hpp"

namespace mmdv::xr
{
    enum class Handedness : uint8_t
    {
        None,
        Left,
        Right
    };

    enum class XrState : uint8_t
    {
        NotInXr,
        InXr
    };

    enum class LocomotionMode : uint8_t
    {
        Free,
        Teleport
    };

    core::Result<LocomotionMode> parseLocomotionMode(const std::string& text);
    const char* toString(Handedness handedness);
    const char* toString(XrState state);

    struct SessionRequest
    {
        std::string sessionMode = "immersive-vr";
        std::string referenceSpace = "local-floor";
    };

    // Head pose in the session's reference space
    struct HeadPose
    {
        glm::vec3 position{0.0f};
        glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
    };
}
