#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mmdv::assets {

    struct VmdBoneKey {
        std::string boneName;
        uint32_t frame = 0;
        glm::vec3 translation{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
        // Channel c in X, Y, Z, R: x1 = [c], y1 = [c + 4], x2 = [c + 8],
        // y2 = [c + 12]. The remaining rows repeat the first.
        std::array<uint8_t, 64> interpolation{};
    };

    struct VmdMorphKey {
        std::string morphName;
        uint32_t frame = 0;
        float weight = 0.0f;
    };

    struct VmdCameraKey {
        uint32_t frame = 0;
        float distance = 0.0f;
        glm::vec3 interest{0.0f};
        glm::vec3 rotation{0.0f};
        // Six channels: X, Y, Z, rotation, distance, view angle. Each is
        // x1 x2 y1 y2.
        std::array<uint8_t, 24> interpolation{};
        uint32_t viewAngle = 30;   // degrees
        uint8_t isPerspective = 0;
    };

    struct VmdLightKey {
        uint32_t frame = 0;
        glm::vec3 color{0.6f};
        glm::vec3 position{-0.5f, -1.0f, 0.5f};
    };

    struct VmdShadowKey {
        uint32_t frame = 0;
        uint8_t mode = 0;
        float distance = 0.0f;
    };

    struct VmdIkInfo {
        std::string name;
        bool enabled = true;
    };

    struct VmdIkKey {
        uint32_t frame = 0;
        bool show = true;
        std::vector<VmdIkInfo> iks;
    };

    struct MotionData {
        std::string modelName;
        std::vector<VmdBoneKey> boneKeys;
        std::vector<VmdMorphKey> morphKeys;
        std::vector<VmdCameraKey> cameraKeys;
        std::vector<VmdLightKey> lightKeys;
        std::vector<VmdShadowKey> shadowKeys;
        std::vector<VmdIkKey> ikKeys;

        [[nodiscard]] bool isCameraMotion() const { return !cameraKeys.empty(); }
        [[nodiscard]] uint32_t lastFrame() const;
    };

}
