#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmdv/assets/MotionData.hpp"
#include "mmdv/core/result.hpp"
#include "mmdv/runtime/Bezier.hpp"

namespace mmdv::runtime {

    inline constexpr float kFramesPerSecond = 30.0f;

    struct BonePose {
        glm::vec3 translation{0.0f};
        glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    struct BoneKeyframe {
        uint32_t frame = 0;
        BonePose pose;
        Bezier tx, ty, tz, rotation;
    };

    struct MorphKeyframe {
        uint32_t frame = 0;
        float weight = 0.0f;
    };

    struct BoneChannel {
        std::string boneName;
        std::vector<BoneKeyframe> keys;   // sorted by frame
    };

    struct MorphChannel {
        std::string morphName;
        std::vector<MorphKeyframe> keys;  // sorted by frame
    };

    // Immutable body motion. Shared between the loader and the model that
    // plays it; evaluation is const and thread safe.
    class MotionTrack {
    public:
        static std::shared_ptr<const MotionTrack> fromMotion(std::string name, const assets::MotionData& motion);

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] uint32_t duration() const { return m_duration; }

        [[nodiscard]] const std::vector<BoneChannel>& boneChannels() const { return m_bones; }
        [[nodiscard]] const std::vector<MorphChannel>& morphChannels() const { return m_morphs; }

        // Channel index for a bone name, or -1
        [[nodiscard]] int32_t findBoneChannel(const std::string& boneName) const;
        [[nodiscard]] int32_t findMorphChannel(const std::string& morphName) const;

        [[nodiscard]] BonePose evaluateBone(size_t channel, float frame) const;
        [[nodiscard]] float evaluateMorph(size_t channel, float frame) const;

    private:
        explicit MotionTrack(std::string name) : m_name(std::move(name)) {}

        std::string m_name;
        std::vector<BoneChannel> m_bones;
        std::vector<MorphChannel> m_morphs;
        std::unordered_map<std::string, int32_t> m_boneLookup;
        std::unordered_map<std::string, int32_t> m_morphLookup;
        uint32_t m_duration = 0;
    };

    struct CameraPose {
        glm::vec3 target{0.0f};
        glm::vec3 rotation{0.0f};   // radians
        float distance = -45.0f;
        float fov = glm::radians(30.0f);
    };

    struct CameraKeyframe {
        uint32_t frame = 0;
        CameraPose pose;
        Bezier ix, iy, iz, rotation, distance, fov;
    };

    // Immutable camera motion in right-handed coordinates
    class CameraTrack {
    public:
        // Fails when the motion holds no camera keys
        static core::Result<std::shared_ptr<const CameraTrack>> fromMotion(std::string name,
                                                                           const assets::MotionData& motion);

        [[nodiscard]] const std::string& name() const { return m_name; }
        [[nodiscard]] uint32_t duration() const { return m_duration; }
        [[nodiscard]] const std::vector<CameraKeyframe>& keys() const { return m_keys; }

        // Keys exactly one frame apart mark a cut and are not interpolated
        [[nodiscard]] CameraPose evaluate(float frame) const;

    private:
        explicit CameraTrack(std::string name) : m_name(std::move(name)) {}

        std::string m_name;
        std::vector<CameraKeyframe> m_keys;
        uint32_t m_duration = 0;
    };

}
