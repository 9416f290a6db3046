#pragma once

#include <glm/glm.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmdv/assets/ModelData.hpp"
#include "mmdv/core/ECS.hpp"
#include "mmdv/core/result.hpp"
#include "mmdv/runtime/AnimationTrack.hpp"

namespace mmdv::runtime {

    class EvaluationBackend;

    // Animated instance of a loaded model. Structure is fixed at creation;
    // only the pose changes per frame.
    class MmdModel {
    public:
        MmdModel(std::shared_ptr<const assets::ModelData> data, ecs::Entity root, bool sdefEnabled);

        MmdModel(const MmdModel&) = delete;
        MmdModel& operator=(const MmdModel&) = delete;

        void addAnimation(std::shared_ptr<const MotionTrack> track);
        core::Result<void> setAnimation(const std::string& name);

        [[nodiscard]] const MotionTrack* currentAnimation() const { return m_current.get(); }
        [[nodiscard]] bool hasAnimation() const { return m_current != nullptr; }

        // Samples the current animation at `frame` into the local pose and
        // recomputes bone positions in model space
        void evaluate(float frame, const EvaluationBackend& backend);

        [[nodiscard]] const assets::ModelData& data() const { return *m_data; }
        [[nodiscard]] ecs::Entity root() const { return m_root; }
        [[nodiscard]] bool sdefEnabled() const { return m_sdefEnabled; }

        [[nodiscard]] const std::vector<BonePose>& localPose() const { return m_localPose; }
        [[nodiscard]] const std::vector<glm::mat4>& boneTransforms() const { return m_boneTransforms; }
        [[nodiscard]] const std::vector<float>& morphWeights() const { return m_morphWeights; }
        [[nodiscard]] const std::vector<std::string>& morphNames() const { return m_morphNames; }

    private:
        void bindCurrent();
        void updateBoneTransforms();

        std::shared_ptr<const assets::ModelData> m_data;
        ecs::Entity m_root;
        bool m_sdefEnabled;

        std::unordered_map<std::string, std::shared_ptr<const MotionTrack>> m_animations;
        std::shared_ptr<const MotionTrack> m_current;

        // Per model bone: channel index in the current track or -1
        std::vector<int32_t> m_boneBinding;
        std::vector<int32_t> m_boneOrder;   // parents before children
        std::vector<BonePose> m_localPose;
        std::vector<glm::mat4> m_boneTransforms;

        std::vector<std::string> m_morphNames;
        std::vector<float> m_morphWeights;
    };

}
