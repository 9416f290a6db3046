#include "mmdv/runtime/MmdModel.hpp"
#include "mmdv/runtime/EvaluationBackend.hpp"
#include "mmdv/core/common.hpp"
#include "mmdv/core/logger.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <format>

namespace mmdv::runtime {

    MmdModel::MmdModel(std::shared_ptr<const assets::ModelData> data, ecs::Entity root, bool sdefEnabled)
        : m_data(std::move(data)), m_root(root), m_sdefEnabled(sdefEnabled)
    {
        const auto& bones = m_data->bones;
        m_localPose.resize(bones.size());
        m_boneTransforms.resize(bones.size(), glm::mat4(1.0f));
        m_boneBinding.assign(bones.size(), -1);

        // Parent-first order; deform depth only reorders within a level
        m_boneOrder.resize(bones.size());
        std::vector<int32_t> depth(bones.size(), 0);
        for (size_t i = 0; i < bones.size(); ++i) {
            m_boneOrder[i] = static_cast<int32_t>(i);
            int32_t parent = bones[i].parentIndex;
            int32_t guard = 0;
            while (parent >= 0 && guard++ < static_cast<int32_t>(bones.size())) {
                ++depth[i];
                parent = bones[static_cast<size_t>(parent)].parentIndex;
            }
            MMDV_ASSERT(parent < 0, "bone hierarchy contains a cycle");
        }
        std::stable_sort(m_boneOrder.begin(), m_boneOrder.end(),
                         [&](int32_t a, int32_t b) { return depth[static_cast<size_t>(a)] < depth[static_cast<size_t>(b)]; });

        updateBoneTransforms();
    }

    void MmdModel::addAnimation(std::shared_ptr<const MotionTrack> track)
    {
        if (!track) {
            return;
        }
        const std::string name = track->name();
        m_animations[name] = std::move(track);
    }

    core::Result<void> MmdModel::setAnimation(const std::string& name)
    {
        auto it = m_animations.find(name);
        if (it == m_animations.end()) {
            return core::Unexpected(std::format("model \"{}\" has no animation named \"{}\"",
                                                m_data->header.modelName, name));
        }
        m_current = it->second;
        bindCurrent();
        return {};
    }

    void MmdModel::bindCurrent()
    {
        size_t boundBones = 0;
        for (size_t i = 0; i < m_data->bones.size(); ++i) {
            m_boneBinding[i] = m_current->findBoneChannel(m_data->bones[i].name);
            if (m_boneBinding[i] >= 0) {
                ++boundBones;
            }
        }

        m_morphNames.clear();
        for (const auto& channel : m_current->morphChannels()) {
            m_morphNames.push_back(channel.morphName);
        }
        m_morphWeights.assign(m_morphNames.size(), 0.0f);

        core::Logger::info("Animation \"{}\" bound to \"{}\": {}/{} bones, {} morphs",
                           m_current->name(), m_data->header.modelName, boundBones,
                           m_data->bones.size(), m_morphNames.size());
    }

    void MmdModel::evaluate(float frame, const EvaluationBackend& backend)
    {
        if (!m_current) {
            return;
        }

        const MotionTrack& track = *m_current;
        backend.forEach(static_cast<uint32_t>(m_boneBinding.size()), [&](uint32_t i) {
            const int32_t channel = m_boneBinding[i];
            m_localPose[i] = channel >= 0 ? track.evaluateBone(static_cast<size_t>(channel), frame) : BonePose{};
        });

        for (size_t i = 0; i < m_morphWeights.size(); ++i) {
            m_morphWeights[i] = track.evaluateMorph(i, frame);
        }

        updateBoneTransforms();
    }

    void MmdModel::updateBoneTransforms()
    {
        const auto& bones = m_data->bones;
        for (int32_t index : m_boneOrder) {
            const auto i = static_cast<size_t>(index);
            const auto& bone = bones[i];
            const glm::vec3 restPosition = bone.position * glm::vec3(1.0f, 1.0f, -1.0f);
            glm::vec3 relative = restPosition;
            glm::mat4 parentTransform(1.0f);
            if (bone.parentIndex >= 0) {
                const auto& parent = bones[static_cast<size_t>(bone.parentIndex)];
                relative = restPosition - parent.position * glm::vec3(1.0f, 1.0f, -1.0f);
                parentTransform = m_boneTransforms[static_cast<size_t>(bone.parentIndex)];
            }
            const BonePose& pose = m_localPose[i];
            m_boneTransforms[i] = parentTransform
                * glm::translate(glm::mat4(1.0f), relative + pose.translation)
                * glm::mat4_cast(pose.rotation);
        }
    }

}
