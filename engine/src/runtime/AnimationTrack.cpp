#include "mmdv/runtime/AnimationTrack.hpp"

#include <algorithm>
#include <format>

namespace mmdv::runtime {

    namespace {
        // First key strictly after `frame`, as the upper bound of the
        // interpolation interval
        template <typename Key>
        typename std::vector<Key>::const_iterator upperKey(const std::vector<Key>& keys, float frame)
        {
            return std::upper_bound(keys.begin(), keys.end(), frame,
                                    [](float f, const Key& k) { return f < static_cast<float>(k.frame); });
        }

        template <typename Key>
        float intervalProgress(const Key& from, const Key& to, float frame)
        {
            const float span = static_cast<float>(to.frame - from.frame);
            return span > 0.0f ? (frame - static_cast<float>(from.frame)) / span : 1.0f;
        }
    }

    std::shared_ptr<const MotionTrack> MotionTrack::fromMotion(std::string name, const assets::MotionData& motion)
    {
        std::shared_ptr<MotionTrack> track(new MotionTrack(std::move(name)));

        for (const auto& src : motion.boneKeys) {
            auto [it, inserted] = track->m_boneLookup.try_emplace(src.boneName, static_cast<int32_t>(track->m_bones.size()));
            if (inserted) {
                track->m_bones.push_back({src.boneName, {}});
            }
            const auto& ip = src.interpolation;
            BoneKeyframe key;
            key.frame = src.frame;
            key.pose.translation = src.translation * glm::vec3(1.0f, 1.0f, -1.0f);
            key.pose.rotation = glm::quat(src.rotation.w, -src.rotation.x, -src.rotation.y, src.rotation.z);
            key.tx = Bezier(ip[0], ip[4], ip[8], ip[12]);
            key.ty = Bezier(ip[1], ip[5], ip[9], ip[13]);
            key.tz = Bezier(ip[2], ip[6], ip[10], ip[14]);
            key.rotation = Bezier(ip[3], ip[7], ip[11], ip[15]);
            track->m_bones[static_cast<size_t>(it->second)].keys.push_back(key);
            track->m_duration = std::max(track->m_duration, src.frame);
        }

        for (const auto& src : motion.morphKeys) {
            auto [it, inserted] = track->m_morphLookup.try_emplace(src.morphName, static_cast<int32_t>(track->m_morphs.size()));
            if (inserted) {
                track->m_morphs.push_back({src.morphName, {}});
            }
            track->m_morphs[static_cast<size_t>(it->second)].keys.push_back({src.frame, src.weight});
            track->m_duration = std::max(track->m_duration, src.frame);
        }

        const auto byFrame = [](const auto& a, const auto& b) { return a.frame < b.frame; };
        for (auto& channel : track->m_bones) {
            std::stable_sort(channel.keys.begin(), channel.keys.end(), byFrame);
        }
        for (auto& channel : track->m_morphs) {
            std::stable_sort(channel.keys.begin(), channel.keys.end(), byFrame);
        }
        return track;
    }

    int32_t MotionTrack::findBoneChannel(const std::string& boneName) const
    {
        auto it = m_boneLookup.find(boneName);
        return it == m_boneLookup.end() ? -1 : it->second;
    }

    int32_t MotionTrack::findMorphChannel(const std::string& morphName) const
    {
        auto it = m_morphLookup.find(morphName);
        return it == m_morphLookup.end() ? -1 : it->second;
    }

    BonePose MotionTrack::evaluateBone(size_t channel, float frame) const
    {
        const auto& keys = m_bones.at(channel).keys;
        if (keys.empty()) {
            return {};
        }
        const auto upper = upperKey(keys, frame);
        if (upper == keys.begin()) {
            return keys.front().pose;
        }
        if (upper == keys.end()) {
            return keys.back().pose;
        }

        const BoneKeyframe& from = *(upper - 1);
        const BoneKeyframe& to = *upper;
        const float t = intervalProgress(from, to, frame);

        BonePose pose;
        pose.translation = glm::mix(from.pose.translation, to.pose.translation,
                                    glm::vec3(to.tx.ease(t), to.ty.ease(t), to.tz.ease(t)));
        pose.rotation = glm::slerp(from.pose.rotation, to.pose.rotation, to.rotation.ease(t));
        return pose;
    }

    float MotionTrack::evaluateMorph(size_t channel, float frame) const
    {
        const auto& keys = m_morphs.at(channel).keys;
        if (keys.empty()) {
            return 0.0f;
        }
        const auto upper = upperKey(keys, frame);
        if (upper == keys.begin()) {
            return keys.front().weight;
        }
        if (upper == keys.end()) {
            return keys.back().weight;
        }
        const MorphKeyframe& from = *(upper - 1);
        return glm::mix(from.weight, upper->weight, intervalProgress(from, *upper, frame));
    }

    core::Result<std::shared_ptr<const CameraTrack>> CameraTrack::fromMotion(std::string name,
                                                                             const assets::MotionData& motion)
    {
        if (motion.cameraKeys.empty()) {
            return core::Unexpected(std::format("motion \"{}\" has no camera keys", name));
        }

        std::shared_ptr<CameraTrack> track(new CameraTrack(std::move(name)));
        track->m_keys.reserve(motion.cameraKeys.size());
        for (const auto& src : motion.cameraKeys) {
            const auto& ip = src.interpolation;
            CameraKeyframe key;
            key.frame = src.frame;
            key.pose.target = src.interest * glm::vec3(1.0f, 1.0f, -1.0f);
            key.pose.rotation = src.rotation;
            key.pose.distance = src.distance;
            key.pose.fov = glm::radians(static_cast<float>(src.viewAngle));
            key.ix = Bezier(ip[0], ip[2], ip[1], ip[3]);
            key.iy = Bezier(ip[4], ip[6], ip[5], ip[7]);
            key.iz = Bezier(ip[8], ip[10], ip[9], ip[11]);
            key.rotation = Bezier(ip[12], ip[14], ip[13], ip[15]);
            key.distance = Bezier(ip[16], ip[18], ip[17], ip[19]);
            key.fov = Bezier(ip[20], ip[22], ip[21], ip[23]);
            track->m_keys.push_back(key);
            track->m_duration = std::max(track->m_duration, src.frame);
        }
        std::stable_sort(track->m_keys.begin(), track->m_keys.end(),
                         [](const CameraKeyframe& a, const CameraKeyframe& b) { return a.frame < b.frame; });
        return std::shared_ptr<const CameraTrack>(std::move(track));
    }

    CameraPose CameraTrack::evaluate(float frame) const
    {
        const auto upper = upperKey(m_keys, frame);
        if (upper == m_keys.begin()) {
            return m_keys.front().pose;
        }
        if (upper == m_keys.end()) {
            return m_keys.back().pose;
        }

        const CameraKeyframe& from = *(upper - 1);
        const CameraKeyframe& to = *upper;
        if (to.frame - from.frame <= 1) {
            return from.pose;
        }

        const float t = intervalProgress(from, to, frame);
        CameraPose pose;
        pose.target = glm::mix(from.pose.target, to.pose.target,
                               glm::vec3(to.ix.ease(t), to.iy.ease(t), to.iz.ease(t)));
        pose.rotation = glm::mix(from.pose.rotation, to.pose.rotation, to.rotation.ease(t));
        pose.distance = glm::mix(from.pose.distance, to.pose.distance, to.distance.ease(t));
        pose.fov = glm::mix(from.pose.fov, to.pose.fov, to.fov.ease(t));
        return pose;
    }

}
