#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mmdv/core/Observable.hpp"
#include "mmdv/core/Timer.h"
#include "mmdv/core/result.hpp"
#include "mmdv/runtime/AnimationTrack.hpp"
#include "mmdv/runtime/EvaluationBackend.hpp"
#include "mmdv/runtime/MmdModel.hpp"

namespace mmdv::scene {
    class Scene;
    class MmdCamera;
}

namespace mmdv::runtime {

    class IAudioPlayer;

    // Rigid-body settings handed to the physics layer. The viewer only
    // records which collision groups collide with the ground plane.
    struct PhysicsConfig {
        std::vector<uint32_t> groundCollisionGroups;
        bool groundModelCreated = false;
    };

    // Owns the animated models and the animation clock (30 frames per
    // second). With an audio player attached and playing, the clock follows
    // the audio position.
    class MmdRuntime {
    public:
        explicit MmdRuntime(std::shared_ptr<EvaluationBackend> backend);
        ~MmdRuntime();

        MmdRuntime(const MmdRuntime&) = delete;
        MmdRuntime& operator=(const MmdRuntime&) = delete;

        // Advances and evaluates before every render of `scene`
        void registerScene(scene::Scene& scene);
        void unregisterScene();

        MmdModel& createMmdModel(std::shared_ptr<const assets::ModelData> data, ecs::Entity root, bool sdefEnabled);
        [[nodiscard]] const std::vector<std::unique_ptr<MmdModel>>& models() const { return m_models; }

        void setCamera(scene::MmdCamera* camera);
        [[nodiscard]] scene::MmdCamera* camera() const { return m_camera; }
        void addCameraAnimation(std::shared_ptr<const CameraTrack> track);
        core::Result<void> setCameraAnimation(const std::string& name);

        // Non-owning. Pass nullptr to detach.
        void setAudioPlayer(IAudioPlayer* player);
        [[nodiscard]] IAudioPlayer* audioPlayer() const { return m_audio; }

        // Fails when the camera or any model has no bound animation
        core::Result<void> playAnimation();
        void pauseAnimation();
        void seekAnimation(float frame);

        [[nodiscard]] bool isAnimationPlaying() const { return m_playing; }
        [[nodiscard]] float currentFrameTime() const { return m_frameTime; }
        [[nodiscard]] float currentTime() const { return m_frameTime / kFramesPerSecond; }

        // Longest bound track or audio, in frames
        [[nodiscard]] float animationDuration() const;

        // Moves the clock by `deltaSeconds` (or to the audio position) and
        // applies the pose
        void update(float deltaSeconds);
        void evaluate();

        void createGroundModel(std::vector<uint32_t> collisionGroups);
        [[nodiscard]] const PhysicsConfig& physics() const { return m_physics; }

        bool loggingEnabled = false;

        core::Observable<> onPlayAnimation;
        core::Observable<> onPauseAnimation;
        core::Observable<> onSeekAnimation;
        core::Observable<> onAnimationEnd;

    private:
        void publishSkeleton(const MmdModel& model);

        std::shared_ptr<EvaluationBackend> m_backend;
        scene::Scene* m_scene = nullptr;
        std::vector<std::unique_ptr<MmdModel>> m_models;

        scene::MmdCamera* m_camera = nullptr;
        std::unordered_map<std::string, std::shared_ptr<const CameraTrack>> m_cameraAnimations;
        std::shared_ptr<const CameraTrack> m_cameraTrack;

        IAudioPlayer* m_audio = nullptr;
        core::SubscriptionSet m_audioSubscriptions;
        core::Subscription m_sceneSubscription;
        core::Timer m_timer;

        PhysicsConfig m_physics;
        float m_frameTime = 0.0f;
        bool m_playing = false;
    };

}
