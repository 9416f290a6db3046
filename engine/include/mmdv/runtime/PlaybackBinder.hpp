#pragma once

#include <memory>

#include "mmdv/assets/ModelData.hpp"
#include "mmdv/core/ECS.hpp"
#include "mmdv/core/Observable.hpp"
#include "mmdv/core/result.hpp"
#include "mmdv/runtime/AnimationTrack.hpp"

namespace mmdv::scene
{
    class Scene;
    class MmdCamera;
    class ShadowGenerator;
}

namespace mmdv::runtime
{
    class IAudioPlayer;
    class MmdModel;
    class MmdRuntime;

    struct PlaybackSources
    {
        std::shared_ptr<const assets::ModelData> model;
        std::shared_ptr<const MotionTrack> motion;
        std::shared_ptr<const CameraTrack> cameraMotion;
        IAudioPlayer* audio = nullptr;
    };

    // Puts a loaded model into the scene, attaches both tracks, ties the
    // audio to the animation clock and starts playback. Shadow casting is
    // registered at the start of the next rendered frame.
    class PlaybackBinder
    {
    public:
        PlaybackBinder(scene::Scene& scene, MmdRuntime& runtime, scene::MmdCamera& camera,
                       scene::ShadowGenerator& shadowGenerator)
            : m_scene(&scene), m_runtime(&runtime), m_camera(&camera), m_shadowGenerator(&shadowGenerator) {}

        PlaybackBinder(const PlaybackBinder&) = delete;
        PlaybackBinder& operator=(const PlaybackBinder&) = delete;

        core::Result<MmdModel*> bind(const PlaybackSources& sources, ecs::Entity parent, bool sdefEnabled);

        [[nodiscard]] bool shadowRegistrationPending() const { return m_shadowRegistration.active(); }

    private:
        ecs::Entity spawnModel(const assets::ModelData& data, ecs::Entity parent);

        scene::Scene* m_scene;
        MmdRuntime* m_runtime;
        scene::MmdCamera* m_camera;
        scene::ShadowGenerator* m_shadowGenerator;
        core::Subscription m_shadowRegistration;
    };
}
