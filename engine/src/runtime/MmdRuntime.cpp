#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/runtime/AudioPlayer.hpp"
#include "mmdv/scene/Camera.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/core/logger.hpp"

#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <format>

namespace mmdv::runtime {

    MmdRuntime::MmdRuntime(std::shared_ptr<EvaluationBackend> backend)
        : m_backend(std::move(backend))
    {
        if (!m_backend) {
            throw cpptrace::invalid_argument("MmdRuntime requires an evaluation backend");
        }
    }

    MmdRuntime::~MmdRuntime()
    {
        setAudioPlayer(nullptr);
    }

    void MmdRuntime::registerScene(scene::Scene& scene)
    {
        m_scene = &scene;
        m_timer.reset();
        m_sceneSubscription = scene.onBeforeRender.add([this] {
            update(m_timer.deltaTime());
        });
    }

    void MmdRuntime::unregisterScene()
    {
        m_sceneSubscription.reset();
        m_scene = nullptr;
    }

    MmdModel& MmdRuntime::createMmdModel(std::shared_ptr<const assets::ModelData> data, ecs::Entity root,
                                         bool sdefEnabled)
    {
        const bool sdef = sdefEnabled && data->usesSdef();
        m_models.push_back(std::make_unique<MmdModel>(std::move(data), root, sdef));
        MmdModel& model = *m_models.back();
        if (loggingEnabled) {
            core::Logger::info("MMD model created: \"{}\" ({} bones, SDEF {})", model.data().header.modelName,
                               model.data().bones.size(), sdef ? "on" : "off");
        }
        return model;
    }

    void MmdRuntime::setCamera(scene::MmdCamera* camera)
    {
        m_camera = camera;
        m_cameraTrack.reset();
    }

    void MmdRuntime::addCameraAnimation(std::shared_ptr<const CameraTrack> track)
    {
        if (!track) {
            return;
        }
        const std::string name = track->name();
        m_cameraAnimations[name] = std::move(track);
    }

    core::Result<void> MmdRuntime::setCameraAnimation(const std::string& name)
    {
        if (m_camera == nullptr) {
            return core::Unexpected(std::string("no camera is attached to the runtime"));
        }
        auto it = m_cameraAnimations.find(name);
        if (it == m_cameraAnimations.end()) {
            return core::Unexpected(std::format("no camera animation named \"{}\"", name));
        }
        m_cameraTrack = it->second;
        m_camera->animationName = name;
        return {};
    }

    void MmdRuntime::setAudioPlayer(IAudioPlayer* player)
    {
        if (m_audio == player) {
            return;
        }
        m_audioSubscriptions.clear();
        m_audio = player;
        if (m_audio == nullptr) {
            return;
        }

        // Pausing from the audio side (device loss, end of stream) stops the clock
        m_audioSubscriptions.add(m_audio->onPause.add([this] {
            if (m_playing) {
                m_playing = false;
                onPauseAnimation.notify();
            }
        }));
        m_audio->setCurrentTime(currentTime());
    }

    core::Result<void> MmdRuntime::playAnimation()
    {
        if (m_camera != nullptr && !m_cameraTrack) {
            return core::Unexpected(std::format("camera \"{}\" has no bound animation", m_camera->name()));
        }
        for (const auto& model : m_models) {
            if (!model->hasAnimation()) {
                return core::Unexpected(std::format("model \"{}\" has no bound animation",
                                                    model->data().header.modelName));
            }
        }
        if (m_playing) {
            return {};
        }

        if (m_audio != nullptr) {
            m_audio->setCurrentTime(currentTime());
            if (auto r = m_audio->play(); !r) {
                core::Logger::warn("Audio unavailable, animating without it: {}", r.error());
            }
        }

        m_playing = true;
        m_timer.reset();
        if (loggingEnabled) {
            core::Logger::info("Animation playing from frame {:.1f}", m_frameTime);
        }
        onPlayAnimation.notify();
        return {};
    }

    void MmdRuntime::pauseAnimation()
    {
        if (!m_playing) {
            return;
        }
        m_playing = false;
        if (m_audio != nullptr) {
            m_audio->pause();
        }
        if (loggingEnabled) {
            core::Logger::info("Animation paused at frame {:.1f}", m_frameTime);
        }
        onPauseAnimation.notify();
    }

    void MmdRuntime::seekAnimation(float frame)
    {
        m_frameTime = std::clamp(frame, 0.0f, animationDuration());
        if (m_audio != nullptr) {
            m_audio->setCurrentTime(currentTime());
        }
        evaluate();
        onSeekAnimation.notify();
    }

    float MmdRuntime::animationDuration() const
    {
        uint32_t frames = m_cameraTrack ? m_cameraTrack->duration() : 0;
        for (const auto& model : m_models) {
            if (const MotionTrack* track = model->currentAnimation()) {
                frames = std::max(frames, track->duration());
            }
        }
        float duration = static_cast<float>(frames);
        if (m_audio != nullptr) {
            duration = std::max(duration, static_cast<float>(m_audio->duration()) * kFramesPerSecond);
        }
        return duration;
    }

    void MmdRuntime::update(float deltaSeconds)
    {
        if (m_playing) {
            if (m_audio != nullptr && m_audio->isPlaying()) {
                m_frameTime = static_cast<float>(m_audio->currentTime()) * kFramesPerSecond;
            } else {
                m_frameTime += deltaSeconds * kFramesPerSecond;
            }

            const float duration = animationDuration();
            if (m_frameTime >= duration) {
                m_frameTime = duration;
                pauseAnimation();
                onAnimationEnd.notify();
            }
        }
        evaluate();
    }

    void MmdRuntime::evaluate()
    {
        for (auto& model : m_models) {
            model->evaluate(m_frameTime, *m_backend);
            if (m_scene != nullptr) {
                publishSkeleton(*model);
            }
        }
        if (m_camera != nullptr && m_cameraTrack) {
            const CameraPose pose = m_cameraTrack->evaluate(m_frameTime);
            m_camera->target = pose.target;
            m_camera->rotation = pose.rotation;
            m_camera->distance = pose.distance;
            m_camera->fov = pose.fov;
        }
    }

    void MmdRuntime::publishSkeleton(const MmdModel& model)
    {
        auto* skeleton = m_scene->graph.registry.tryGet<scene::SkeletonPose>(model.root());
        if (skeleton == nullptr) {
            return;
        }
        const auto& transforms = model.boneTransforms();
        skeleton->joints.resize(transforms.size());
        skeleton->parents.resize(transforms.size());
        for (size_t i = 0; i < transforms.size(); ++i) {
            skeleton->joints[i] = glm::vec3(transforms[i][3]);
            skeleton->parents[i] = model.data().bones[i].parentIndex;
        }
    }

    void MmdRuntime::createGroundModel(std::vector<uint32_t> collisionGroups)
    {
        m_physics.groundCollisionGroups = std::move(collisionGroups);
        m_physics.groundModelCreated = true;
        if (loggingEnabled) {
            core::Logger::info("Ground collision model registered for {} group(s)",
                               m_physics.groundCollisionGroups.size());
        }
    }

}
