#pragma once

#include <future>
#include <memory>

#include "mmdv/app/AssetLoader.hpp"
#include "mmdv/app/ViewerConfig.hpp"
#include "mmdv/core/ECS.hpp"
#include "mmdv/render/RenderOptimizer.hpp"

namespace mmdv::scene
{
    class Scene;
    class MmdCamera;
    class XrDeviceCamera;
    struct DirectionalLight;
}
namespace mmdv::render { class LoadingScreen; }
namespace mmdv::ui { struct EnterVrButton; }
namespace mmdv::runtime
{
    struct EngineHooks;
    class MmdRuntime;
    class MiniaudioPlayer;
    class PlaybackBinder;
}
namespace mmdv::xr
{
    class XrRuntime;
    class VrSessionManager;
}

namespace mmdv::app
{
    // Builds the stage in two steps: start() assembles the static scene and
    // launches the asset load, poll() completes the scene once the load has
    // resolved. The main loop keeps rendering the loading screen meanwhile.
    class SceneBuilder
    {
    public:
        SceneBuilder(scene::Scene& scene, render::LoadingScreen& loadingScreen, ui::EnterVrButton& vrButton,
                     runtime::EngineHooks& hooks, ViewerSettings settings,
                     std::unique_ptr<xr::XrRuntime> xrRuntime);
        ~SceneBuilder();

        SceneBuilder(const SceneBuilder&) = delete;
        SceneBuilder& operator=(const SceneBuilder&) = delete;

        void start();

        // True once the scene is complete. Throws cpptrace::runtime_error
        // when the asset load failed.
        bool poll();

        [[nodiscard]] bool finished() const { return m_finished; }
        [[nodiscard]] runtime::MmdRuntime* runtime() const { return m_runtime.get(); }
        [[nodiscard]] xr::VrSessionManager* vrSession() const { return m_vrSession.get(); }
        [[nodiscard]] ecs::Entity mmdRoot() const { return m_mmdRoot; }
        [[nodiscard]] scene::MmdCamera* mmdCamera() const { return m_mmdCamera; }

    private:
        void setupScene();
        void createMmdRoot();
        void createMmdCamera();
        void createDirectionalLight();
        void createGround();
        void setupAudioPlayer();

        void finish(LoadedAssets assets);
        void setupMmdRuntime(LoadedAssets& assets);
        void setupRenderingPipeline();
        void setupXrExperience();

        scene::Scene* m_scene;
        render::LoadingScreen* m_loadingScreen;
        ui::EnterVrButton* m_vrButton;
        runtime::EngineHooks* m_hooks;
        ViewerSettings m_settings;

        ecs::Entity m_mmdRoot = ecs::NULL_ENTITY;
        ecs::Entity m_ground = ecs::NULL_ENTITY;
        scene::MmdCamera* m_mmdCamera = nullptr;
        scene::DirectionalLight* m_light = nullptr;
        std::unique_ptr<runtime::MiniaudioPlayer> m_audioPlayer;

        std::shared_ptr<assets::ProgressBoard> m_progress;
        std::future<core::Result<LoadedAssets>> m_pending;

        std::unique_ptr<runtime::MmdRuntime> m_runtime;
        std::unique_ptr<runtime::PlaybackBinder> m_binder;
        render::RenderOptimizer m_optimizer;

        std::unique_ptr<xr::XrRuntime> m_xrRuntime;
        std::unique_ptr<xr::VrSessionManager> m_vrSession;
        scene::XrDeviceCamera* m_xrCamera = nullptr;
        ecs::Entity m_cameraRoot = ecs::NULL_ENTITY;

        bool m_started = false;
        bool m_finished = false;
    };
}
