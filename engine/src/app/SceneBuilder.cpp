#include "mmdv/app/SceneBuilder.hpp"
#include "mmdv/core/TaskSystem.hpp"
#include "mmdv/core/logger.hpp"
#include "mmdv/render/LoadingScreen.hpp"
#include "mmdv/runtime/AudioPlayer.hpp"
#include "mmdv/runtime/EngineHooks.hpp"
#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/runtime/PlaybackBinder.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/ui/EnterVrButton.hpp"
#include "mmdv/xr/VrSessionManager.hpp"
#include "mmdv/xr/XrRuntime.hpp"

#include <cpptrace/cpptrace.hpp>
#include <chrono>

namespace mmdv::app
{
    SceneBuilder::SceneBuilder(scene::Scene& scene, render::LoadingScreen& loadingScreen,
                               ui::EnterVrButton& vrButton, runtime::EngineHooks& hooks, ViewerSettings settings,
                               std::unique_ptr<xr::XrRuntime> xrRuntime)
        : m_scene(&scene), m_loadingScreen(&loadingScreen), m_vrButton(&vrButton), m_hooks(&hooks),
          m_settings(std::move(settings)), m_optimizer(scene), m_xrRuntime(std::move(xrRuntime))
    {
    }

    SceneBuilder::~SceneBuilder()
    {
        // Loads left running by a failed join still report progress; cut
        // them off from the loading screen before it can go away
        if (m_progress) {
            m_progress->setListener({});
        }
        // A load still in flight owns only copies; wait so its tasks do not
        // outlive the scheduler
        if (m_pending.valid()) {
            m_pending.wait();
        }
        m_vrSession.reset();
        if (m_runtime) {
            m_runtime->unregisterScene();
        }
    }

    void SceneBuilder::start()
    {
        if (m_started) {
            return;
        }
        m_started = true;

        if (!m_hooks->initialized) {
            runtime::initializeEngineHooks(*m_hooks);
        }

        setupScene();
        createMmdRoot();
        createMmdCamera();
        createDirectionalLight();
        createGround();
        setupAudioPlayer();

        m_loadingScreen->display();
        m_progress = std::make_shared<assets::ProgressBoard>();
        m_progress->setListener([screen = m_loadingScreen](const std::string& text) { screen->setText(text); });

        AssetRequest request;
        request.motionPath = m_settings.motionPath;
        request.cameraMotionPath = m_settings.cameraMotionPath;
        request.modelPath = m_settings.modelPath;
        request.evaluationMode = m_settings.evaluationMode;

        auto promise = std::make_shared<std::promise<core::Result<LoadedAssets>>>();
        m_pending = promise->get_future();
        core::TaskSystem::launchIo([promise, request, loader = AssetLoader(m_progress, &m_hooks->textureDecoders)]() {
            promise->set_value(loader.load(request));
        });
    }

    bool SceneBuilder::poll()
    {
        if (m_finished || !m_pending.valid()) {
            return m_finished;
        }
        if (m_pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return false;
        }

        core::Result<LoadedAssets> loaded = m_pending.get();
        if (!loaded) {
            core::Logger::error("Scene build failed: {}", loaded.error());
            throw cpptrace::runtime_error("Scene build failed: " + loaded.error());
        }
        finish(std::move(*loaded));
        return true;
    }

    void SceneBuilder::setupScene()
    {
        m_scene->clearColor = glm::vec4(0.95f, 0.95f, 0.95f, 1.0f);
        m_scene->ambientColor = glm::vec3(0.5f, 0.5f, 0.5f);
    }

    void SceneBuilder::createMmdRoot()
    {
        m_mmdRoot = m_scene->createTransformNode("mmdRoot");
        m_scene->graph.transform(m_mmdRoot).position.z = 20.0f;
    }

    void SceneBuilder::createMmdCamera()
    {
        const ecs::Entity node = m_scene->createTransformNode("mmdCamera", m_mmdRoot);
        m_mmdCamera = &m_scene->addCamera<scene::MmdCamera>("mmdCamera", node, glm::vec3(0.0f, 10.0f, 0.0f));
        m_mmdCamera->maxZ = 300.0f;
        m_mmdCamera->minZ = 1.0f;
        m_mmdCamera->inertia = 0.8f;
        m_scene->setActiveCamera(m_mmdCamera);
    }

    void SceneBuilder::createDirectionalLight()
    {
        m_light = &m_scene->createDirectionalLight("DirectionalLight", glm::vec3(0.5f, -1.0f, 1.0f));
        m_light->intensity = 1.0f;
        m_light->autoCalcShadowZBounds = false;
        m_light->autoUpdateExtends = false;
    }

    void SceneBuilder::createGround()
    {
        m_ground = m_scene->createGround("ground1", scene::GroundOptions{100.0f, 100.0f, 2}, m_mmdRoot);

        scene::Material shadowOnly;
        shadowOnly.name = "shadowOnly";
        shadowOnly.type = scene::MaterialType::ShadowOnly;
        shadowOnly.activeLight = m_light;
        shadowOnly.alpha = 0.4f;

        auto& mesh = m_scene->graph.registry.get<scene::MeshComponent>(m_ground);
        mesh.materialIndex = m_scene->addMaterial(std::move(shadowOnly));
        mesh.receiveShadows = true;
    }

    void SceneBuilder::setupAudioPlayer()
    {
        m_audioPlayer = std::make_unique<runtime::MiniaudioPlayer>();
        m_audioPlayer->setPreservesPitch(false);
        m_audioPlayer->setSource(m_settings.audioPath);
    }

    void SceneBuilder::finish(LoadedAssets assets)
    {
        m_loadingScreen->hideAfterNextFrame(*m_scene);
        setupMmdRuntime(assets);
        setupRenderingPipeline();
        setupXrExperience();
        m_finished = true;
        core::Logger::info("Scene ready");
    }

    void SceneBuilder::setupMmdRuntime(LoadedAssets& assets)
    {
        m_runtime = std::make_unique<runtime::MmdRuntime>(assets.backend);
        m_runtime->loggingEnabled = true;
        m_runtime->registerScene(*m_scene);

        scene::ShadowSettings shadowSettings;
        shadowSettings.mapSize = m_settings.shadowMapSize;
        shadowSettings.useFullFloat = true;
        shadowSettings.usePoissonSampling = true;
        shadowSettings.useBlurExponentialShadowMap = true;
        shadowSettings.usePercentageCloserFiltering = true;
        shadowSettings.transparencyShadow = true;
        shadowSettings.forceBackFacesOnly = true;
        shadowSettings.frustumEdgeFalloff = 0.1f;
        scene::ShadowGenerator& shadowGenerator = m_scene->createShadowGenerator(*m_light, shadowSettings);

        m_binder = std::make_unique<runtime::PlaybackBinder>(*m_scene, *m_runtime, *m_mmdCamera, shadowGenerator);
        runtime::PlaybackSources sources;
        sources.model = assets.model;
        sources.motion = assets.motion;
        sources.cameraMotion = assets.cameraMotion;
        sources.audio = m_audioPlayer.get();

        auto bound = m_binder->bind(sources, m_mmdRoot, m_hooks->skinning.sdefEnabled);
        if (!bound) {
            core::Logger::error("Playback setup failed: {}", bound.error());
            throw cpptrace::runtime_error("Playback setup failed: " + bound.error());
        }

        m_optimizer.armAfterNextFrame();
    }

    void SceneBuilder::setupRenderingPipeline()
    {
        render::DefaultRenderingPipeline& pipeline = m_scene->createDefaultPipeline("default", true, {m_mmdCamera});
        pipeline.settings.samples = m_settings.samples;
        pipeline.settings.fxaaEnabled = true;
    }

    void SceneBuilder::setupXrExperience()
    {
        if (!m_xrRuntime) {
            m_vrButton->visible = false;
            core::Logger::info("No XR runtime, VR disabled");
            return;
        }

        m_cameraRoot = m_scene->createTransformNode("cameraRoot");
        const ecs::Entity xrNode = m_scene->createTransformNode("xrCamera", m_cameraRoot);
        m_xrCamera = &m_scene->addCamera<scene::XrDeviceCamera>("xrCamera", xrNode);

        m_vrSession = std::make_unique<xr::VrSessionManager>(*m_xrRuntime, *m_scene, *m_xrCamera, m_cameraRoot,
                                                             *m_vrButton, m_settings.vr);
        m_vrButton->visible = true;
    }
}
