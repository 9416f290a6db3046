#include "mmdv/app/Application.hpp"
#include "mmdv/app/SceneBuilder.hpp"
#include "mmdv/app/ViewerConfig.hpp"
#include "mmdv/core/logger.hpp"
#include "mmdv/render/LoadingScreen.hpp"
#include "mmdv/render/SdlRenderBackend.hpp"
#include "mmdv/runtime/EngineHooks.hpp"
#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/ui/EnterVrButton.hpp"
#include "mmdv/ui/ViewerOverlay.hpp"
#include "mmdv/xr/OpenXrRuntime.hpp"
#include "mmdv/xr/VrSessionManager.hpp"

using namespace mmdv;

class ViewerApp : public app::Application {
    runtime::EngineHooks m_hooks;
    scene::Scene m_scene;
    render::LoadingScreen m_loadingScreen;
    ui::EnterVrButton m_vrButton;
    std::unique_ptr<render::SdlRenderBackend> m_backend;
    std::unique_ptr<ui::ViewerOverlay> m_overlay;
    std::unique_ptr<app::SceneBuilder> m_builder;

public:
    ViewerApp() : Application({"MMDV - MMD viewer", 1280, 720}) {}

    void onInit() override {
        // Hooks go in before any scene object exists
        runtime::initializeEngineHooks(m_hooks);

        auto settings = app::readViewerSettings();
        if (!settings) {
            throw cpptrace::runtime_error("Invalid configuration: " + settings.error());
        }
        m_window.setSize(settings->windowWidth, settings->windowHeight);

        m_backend = std::make_unique<render::SdlRenderBackend>(m_window, settings->vsync);
        m_scene.resize(static_cast<uint32_t>(m_window.width()), static_cast<uint32_t>(m_window.height()));

        m_overlay = std::make_unique<ui::ViewerOverlay>(m_loadingScreen, m_vrButton);
        m_backend->setOverlay([this] { m_overlay->draw(); });

        m_builder = std::make_unique<app::SceneBuilder>(m_scene, m_loadingScreen, m_vrButton, m_hooks,
                                                        std::move(*settings),
                                                        std::make_unique<xr::OpenXrRuntime>());
        m_builder->start();
    }

    void onEvent(const SDL_Event& event) override {
        m_backend->processEvent(event);
    }

    void onUpdate(float /*dt*/) override {
        if (!m_builder->finished() && m_builder->poll()) {
            m_overlay->setRuntime(m_builder->runtime());
        }

        xr::VrSessionManager* vr = m_builder->vrSession();
        if (m_input.wasKeyPressed(SDL_SCANCODE_ESCAPE)) {
            if (vr != nullptr && vr->state() == xr::XrState::InXr) {
                vr->exitXr();
            } else {
                m_window.requestClose();
            }
        }
        if (m_input.wasKeyPressed(SDL_SCANCODE_SPACE)) {
            togglePlayback();
        }

        if (vr != nullptr) {
            vr->update();
        }
    }

    void onRenderFrame(float /*dt*/) override {
        m_backend->beginFrame();
        m_scene.render(*m_backend);
    }

    void onResize(int width, int height) override {
        const auto w = static_cast<uint32_t>(width);
        const auto h = static_cast<uint32_t>(height);
        m_scene.resize(w, h);
        if (m_backend) {
            m_backend->resize(w, h);
        }
    }

    void onShutdown() override {
        m_overlay->setRuntime(nullptr);
        m_builder.reset();
    }

private:
    void togglePlayback() {
        runtime::MmdRuntime* rt = m_builder->runtime();
        if (rt == nullptr) {
            return;
        }
        if (rt->isAnimationPlaying()) {
            rt->pauseAnimation();
        } else if (auto r = rt->playAnimation(); !r) {
            Log::warn("Cannot play: {}", r.error());
        }
    }
};

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    ViewerApp app;
    return app.run();
}
