#pragma once

namespace mmdv::render { class LoadingScreen; }
namespace mmdv::runtime { class MmdRuntime; }

namespace mmdv::ui
{
    struct EnterVrButton;

    // Dear ImGui widgets drawn over the scene: loading text, VR button and
    // the player control. Call draw() between ImGui::NewFrame and Render.
    class ViewerOverlay
    {
    public:
        ViewerOverlay(render::LoadingScreen& loadingScreen, EnterVrButton& vrButton)
            : m_loadingScreen(&loadingScreen), m_vrButton(&vrButton) {}

        // Player control is shown once a runtime is attached
        void setRuntime(runtime::MmdRuntime* runtime) { m_runtime = runtime; }

        void draw();

    private:
        void drawLoading();
        void drawVrButton();
        void drawPlayerControl();

        render::LoadingScreen* m_loadingScreen;
        EnterVrButton* m_vrButton;
        runtime::MmdRuntime* m_runtime = nullptr;
    };
}
