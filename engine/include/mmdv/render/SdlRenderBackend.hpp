#pragma once

#include <SDL3/SDL.h>
#include <glm/glm.hpp>
#include <functional>

#include "mmdv/render/IRenderBackend.hpp"

namespace mmdv::platform { class Window; }

namespace mmdv::render
{
    // Desktop preview on SDL_Renderer: ground grid and model skeletons
    // projected through the active camera, with the Dear ImGui overlay on top.
    class SdlRenderBackend final : public IRenderBackend
    {
    public:
        explicit SdlRenderBackend(platform::Window& window, bool vsync = true);
        ~SdlRenderBackend() override;

        SdlRenderBackend(const SdlRenderBackend&) = delete;
        SdlRenderBackend& operator=(const SdlRenderBackend&) = delete;

        void processEvent(const SDL_Event& event);

        // Starts the ImGui frame and runs the overlay callback
        void beginFrame();
        void setOverlay(std::function<void()> overlay) { m_overlay = std::move(overlay); }

        void resize(uint32_t width, uint32_t height) override;
        void drawScene(const scene::Scene& scene) override;
        void present() override;
        [[nodiscard]] const char* name() const override { return "SDL_Renderer"; }

    private:
        void drawLine(const glm::mat4& viewProj, const glm::vec3& a, const glm::vec3& b);

        SDL_Renderer* m_renderer = nullptr;
        std::function<void()> m_overlay;
        float m_width = 1.0f;
        float m_height = 1.0f;
        bool m_frameStarted = false;
    };
}
