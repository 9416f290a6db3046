#include "mmdv/render/SdlRenderBackend.hpp"
#include "mmdv/platform/window.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/core/logger.hpp"

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>
#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <string>

namespace mmdv::render
{
    namespace
    {
        constexpr float kNearW = 1e-3f;
    }

    SdlRenderBackend::SdlRenderBackend(platform::Window& window, bool vsync)
    {
        m_renderer = SDL_CreateRenderer(window.get(), nullptr);
        if (m_renderer == nullptr) {
            throw cpptrace::runtime_error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        }
        if (vsync && !SDL_SetRenderVSync(m_renderer, 1)) {
            core::Logger::warn("VSync unavailable: {}", SDL_GetError());
        }
        SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGui::GetIO().IniFilename = nullptr;
        ImGui::StyleColorsDark();
        ImGui_ImplSDL3_InitForSDLRenderer(window.get(), m_renderer);
        ImGui_ImplSDLRenderer3_Init(m_renderer);

        resize(static_cast<uint32_t>(window.width()), static_cast<uint32_t>(window.height()));
        core::Logger::info("Render backend: {} ({})", name(), SDL_GetRendererName(m_renderer));
    }

    SdlRenderBackend::~SdlRenderBackend()
    {
        ImGui_ImplSDLRenderer3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        SDL_DestroyRenderer(m_renderer);
    }

    void SdlRenderBackend::processEvent(const SDL_Event& event)
    {
        ImGui_ImplSDL3_ProcessEvent(&event);
    }

    void SdlRenderBackend::beginFrame()
    {
        ImGui_ImplSDLRenderer3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();
        m_frameStarted = true;
        if (m_overlay) {
            m_overlay();
        }
    }

    void SdlRenderBackend::resize(uint32_t width, uint32_t height)
    {
        m_width = static_cast<float>(std::max(width, 1u));
        m_height = static_cast<float>(std::max(height, 1u));
    }

    void SdlRenderBackend::drawLine(const glm::mat4& viewProj, const glm::vec3& a, const glm::vec3& b)
    {
        const glm::vec4 ca = viewProj * glm::vec4(a, 1.0f);
        const glm::vec4 cb = viewProj * glm::vec4(b, 1.0f);
        if (ca.w <= kNearW || cb.w <= kNearW) {
            return;
        }
        const glm::vec2 na = glm::vec2(ca) / ca.w;
        const glm::vec2 nb = glm::vec2(cb) / cb.w;
        SDL_RenderLine(m_renderer,
                       (na.x * 0.5f + 0.5f) * m_width, (0.5f - na.y * 0.5f) * m_height,
                       (nb.x * 0.5f + 0.5f) * m_width, (0.5f - nb.y * 0.5f) * m_height);
    }

    void SdlRenderBackend::drawScene(const scene::Scene& scene)
    {
        int w = 0;
        int h = 0;
        if (SDL_GetRenderOutputSize(m_renderer, &w, &h)) {
            resize(static_cast<uint32_t>(w), static_cast<uint32_t>(h));
        }

        const glm::vec4& clear = scene.clearColor;
        SDL_SetRenderDrawColorFloat(m_renderer, clear.r, clear.g, clear.b, clear.a);
        SDL_RenderClear(m_renderer);

        const scene::Camera* camera = scene.activeCamera();
        if (camera == nullptr) {
            return;
        }
        const glm::mat4 viewProj = camera->viewProj();
        auto& registry = const_cast<scene::SceneGraph&>(scene.graph).registry;

        registry.each<scene::GroundMesh>([&](ecs::Entity e, const scene::GroundMesh& ground) {
            const glm::mat4& world = scene.graph.worldMatrix(e);
            float alpha = 1.0f;
            if (const auto* mesh = registry.tryGet<scene::MeshComponent>(e); mesh && mesh->materialIndex >= 0) {
                alpha = scene.materials()[static_cast<size_t>(mesh->materialIndex)].alpha;
            }
            SDL_SetRenderDrawColorFloat(m_renderer, 0.3f, 0.3f, 0.3f, alpha);

            const float hw = ground.width * 0.5f;
            const float hh = ground.height * 0.5f;
            const uint32_t lines = ground.subdivisions * 4;
            for (uint32_t i = 0; i <= lines; ++i) {
                const float t = static_cast<float>(i) / static_cast<float>(lines);
                const float x = -hw + t * ground.width;
                const float z = -hh + t * ground.height;
                drawLine(viewProj, glm::vec3(world * glm::vec4(x, 0.0f, -hh, 1.0f)),
                         glm::vec3(world * glm::vec4(x, 0.0f, hh, 1.0f)));
                drawLine(viewProj, glm::vec3(world * glm::vec4(-hw, 0.0f, z, 1.0f)),
                         glm::vec3(world * glm::vec4(hw, 0.0f, z, 1.0f)));
            }
        });

        SDL_SetRenderDrawColorFloat(m_renderer, 0.1f, 0.1f, 0.15f, 1.0f);
        registry.each<scene::SkeletonPose>([&](ecs::Entity e, const scene::SkeletonPose& skeleton) {
            const glm::mat4& world = scene.graph.worldMatrix(e);
            for (size_t i = 0; i < skeleton.joints.size(); ++i) {
                const int32_t parent = skeleton.parents[i];
                if (parent < 0) {
                    continue;
                }
                drawLine(viewProj, glm::vec3(world * glm::vec4(skeleton.joints[i], 1.0f)),
                         glm::vec3(world * glm::vec4(skeleton.joints[static_cast<size_t>(parent)], 1.0f)));
            }
        });
    }

    void SdlRenderBackend::present()
    {
        if (m_frameStarted) {
            ImGui::Render();
            ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), m_renderer);
            m_frameStarted = false;
        }
        SDL_RenderPresent(m_renderer);
    }
}
