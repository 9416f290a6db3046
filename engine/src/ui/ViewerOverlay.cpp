#include "mmdv/ui/ViewerOverlay.hpp"
#include "mmdv/ui/EnterVrButton.hpp"
#include "mmdv/render/LoadingScreen.hpp"
#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/core/logger.hpp"

#include <imgui.h>
#include <cmath>
#include <string>

namespace mmdv::ui
{
    namespace
    {
        std::string formatClock(float seconds)
        {
            const int total = static_cast<int>(std::floor(seconds));
            return std::to_string(total / 60) + ":" + (total % 60 < 10 ? "0" : "") + std::to_string(total % 60);
        }
    }

    void ViewerOverlay::draw()
    {
        if (m_loadingScreen->isVisible()) {
            drawLoading();
            return;
        }
        if (m_vrButton->visible) {
            drawVrButton();
        }
        if (m_runtime != nullptr) {
            drawPlayerControl();
        }
    }

    void ViewerOverlay::drawLoading()
    {
        const ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(viewport->Pos);
        ImGui::SetNextWindowSize(viewport->Size);
        ImGui::SetNextWindowBgAlpha(1.0f);
        constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoInputs;
        if (ImGui::Begin("##loading", nullptr, flags)) {
            const std::string text = m_loadingScreen->text();
            const ImVec2 size = ImGui::CalcTextSize(text.c_str());
            ImGui::SetCursorPos(ImVec2((viewport->Size.x - size.x) * 0.5f, (viewport->Size.y - size.y) * 0.5f));
            ImGui::TextUnformatted(text.c_str());
        }
        ImGui::End();
    }

    void ViewerOverlay::drawVrButton()
    {
        const ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(ImVec2(viewport->Pos.x + 10.0f, viewport->Pos.y + 10.0f));
        constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize
            | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBackground;
        if (ImGui::Begin("##vr", nullptr, flags)) {
            if (ImGui::Button(m_vrButton->label.c_str())) {
                m_vrButton->click();
            }
        }
        ImGui::End();
    }

    void ViewerOverlay::drawPlayerControl()
    {
        const ImGuiViewport* viewport = ImGui::GetMainViewport();
        constexpr float kHeight = 44.0f;
        ImGui::SetNextWindowPos(ImVec2(viewport->Pos.x, viewport->Pos.y + viewport->Size.y - kHeight));
        ImGui::SetNextWindowSize(ImVec2(viewport->Size.x, kHeight));
        ImGui::SetNextWindowBgAlpha(0.5f);
        constexpr ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoSavedSettings;
        if (!ImGui::Begin("##player", nullptr, flags)) {
            ImGui::End();
            return;
        }

        runtime::MmdRuntime& rt = *m_runtime;
        if (rt.isAnimationPlaying()) {
            if (ImGui::Button("Pause")) {
                rt.pauseAnimation();
            }
        } else if (ImGui::Button("Play")) {
            if (auto r = rt.playAnimation(); !r) {
                core::Logger::warn("Cannot play: {}", r.error());
            }
        }

        ImGui::SameLine();
        const float duration = rt.animationDuration();
        const std::string clock = formatClock(rt.currentTime()) + " / " + formatClock(duration / runtime::kFramesPerSecond);
        ImGui::TextUnformatted(clock.c_str());

        ImGui::SameLine();
        ImGui::SetNextItemWidth(-1.0f);
        float frame = rt.currentFrameTime();
        if (ImGui::SliderFloat("##seek", &frame, 0.0f, duration, "%.0f")) {
            rt.seekAnimation(frame);
        }
        ImGui::End();
    }
}
