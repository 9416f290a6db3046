#include "mmdv/render/LoadingScreen.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/core/logger.hpp"

namespace mmdv::render
{
    void LoadingScreen::display()
    {
        m_visible.store(true, std::memory_order_release);
        core::Logger::debug("Loading screen shown");
    }

    void LoadingScreen::hide()
    {
        m_visible.store(false, std::memory_order_release);
        core::Logger::debug("Loading screen hidden");
    }

    void LoadingScreen::setText(std::string text)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_text = std::move(text);
    }

    std::string LoadingScreen::text() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_text;
    }

    void LoadingScreen::hideAfterNextFrame(scene::Scene& scene)
    {
        m_afterRender = scene.onAfterRender.addOnce([this] { hide(); });
    }
}
