#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "mmdv/core/Observable.hpp"

namespace mmdv::scene { class Scene; }

namespace mmdv::render
{
    // Full-window overlay shown while assets load. Text updates may come
    // from loader threads.
    class LoadingScreen
    {
    public:
        void display();
        void hide();
        [[nodiscard]] bool isVisible() const { return m_visible.load(std::memory_order_acquire); }

        void setText(std::string text);
        [[nodiscard]] std::string text() const;

        // Hides once the next frame of `scene` has rendered
        void hideAfterNextFrame(scene::Scene& scene);

    private:
        mutable std::mutex m_mutex;
        std::string m_text;
        std::atomic<bool> m_visible{false};
        core::Subscription m_afterRender;
    };
}
