#pragma once

#include <chrono>

namespace mmdv::core {

    // Frame timer. deltaTime() consumes the interval since the previous call.
    class Timer {
    public:
        Timer() { reset(); }

        void reset() {
            m_start = std::chrono::steady_clock::now();
            m_lastFrame = m_start;
        }

        [[nodiscard]] float deltaTime() {
            auto now = std::chrono::steady_clock::now();
            std::chrono::duration<float> delta = now - m_lastFrame;
            m_lastFrame = now;
            return delta.count();
        }

        [[nodiscard]] double sinceStart() const {
            std::chrono::duration<double> total = std::chrono::steady_clock::now() - m_start;
            return total.count();
        }

    private:
        std::chrono::steady_clock::time_point m_start;
        std::chrono::steady_clock::time_point m_lastFrame;
    };

}
