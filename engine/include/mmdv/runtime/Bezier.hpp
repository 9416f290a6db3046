#pragma once

#include <cstdint>
#include <glm/vec2.hpp>

namespace mmdv::runtime {

    // MMD interpolation curve: cubic Bezier from (0,0) to (1,1) with two
    // control points given in 0..127.
    class Bezier {
    public:
        Bezier() = default;
        Bezier(uint8_t x1, uint8_t y1, uint8_t x2, uint8_t y2);

        [[nodiscard]] float evalX(float t) const;
        [[nodiscard]] float evalY(float t) const;

        // Curve parameter whose x equals `x`, found by bisection
        [[nodiscard]] float findT(float x) const;

        // Eased progress for linear progress in [0, 1]
        [[nodiscard]] float ease(float progress) const;

        [[nodiscard]] bool isLinear() const { return m_linear; }
        [[nodiscard]] glm::vec2 cp1() const { return m_cp1; }
        [[nodiscard]] glm::vec2 cp2() const { return m_cp2; }

    private:
        glm::vec2 m_cp1{20.0f / 127.0f};
        glm::vec2 m_cp2{107.0f / 127.0f};
        bool m_linear = true;
    };

}
