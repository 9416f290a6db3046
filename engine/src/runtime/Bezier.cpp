#include "mmdv/runtime/Bezier.hpp"

#include <algorithm>
#include <cmath>

namespace mmdv::runtime {

    namespace {
        float cubic(float t, float p1, float p2)
        {
            const float it = 1.0f - t;
            return 3.0f * it * it * t * p1 + 3.0f * it * t * t * p2 + t * t * t;
        }
    }

    Bezier::Bezier(uint8_t x1, uint8_t y1, uint8_t x2, uint8_t y2)
        : m_cp1(static_cast<float>(x1) / 127.0f, static_cast<float>(y1) / 127.0f)
        , m_cp2(static_cast<float>(x2) / 127.0f, static_cast<float>(y2) / 127.0f)
        , m_linear(x1 == y1 && x2 == y2)
    {
    }

    float Bezier::evalX(float t) const
    {
        return cubic(t, m_cp1.x, m_cp2.x);
    }

    float Bezier::evalY(float t) const
    {
        return cubic(t, m_cp1.y, m_cp2.y);
    }

    float Bezier::findT(float x) const
    {
        constexpr float kEpsilon = 1e-5f;
        constexpr int kMaxIterations = 32;

        float start = 0.0f;
        float stop = 1.0f;
        float t = 0.5f;
        float cx = evalX(t);
        for (int i = 0; i < kMaxIterations && std::abs(x - cx) > kEpsilon; ++i) {
            if (x < cx) {
                stop = t;
            } else {
                start = t;
            }
            t = (start + stop) * 0.5f;
            cx = evalX(t);
        }
        return t;
    }

    float Bezier::ease(float progress) const
    {
        progress = std::clamp(progress, 0.0f, 1.0f);
        if (m_linear) {
            return progress;
        }
        return evalY(findT(progress));
    }

}
