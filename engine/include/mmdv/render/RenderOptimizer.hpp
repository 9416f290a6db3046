#pragma once

#include <cstddef>
#include <cstdint>

#include "mmdv/core/Observable.hpp"

namespace mmdv::scene { class Scene; }

namespace mmdv::render
{
    enum class OptimizationState : uint8_t {
        Unoptimized,
        Optimized
    };

    // Freezes static scene state once the first frame after construction has
    // rendered. One-way: meshes created afterwards keep their defaults.
    class RenderOptimizer
    {
    public:
        explicit RenderOptimizer(scene::Scene& scene) : m_scene(&scene) {}

        RenderOptimizer(const RenderOptimizer&) = delete;
        RenderOptimizer& operator=(const RenderOptimizer&) = delete;

        // Applies optimize() after the next completed frame
        void armAfterNextFrame();

        // Returns false if the scene was already optimized
        bool optimize();

        [[nodiscard]] OptimizationState state() const { return m_state; }
        [[nodiscard]] size_t optimizedMeshCount() const { return m_optimizedMeshes; }

    private:
        scene::Scene* m_scene;
        core::Subscription m_afterRender;
        OptimizationState m_state = OptimizationState::Unoptimized;
        size_t m_optimizedMeshes = 0;
    };
}
