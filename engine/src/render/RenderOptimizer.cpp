#include "mmdv/render/RenderOptimizer.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/core/logger.hpp"

namespace mmdv::render
{
    void RenderOptimizer::armAfterNextFrame()
    {
        if (m_state == OptimizationState::Optimized || m_afterRender.active()) {
            return;
        }
        m_afterRender = m_scene->onAfterRender.addOnce([this] { optimize(); });
    }

    bool RenderOptimizer::optimize()
    {
        if (m_state == OptimizationState::Optimized) {
            return false;
        }
        m_state = OptimizationState::Optimized;

        scene::Scene& scene = *m_scene;
        scene.freezeMaterials();

        const auto meshes = scene.meshes();
        for (ecs::Entity entity : meshes) {
            scene.graph.freezeWorldMatrix(entity);
            auto& mesh = scene.graph.registry.get<scene::MeshComponent>(entity);
            mesh.doNotSyncBoundingInfo = true;
            mesh.isPickable = false;
            mesh.alwaysSelectAsActiveMesh = true;
        }
        m_optimizedMeshes = meshes.size();

        scene.flags.skipPointerMovePicking = true;
        scene.flags.skipPointerDownPicking = true;
        scene.flags.skipPointerUpPicking = true;
        scene.flags.skipFrustumClipping = true;
        scene.flags.blockMaterialDirtyMechanism = true;

        core::Logger::info("Scene optimized: {} meshes frozen", m_optimizedMeshes);
        return true;
    }
}
