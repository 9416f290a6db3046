#include "mmdv/scene/Scene.hpp"
#include "mmdv/render/IRenderBackend.hpp"
#include "mmdv/core/logger.hpp"

#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <string>

namespace mmdv::scene {

    ecs::Entity Scene::createTransformNode(const std::string& name, ecs::Entity parent)
    {
        return graph.createNode(name, parent);
    }

    ecs::Entity Scene::createMesh(const std::string& name, const MeshComponent& mesh, ecs::Entity parent)
    {
        const ecs::Entity entity = graph.createNode(name, parent);
        graph.registry.emplace<MeshComponent>(entity, mesh);
        return entity;
    }

    ecs::Entity Scene::createGround(const std::string& name, const GroundOptions& options, ecs::Entity parent)
    {
        const uint32_t subdivisions = std::max(options.subdivisions, 1u);
        MeshComponent mesh{};
        mesh.indexCount = subdivisions * subdivisions * 6;
        const ecs::Entity entity = createMesh(name, mesh, parent);
        graph.registry.emplace<GroundMesh>(entity, options.width, options.height, subdivisions);
        return entity;
    }

    DirectionalLight& Scene::createDirectionalLight(const std::string& name, const glm::vec3& direction)
    {
        auto light = std::make_unique<DirectionalLight>();
        light->name = name;
        light->direction = direction;
        m_lights.push_back(std::move(light));
        return *m_lights.back();
    }

    ShadowGenerator& Scene::createShadowGenerator(const DirectionalLight& light, const ShadowSettings& settings)
    {
        m_shadowGenerators.push_back(std::make_unique<ShadowGenerator>(light, settings));
        return *m_shadowGenerators.back();
    }

    render::DefaultRenderingPipeline& Scene::createDefaultPipeline(const std::string& name, bool hdr,
                                                                   std::vector<Camera*> cameras)
    {
        m_pipelines.push_back(std::make_unique<render::DefaultRenderingPipeline>(name, hdr, std::move(cameras)));
        return *m_pipelines.back();
    }

    int32_t Scene::addMaterial(Material material)
    {
        m_materials.push_back(std::move(material));
        return static_cast<int32_t>(m_materials.size() - 1);
    }

    Material& Scene::material(int32_t index)
    {
        if (index < 0 || static_cast<size_t>(index) >= m_materials.size()) {
            throw cpptrace::out_of_range("Scene::material: index " + std::to_string(index) + " out of range");
        }
        return m_materials[static_cast<size_t>(index)];
    }

    void Scene::freezeMaterials()
    {
        for (auto& mat : m_materials) {
            mat.frozen = true;
        }
    }

    std::vector<ecs::Entity> Scene::meshes()
    {
        return graph.registry.pool<MeshComponent>().entities();
    }

    render::DefaultRenderingPipeline* Scene::defaultPipeline() const
    {
        return m_pipelines.empty() ? nullptr : m_pipelines.front().get();
    }

    void Scene::resize(uint32_t width, uint32_t height)
    {
        m_width = std::max(width, 1u);
        m_height = std::max(height, 1u);
    }

    float Scene::aspectRatio() const
    {
        return static_cast<float>(m_width) / static_cast<float>(m_height);
    }

    void Scene::render(render::IRenderBackend& backend)
    {
        onBeforeRender.notify();

        graph.updateTransforms();
        const float aspect = aspectRatio();
        for (auto& camera : m_cameras) {
            camera->updateMatrices(graph, aspect);
        }

        backend.drawScene(*this);
        backend.present();

        onAfterRender.notify();
        ++m_frameCount;
    }

}
