#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "mmdv/core/Observable.hpp"
#include "mmdv/render/RenderPipeline.hpp"
#include "mmdv/scene/Camera.hpp"
#include "mmdv/scene/Light.hpp"
#include "mmdv/scene/Material.hpp"
#include "mmdv/scene/SceneGraph.hpp"
#include "mmdv/scene/ShadowGenerator.hpp"

namespace mmdv::render { class IRenderBackend; }

namespace mmdv::scene {

    struct SceneFlags {
        bool skipPointerMovePicking = false;
        bool skipPointerDownPicking = false;
        bool skipPointerUpPicking = false;
        bool skipFrustumClipping = false;
        bool blockMaterialDirtyMechanism = false;
    };

    struct GroundOptions {
        float width = 1.0f;
        float height = 1.0f;
        uint32_t subdivisions = 1;
    };

    // Owns every scene object. Cameras, lights and shadow generators have
    // stable addresses for the lifetime of the scene.
    class Scene {
    public:
        Scene() = default;
        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        ecs::Entity createTransformNode(const std::string& name, ecs::Entity parent = ecs::NULL_ENTITY);
        ecs::Entity createMesh(const std::string& name, const MeshComponent& mesh,
                               ecs::Entity parent = ecs::NULL_ENTITY);
        ecs::Entity createGround(const std::string& name, const GroundOptions& options,
                                 ecs::Entity parent = ecs::NULL_ENTITY);

        template <typename T, typename... Args>
        T& addCamera(Args&&... args) {
            auto camera = std::make_unique<T>(std::forward<Args>(args)...);
            T& ref = *camera;
            m_cameras.push_back(std::move(camera));
            if (m_activeCamera == nullptr) {
                m_activeCamera = &ref;
            }
            return ref;
        }

        DirectionalLight& createDirectionalLight(const std::string& name, const glm::vec3& direction);
        ShadowGenerator& createShadowGenerator(const DirectionalLight& light, const ShadowSettings& settings);
        render::DefaultRenderingPipeline& createDefaultPipeline(const std::string& name, bool hdr,
                                                                std::vector<Camera*> cameras);

        int32_t addMaterial(Material material);
        [[nodiscard]] Material& material(int32_t index);
        [[nodiscard]] const std::vector<Material>& materials() const { return m_materials; }

        // Marks every material frozen. Materials added later stay unfrozen.
        void freezeMaterials();

        [[nodiscard]] std::vector<ecs::Entity> meshes();

        [[nodiscard]] Camera* activeCamera() const { return m_activeCamera; }
        void setActiveCamera(Camera* camera) { m_activeCamera = camera; }

        // First post-process pipeline, nullptr when none was created
        [[nodiscard]] render::DefaultRenderingPipeline* defaultPipeline() const;
        [[nodiscard]] const std::vector<std::unique_ptr<ShadowGenerator>>& shadowGenerators() const {
            return m_shadowGenerators;
        }
        [[nodiscard]] const std::vector<std::unique_ptr<DirectionalLight>>& lights() const { return m_lights; }

        void resize(uint32_t width, uint32_t height);
        [[nodiscard]] float aspectRatio() const;

        // One frame: before-render observers, transform and camera update,
        // backend draw, after-render observers.
        void render(render::IRenderBackend& backend);

        [[nodiscard]] uint64_t frameCount() const { return m_frameCount; }

        SceneGraph graph;
        glm::vec4 clearColor{0.2f, 0.2f, 0.3f, 1.0f};
        glm::vec3 ambientColor{0.0f};
        SceneFlags flags;

        core::Observable<> onBeforeRender;
        core::Observable<> onAfterRender;

    private:
        std::vector<std::unique_ptr<Camera>> m_cameras;
        std::vector<std::unique_ptr<DirectionalLight>> m_lights;
        std::vector<std::unique_ptr<ShadowGenerator>> m_shadowGenerators;
        std::vector<std::unique_ptr<render::DefaultRenderingPipeline>> m_pipelines;
        std::vector<Material> m_materials;
        Camera* m_activeCamera = nullptr;
        uint32_t m_width = 1280;
        uint32_t m_height = 720;
        uint64_t m_frameCount = 0;
    };

}
