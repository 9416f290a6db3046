#pragma once
#include <cstdint>
#include <vector>
#include "mmdv/core/ECS.hpp"

namespace mmdv::scene {

    struct DirectionalLight;
    class SceneGraph;

    struct ShadowSettings {
        uint32_t mapSize = 1024;
        bool useFullFloat = true;
        bool usePoissonSampling = false;
        bool useBlurExponentialShadowMap = false;
        bool usePercentageCloserFiltering = false;
        bool transparencyShadow = false;
        bool forceBackFacesOnly = false;
        float frustumEdgeFalloff = 0.0f;
    };

    class ShadowGenerator {
    public:
        ShadowGenerator(const DirectionalLight& light, ShadowSettings settings)
            : m_light(&light), m_settings(settings) {}

        void addShadowCaster(ecs::Entity entity, bool includeDescendants = true);
        void removeShadowCaster(ecs::Entity entity);

        // True when entity, or an ancestor registered with descendants, casts
        [[nodiscard]] bool isCaster(const SceneGraph& graph, ecs::Entity entity) const;

        [[nodiscard]] const DirectionalLight& light() const { return *m_light; }
        [[nodiscard]] const ShadowSettings& settings() const { return m_settings; }
        [[nodiscard]] size_t casterCount() const { return m_casters.size(); }

    private:
        struct Caster {
            ecs::Entity entity;
            bool includeDescendants;
        };

        const DirectionalLight* m_light;
        ShadowSettings m_settings;
        std::vector<Caster> m_casters;
    };

}
