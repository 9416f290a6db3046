#include "mmdv/scene/ShadowGenerator.hpp"
#include "mmdv/scene/SceneGraph.hpp"

#include <algorithm>

namespace mmdv::scene {

    void ShadowGenerator::addShadowCaster(ecs::Entity entity, bool includeDescendants)
    {
        for (auto& caster : m_casters) {
            if (caster.entity == entity) {
                caster.includeDescendants = caster.includeDescendants || includeDescendants;
                return;
            }
        }
        m_casters.push_back({entity, includeDescendants});
    }

    void ShadowGenerator::removeShadowCaster(ecs::Entity entity)
    {
        std::erase_if(m_casters, [entity](const Caster& c) { return c.entity == entity; });
    }

    bool ShadowGenerator::isCaster(const SceneGraph& graph, ecs::Entity entity) const
    {
        return std::any_of(m_casters.begin(), m_casters.end(), [&](const Caster& c) {
            if (c.entity == entity) {
                return true;
            }
            return c.includeDescendants && graph.isDescendantOf(entity, c.entity);
        });
    }

}
