#pragma once
#include "mmdv/core/ECS.hpp"
#include "mmdv/scene/Components.hpp"
#include <glm/glm.hpp>
#include <string>
#include <vector>

namespace mmdv::scene {

    glm::mat4 composeTransform(const Transform& t);

    class SceneGraph {
    public:
        ecs::Registry registry;

        ecs::Entity createNode(const std::string& name, ecs::Entity parent = ecs::NULL_ENTITY);
        void destroyNode(ecs::Entity entity);

        void setParent(ecs::Entity entity, ecs::Entity parent);
        [[nodiscard]] ecs::Entity parentOf(ecs::Entity entity) const;
        [[nodiscard]] bool isDescendantOf(ecs::Entity entity, ecs::Entity ancestor) const;
        [[nodiscard]] std::vector<ecs::Entity> descendants(ecs::Entity entity) const;

        // Local transform access. Mutable access marks the node dirty.
        Transform& transform(ecs::Entity entity);
        [[nodiscard]] const Transform& transform(ecs::Entity entity) const;
        [[nodiscard]] const glm::mat4& worldMatrix(ecs::Entity entity) const;
        [[nodiscard]] const std::string& name(ecs::Entity entity) const;

        void markAsChanged(ecs::Entity entity);
        void freezeWorldMatrix(ecs::Entity entity);

        // Recomputes world matrices of dirty nodes and their subtrees,
        // skipping frozen nodes.
        void updateTransforms();

        [[nodiscard]] const std::vector<ecs::Entity>& roots() const { return m_roots; }

    private:
        void updateTopoOrder();
        void detach(ecs::Entity entity, Relationship& rel);

        std::vector<ecs::Entity> m_topoOrder;
        std::vector<ecs::Entity> m_roots;
        bool m_hierarchyDirty = false;
    };
}
