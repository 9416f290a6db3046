#include "mmdv/scene/SceneGraph.hpp"

#include <cpptrace/cpptrace.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/euler_angles.hpp>
#include <algorithm>
#include <stack>

namespace mmdv::scene {

    glm::mat4 composeTransform(const Transform& t) {
        glm::mat4 m = glm::translate(glm::mat4(1.0f), t.position);
        m *= glm::eulerAngleYXZ(t.rotation.y, t.rotation.x, t.rotation.z);
        return glm::scale(m, t.scaling);
    }

    namespace {
        template <typename T>
        const T& require(const ecs::Registry& registry, ecs::Entity entity, const char* what) {
            const T* component = registry.tryGet<T>(entity);
            if (component == nullptr) {
                throw cpptrace::invalid_argument(std::string("SceneGraph: entity has no ") + what);
            }
            return *component;
        }
    }

    ecs::Entity SceneGraph::createNode(const std::string& name, ecs::Entity parent) {
        ecs::Entity entity = registry.create();

        registry.emplace<Transform>(entity);
        registry.emplace<WorldTransform>(entity);
        registry.emplace<Relationship>(entity);
        registry.emplace<Name>(entity, name);
        registry.emplace<TransformDirtyTag>(entity);

        m_roots.push_back(entity);
        m_hierarchyDirty = true;

        if (parent != ecs::NULL_ENTITY) {
            setParent(entity, parent);
        }
        return entity;
    }

    void SceneGraph::destroyNode(ecs::Entity entity) {
        if (!registry.has<Relationship>(entity)) return;

        ecs::Entity child = registry.get<Relationship>(entity).firstChild;
        while (child != ecs::NULL_ENTITY) {
            ecs::Entity next = registry.get<Relationship>(child).nextSibling;
            destroyNode(child);
            child = next;
        }

        detach(entity, registry.get<Relationship>(entity));
        registry.destroy(entity);
        m_hierarchyDirty = true;
    }

    void SceneGraph::detach(ecs::Entity entity, Relationship& rel) {
        if (rel.parent != ecs::NULL_ENTITY) {
            Relationship& parentRel = registry.get<Relationship>(rel.parent);
            if (parentRel.firstChild == entity) parentRel.firstChild = rel.nextSibling;
            if (parentRel.lastChild == entity) parentRel.lastChild = rel.prevSibling;
        } else {
            std::erase(m_roots, entity);
        }

        if (rel.prevSibling != ecs::NULL_ENTITY) {
            registry.get<Relationship>(rel.prevSibling).nextSibling = rel.nextSibling;
        }
        if (rel.nextSibling != ecs::NULL_ENTITY) {
            registry.get<Relationship>(rel.nextSibling).prevSibling = rel.prevSibling;
        }
        rel.parent = ecs::NULL_ENTITY;
        rel.prevSibling = ecs::NULL_ENTITY;
        rel.nextSibling = ecs::NULL_ENTITY;
    }

    void SceneGraph::setParent(ecs::Entity entity, ecs::Entity parent) {
        if (entity == parent || !registry.has<Relationship>(entity)) return;
        if (parent != ecs::NULL_ENTITY) {
            if (!registry.has<Relationship>(parent) || isDescendantOf(parent, entity)) {
                return;
            }
        }

        Relationship& rel = registry.get<Relationship>(entity);
        if (rel.parent == parent) return;
        detach(entity, rel);

        rel.parent = parent;
        if (parent != ecs::NULL_ENTITY) {
            Relationship& parentRel = registry.get<Relationship>(parent);
            rel.level = parentRel.level + 1;
            rel.prevSibling = parentRel.lastChild;
            if (parentRel.firstChild == ecs::NULL_ENTITY) {
                parentRel.firstChild = entity;
            } else {
                registry.get<Relationship>(parentRel.lastChild).nextSibling = entity;
            }
            parentRel.lastChild = entity;
        } else {
            rel.level = 0;
            m_roots.push_back(entity);
        }

        m_hierarchyDirty = true;
        markAsChanged(entity);
    }

    ecs::Entity SceneGraph::parentOf(ecs::Entity entity) const {
        return require<Relationship>(registry, entity, "Relationship").parent;
    }

    bool SceneGraph::isDescendantOf(ecs::Entity entity, ecs::Entity ancestor) const {
        ecs::Entity current = entity;
        while (current != ecs::NULL_ENTITY) {
            if (current == ancestor) return true;
            const Relationship* rel = registry.tryGet<Relationship>(current);
            if (rel == nullptr) return false;
            current = rel->parent;
        }
        return false;
    }

    std::vector<ecs::Entity> SceneGraph::descendants(ecs::Entity entity) const {
        std::vector<ecs::Entity> result;
        const Relationship& rel = require<Relationship>(registry, entity, "Relationship");
        std::stack<ecs::Entity> pending;
        for (ecs::Entity c = rel.firstChild; c != ecs::NULL_ENTITY;
             c = require<Relationship>(registry, c, "Relationship").nextSibling) {
            pending.push(c);
        }
        while (!pending.empty()) {
            ecs::Entity e = pending.top();
            pending.pop();
            result.push_back(e);
            const Relationship& childRel = require<Relationship>(registry, e, "Relationship");
            for (ecs::Entity c = childRel.firstChild; c != ecs::NULL_ENTITY;
                 c = require<Relationship>(registry, c, "Relationship").nextSibling) {
                pending.push(c);
            }
        }
        return result;
    }

    Transform& SceneGraph::transform(ecs::Entity entity) {
        Transform* t = registry.tryGet<Transform>(entity);
        if (t == nullptr) {
            throw cpptrace::invalid_argument("SceneGraph: entity has no Transform");
        }
        markAsChanged(entity);
        return *t;
    }

    const Transform& SceneGraph::transform(ecs::Entity entity) const {
        return require<Transform>(registry, entity, "Transform");
    }

    const glm::mat4& SceneGraph::worldMatrix(ecs::Entity entity) const {
        return require<WorldTransform>(registry, entity, "WorldTransform").matrix;
    }

    const std::string& SceneGraph::name(ecs::Entity entity) const {
        return require<Name>(registry, entity, "Name").str;
    }

    void SceneGraph::markAsChanged(ecs::Entity entity) {
        if (!registry.has<TransformDirtyTag>(entity)) {
            registry.emplace<TransformDirtyTag>(entity);
        }
    }

    void SceneGraph::freezeWorldMatrix(ecs::Entity entity) {
        if (!registry.has<FrozenWorldMatrixTag>(entity)) {
            registry.emplace<FrozenWorldMatrixTag>(entity);
        }
    }

    void SceneGraph::updateTopoOrder() {
        m_topoOrder.clear();
        std::stack<ecs::Entity> stack;
        for (auto it = m_roots.rbegin(); it != m_roots.rend(); ++it) {
            stack.push(*it);
        }

        std::vector<ecs::Entity> children;
        while (!stack.empty()) {
            ecs::Entity e = stack.top();
            stack.pop();
            m_topoOrder.push_back(e);

            children.clear();
            for (ecs::Entity c = registry.get<Relationship>(e).firstChild; c != ecs::NULL_ENTITY;
                 c = registry.get<Relationship>(c).nextSibling) {
                children.push_back(c);
            }
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                stack.push(*it);
            }
        }
        m_hierarchyDirty = false;
    }

    void SceneGraph::updateTransforms() {
        if (m_hierarchyDirty) {
            updateTopoOrder();
        }
        if (registry.count<TransformDirtyTag>() == 0) return;

        for (ecs::Entity e : m_topoOrder) {
            const Relationship& rel = registry.get<Relationship>(e);
            bool dirty = registry.has<TransformDirtyTag>(e);
            if (!dirty && rel.parent != ecs::NULL_ENTITY && registry.has<TransformDirtyTag>(rel.parent)) {
                registry.emplace<TransformDirtyTag>(e);
                dirty = true;
            }
            if (!dirty || registry.has<FrozenWorldMatrixTag>(e)) {
                continue;
            }

            const glm::mat4 local = composeTransform(registry.get<Transform>(e));
            if (rel.parent != ecs::NULL_ENTITY) {
                registry.get<WorldTransform>(e).matrix = registry.get<WorldTransform>(rel.parent).matrix * local;
            } else {
                registry.get<WorldTransform>(e).matrix = local;
            }
        }

        registry.pool<TransformDirtyTag>().clear();
    }
}
