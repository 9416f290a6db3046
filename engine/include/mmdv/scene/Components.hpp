#pragma once
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "mmdv/core/ECS.hpp"

namespace mmdv::scene {

    // Tree structure. Children form a doubly linked sibling list.
    struct Relationship {
        ecs::Entity parent = ecs::NULL_ENTITY;
        ecs::Entity firstChild = ecs::NULL_ENTITY;
        ecs::Entity prevSibling = ecs::NULL_ENTITY;
        ecs::Entity nextSibling = ecs::NULL_ENTITY;
        ecs::Entity lastChild = ecs::NULL_ENTITY;
        uint16_t level = 0;
    };

    // Local TRS. Rotation is Euler angles in radians applied yaw (Y),
    // pitch (X), roll (Z).
    struct Transform {
        glm::vec3 position{0.0f};
        glm::vec3 rotation{0.0f};
        glm::vec3 scaling{1.0f};
    };

    struct WorldTransform {
        glm::mat4 matrix{1.0f};
    };

    struct TransformDirtyTag {};
    // World matrix is no longer recomputed
    struct FrozenWorldMatrixTag {};

    struct MeshComponent {
        int32_t materialIndex = -1;
        uint32_t indexStart = 0;
        uint32_t indexCount = 0;
        bool receiveShadows = false;
        bool isPickable = true;
        bool alwaysSelectAsActiveMesh = false;
        bool doNotSyncBoundingInfo = false;
    };

    // Flat plane in the XZ plane centered on the node
    struct GroundMesh {
        float width = 1.0f;
        float height = 1.0f;
        uint32_t subdivisions = 1;
    };

    // Marks the root mesh of a loaded model. Index into MmdRuntime models.
    struct ModelComponent {
        int32_t modelIndex = -1;
    };

    // Joint positions in the owning node's space, refreshed by the runtime
    // each frame. parents[i] is -1 for root joints.
    struct SkeletonPose {
        std::vector<glm::vec3> joints;
        std::vector<int32_t> parents;
    };

    struct Name {
        std::string str;
    };
}
