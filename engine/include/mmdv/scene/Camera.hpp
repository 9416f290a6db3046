#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <string>
#include <utility>
#include "mmdv/core/ECS.hpp"

namespace mmdv::scene {

    class SceneGraph;

    // Local axes in camera space. Cameras look down -Z.
    namespace axis {
        inline constexpr glm::vec3 Forward{0.0f, 0.0f, -1.0f};
        inline constexpr glm::vec3 Backward{0.0f, 0.0f, 1.0f};
        inline constexpr glm::vec3 Right{1.0f, 0.0f, 0.0f};
        inline constexpr glm::vec3 Up{0.0f, 1.0f, 0.0f};
    }

    class Camera {
    public:
        Camera(std::string name, ecs::Entity node) : m_name(std::move(name)), m_node(node) {}
        virtual ~Camera() = default;

        Camera(const Camera&) = delete;
        Camera& operator=(const Camera&) = delete;

        // Rebuilds view and projection from the node's world matrix
        virtual void updateMatrices(const SceneGraph& graph, float aspect);

        // World-space direction of a camera-local axis
        [[nodiscard]] glm::vec3 getDirection(const glm::vec3& localAxis) const;

        [[nodiscard]] const std::string& name() const noexcept { return m_name; }
        [[nodiscard]] ecs::Entity node() const noexcept { return m_node; }

        [[nodiscard]] const glm::mat4& view() const noexcept { return m_view; }
        [[nodiscard]] const glm::mat4& proj() const noexcept { return m_proj; }
        [[nodiscard]] glm::mat4 viewProj() const noexcept { return m_proj * m_view; }
        [[nodiscard]] glm::vec3 globalPosition() const noexcept { return m_globalPosition; }

        float minZ = 0.1f;
        float maxZ = 1000.0f;
        float fov = 0.8f;   // vertical, radians
        float inertia = 0.9f;

    protected:
        std::string m_name;
        ecs::Entity m_node;
        glm::mat4 m_view{1.0f};
        glm::mat4 m_proj{1.0f};
        glm::quat m_worldRotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 m_globalPosition{0.0f};
    };

    // Orbit camera driven by MMD camera keys: the eye sits at `distance`
    // from `target` along the rotated view axis.
    class MmdCamera : public Camera {
    public:
        MmdCamera(std::string name, ecs::Entity node, const glm::vec3& target)
            : Camera(std::move(name), node), target(target) {}

        void updateMatrices(const SceneGraph& graph, float aspect) override;

        glm::vec3 target{0.0f};
        glm::vec3 rotation{0.0f};    // radians, MMD convention
        float distance = -45.0f;

        // Name of the camera track to evaluate, empty when unbound
        std::string animationName;
    };

    // Head-mounted display camera. The pose comes from the XR runtime and is
    // relative to the camera's node (the locomotion anchor).
    class XrDeviceCamera : public Camera {
    public:
        using Camera::Camera;

        void updateMatrices(const SceneGraph& graph, float aspect) override;

        void setDevicePose(const glm::vec3& position, const glm::quat& orientation) {
            m_devicePosition = position;
            m_deviceOrientation = orientation;
        }

        // Offset added to the tracked head position, in rig space
        glm::vec3 position{0.0f};

        [[nodiscard]] const glm::quat& deviceOrientation() const { return m_deviceOrientation; }

    private:
        glm::vec3 m_devicePosition{0.0f};
        glm::quat m_deviceOrientation{1.0f, 0.0f, 0.0f, 0.0f};
    };

} // namespace mmdv::scene
