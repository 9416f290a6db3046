#include "mmdv/scene/Camera.hpp"
#include "mmdv/scene/SceneGraph.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/euler_angles.hpp>

namespace mmdv::scene {

    namespace {
        glm::quat worldRotationOf(const glm::mat4& world)
        {
            glm::mat3 basis(world);
            basis[0] = glm::normalize(basis[0]);
            basis[1] = glm::normalize(basis[1]);
            basis[2] = glm::normalize(basis[2]);
            return glm::normalize(glm::quat_cast(basis));
        }
    }

    void Camera::updateMatrices(const SceneGraph& graph, float aspect)
    {
        const glm::mat4& world = graph.worldMatrix(m_node);
        m_globalPosition = glm::vec3(world[3]);
        m_worldRotation = worldRotationOf(world);

        const glm::mat4 rigid = glm::translate(glm::mat4(1.0f), m_globalPosition) * glm::mat4_cast(m_worldRotation);
        m_view = glm::inverse(rigid);
        m_proj = glm::perspective(fov, aspect, minZ, maxZ);
    }

    glm::vec3 Camera::getDirection(const glm::vec3& localAxis) const
    {
        return glm::normalize(m_worldRotation * localAxis);
    }

    void MmdCamera::updateMatrices(const SceneGraph& graph, float aspect)
    {
        // MMD stores a left-handed orbit; mirror Z into our right-handed frame.
        const glm::mat4 orbit = glm::eulerAngleYXZ(-rotation.y, -rotation.x, rotation.z);
        const glm::vec3 eyeLocal = target + glm::vec3(orbit * glm::vec4(0.0f, 0.0f, -distance, 1.0f));
        const glm::vec3 upLocal = glm::vec3(orbit * glm::vec4(axis::Up, 0.0f));

        const glm::mat4& world = graph.worldMatrix(m_node);
        const glm::vec3 eye = glm::vec3(world * glm::vec4(eyeLocal, 1.0f));
        const glm::vec3 center = glm::vec3(world * glm::vec4(target, 1.0f));
        const glm::vec3 up = glm::normalize(glm::vec3(world * glm::vec4(upLocal, 0.0f)));

        m_view = glm::lookAt(eye, center, up);
        m_proj = glm::perspective(fov, aspect, minZ, maxZ);
        m_globalPosition = eye;
        m_worldRotation = glm::normalize(glm::quat_cast(glm::mat3(glm::inverse(m_view))));
    }

    void XrDeviceCamera::updateMatrices(const SceneGraph& graph, float aspect)
    {
        const glm::mat4& rig = graph.worldMatrix(m_node);
        const glm::mat4 head = glm::translate(glm::mat4(1.0f), position + m_devicePosition)
            * glm::mat4_cast(m_deviceOrientation);
        const glm::mat4 world = rig * head;

        m_globalPosition = glm::vec3(world[3]);
        m_worldRotation = worldRotationOf(world);
        const glm::mat4 rigid = glm::translate(glm::mat4(1.0f), m_globalPosition) * glm::mat4_cast(m_worldRotation);
        m_view = glm::inverse(rigid);
        m_proj = glm::perspective(fov, aspect, minZ, maxZ);
    }

}
