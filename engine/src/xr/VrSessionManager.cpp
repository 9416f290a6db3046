#include "mmdv/xr/VrSessionManager.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/ui/EnterVrButton.hpp"
#include "mmdv/core/logger.hpp"

#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <limits>

namespace mmdv::xr
{
    namespace
    {
        // Below this the projected direction is rounding noise of a vertical axis
        constexpr float kMinGroundLength = 1e-4f;

        glm::vec3 groundProjected(glm::vec3 v)
        {
            v.y = 0.0f;
            const float len = glm::length(v);
            return len > kMinGroundLength ? v / len : glm::vec3(0.0f);
        }
    }

    VrSessionManager::VrSessionManager(XrRuntime& runtime, scene::Scene& scene, scene::XrDeviceCamera& xrCamera,
                                       ecs::Entity cameraRoot, ui::EnterVrButton& button, VrConfig config)
        : m_runtime(&runtime), m_scene(&scene), m_xrCamera(&xrCamera), m_cameraRoot(cameraRoot),
          m_button(&button), m_config(std::move(config))
    {
        m_buttonClick = m_button->onClick.add([this]() {
            if (auto r = enterXr(); !r) {
                core::Logger::warn("Cannot enter VR: {}", r.error());
            }
        });
    }

    VrSessionManager::~VrSessionManager() = default;

    core::Result<void> VrSessionManager::enterXr()
    {
        if (m_state == XrState::InXr) {
            return {};
        }

        // Controllers announced during negotiation must already be observed
        m_controllerAdded = m_runtime->onControllerAdded.add(
            [this](XrInputSource& source) { handleControllerAdded(source); });
        m_sessionEnded = m_runtime->onSessionEnded.add([this]() { handleSessionEnded(); });

        if (auto r = m_runtime->requestSession(m_config.session); !r) {
            m_controllerAdded.reset();
            m_sessionEnded.reset();
            m_controllerSubscriptions.clear();
            return r;
        }

        m_previousCamera = m_scene->activeCamera();
        if (render::DefaultRenderingPipeline* pipeline = m_scene->defaultPipeline()) {
            m_previousPostProcess = pipeline->settings;
            m_pipelineHadXrCamera = pipeline->hasCamera(m_xrCamera);
            pipeline->settings.fxaaEnabled = false;
            pipeline->settings.chromaticAberrationEnabled = false;
            pipeline->addCamera(m_xrCamera);
        }
        m_scene->setActiveCamera(m_xrCamera);
        m_xrCamera->position.y = m_config.cameraHeight;
        m_button->visible = false;

        m_exitPending = false;
        m_state = XrState::InXr;
        core::Logger::info("Entered XR ({} locomotion)",
                           m_config.locomotion == LocomotionMode::Free ? "free" : "teleport");
        onStateChanged.notify(m_state);
        return {};
    }

    void VrSessionManager::exitXr()
    {
        if (m_state == XrState::InXr) {
            requestExit();
        }
    }

    void VrSessionManager::requestExit()
    {
        if (m_exitPending) {
            return;
        }
        m_exitPending = true;
        ++m_exitRequests;
        m_runtime->requestExit();
    }

    void VrSessionManager::update()
    {
        m_runtime->pollEvents();
        if (m_state != XrState::InXr) {
            return;
        }
        if (auto pose = m_runtime->headPose()) {
            m_xrCamera->setDevicePose(pose->position, pose->orientation);
        }
    }

    void VrSessionManager::handleControllerAdded(XrInputSource& source)
    {
        core::Logger::debug("XR controller added: {} ({})", source.uniqueId(), toString(source.handedness()));
        m_controllerSubscriptions.add(source.onMotionControllerInit.add(
            [this](MotionController& controller) { handleMotionControllerInit(controller); }));
        if (MotionController* controller = source.motionController()) {
            handleMotionControllerInit(*controller);
        }
    }

    void VrSessionManager::handleMotionControllerInit(MotionController& controller)
    {
        if (ControllerComponent* thumbstick = controller.getComponent(component_ids::Thumbstick)) {
            if (controller.handedness() == Handedness::Right && m_config.locomotion == LocomotionMode::Free) {
                m_controllerSubscriptions.add(thumbstick->onAxisValueChanged.add(
                    [this](const AxisValues& axes) { translate(axes); }));
            } else if (controller.handedness() == Handedness::Left) {
                m_controllerSubscriptions.add(thumbstick->onAxisValueChanged.add(
                    [this](const AxisValues& axes) { rotate(axes); }));
            }
        }

        ControllerComponent* main = controller.getMainComponent();
        for (const std::string& id : controller.getComponentIds()) {
            ControllerComponent* component = controller.getComponent(id);
            if (component == nullptr || component->type() == ComponentType::Thumbstick) {
                continue;
            }
            const bool teleports = m_config.locomotion == LocomotionMode::Teleport && component == main;
            m_controllerSubscriptions.add(component->onButtonStateChanged.add(
                [this, teleports, wasPressed = component->pressed()](const ControllerComponent& c) mutable {
                    const bool pressedNow = c.pressed() && !wasPressed;
                    wasPressed = c.pressed();
                    if (!pressedNow || m_state != XrState::InXr) {
                        return;
                    }
                    // The main component snaps before exiting
                    if (teleports) {
                        teleport();
                    }
                    requestExit();
                }));
        }
    }

    void VrSessionManager::handleSessionEnded()
    {
        if (m_state != XrState::InXr) {
            return;
        }

        if (render::DefaultRenderingPipeline* pipeline = m_scene->defaultPipeline()) {
            pipeline->settings = m_previousPostProcess;
            if (!m_pipelineHadXrCamera) {
                pipeline->removeCamera(m_xrCamera);
            }
        }
        m_scene->setActiveCamera(m_previousCamera);
        m_button->visible = true;

        m_controllerSubscriptions.clear();
        m_controllerAdded.reset();
        m_sessionEnded.reset();

        m_exitPending = false;
        m_state = XrState::NotInXr;
        core::Logger::info("Left XR");
        onStateChanged.notify(m_state);
    }

    void VrSessionManager::translate(const AxisValues& axes)
    {
        if (m_state != XrState::InXr) {
            return;
        }
        const glm::vec3 forward = groundProjected(m_xrCamera->getDirection(scene::axis::Backward));
        const glm::vec3 right = groundProjected(m_xrCamera->getDirection(scene::axis::Right));
        const glm::vec3 movement = forward * (axes.y * m_config.movementSensitivity)
                                 + right * (axes.x * m_config.movementSensitivity);
        m_scene->graph.transform(m_cameraRoot).position += movement;
    }

    void VrSessionManager::rotate(const AxisValues& axes)
    {
        if (m_state != XrState::InXr) {
            return;
        }
        glm::vec3& rotation = m_scene->graph.transform(m_cameraRoot).rotation;
        rotation.y -= axes.x * m_config.rotationSpeed;
        rotation.x -= axes.y * m_config.rotationSpeed;
        rotation.x = std::clamp(rotation.x, -glm::half_pi<float>(), glm::half_pi<float>());
    }

    void VrSessionManager::teleport()
    {
        if (m_config.snapPositions.empty()) {
            return;
        }
        glm::vec3 aim = m_xrCamera->globalPosition();
        aim.y = 0.0f;
        aim += groundProjected(m_xrCamera->getDirection(scene::axis::Forward)) * m_config.teleportRadius;

        const glm::vec3* nearest = nullptr;
        float best = std::numeric_limits<float>::max();
        for (const glm::vec3& snap : m_config.snapPositions) {
            const float d = glm::distance(snap, aim);
            if (d < best) {
                best = d;
                nearest = &snap;
            }
        }

        scene::Transform& root = m_scene->graph.transform(m_cameraRoot);
        root.position.x = nearest->x;
        root.position.z = nearest->z;
        core::Logger::debug("Teleported to ({}, {})", nearest->x, nearest->z);
    }
}
