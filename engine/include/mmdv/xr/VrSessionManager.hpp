#pragma once

#include <glm/glm.hpp>
#include <vector>

#include "mmdv/core/ECS.hpp"
#include "mmdv/core/Observable.hpp"
#include "mmdv/core/result.hpp"
#include "mmdv/render/RenderPipeline.hpp"
#include "mmdv/xr/XrRuntime.hpp"

namespace mmdv::scene
{
    class Scene;
    class Camera;
    class XrDeviceCamera;
}

namespace mmdv::ui { struct EnterVrButton; }

namespace mmdv::xr
{
    struct VrConfig
    {
        LocomotionMode locomotion = LocomotionMode::Free;
        float movementSensitivity = 0.1f;
        float rotationSpeed = 0.05f;
        float cameraHeight = 10.0f;
        float teleportRadius = 2.0f;
        std::vector<glm::vec3> snapPositions{glm::vec3(2.4f * 3.5f, 0.0f, -10.0f)};
        SessionRequest session;
    };

    // Owns the NotInXr/InXr state. The XR camera's parent node is the
    // locomotion anchor moved and rotated by the thumbsticks.
    class VrSessionManager
    {
    public:
        VrSessionManager(XrRuntime& runtime, scene::Scene& scene, scene::XrDeviceCamera& xrCamera,
                         ecs::Entity cameraRoot, ui::EnterVrButton& button, VrConfig config = {});
        ~VrSessionManager();

        VrSessionManager(const VrSessionManager&) = delete;
        VrSessionManager& operator=(const VrSessionManager&) = delete;

        // Requests the immersive session and swaps camera and post-process
        // state on success. Leaves everything untouched on failure.
        core::Result<void> enterXr();

        // Programmatic exit; the state changes when the runtime reports the end
        void exitXr();

        // Polls the runtime and applies the head pose to the XR camera
        void update();

        [[nodiscard]] XrState state() const { return m_state; }
        [[nodiscard]] const VrConfig& config() const { return m_config; }
        [[nodiscard]] size_t exitRequestCount() const { return m_exitRequests; }
        [[nodiscard]] size_t controllerSubscriptionCount() const { return m_controllerSubscriptions.size(); }

        core::Observable<XrState> onStateChanged;

    private:
        void handleControllerAdded(XrInputSource& source);
        void handleMotionControllerInit(MotionController& controller);
        void handleSessionEnded();

        void translate(const AxisValues& axes);
        void rotate(const AxisValues& axes);
        void teleport();
        void requestExit();

        XrRuntime* m_runtime;
        scene::Scene* m_scene;
        scene::XrDeviceCamera* m_xrCamera;
        ecs::Entity m_cameraRoot;
        ui::EnterVrButton* m_button;
        VrConfig m_config;

        XrState m_state = XrState::NotInXr;
        bool m_exitPending = false;
        size_t m_exitRequests = 0;

        // Restored on exit
        scene::Camera* m_previousCamera = nullptr;
        render::PostProcessSettings m_previousPostProcess;
        bool m_pipelineHadXrCamera = false;

        core::SubscriptionSet m_controllerSubscriptions;
        core::Subscription m_controllerAdded;
        core::Subscription m_sessionEnded;
        core::Subscription m_buttonClick;
    };
}
