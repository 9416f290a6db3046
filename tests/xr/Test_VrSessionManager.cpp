#include <doctest/doctest.h>
#include "mmdv/scene/Scene.hpp"
#include "mmdv/ui/EnterVrButton.hpp"
#include "mmdv/xr/VrSessionManager.hpp"

#include <glm/gtc/constants.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mmdv;
using namespace mmdv::xr;

namespace {

    // Session runtime that the test steps through by hand
    class FakeXrRuntime final : public XrRuntime {
    public:
        [[nodiscard]] const char* name() const override { return "fake"; }

        core::Result<void> requestSession(const SessionRequest& request) override {
            lastRequest = request;
            if (failNextRequest) {
                failNextRequest = false;
                return core::Unexpected(std::string("immersive-vr is not supported"));
            }
            ++sessionRequests;
            active = true;
            if (announceDuringRequest) {
                connectControllers();
            }
            return {};
        }

        void requestExit() override {
            ++exitRequests;
            exitPending = true;
        }

        [[nodiscard]] bool sessionActive() const override { return active; }

        void pollEvents() override {
            if (exitPending) {
                exitPending = false;
                active = false;
                sources.clear();
                onSessionEnded.notify();
            }
        }

        [[nodiscard]] std::optional<HeadPose> headPose() const override {
            return active ? pose : std::nullopt;
        }

        void connectControllers() {
            for (Handedness hand : {Handedness::Left, Handedness::Right}) {
                sources.push_back(std::make_unique<XrInputSource>(toString(hand), hand));
                XrInputSource& source = *sources.back();
                onControllerAdded.notify(source);
                source.initMotionController(makeStandardController(hand));
            }
        }

        MotionController& controller(Handedness hand) {
            for (const auto& source : sources) {
                if (source->handedness() == hand) {
                    return *source->motionController();
                }
            }
            throw std::runtime_error("no controller for that hand");
        }

        std::vector<std::unique_ptr<XrInputSource>> sources;
        SessionRequest lastRequest;
        std::optional<HeadPose> pose;
        bool failNextRequest = false;
        bool announceDuringRequest = false;
        bool exitPending = false;
        bool active = false;
        int sessionRequests = 0;
        int exitRequests = 0;
    };

    struct VrFixture {
        VrFixture() {
            mmdCamera = &scene.addCamera<scene::MmdCamera>("MmdCamera", scene.createTransformNode("MmdCamera"),
                                                           glm::vec3(0.0f, 10.0f, 0.0f));
            pipeline = &scene.createDefaultPipeline("default", true, {mmdCamera});
            pipeline->settings.samples = 4;
            pipeline->settings.fxaaEnabled = true;
            pipeline->settings.chromaticAberrationEnabled = true;

            cameraRoot = scene.createTransformNode("cameraRoot");
            xrCamera = &scene.addCamera<scene::XrDeviceCamera>("XrCamera", scene.createTransformNode("xr", cameraRoot));
        }

        std::unique_ptr<VrSessionManager> makeManager(VrConfig config = {}) {
            return std::make_unique<VrSessionManager>(runtime, scene, *xrCamera, cameraRoot, button, std::move(config));
        }

        void endSession(VrSessionManager& manager) {
            manager.exitXr();
            manager.update();
        }

        const scene::Transform& rig() const { return scene.graph.transform(cameraRoot); }

        FakeXrRuntime runtime;
        scene::Scene scene;
        ui::EnterVrButton button;
        scene::MmdCamera* mmdCamera = nullptr;
        scene::XrDeviceCamera* xrCamera = nullptr;
        render::DefaultRenderingPipeline* pipeline = nullptr;
        ecs::Entity cameraRoot = ecs::NULL_ENTITY;
    };

}

TEST_CASE_FIXTURE(VrFixture, "Entering and leaving XR") {
    auto manager = makeManager();
    std::vector<XrState> transitions;
    auto sub = manager->onStateChanged.add([&](XrState state) { transitions.push_back(state); });
    const render::PostProcessSettings before = pipeline->settings;

    SUBCASE("Button click enters XR") {
        button.click();
        CHECK(manager->state() == XrState::InXr);
        CHECK(runtime.lastRequest.sessionMode == "immersive-vr");
        CHECK(runtime.lastRequest.referenceSpace == "local-floor");

        CHECK(scene.activeCamera() == xrCamera);
        CHECK(pipeline->hasCamera(xrCamera));
        CHECK_FALSE(pipeline->settings.fxaaEnabled);
        CHECK_FALSE(pipeline->settings.chromaticAberrationEnabled);
        CHECK(pipeline->settings.samples == 4);
        CHECK(xrCamera->position.y == doctest::Approx(10.0f));
        CHECK_FALSE(button.visible);
        CHECK((transitions == std::vector<XrState>{XrState::InXr}));
    }

    SUBCASE("Second enter is a no-op") {
        REQUIRE(manager->enterXr().has_value());
        REQUIRE(manager->enterXr().has_value());
        CHECK(runtime.sessionRequests == 1);
    }

    SUBCASE("Leaving restores the previous state exactly") {
        REQUIRE(manager->enterXr().has_value());
        runtime.connectControllers();
        CHECK(manager->controllerSubscriptionCount() > 0);

        endSession(*manager);
        CHECK(manager->state() == XrState::NotInXr);
        CHECK(pipeline->settings == before);
        CHECK(scene.activeCamera() == mmdCamera);
        CHECK_FALSE(pipeline->hasCamera(xrCamera));
        CHECK(button.visible);
        CHECK(manager->controllerSubscriptionCount() == 0);
        CHECK(runtime.onSessionEnded.observerCount() == 0);
        CHECK(runtime.onControllerAdded.observerCount() == 0);
        CHECK((transitions == std::vector<XrState>{XrState::InXr, XrState::NotInXr}));

        SUBCASE("and the session can be entered again") {
            REQUIRE(manager->enterXr().has_value());
            CHECK(runtime.sessionRequests == 2);
            CHECK(scene.activeCamera() == xrCamera);
        }
    }

    SUBCASE("Failed request leaves everything untouched") {
        runtime.failNextRequest = true;
        auto result = manager->enterXr();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == "immersive-vr is not supported");

        CHECK(manager->state() == XrState::NotInXr);
        CHECK(scene.activeCamera() == mmdCamera);
        CHECK(pipeline->settings == before);
        CHECK_FALSE(pipeline->hasCamera(xrCamera));
        CHECK(button.visible);
        CHECK(runtime.onSessionEnded.observerCount() == 0);
        CHECK(transitions.empty());
    }

    SUBCASE("Exit from the host is ignored outside XR") {
        manager->exitXr();
        CHECK(runtime.exitRequests == 0);
    }
}

TEST_CASE_FIXTURE(VrFixture, "Free locomotion") {
    auto manager = makeManager();
    runtime.announceDuringRequest = true;
    REQUIRE(manager->enterXr().has_value());
    MotionController& left = runtime.controller(Handedness::Left);
    MotionController& right = runtime.controller(Handedness::Right);

    SUBCASE("Right stick moves the rig along the ground") {
        right.updateComponent(component_ids::Thumbstick, 0.0f, false, {1.0f, 0.0f});
        CHECK(rig().position.x == doctest::Approx(0.1f));
        CHECK(rig().position.y == doctest::Approx(0.0f));
        CHECK(rig().position.z == doctest::Approx(0.0f));

        right.updateComponent(component_ids::Thumbstick, 0.0f, false, {0.0f, 0.5f});
        CHECK(rig().position.x == doctest::Approx(0.1f));
        CHECK(rig().position.z == doctest::Approx(0.05f));
    }

    SUBCASE("Tilted head moves the rig level at full speed") {
        HeadPose pose;
        pose.position = glm::vec3(0.0f, 1.6f, 0.0f);
        pose.orientation = glm::angleAxis(0.7f, glm::vec3(0.0f, 1.0f, 0.0f))
                         * glm::angleAxis(0.5f, glm::vec3(1.0f, 0.0f, 0.0f))
                         * glm::angleAxis(0.4f, glm::vec3(0.0f, 0.0f, 1.0f));
        runtime.pose = pose;
        manager->update();
        scene.graph.updateTransforms();
        xrCamera->updateMatrices(scene.graph, 1.0f);

        glm::vec3 expected = xrCamera->getDirection(scene::axis::Right);
        expected.y = 0.0f;
        expected = glm::normalize(expected) * 0.1f;

        right.updateComponent(component_ids::Thumbstick, 0.0f, false, {1.0f, 0.0f});
        CHECK(rig().position.y == 0.0f);
        CHECK(glm::length(rig().position) == doctest::Approx(0.1f));
        CHECK(rig().position.x == doctest::Approx(expected.x));
        CHECK(rig().position.z == doctest::Approx(expected.z));
    }

    SUBCASE("Looking straight down leaves no forward movement") {
        HeadPose pose;
        pose.orientation = glm::angleAxis(-glm::half_pi<float>(), glm::vec3(1.0f, 0.0f, 0.0f));
        runtime.pose = pose;
        manager->update();
        scene.graph.updateTransforms();
        xrCamera->updateMatrices(scene.graph, 1.0f);

        right.updateComponent(component_ids::Thumbstick, 0.0f, false, {0.0f, 1.0f});
        CHECK(rig().position.x == 0.0f);
        CHECK(rig().position.y == 0.0f);
        CHECK(rig().position.z == 0.0f);
    }

    SUBCASE("Left stick turns the rig and pitch is clamped") {
        left.updateComponent(component_ids::Thumbstick, 0.0f, false, {0.5f, 0.0f});
        CHECK(rig().rotation.y == doctest::Approx(-0.025f));

        for (int i = 0; i < 40; ++i) {
            left.updateComponent(component_ids::Thumbstick, 0.0f, false, {0.0f, i % 2 == 0 ? -1.0f : -0.9f});
        }
        CHECK(rig().rotation.x == glm::half_pi<float>());

        for (int i = 0; i < 80; ++i) {
            left.updateComponent(component_ids::Thumbstick, 0.0f, false, {0.0f, i % 2 == 0 ? 1.0f : 0.9f});
        }
        CHECK(rig().rotation.x == -glm::half_pi<float>());
    }

    SUBCASE("Any button press asks for exactly one exit") {
        left.updateComponent(component_ids::Trigger, 1.0f, true);
        right.updateComponent(component_ids::ButtonA, 1.0f, true);
        right.updateComponent(component_ids::Squeeze, 1.0f, true);
        CHECK(manager->exitRequestCount() == 1);
        CHECK(runtime.exitRequests == 1);
        CHECK(manager->state() == XrState::InXr);

        manager->update();
        CHECK(manager->state() == XrState::NotInXr);
    }

    SUBCASE("Releases, thumbstick clicks and unknown ids do not exit") {
        right.updateComponent(component_ids::Thumbstick, 1.0f, true);
        right.updateComponent("menu", 1.0f, true);
        right.updateComponent(component_ids::Trigger, 0.4f, false);
        CHECK(runtime.exitRequests == 0);
        CHECK(manager->state() == XrState::InXr);
    }

    SUBCASE("Head pose reaches the XR camera") {
        HeadPose pose;
        pose.position = glm::vec3(0.0f, 1.6f, 0.0f);
        pose.orientation = glm::angleAxis(0.3f, glm::vec3(0.0f, 1.0f, 0.0f));
        runtime.pose = pose;
        manager->update();
        CHECK(xrCamera->deviceOrientation().w == doctest::Approx(pose.orientation.w));
        CHECK(xrCamera->deviceOrientation().y == doctest::Approx(pose.orientation.y));
    }

    endSession(*manager);
}

TEST_CASE_FIXTURE(VrFixture, "Teleport locomotion") {
    VrConfig config;
    config.locomotion = LocomotionMode::Teleport;
    auto manager = makeManager(config);
    REQUIRE(manager->enterXr().has_value());
    runtime.connectControllers();
    MotionController& right = runtime.controller(Handedness::Right);

    SUBCASE("Main button snaps the rig to the nearest point, then exits") {
        right.updateComponent(component_ids::Trigger, 1.0f, true);
        CHECK(rig().position.x == doctest::Approx(8.4f));
        CHECK(rig().position.z == doctest::Approx(-10.0f));
        CHECK(runtime.exitRequests == 1);

        right.updateComponent(component_ids::Trigger, 0.0f, false);
        right.updateComponent(component_ids::Trigger, 1.0f, true);
        CHECK(runtime.exitRequests == 1);
    }

    SUBCASE("Right stick does not move the rig") {
        right.updateComponent(component_ids::Thumbstick, 0.0f, false, {1.0f, 1.0f});
        CHECK(rig().position.x == doctest::Approx(0.0f));
    }

    SUBCASE("Other buttons still exit") {
        right.updateComponent(component_ids::ButtonB, 1.0f, true);
        CHECK(runtime.exitRequests == 1);
    }

    endSession(*manager);
}
