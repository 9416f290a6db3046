#include <doctest/doctest.h>
#include "mmdv/app/SceneBuilder.hpp"
#include "mmdv/render/IRenderBackend.hpp"
#include "mmdv/render/LoadingScreen.hpp"
#include "mmdv/runtime/EngineHooks.hpp"
#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/ui/EnterVrButton.hpp"
#include "mmdv/xr/XrRuntime.hpp"
#include "AssetFiles.hpp"

#include <cpptrace/cpptrace.hpp>
#include <chrono>
#include <thread>

using namespace mmdv;

namespace {

    struct BuilderFixture {
        BuilderFixture() {
            settings.motionPath = files.motion();
            settings.cameraMotionPath = files.camera();
            settings.modelPath = files.model();
            settings.audioPath = files.dir / "silence.wav";
            settings.evaluationMode = runtime::EvaluationMode::Serial;
            settings.shadowMapSize = 1024;
        }

        std::unique_ptr<app::SceneBuilder> makeBuilder() {
            return std::make_unique<app::SceneBuilder>(scene, loadingScreen, button, hooks, settings, nullptr);
        }

        // Polls until the build completes; false on timeout
        static bool waitForBuild(app::SceneBuilder& builder) {
            for (int i = 0; i < 5000; ++i) {
                if (builder.poll()) {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return false;
        }

        test::StageFiles files{"mmdv_scene_builder_test"};
        app::ViewerSettings settings;
        runtime::EngineHooks hooks;
        scene::Scene scene;
        render::LoadingScreen loadingScreen;
        ui::EnterVrButton button;
    };

}

TEST_CASE_FIXTURE(BuilderFixture, "SceneBuilder assembles the stage") {
    auto builder = makeBuilder();
    builder->start();

    CHECK(hooks.initialized);
    CHECK(loadingScreen.isVisible());
    CHECK(scene.clearColor.r == doctest::Approx(0.95f));
    CHECK(scene.ambientColor.g == doctest::Approx(0.5f));

    REQUIRE(builder->mmdRoot() != ecs::NULL_ENTITY);
    CHECK(scene.graph.transform(builder->mmdRoot()).position.z == doctest::Approx(20.0f));

    scene::MmdCamera* camera = builder->mmdCamera();
    REQUIRE(camera != nullptr);
    CHECK(scene.activeCamera() == camera);
    CHECK(camera->target.y == doctest::Approx(10.0f));
    CHECK(camera->minZ == doctest::Approx(1.0f));
    CHECK(camera->maxZ == doctest::Approx(300.0f));
    CHECK(camera->inertia == doctest::Approx(0.8f));

    REQUIRE(scene.lights().size() == 1);
    CHECK(scene.lights()[0]->intensity == doctest::Approx(1.0f));

    bool hasShadowOnly = false;
    for (const scene::Material& material : scene.materials()) {
        if (material.type == scene::MaterialType::ShadowOnly) {
            hasShadowOnly = true;
            CHECK(material.alpha == doctest::Approx(0.4f));
        }
    }
    CHECK(hasShadowOnly);

    REQUIRE(waitForBuild(*builder));
    CHECK(builder->finished());

    SUBCASE("Playback runs against the loaded tracks") {
        runtime::MmdRuntime* rt = builder->runtime();
        REQUIRE(rt != nullptr);
        CHECK(rt->isAnimationPlaying());
        CHECK(camera->animationName == app::kCameraTrackName);
    }

    SUBCASE("Shadows and post-processing are configured") {
        REQUIRE(scene.shadowGenerators().size() == 1);
        CHECK(scene.shadowGenerators()[0]->settings().mapSize == 1024);
        CHECK(scene.shadowGenerators()[0]->settings().usePoissonSampling);

        render::DefaultRenderingPipeline* pipeline = scene.defaultPipeline();
        REQUIRE(pipeline != nullptr);
        CHECK(pipeline->settings.samples == 4);
        CHECK(pipeline->settings.fxaaEnabled);
        CHECK(pipeline->hasCamera(camera));
    }

    SUBCASE("Without an XR runtime the VR button is hidden") {
        CHECK(builder->vrSession() == nullptr);
        CHECK_FALSE(button.visible);
    }

    SUBCASE("Loading screen hides after the first frame") {
        render::NullRenderBackend backend;
        CHECK(loadingScreen.isVisible());
        scene.render(backend);
        CHECK_FALSE(loadingScreen.isVisible());
    }
}

TEST_CASE_FIXTURE(BuilderFixture, "SceneBuilder reports a failed load") {
    settings.modelPath = files.dir / "absent.pmx";
    auto builder = makeBuilder();
    builder->start();

    CHECK_THROWS_AS(waitForBuild(*builder), cpptrace::runtime_error);
    CHECK_FALSE(builder->finished());
    CHECK(builder->runtime() == nullptr);
}
