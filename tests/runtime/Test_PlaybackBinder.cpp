#include <doctest/doctest.h>
#include "mmdv/render/IRenderBackend.hpp"
#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/runtime/PlaybackBinder.hpp"
#include "mmdv/scene/Scene.hpp"
#include "RuntimeFixtures.hpp"

using namespace mmdv;
using namespace mmdv::runtime;

TEST_CASE("PlaybackBinder") {
    scene::Scene scene;
    const ecs::Entity mmdRoot = scene.createTransformNode("mmdRoot");
    auto& camera = scene.addCamera<scene::MmdCamera>("MmdCamera", scene.createTransformNode("MmdCamera", mmdRoot),
                                                     glm::vec3(0.0f, 10.0f, 0.0f));
    auto& light = scene.createDirectionalLight("DirectionalLight", glm::vec3(0.5f, -1.0f, 1.0f));
    auto& shadows = scene.createShadowGenerator(light, {});

    auto backend = EvaluationBackend::create(EvaluationMode::Serial);
    REQUIRE(backend.has_value());
    MmdRuntime runtime(*backend);
    runtime.registerScene(scene);

    PlaybackSources sources;
    sources.model = test::makeTwoBoneModel();
    sources.motion = MotionTrack::fromMotion("motion", test::makeSlideMotion());
    auto cameraTrack = CameraTrack::fromMotion("cameraMotion", test::makeCameraMotion(90));
    REQUIRE(cameraTrack.has_value());
    sources.cameraMotion = *cameraTrack;

    SUBCASE("Missing sources throw") {
        PlaybackBinder binder(scene, runtime, camera, shadows);
        PlaybackSources partial = sources;
        partial.cameraMotion.reset();
        CHECK_THROWS(binder.bind(partial, mmdRoot, true));
    }

    SUBCASE("Binds tracks and starts playback") {
        test::FakeAudioPlayer audio;
        sources.audio = &audio;
        PlaybackBinder binder(scene, runtime, camera, shadows);

        auto model = binder.bind(sources, mmdRoot, true);
        REQUIRE(model.has_value());

        CHECK(runtime.isAnimationPlaying());
        CHECK(audio.playCalls == 1);
        CHECK(runtime.camera() == &camera);
        CHECK(camera.animationName == "cameraMotion");
        CHECK((*model)->currentAnimation()->name() == "motion");
        CHECK(runtime.physics().groundModelCreated);

        const ecs::Entity root = (*model)->root();
        CHECK(scene.graph.parentOf(root) == mmdRoot);
        CHECK(scene.graph.name(root) == "Probe");
        CHECK(scene.graph.registry.get<scene::ModelComponent>(root).modelIndex == 0);
        CHECK(scene.graph.registry.has<scene::SkeletonPose>(root));

        const auto children = scene.graph.descendants(root);
        REQUIRE(children.size() == 1);
        const auto& mesh = scene.graph.registry.get<scene::MeshComponent>(children[0]);
        CHECK(mesh.receiveShadows);
        CHECK(mesh.indexCount == 3);
        CHECK(scene.material(mesh.materialIndex).alpha == doctest::Approx(0.5f));

        SUBCASE("Shadow caster is registered on the next frame") {
            CHECK(binder.shadowRegistrationPending());
            CHECK(shadows.casterCount() == 0);

            render::NullRenderBackend renderer;
            scene.render(renderer);
            CHECK_FALSE(binder.shadowRegistrationPending());
            CHECK(shadows.casterCount() == 1);
            CHECK(shadows.isCaster(scene.graph, children[0]));

            scene.render(renderer);
            CHECK(shadows.casterCount() == 1);
        }

        runtime.setAudioPlayer(nullptr);
    }

    runtime.unregisterScene();
}
