#include <doctest/doctest.h>
#include "mmdv/render/IRenderBackend.hpp"
#include "mmdv/render/LoadingScreen.hpp"
#include "mmdv/render/RenderOptimizer.hpp"
#include "mmdv/scene/Scene.hpp"

using namespace mmdv;
using namespace mmdv::render;

TEST_CASE("RenderOptimizer freezes the scene after the first frame") {
    scene::Scene scene;
    NullRenderBackend backend;

    scene::MeshComponent early{};
    early.materialIndex = scene.addMaterial({.name = "body"});
    const ecs::Entity bodyMesh = scene.createMesh("body", early);

    RenderOptimizer optimizer(scene);
    optimizer.armAfterNextFrame();
    CHECK(optimizer.state() == OptimizationState::Unoptimized);

    scene.render(backend);
    REQUIRE(optimizer.state() == OptimizationState::Optimized);
    CHECK(optimizer.optimizedMeshCount() == 1);

    SUBCASE("Existing meshes and materials are frozen") {
        const auto& mesh = scene.graph.registry.get<scene::MeshComponent>(bodyMesh);
        CHECK_FALSE(mesh.isPickable);
        CHECK(mesh.alwaysSelectAsActiveMesh);
        CHECK(mesh.doNotSyncBoundingInfo);
        CHECK(scene.graph.registry.has<scene::FrozenWorldMatrixTag>(bodyMesh));
        CHECK(scene.material(early.materialIndex).frozen);
        CHECK(scene.flags.skipFrustumClipping);
        CHECK(scene.flags.skipPointerMovePicking);
        CHECK(scene.flags.blockMaterialDirtyMechanism);
    }

    SUBCASE("Meshes created afterwards keep their defaults") {
        scene::MeshComponent late{};
        late.materialIndex = scene.addMaterial({.name = "hair"});
        const ecs::Entity hairMesh = scene.createMesh("hair", late);
        scene.render(backend);

        const auto& mesh = scene.graph.registry.get<scene::MeshComponent>(hairMesh);
        CHECK(mesh.isPickable);
        CHECK_FALSE(mesh.alwaysSelectAsActiveMesh);
        CHECK_FALSE(scene.graph.registry.has<scene::FrozenWorldMatrixTag>(hairMesh));
        CHECK_FALSE(scene.material(late.materialIndex).frozen);
    }

    SUBCASE("Optimization is one-way") {
        CHECK_FALSE(optimizer.optimize());
        optimizer.armAfterNextFrame();
        CHECK(scene.onAfterRender.observerCount() == 0);
    }
}

TEST_CASE("LoadingScreen") {
    LoadingScreen screen;
    CHECK_FALSE(screen.isVisible());

    screen.display();
    screen.setText("Loading model... 1/2 (50%)");
    CHECK(screen.isVisible());
    CHECK(screen.text() == "Loading model... 1/2 (50%)");

    SUBCASE("Hides only after the next rendered frame") {
        scene::Scene scene;
        NullRenderBackend backend;
        screen.hideAfterNextFrame(scene);
        CHECK(screen.isVisible());

        scene.render(backend);
        CHECK_FALSE(screen.isVisible());
        CHECK(backend.presentCount() == 1);
    }

    SUBCASE("Direct hide") {
        screen.hide();
        CHECK_FALSE(screen.isVisible());
    }
}
