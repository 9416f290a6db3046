#include <doctest/doctest.h>
#include "mmdv/render/IRenderBackend.hpp"
#include "mmdv/scene/Scene.hpp"

#include <glm/gtc/constants.hpp>
#include <string>
#include <vector>

using namespace mmdv;
using namespace mmdv::scene;

TEST_CASE("SceneGraph hierarchy") {
    SceneGraph graph;
    const ecs::Entity root = graph.createNode("mmdRoot");
    const ecs::Entity model = graph.createNode("model", root);
    const ecs::Entity mesh = graph.createNode("mesh", model);

    SUBCASE("Parent links and descendants") {
        CHECK(graph.parentOf(model) == root);
        CHECK(graph.isDescendantOf(mesh, root));
        CHECK_FALSE(graph.isDescendantOf(root, mesh));
        CHECK(graph.descendants(root).size() == 2);
        CHECK(graph.roots().size() == 1);
    }

    SUBCASE("World matrices compose down the tree") {
        graph.transform(root).position = glm::vec3(0.0f, 0.0f, 20.0f);
        graph.transform(model).position = glm::vec3(1.0f, 0.0f, 0.0f);
        graph.updateTransforms();
        CHECK(graph.worldMatrix(mesh)[3].x == doctest::Approx(1.0f));
        CHECK(graph.worldMatrix(mesh)[3].z == doctest::Approx(20.0f));
    }

    SUBCASE("Cycles are refused") {
        graph.setParent(root, mesh);
        CHECK(graph.parentOf(root) == ecs::NULL_ENTITY);
    }

    SUBCASE("Frozen nodes keep their world matrix") {
        graph.updateTransforms();
        graph.freezeWorldMatrix(model);
        graph.transform(root).position = glm::vec3(5.0f, 0.0f, 0.0f);
        graph.updateTransforms();
        CHECK(graph.worldMatrix(root)[3].x == doctest::Approx(5.0f));
        CHECK(graph.worldMatrix(model)[3].x == doctest::Approx(0.0f));
    }

    SUBCASE("Destroying a node removes its subtree") {
        graph.destroyNode(model);
        CHECK(graph.descendants(root).empty());
        CHECK_FALSE(graph.registry.has<Transform>(mesh));
        CHECK_THROWS(graph.worldMatrix(mesh));
    }
}

TEST_CASE("Scene objects") {
    Scene scene;

    SUBCASE("Ground plane") {
        const ecs::Entity ground = scene.createGround("ground1", {.width = 100.0f, .height = 100.0f, .subdivisions = 2});
        const auto& plane = scene.graph.registry.get<GroundMesh>(ground);
        CHECK(plane.width == doctest::Approx(100.0f));
        CHECK(plane.subdivisions == 2);
        CHECK(scene.graph.registry.get<MeshComponent>(ground).indexCount == 24);
        CHECK(scene.meshes().size() == 1);
    }

    SUBCASE("Material indices are checked") {
        CHECK(scene.addMaterial({.name = "shadowOnly", .type = MaterialType::ShadowOnly}) == 0);
        CHECK(scene.material(0).type == MaterialType::ShadowOnly);
        CHECK_THROWS(scene.material(1));
    }

    SUBCASE("First camera becomes active") {
        auto& first = scene.addCamera<MmdCamera>("MmdCamera", scene.createTransformNode("a"), glm::vec3(0.0f));
        scene.addCamera<XrDeviceCamera>("XrCamera", scene.createTransformNode("b"));
        CHECK(scene.activeCamera() == &first);
        CHECK(scene.defaultPipeline() == nullptr);
    }

    SUBCASE("Shadow casters include descendants") {
        auto& light = scene.createDirectionalLight("DirectionalLight", glm::vec3(0.5f, -1.0f, 1.0f));
        auto& shadows = scene.createShadowGenerator(light, {.mapSize = 4096});
        const ecs::Entity model = scene.createTransformNode("model");
        const ecs::Entity mesh = scene.createTransformNode("mesh", model);
        const ecs::Entity ground = scene.createTransformNode("ground");

        shadows.addShadowCaster(model, true);
        shadows.addShadowCaster(model, false);
        CHECK(shadows.casterCount() == 1);
        CHECK(shadows.isCaster(scene.graph, mesh));
        CHECK_FALSE(shadows.isCaster(scene.graph, ground));
        CHECK(shadows.settings().mapSize == 4096);

        shadows.removeShadowCaster(model);
        CHECK_FALSE(shadows.isCaster(scene.graph, mesh));
    }

    SUBCASE("Frame order") {
        std::vector<std::string> events;
        auto before = scene.onBeforeRender.add([&events] { events.push_back("before"); });
        auto after = scene.onAfterRender.add([&events] { events.push_back("after"); });

        render::NullRenderBackend backend;
        scene.render(backend);
        CHECK((events == std::vector<std::string>{"before", "after"}));
        CHECK(backend.drawCount() == 1);
        CHECK(scene.frameCount() == 1);
    }
}

TEST_CASE("Camera directions") {
    SceneGraph graph;
    const ecs::Entity node = graph.createNode("xr");
    graph.transform(node).rotation.y = glm::half_pi<float>();
    graph.updateTransforms();

    Camera camera("camera", node);
    camera.updateMatrices(graph, 16.0f / 9.0f);

    const glm::vec3 forward = camera.getDirection(axis::Forward);
    CHECK(forward.x == doctest::Approx(-1.0f));
    CHECK(forward.z == doctest::Approx(0.0f).epsilon(1e-4));

    const glm::vec3 right = camera.getDirection(axis::Right);
    CHECK(right.z == doctest::Approx(-1.0f));
}
