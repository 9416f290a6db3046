#include "mmdv/runtime/PlaybackBinder.hpp"
#include "mmdv/runtime/MmdRuntime.hpp"
#include "mmdv/scene/Scene.hpp"
#include "mmdv/core/logger.hpp"

#include <cpptrace/cpptrace.hpp>

namespace mmdv::runtime
{
    ecs::Entity PlaybackBinder::spawnModel(const assets::ModelData& data, ecs::Entity parent)
    {
        const ecs::Entity root = m_scene->createTransformNode(data.header.modelName, parent);

        for (const assets::SubMesh& sub : data.subMeshes()) {
            const assets::PmxMaterial& src = data.materials[sub.materialIndex];
            scene::Material material;
            material.name = src.name;
            material.diffuse = src.diffuse;
            material.specular = src.specular;
            material.specularPower = src.specularPower;
            material.ambient = src.ambient;
            material.alpha = src.diffuse.a;
            material.textureIndex = src.textureIndex;
            material.doubleSided = src.hasFlag(assets::material_flags::DoubleSided);

            scene::MeshComponent mesh;
            mesh.materialIndex = m_scene->addMaterial(std::move(material));
            mesh.indexStart = sub.indexStart;
            mesh.indexCount = sub.indexCount;
            mesh.receiveShadows = true;
            m_scene->createMesh(src.name, mesh, root);
        }
        return root;
    }

    core::Result<MmdModel*> PlaybackBinder::bind(const PlaybackSources& sources, ecs::Entity parent,
                                                 bool sdefEnabled)
    {
        if (!sources.model || !sources.motion || !sources.cameraMotion) {
            throw cpptrace::invalid_argument("PlaybackBinder::bind requires a model and both tracks");
        }

        const ecs::Entity root = spawnModel(*sources.model, parent);
        MmdModel& model = m_runtime->createMmdModel(sources.model, root, sdefEnabled);

        auto& registry = m_scene->graph.registry;
        registry.emplace<scene::ModelComponent>(root, static_cast<int32_t>(m_runtime->models().size() - 1));
        registry.emplace<scene::SkeletonPose>(root);

        // Tracks first, playAnimation rejects unbound targets
        m_runtime->setCamera(m_camera);
        m_runtime->addCameraAnimation(sources.cameraMotion);
        if (auto r = m_runtime->setCameraAnimation(sources.cameraMotion->name()); !r) {
            return core::Unexpected(r.error());
        }
        model.addAnimation(sources.motion);
        if (auto r = model.setAnimation(sources.motion->name()); !r) {
            return core::Unexpected(r.error());
        }

        m_runtime->setAudioPlayer(sources.audio);
        if (auto r = m_runtime->playAnimation(); !r) {
            return core::Unexpected(r.error());
        }

        m_shadowRegistration = m_scene->onBeforeRender.addOnce([this, root]() {
            m_shadowGenerator->addShadowCaster(root, true);
            core::Logger::debug("Shadow caster registered for entity {}", root);
        });

        m_runtime->createGroundModel({0});

        core::Logger::info("Playback started: {} frames", m_runtime->animationDuration());
        return &model;
    }
}
