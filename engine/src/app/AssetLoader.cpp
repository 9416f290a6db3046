#include "mmdv/app/AssetLoader.hpp"
#include "mmdv/assets/FileSource.hpp"
#include "mmdv/assets/PmxFile.hpp"
#include "mmdv/assets/VmdFile.hpp"
#include "mmdv/assets/WhenAll.hpp"
#include "mmdv/core/logger.hpp"

#include <algorithm>
#include <format>

namespace mmdv::app
{
    namespace
    {
        assets::ProgressCallback slotProgress(const std::shared_ptr<assets::ProgressBoard>& board,
                                              assets::LoadSlot slot)
        {
            return [board, slot](uint64_t loaded, uint64_t total) { board->update(slot, loaded, total); };
        }
    }

    core::Result<LoadedAssets> AssetLoader::load(const AssetRequest& request) const
    {
        core::Logger::info("Loading model {} with motion {} and camera {}",
                           request.modelPath.string(), request.motionPath.string(),
                           request.cameraMotionPath.string());

        const runtime::EvaluationMode mode = request.evaluationMode;
        // Tasks may outlive this call after a failure, so they own copies
        auto joined = assets::whenAll(
            [mode]() { return runtime::EvaluationBackend::create(mode); },
            [path = request.motionPath, progress = slotProgress(m_board, assets::LoadSlot::Motion)]()
                -> core::Result<std::shared_ptr<const runtime::MotionTrack>> {
                auto motion = assets::loadVmd(path, progress);
                if (!motion) {
                    return core::Unexpected(motion.error());
                }
                return runtime::MotionTrack::fromMotion(kMotionTrackName, *motion);
            },
            [path = request.cameraMotionPath, progress = slotProgress(m_board, assets::LoadSlot::CameraMotion)]()
                -> core::Result<std::shared_ptr<const runtime::CameraTrack>> {
                auto motion = assets::loadVmd(path, progress);
                if (!motion) {
                    return core::Unexpected(motion.error());
                }
                return runtime::CameraTrack::fromMotion(kCameraTrackName, *motion);
            },
            [path = request.modelPath, progress = slotProgress(m_board, assets::LoadSlot::Model)]()
                -> core::Result<std::shared_ptr<const assets::ModelData>> {
                auto model = assets::loadPmx(path, progress);
                if (!model) {
                    return core::Unexpected(model.error());
                }
                return std::make_shared<const assets::ModelData>(std::move(*model));
            });

        if (!joined) {
            core::Logger::error("Asset load failed: {}", joined.error());
            return core::Unexpected(joined.error());
        }

        LoadedAssets loaded;
        std::tie(loaded.backend, loaded.motion, loaded.cameraMotion, loaded.model) = std::move(*joined);
        loaded.textures = decodeTextures(*loaded.model, request.modelPath);

        core::Logger::info("Loaded '{}': {} vertices, {} materials, {} bones, {} textures decoded",
                           loaded.model->header.modelName, loaded.model->vertices.size(),
                           loaded.model->materials.size(), loaded.model->bones.size(), loaded.textures.size());
        return loaded;
    }

    std::vector<LoadedTexture> AssetLoader::decodeTextures(const assets::ModelData& model,
                                                           const std::filesystem::path& modelPath) const
    {
        std::vector<LoadedTexture> textures;
        if (m_decoders == nullptr || m_decoders->size() == 0) {
            return textures;
        }

        const std::filesystem::path baseDir = modelPath.parent_path();
        for (std::string relative : model.textures) {
            std::replace(relative.begin(), relative.end(), '\\', '/');
            const std::filesystem::path path = baseDir / relative;

            auto bytes = assets::fetchFile(path);
            if (!bytes) {
                core::Logger::warn("Texture skipped: {}", bytes.error());
                continue;
            }
            auto image = m_decoders->decode(path, *bytes);
            if (!image) {
                core::Logger::debug("Texture not decoded: {}", image.error());
                continue;
            }
            textures.push_back(LoadedTexture{path.string(), std::move(*image)});
        }
        return textures;
    }
}
