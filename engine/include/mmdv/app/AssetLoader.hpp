#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "mmdv/assets/LoadProgress.hpp"
#include "mmdv/assets/ModelData.hpp"
#include "mmdv/assets/TextureDecoder.hpp"
#include "mmdv/core/result.hpp"
#include "mmdv/runtime/AnimationTrack.hpp"
#include "mmdv/runtime/EvaluationBackend.hpp"

namespace mmdv::app
{
    struct AssetRequest
    {
        std::filesystem::path motionPath;
        std::filesystem::path cameraMotionPath;
        std::filesystem::path modelPath;
        runtime::EvaluationMode evaluationMode = runtime::EvaluationMode::Parallel;
    };

    struct LoadedTexture
    {
        std::string path;
        assets::DecodedImage image;
    };

    struct LoadedAssets
    {
        std::shared_ptr<runtime::EvaluationBackend> backend;
        std::shared_ptr<const runtime::MotionTrack> motion;
        std::shared_ptr<const runtime::CameraTrack> cameraMotion;
        std::shared_ptr<const assets::ModelData> model;
        std::vector<LoadedTexture> textures;
    };

    // Track names the runtime binds by
    inline constexpr const char* kMotionTrackName = "motion";
    inline constexpr const char* kCameraTrackName = "cameraMotion";

    // Loads the evaluation backend, both motions and the model concurrently
    // on the I/O pool. Byte progress goes to the shared board.
    class AssetLoader
    {
    public:
        explicit AssetLoader(std::shared_ptr<assets::ProgressBoard> board,
                             const assets::TextureDecoderRegistry* decoders = nullptr)
            : m_board(std::move(board)), m_decoders(decoders) {}

        // Fails with the first error observed among the four loads
        core::Result<LoadedAssets> load(const AssetRequest& request) const;

    private:
        std::vector<LoadedTexture> decodeTextures(const assets::ModelData& model,
                                                  const std::filesystem::path& modelPath) const;

        std::shared_ptr<assets::ProgressBoard> m_board;
        const assets::TextureDecoderRegistry* m_decoders;
    };
}
