#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "mmdv/assets/FileSource.hpp"
#include "mmdv/assets/MotionData.hpp"
#include "mmdv/core/result.hpp"

namespace mmdv::assets {

    inline constexpr size_t kVmdHeaderSize = 30;
    inline constexpr size_t kVmdModelNameSize = 20;
    inline constexpr size_t kVmdBoneKeySize = 111;
    inline constexpr size_t kVmdMorphKeySize = 23;
    inline constexpr size_t kVmdCameraKeySize = 61;
    inline constexpr size_t kVmdLightKeySize = 28;
    inline constexpr size_t kVmdShadowKeySize = 9;

    // Parses a "Vocaloid Motion Data 0002" file. Sections after the morph
    // keys are optional; files that end early are accepted. Errors name the
    // section that failed.
    core::Result<MotionData> parseVmd(std::span<const uint8_t> bytes);

    core::Result<MotionData> loadVmd(const std::filesystem::path& path,
                                     const ProgressCallback& onProgress = nullptr);

}
