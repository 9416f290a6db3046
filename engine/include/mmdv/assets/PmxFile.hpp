#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "mmdv/assets/FileSource.hpp"
#include "mmdv/assets/ModelData.hpp"
#include "mmdv/core/result.hpp"

namespace mmdv::assets {

    // Reads a PMX 2.0/2.1 model up to and including the bone section.
    // Morphs, display frames, rigid bodies and joints are not read.
    core::Result<ModelData> parsePmx(std::span<const uint8_t> bytes);

    core::Result<ModelData> loadPmx(const std::filesystem::path& path,
                                    const ProgressCallback& onProgress = nullptr);

}
