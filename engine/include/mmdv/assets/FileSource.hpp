#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

#include "mmdv/core/result.hpp"

namespace mmdv::assets {

    using ByteBuffer = std::vector<uint8_t>;

    // (loaded, total) in bytes. Called once before the first chunk and after
    // every chunk, with loaded never decreasing.
    using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

    inline constexpr size_t kDefaultChunkSize = 64 * 1024;

    core::Result<ByteBuffer> fetchFile(const std::filesystem::path& path,
                                       const ProgressCallback& onProgress = nullptr,
                                       size_t chunkSize = kDefaultChunkSize);

}
