#include "mmdv/assets/FileSource.hpp"
#include "mmdv/core/logger.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <system_error>

namespace mmdv::assets {

    core::Result<ByteBuffer> fetchFile(const std::filesystem::path& path,
                                       const ProgressCallback& onProgress,
                                       size_t chunkSize)
    {
        std::error_code ec;
        const auto fileSize = std::filesystem::file_size(path, ec);
        if (ec) {
            return core::Unexpected(std::format("{}: {}", path.string(), ec.message()));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return core::Unexpected(std::format("{}: failed to open", path.string()));
        }

        const uint64_t total = static_cast<uint64_t>(fileSize);
        chunkSize = std::max<size_t>(chunkSize, 1);

        ByteBuffer bytes(static_cast<size_t>(total));
        uint64_t loaded = 0;
        if (onProgress) {
            onProgress(loaded, total);
        }

        while (loaded < total) {
            const size_t want = static_cast<size_t>(std::min<uint64_t>(chunkSize, total - loaded));
            file.read(reinterpret_cast<char*>(bytes.data() + loaded), static_cast<std::streamsize>(want));
            const auto got = static_cast<uint64_t>(file.gcount());
            if (got == 0) {
                return core::Unexpected(std::format("{}: read failed at byte {} of {}", path.string(), loaded, total));
            }
            loaded += got;
            if (onProgress) {
                onProgress(loaded, total);
            }
        }

        core::Logger::debug("Fetched {} ({} bytes)", path.string(), total);
        return bytes;
    }

}
