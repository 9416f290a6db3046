#include "mmdv/assets/TextureDecoder.hpp"
#include "mmdv/core/logger.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_BMP
#include <stb_image.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <format>
#include <limits>

namespace mmdv::assets {

    namespace {
        std::string lowerExtension(const std::filesystem::path& path) {
            std::string ext = path.extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ext;
        }
    }

    bool BmpTextureDecoder::canDecode(const std::string& extension, std::span<const uint8_t> bytes) const
    {
        const bool magic = bytes.size() >= 2 && bytes[0] == 'B' && bytes[1] == 'M';
        return magic || (bytes.empty() && extension == ".bmp");
    }

    core::Result<DecodedImage> BmpTextureDecoder::decode(std::span<const uint8_t> bytes) const
    {
        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return core::Unexpected(std::string("bitmap too large"));
        }

        int w = 0;
        int h = 0;
        int c = 0;
        stbi_uc* pixels = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &w, &h, &c, 4);
        if (pixels == nullptr) {
            return core::Unexpected(std::format("bitmap decode failed: {}", stbi_failure_reason()));
        }

        DecodedImage image;
        image.width = static_cast<uint32_t>(w);
        image.height = static_cast<uint32_t>(h);
        const size_t size = static_cast<size_t>(w) * static_cast<size_t>(h) * 4;
        image.pixels.resize(size);
        std::memcpy(image.pixels.data(), pixels, size);
        stbi_image_free(pixels);
        return image;
    }

    bool TextureDecoderRegistry::registerDecoder(std::unique_ptr<ITextureDecoder> decoder)
    {
        if (!decoder) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        const std::string name = decoder->name();
        for (const auto& existing : m_decoders) {
            if (name == existing->name()) {
                return false;
            }
        }
        core::Logger::debug("Texture decoder registered: {}", name);
        m_decoders.push_back(std::move(decoder));
        return true;
    }

    bool TextureDecoderRegistry::hasDecoder(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::any_of(m_decoders.begin(), m_decoders.end(),
                           [&](const auto& d) { return name == d->name(); });
    }

    size_t TextureDecoderRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_decoders.size();
    }

    core::Result<DecodedImage> TextureDecoderRegistry::decode(const std::filesystem::path& path,
                                                              std::span<const uint8_t> bytes) const
    {
        const std::string ext = lowerExtension(path);
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_decoders.rbegin(); it != m_decoders.rend(); ++it) {
            if ((*it)->canDecode(ext, bytes)) {
                auto image = (*it)->decode(bytes);
                if (!image) {
                    return core::Unexpected(std::format("{}: {}", path.filename().string(), image.error()));
                }
                return image;
            }
        }
        return core::Unexpected(std::format("{}: no decoder for this format", path.filename().string()));
    }

}
