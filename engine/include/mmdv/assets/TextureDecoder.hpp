#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include "mmdv/core/result.hpp"

namespace mmdv::assets {

    // Tightly packed RGBA8
    struct DecodedImage {
        uint32_t width = 0;
        uint32_t height = 0;
        std::vector<uint8_t> pixels;
    };

    class ITextureDecoder {
    public:
        virtual ~ITextureDecoder() = default;

        [[nodiscard]] virtual const char* name() const = 0;
        // extension is lower case with the leading dot
        [[nodiscard]] virtual bool canDecode(const std::string& extension, std::span<const uint8_t> bytes) const = 0;
        [[nodiscard]] virtual core::Result<DecodedImage> decode(std::span<const uint8_t> bytes) const = 0;
    };

    // Windows bitmaps as shipped with MMD models, including 32-bit files with
    // an alpha channel. Decoded with stb_image.
    class BmpTextureDecoder final : public ITextureDecoder {
    public:
        [[nodiscard]] const char* name() const override { return "bmp"; }
        [[nodiscard]] bool canDecode(const std::string& extension, std::span<const uint8_t> bytes) const override;
        [[nodiscard]] core::Result<DecodedImage> decode(std::span<const uint8_t> bytes) const override;
    };

    // Decoders are tried most recently registered first
    class TextureDecoderRegistry {
    public:
        // Returns false if a decoder with the same name is already present
        bool registerDecoder(std::unique_ptr<ITextureDecoder> decoder);

        [[nodiscard]] bool hasDecoder(const std::string& name) const;
        [[nodiscard]] size_t size() const;

        [[nodiscard]] core::Result<DecodedImage> decode(const std::filesystem::path& path,
                                                        std::span<const uint8_t> bytes) const;

    private:
        mutable std::mutex m_mutex;
        std::vector<std::unique_ptr<ITextureDecoder>> m_decoders;
    };

}
