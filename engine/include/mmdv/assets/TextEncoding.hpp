#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "mmdv/core/result.hpp"

namespace mmdv::assets {

    // iconv-backed converter into UTF-8. Holds one conversion descriptor,
    // so reuse an instance for the many names of one file.
    class TextConverter {
    public:
        static core::Result<TextConverter> open(const char* fromEncoding);

        TextConverter(TextConverter&& other) noexcept;
        TextConverter& operator=(TextConverter&& other) noexcept;
        TextConverter(const TextConverter&) = delete;
        TextConverter& operator=(const TextConverter&) = delete;
        ~TextConverter();

        // An incomplete multibyte sequence at the end of the input is
        // dropped. Fixed-width MMD names are often cut mid-character.
        // Invalid sequences become U+FFFD with a logged warning.
        core::Result<std::string> toUtf8(std::string_view input);

        [[nodiscard]] const std::string& encoding() const { return m_encoding; }

    private:
        TextConverter(void* handle, std::string encoding) : m_handle(handle), m_encoding(std::move(encoding)) {}

        void* m_handle = nullptr;
        std::string m_encoding;
    };

    // Shift-JIS (code page 932) names, memoized per distinct input
    class ShiftJisDecoder {
    public:
        static core::Result<ShiftJisDecoder> create();

        core::Result<std::string> decode(std::string_view sjis);

    private:
        explicit ShiftJisDecoder(TextConverter converter) : m_converter(std::move(converter)) {}

        TextConverter m_converter;
        std::unordered_map<std::string, std::string> m_cache;
    };

    core::Result<std::string> shiftJisToUtf8(std::string_view sjis);
    core::Result<std::string> utf16leToUtf8(std::span<const uint8_t> utf16);

}
