#include "mmdv/assets/TextEncoding.hpp"
#include "mmdv/core/logger.hpp"
#include <utility>

#include <iconv.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

namespace mmdv::assets {

    namespace {
        constexpr const char* kShiftJis = "CP932";
        constexpr const char* kUtf16Le = "UTF-16LE";
        // U+FFFD REPLACEMENT CHARACTER
        constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

        iconv_t toIconv(void* handle) { return static_cast<iconv_t>(handle); }
    }

    core::Result<TextConverter> TextConverter::open(const char* fromEncoding)
    {
        iconv_t cd = iconv_open("UTF-8", fromEncoding);
        if (cd == reinterpret_cast<iconv_t>(-1)) {
            return core::Unexpected(std::format("iconv_open({} -> UTF-8) failed: {}", fromEncoding, std::strerror(errno)));
        }
        return TextConverter(static_cast<void*>(cd), fromEncoding);
    }

    TextConverter::TextConverter(TextConverter&& other) noexcept
        : m_handle(std::exchange(other.m_handle, nullptr)), m_encoding(std::move(other.m_encoding)) {}

    TextConverter& TextConverter::operator=(TextConverter&& other) noexcept
    {
        if (this != &other) {
            if (m_handle != nullptr) {
                iconv_close(toIconv(m_handle));
            }
            m_handle = std::exchange(other.m_handle, nullptr);
            m_encoding = std::move(other.m_encoding);
        }
        return *this;
    }

    TextConverter::~TextConverter()
    {
        if (m_handle != nullptr) {
            iconv_close(toIconv(m_handle));
        }
    }

    core::Result<std::string> TextConverter::toUtf8(std::string_view input)
    {
        if (input.empty()) {
            return std::string{};
        }

        iconv_t cd = toIconv(m_handle);
        // Reset shift state left over from a previous call
        iconv(cd, nullptr, nullptr, nullptr, nullptr);

        std::string out(input.size() * 3 + 4, '\0');
        char* in = const_cast<char*>(input.data());
        size_t inLeft = input.size();
        char* outPtr = out.data();
        size_t outLeft = out.size();
        size_t invalid = 0;
        size_t firstInvalid = 0;

        while (inLeft > 0) {
            const size_t rc = iconv(cd, &in, &inLeft, &outPtr, &outLeft);
            if (rc != static_cast<size_t>(-1)) {
                continue;
            }
            if (errno == EINVAL) {
                break;
            }
            if (errno == E2BIG) {
                const size_t used = static_cast<size_t>(outPtr - out.data());
                out.resize(out.size() * 2);
                outPtr = out.data() + used;
                outLeft = out.size() - used;
                continue;
            }
            // EILSEQ: replace one code unit and resume after it
            if (invalid == 0) {
                firstInvalid = input.size() - inLeft;
            }
            ++invalid;
            if (outLeft < kReplacement.size()) {
                const size_t used = static_cast<size_t>(outPtr - out.data());
                out.resize(out.size() * 2);
                outPtr = out.data() + used;
                outLeft = out.size() - used;
            }
            std::memcpy(outPtr, kReplacement.data(), kReplacement.size());
            outPtr += kReplacement.size();
            outLeft -= kReplacement.size();
            const size_t skip = std::min(m_encoding == kUtf16Le ? size_t{2} : size_t{1}, inLeft);
            in += skip;
            inLeft -= skip;
        }

        if (invalid > 0) {
            core::Logger::warn("{}: replaced {} invalid sequence(s), first at byte {}", m_encoding, invalid,
                               firstInvalid);
        }
        out.resize(static_cast<size_t>(outPtr - out.data()));
        return out;
    }

    core::Result<ShiftJisDecoder> ShiftJisDecoder::create()
    {
        auto converter = TextConverter::open(kShiftJis);
        if (!converter) {
            return core::Unexpected(converter.error());
        }
        return ShiftJisDecoder(std::move(*converter));
    }

    core::Result<std::string> ShiftJisDecoder::decode(std::string_view sjis)
    {
        std::string key(sjis);
        if (auto it = m_cache.find(key); it != m_cache.end()) {
            return it->second;
        }
        auto utf8 = m_converter.toUtf8(sjis);
        if (utf8) {
            m_cache.emplace(std::move(key), *utf8);
        }
        return utf8;
    }

    core::Result<std::string> shiftJisToUtf8(std::string_view sjis)
    {
        auto converter = TextConverter::open(kShiftJis);
        if (!converter) {
            return core::Unexpected(converter.error());
        }
        return converter->toUtf8(sjis);
    }

    core::Result<std::string> utf16leToUtf8(std::span<const uint8_t> utf16)
    {
        auto converter = TextConverter::open(kUtf16Le);
        if (!converter) {
            return core::Unexpected(converter.error());
        }
        return converter->toUtf8(std::string_view(reinterpret_cast<const char*>(utf16.data()), utf16.size()));
    }

}
