#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>

namespace mmdv::assets {

    // Bounds-checked little-endian cursor over an in-memory file. Every read
    // returns false instead of running past the end.
    class BinaryReader {
    public:
        explicit BinaryReader(std::span<const uint8_t> data) : m_data(data) {}

        template <typename T>
        [[nodiscard]] bool read(T& out) {
            static_assert(std::is_trivially_copyable_v<T>);
            if (remaining() < sizeof(T)) {
                return false;
            }
            std::memcpy(&out, m_data.data() + m_offset, sizeof(T));
            m_offset += sizeof(T);
            return true;
        }

        [[nodiscard]] bool readBytes(void* dst, size_t size) {
            if (remaining() < size) {
                return false;
            }
            std::memcpy(dst, m_data.data() + m_offset, size);
            m_offset += size;
            return true;
        }

        // View of the next `size` bytes, advancing past them
        [[nodiscard]] bool view(size_t size, std::span<const uint8_t>& out) {
            if (remaining() < size) {
                return false;
            }
            out = m_data.subspan(m_offset, size);
            m_offset += size;
            return true;
        }

        // Fixed-width, NUL padded field
        [[nodiscard]] bool readFixedString(size_t width, std::string_view& out) {
            std::span<const uint8_t> raw;
            if (!view(width, raw)) {
                return false;
            }
            const auto* chars = reinterpret_cast<const char*>(raw.data());
            out = std::string_view(chars, strnlen(chars, width));
            return true;
        }

        [[nodiscard]] bool skip(size_t size) {
            if (remaining() < size) {
                return false;
            }
            m_offset += size;
            return true;
        }

        [[nodiscard]] size_t remaining() const { return m_data.size() - m_offset; }
        [[nodiscard]] size_t offset() const { return m_offset; }
        [[nodiscard]] bool atEnd() const { return m_offset >= m_data.size(); }

    private:
        std::span<const uint8_t> m_data;
        size_t m_offset = 0;
    };

}
