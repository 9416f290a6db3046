#pragma once

#include <cstdint>
#include <cstring>
#include <string_view>
#include <vector>

namespace mmdv::test {

    // Little-endian byte sink for building in-memory model and motion files
    class ByteWriter {
    public:
        template <typename T>
        ByteWriter& put(T value) {
            const auto* raw = reinterpret_cast<const uint8_t*>(&value);
            m_bytes.insert(m_bytes.end(), raw, raw + sizeof(T));
            return *this;
        }

        ByteWriter& u8(uint8_t v) { return put(v); }
        ByteWriter& u16(uint16_t v) { return put(v); }
        ByteWriter& u32(uint32_t v) { return put(v); }
        ByteWriter& i32(int32_t v) { return put(v); }
        ByteWriter& f32(float v) { return put(v); }

        ByteWriter& vec3(float x, float y, float z) { return f32(x).f32(y).f32(z); }

        // NUL padded to `width`
        ByteWriter& fixed(std::string_view text, size_t width) {
            for (size_t i = 0; i < width; ++i) {
                m_bytes.push_back(i < text.size() ? static_cast<uint8_t>(text[i]) : 0);
            }
            return *this;
        }

        // int32 byte length followed by the bytes
        ByteWriter& text(std::string_view value) {
            i32(static_cast<int32_t>(value.size()));
            m_bytes.insert(m_bytes.end(), value.begin(), value.end());
            return *this;
        }

        ByteWriter& zeros(size_t count) {
            m_bytes.insert(m_bytes.end(), count, 0);
            return *this;
        }

        [[nodiscard]] const std::vector<uint8_t>& bytes() const { return m_bytes; }
        [[nodiscard]] size_t size() const { return m_bytes.size(); }

    private:
        std::vector<uint8_t> m_bytes;
    };

}
