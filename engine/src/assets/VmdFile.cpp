#include "mmdv/assets/VmdFile.hpp"
#include "mmdv/assets/BinaryReader.hpp"
#include "mmdv/assets/TextEncoding.hpp"
#include "mmdv/core/logger.hpp"

#include <algorithm>
#include <format>
#include <string_view>

namespace mmdv::assets {

    namespace {
        constexpr std::string_view kVmdMagic = "Vocaloid Motion Data 0002";
        constexpr size_t kBoneNameSize = 15;
        constexpr size_t kMorphNameSize = 15;
        constexpr size_t kIkNameSize = 20;

        core::Unexpected<std::string> sectionError(const char* section, const std::string& detail) {
            return core::Unexpected(std::format("VMD {}: {}", section, detail));
        }

        // Reads a section count and checks that `count` fixed-size records fit
        core::Result<uint32_t> readCount(BinaryReader& reader, const char* section, size_t recordSize) {
            uint32_t count = 0;
            if (!reader.read(count)) {
                return sectionError(section, "truncated count");
            }
            if (recordSize > 0 && static_cast<uint64_t>(count) * recordSize > reader.remaining()) {
                return sectionError(section, std::format("{} records need {} bytes, {} left",
                                                         count, static_cast<uint64_t>(count) * recordSize,
                                                         reader.remaining()));
            }
            return count;
        }

        bool readVec3(BinaryReader& reader, glm::vec3& out) {
            return reader.read(out.x) && reader.read(out.y) && reader.read(out.z);
        }

        core::Result<std::string> readName(BinaryReader& reader, ShiftJisDecoder& decoder,
                                           size_t width, const char* section) {
            std::string_view raw;
            if (!reader.readFixedString(width, raw)) {
                return sectionError(section, "truncated name");
            }
            auto utf8 = decoder.decode(raw);
            if (!utf8) {
                return sectionError(section, utf8.error());
            }
            return utf8;
        }

        core::Result<void> readHeader(BinaryReader& reader, ShiftJisDecoder& decoder, MotionData& out) {
            std::string_view magic;
            if (!reader.readFixedString(kVmdHeaderSize, magic)) {
                return sectionError("header", "file shorter than header");
            }
            if (magic != kVmdMagic) {
                return sectionError("header", std::format("unexpected signature \"{}\"", magic));
            }
            auto name = readName(reader, decoder, kVmdModelNameSize, "header");
            if (!name) {
                return core::Unexpected(name.error());
            }
            out.modelName = std::move(*name);
            return {};
        }

        core::Result<void> readBoneKeys(BinaryReader& reader, ShiftJisDecoder& decoder, MotionData& out) {
            auto count = readCount(reader, "bone keys", kVmdBoneKeySize);
            if (!count) {
                return core::Unexpected(count.error());
            }
            out.boneKeys.resize(*count);
            for (auto& key : out.boneKeys) {
                auto name = readName(reader, decoder, kBoneNameSize, "bone keys");
                if (!name) {
                    return core::Unexpected(name.error());
                }
                key.boneName = std::move(*name);
                float qx = 0, qy = 0, qz = 0, qw = 1;
                const bool ok = reader.read(key.frame) && readVec3(reader, key.translation)
                    && reader.read(qx) && reader.read(qy) && reader.read(qz) && reader.read(qw)
                    && reader.readBytes(key.interpolation.data(), key.interpolation.size());
                if (!ok) {
                    return sectionError("bone keys", "truncated record");
                }
                key.rotation = glm::quat(qw, qx, qy, qz);
            }
            return {};
        }

        core::Result<void> readMorphKeys(BinaryReader& reader, ShiftJisDecoder& decoder, MotionData& out) {
            auto count = readCount(reader, "morph keys", kVmdMorphKeySize);
            if (!count) {
                return core::Unexpected(count.error());
            }
            out.morphKeys.resize(*count);
            for (auto& key : out.morphKeys) {
                auto name = readName(reader, decoder, kMorphNameSize, "morph keys");
                if (!name) {
                    return core::Unexpected(name.error());
                }
                key.morphName = std::move(*name);
                if (!reader.read(key.frame) || !reader.read(key.weight)) {
                    return sectionError("morph keys", "truncated record");
                }
            }
            return {};
        }

        core::Result<void> readCameraKeys(BinaryReader& reader, MotionData& out) {
            auto count = readCount(reader, "camera keys", kVmdCameraKeySize);
            if (!count) {
                return core::Unexpected(count.error());
            }
            out.cameraKeys.resize(*count);
            for (auto& key : out.cameraKeys) {
                const bool ok = reader.read(key.frame) && reader.read(key.distance)
                    && readVec3(reader, key.interest) && readVec3(reader, key.rotation)
                    && reader.readBytes(key.interpolation.data(), key.interpolation.size())
                    && reader.read(key.viewAngle) && reader.read(key.isPerspective);
                if (!ok) {
                    return sectionError("camera keys", "truncated record");
                }
            }
            return {};
        }

        core::Result<void> readLightKeys(BinaryReader& reader, MotionData& out) {
            auto count = readCount(reader, "light keys", kVmdLightKeySize);
            if (!count) {
                return core::Unexpected(count.error());
            }
            out.lightKeys.resize(*count);
            for (auto& key : out.lightKeys) {
                if (!reader.read(key.frame) || !readVec3(reader, key.color) || !readVec3(reader, key.position)) {
                    return sectionError("light keys", "truncated record");
                }
            }
            return {};
        }

        core::Result<void> readShadowKeys(BinaryReader& reader, MotionData& out) {
            auto count = readCount(reader, "self-shadow keys", kVmdShadowKeySize);
            if (!count) {
                return core::Unexpected(count.error());
            }
            out.shadowKeys.resize(*count);
            for (auto& key : out.shadowKeys) {
                if (!reader.read(key.frame) || !reader.read(key.mode) || !reader.read(key.distance)) {
                    return sectionError("self-shadow keys", "truncated record");
                }
            }
            return {};
        }

        core::Result<void> readIkKeys(BinaryReader& reader, ShiftJisDecoder& decoder, MotionData& out) {
            // Records are variable length, so only the 9-byte fixed part is prechecked
            auto count = readCount(reader, "IK keys", 9);
            if (!count) {
                return core::Unexpected(count.error());
            }
            out.ikKeys.resize(*count);
            for (auto& key : out.ikKeys) {
                uint8_t show = 1;
                uint32_t ikCount = 0;
                if (!reader.read(key.frame) || !reader.read(show) || !reader.read(ikCount)) {
                    return sectionError("IK keys", "truncated record");
                }
                if (static_cast<uint64_t>(ikCount) * (kIkNameSize + 1) > reader.remaining()) {
                    return sectionError("IK keys", std::format("{} IK entries exceed file size", ikCount));
                }
                key.show = show != 0;
                key.iks.resize(ikCount);
                for (auto& ik : key.iks) {
                    auto name = readName(reader, decoder, kIkNameSize, "IK keys");
                    if (!name) {
                        return core::Unexpected(name.error());
                    }
                    ik.name = std::move(*name);
                    uint8_t enabled = 1;
                    if (!reader.read(enabled)) {
                        return sectionError("IK keys", "truncated record");
                    }
                    ik.enabled = enabled != 0;
                }
            }
            return {};
        }
    }

    uint32_t MotionData::lastFrame() const
    {
        uint32_t last = 0;
        for (const auto& k : boneKeys) last = std::max(last, k.frame);
        for (const auto& k : morphKeys) last = std::max(last, k.frame);
        for (const auto& k : cameraKeys) last = std::max(last, k.frame);
        return last;
    }

    core::Result<MotionData> parseVmd(std::span<const uint8_t> bytes)
    {
        auto decoder = ShiftJisDecoder::create();
        if (!decoder) {
            return core::Unexpected(decoder.error());
        }

        BinaryReader reader(bytes);
        MotionData motion;

        if (auto r = readHeader(reader, *decoder, motion); !r) {
            return core::Unexpected(r.error());
        }
        if (auto r = readBoneKeys(reader, *decoder, motion); !r) {
            return core::Unexpected(r.error());
        }
        if (auto r = readMorphKeys(reader, *decoder, motion); !r) {
            return core::Unexpected(r.error());
        }
        if (!reader.atEnd()) {
            if (auto r = readCameraKeys(reader, motion); !r) {
                return core::Unexpected(r.error());
            }
        }
        if (!reader.atEnd()) {
            if (auto r = readLightKeys(reader, motion); !r) {
                return core::Unexpected(r.error());
            }
        }
        if (!reader.atEnd()) {
            if (auto r = readShadowKeys(reader, motion); !r) {
                return core::Unexpected(r.error());
            }
        }
        if (!reader.atEnd()) {
            if (auto r = readIkKeys(reader, *decoder, motion); !r) {
                return core::Unexpected(r.error());
            }
        }

        return motion;
    }

    core::Result<MotionData> loadVmd(const std::filesystem::path& path, const ProgressCallback& onProgress)
    {
        auto bytes = fetchFile(path, onProgress);
        if (!bytes) {
            return core::Unexpected(bytes.error());
        }
        auto motion = parseVmd(*bytes);
        if (!motion) {
            return core::Unexpected(std::format("{}: {}", path.filename().string(), motion.error()));
        }
        core::Logger::info("Loaded VMD {}: {} bone keys, {} morph keys, {} camera keys",
                           path.filename().string(), motion->boneKeys.size(), motion->morphKeys.size(),
                           motion->cameraKeys.size());
        return motion;
    }

}
