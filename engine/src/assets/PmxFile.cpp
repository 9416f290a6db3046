#include "mmdv/assets/PmxFile.hpp"
#include "mmdv/assets/BinaryReader.hpp"
#include "mmdv/assets/TextEncoding.hpp"
#include "mmdv/core/logger.hpp"

#include <format>
#include <optional>
#include <string_view>

namespace mmdv::assets {

    namespace {
        constexpr std::string_view kPmxMagic = "PMX ";

        core::Unexpected<std::string> sectionError(const char* section, const std::string& detail) {
            return core::Unexpected(std::format("PMX {}: {}", section, detail));
        }

        bool validIndexSize(uint8_t size) {
            return size == 1 || size == 2 || size == 4;
        }

        class PmxParser {
        public:
            explicit PmxParser(std::span<const uint8_t> bytes) : m_reader(bytes) {}

            core::Result<void> parse(ModelData& model) {
                if (auto r = readHeader(model.header); !r) return r;
                if (auto r = readVertices(model); !r) return r;
                if (auto r = readFaces(model); !r) return r;
                if (auto r = readTextures(model); !r) return r;
                if (auto r = readMaterials(model); !r) return r;
                return readBones(model);
            }

        private:
            core::Result<void> readHeader(PmxHeader& header) {
                std::span<const uint8_t> magic;
                if (!m_reader.view(kPmxMagic.size(), magic)) {
                    return sectionError("header", "file shorter than signature");
                }
                if (std::string_view(reinterpret_cast<const char*>(magic.data()), magic.size()) != kPmxMagic) {
                    return sectionError("header", "missing \"PMX \" signature");
                }

                uint8_t globalsCount = 0;
                if (!m_reader.read(header.version) || !m_reader.read(globalsCount)) {
                    return sectionError("header", "truncated");
                }
                if (header.version < 2.0f || header.version > 2.1f + 1e-4f) {
                    return sectionError("header", std::format("unsupported version {}", header.version));
                }
                if (globalsCount < 8) {
                    return sectionError("header", std::format("expected 8 globals, found {}", globalsCount));
                }

                uint8_t encoding = 0;
                const bool ok = m_reader.read(encoding) && m_reader.read(header.additionalUvCount)
                    && m_reader.read(header.vertexIndexSize) && m_reader.read(header.textureIndexSize)
                    && m_reader.read(header.materialIndexSize) && m_reader.read(header.boneIndexSize)
                    && m_reader.read(header.morphIndexSize) && m_reader.read(header.rigidBodyIndexSize)
                    && m_reader.skip(globalsCount - 8u);
                if (!ok) {
                    return sectionError("header", "truncated globals");
                }
                if (encoding > 1) {
                    return sectionError("header", std::format("unknown text encoding {}", encoding));
                }
                header.encoding = static_cast<PmxTextEncoding>(encoding);
                if (header.additionalUvCount > 4) {
                    return sectionError("header", std::format("{} additional UVs (max 4)", header.additionalUvCount));
                }
                for (uint8_t size : {header.vertexIndexSize, header.textureIndexSize, header.materialIndexSize,
                                     header.boneIndexSize, header.morphIndexSize, header.rigidBodyIndexSize}) {
                    if (!validIndexSize(size)) {
                        return sectionError("header", std::format("invalid index size {}", size));
                    }
                }
                m_header = &header;

                if (header.encoding == PmxTextEncoding::Utf16Le) {
                    auto converter = TextConverter::open("UTF-16LE");
                    if (!converter) {
                        return sectionError("header", converter.error());
                    }
                    m_utf16.emplace(std::move(*converter));
                }

                for (std::string* text : {&header.modelName, &header.englishModelName,
                                          &header.comment, &header.englishComment}) {
                    if (auto r = readText("model info", *text); !r) return r;
                }
                return {};
            }

            core::Result<void> readText(const char* section, std::string& out) {
                int32_t byteCount = 0;
                if (!m_reader.read(byteCount)) {
                    return sectionError(section, "truncated text length");
                }
                if (byteCount < 0) {
                    return sectionError(section, std::format("negative text length {}", byteCount));
                }
                std::span<const uint8_t> raw;
                if (!m_reader.view(static_cast<size_t>(byteCount), raw)) {
                    return sectionError(section, "truncated text");
                }
                const std::string_view chars(reinterpret_cast<const char*>(raw.data()), raw.size());
                if (!m_utf16) {
                    out.assign(chars);
                    return {};
                }
                auto utf8 = m_utf16->toUtf8(chars);
                if (!utf8) {
                    return sectionError(section, utf8.error());
                }
                out = std::move(*utf8);
                return {};
            }

            // Signed index; all-ones means "none" for 1 and 2 byte sizes
            bool readIndex(uint8_t size, int32_t& out) {
                switch (size) {
                    case 1: {
                        uint8_t v = 0;
                        if (!m_reader.read(v)) return false;
                        out = v == 0xFF ? -1 : static_cast<int32_t>(v);
                        return true;
                    }
                    case 2: {
                        uint16_t v = 0;
                        if (!m_reader.read(v)) return false;
                        out = v == 0xFFFF ? -1 : static_cast<int32_t>(v);
                        return true;
                    }
                    default:
                        return m_reader.read(out);
                }
            }

            // Vertex indices are unsigned
            bool readVertexIndex(uint32_t& out) {
                switch (m_header->vertexIndexSize) {
                    case 1: {
                        uint8_t v = 0;
                        if (!m_reader.read(v)) return false;
                        out = v;
                        return true;
                    }
                    case 2: {
                        uint16_t v = 0;
                        if (!m_reader.read(v)) return false;
                        out = v;
                        return true;
                    }
                    default:
                        return m_reader.read(out);
                }
            }

            core::Result<size_t> readCount(const char* section, size_t minRecordSize) {
                int32_t count = 0;
                if (!m_reader.read(count)) {
                    return sectionError(section, "truncated count");
                }
                if (count < 0) {
                    return sectionError(section, std::format("negative count {}", count));
                }
                if (static_cast<uint64_t>(count) * minRecordSize > m_reader.remaining()) {
                    return sectionError(section, std::format("{} records exceed the {} bytes left",
                                                             count, m_reader.remaining()));
                }
                return static_cast<size_t>(count);
            }

            bool readVec2(glm::vec2& v) { return m_reader.read(v.x) && m_reader.read(v.y); }
            bool readVec3(glm::vec3& v) { return m_reader.read(v.x) && m_reader.read(v.y) && m_reader.read(v.z); }
            bool readVec4(glm::vec4& v) {
                return m_reader.read(v.x) && m_reader.read(v.y) && m_reader.read(v.z) && m_reader.read(v.w);
            }

            bool readBoneRefs(PmxVertex& v, int count) {
                for (int i = 0; i < count; ++i) {
                    if (!readIndex(m_header->boneIndexSize, v.boneIndices[static_cast<size_t>(i)])) return false;
                }
                return true;
            }

            bool readWeights(PmxVertex& v, int count) {
                for (int i = 0; i < count; ++i) {
                    if (!m_reader.read(v.boneWeights[static_cast<size_t>(i)])) return false;
                }
                return true;
            }

            core::Result<void> readVertices(ModelData& model) {
                const size_t minSize = 32 + m_header->additionalUvCount * 16u + 1 + m_header->boneIndexSize + 4;
                auto count = readCount("vertices", minSize);
                if (!count) return core::Unexpected(count.error());

                model.vertices.resize(*count);
                for (auto& v : model.vertices) {
                    bool ok = readVec3(v.position) && readVec3(v.normal) && readVec2(v.uv);
                    for (uint8_t i = 0; ok && i < m_header->additionalUvCount; ++i) {
                        ok = readVec4(v.additionalUv[i]);
                    }
                    uint8_t weightType = 0;
                    ok = ok && m_reader.read(weightType);
                    if (!ok) {
                        return sectionError("vertices", "truncated record");
                    }

                    v.weightType = static_cast<VertexWeight>(weightType);
                    switch (v.weightType) {
                        case VertexWeight::BDEF1:
                            ok = readBoneRefs(v, 1);
                            break;
                        case VertexWeight::BDEF2:
                            ok = readBoneRefs(v, 2) && readWeights(v, 1);
                            v.boneWeights[1] = 1.0f - v.boneWeights[0];
                            break;
                        case VertexWeight::SDEF:
                            ok = readBoneRefs(v, 2) && readWeights(v, 1)
                                && readVec3(v.sdefC) && readVec3(v.sdefR0) && readVec3(v.sdefR1);
                            v.boneWeights[1] = 1.0f - v.boneWeights[0];
                            break;
                        case VertexWeight::BDEF4:
                        case VertexWeight::QDEF:
                            ok = readBoneRefs(v, 4) && readWeights(v, 4);
                            break;
                        default:
                            return sectionError("vertices", std::format("unknown weight type {}", weightType));
                    }
                    ok = ok && m_reader.read(v.edgeScale);
                    if (!ok) {
                        return sectionError("vertices", "truncated record");
                    }
                }
                return {};
            }

            core::Result<void> readFaces(ModelData& model) {
                auto count = readCount("faces", m_header->vertexIndexSize);
                if (!count) return core::Unexpected(count.error());
                if (*count % 3 != 0) {
                    return sectionError("faces", std::format("index count {} is not a multiple of 3", *count));
                }

                model.indices.resize(*count);
                for (auto& index : model.indices) {
                    if (!readVertexIndex(index)) {
                        return sectionError("faces", "truncated index list");
                    }
                    if (index >= model.vertices.size()) {
                        return sectionError("faces", std::format("vertex index {} out of range", index));
                    }
                }
                return {};
            }

            core::Result<void> readTextures(ModelData& model) {
                auto count = readCount("textures", 4);
                if (!count) return core::Unexpected(count.error());

                model.textures.resize(*count);
                for (auto& path : model.textures) {
                    if (auto r = readText("textures", path); !r) return r;
                }
                return {};
            }

            core::Result<void> readMaterials(ModelData& model) {
                auto count = readCount("materials", 64);
                if (!count) return core::Unexpected(count.error());

                model.materials.resize(*count);
                uint64_t indexTotal = 0;
                for (auto& m : model.materials) {
                    if (auto r = readText("materials", m.name); !r) return r;
                    if (auto r = readText("materials", m.englishName); !r) return r;

                    const uint8_t texSize = m_header->textureIndexSize;
                    bool ok = readVec4(m.diffuse) && readVec3(m.specular) && m_reader.read(m.specularPower)
                        && readVec3(m.ambient) && m_reader.read(m.drawFlags) && readVec4(m.edgeColor)
                        && m_reader.read(m.edgeSize) && readIndex(texSize, m.textureIndex)
                        && readIndex(texSize, m.sphereTextureIndex) && m_reader.read(m.sphereMode)
                        && m_reader.read(m.toonMode);
                    if (ok && m.toonMode == 0) {
                        ok = readIndex(texSize, m.toonTextureIndex);
                    } else if (ok) {
                        uint8_t shared = 0;
                        ok = m_reader.read(shared);
                        m.toonTextureIndex = shared;
                    }
                    if (!ok) {
                        return sectionError("materials", std::format("truncated material \"{}\"", m.name));
                    }
                    if (auto r = readText("materials", m.memo); !r) return r;
                    if (!m_reader.read(m.indexCount) || m.indexCount < 0) {
                        return sectionError("materials", std::format("bad index count for \"{}\"", m.name));
                    }
                    indexTotal += static_cast<uint64_t>(m.indexCount);
                }
                if (indexTotal > model.indices.size()) {
                    return sectionError("materials", std::format("materials cover {} indices, model has {}",
                                                                 indexTotal, model.indices.size()));
                }
                return {};
            }

            core::Result<void> readBones(ModelData& model) {
                auto count = readCount("bones", 8 + 12 + m_header->boneIndexSize + 4 + 2);
                if (!count) return core::Unexpected(count.error());

                const uint8_t boneSize = m_header->boneIndexSize;
                model.bones.resize(*count);
                for (auto& b : model.bones) {
                    if (auto r = readText("bones", b.name); !r) return r;
                    if (auto r = readText("bones", b.englishName); !r) return r;

                    bool ok = readVec3(b.position) && readIndex(boneSize, b.parentIndex)
                        && m_reader.read(b.deformDepth) && m_reader.read(b.flags);
                    if (ok) {
                        ok = b.hasFlag(bone_flags::TailIsBone) ? readIndex(boneSize, b.tailIndex) : readVec3(b.tailOffset);
                    }
                    if (ok && (b.hasFlag(bone_flags::AppendRotate) || b.hasFlag(bone_flags::AppendTranslate))) {
                        ok = readIndex(boneSize, b.appendIndex) && m_reader.read(b.appendWeight);
                    }
                    if (ok && b.hasFlag(bone_flags::FixedAxis)) {
                        ok = readVec3(b.fixedAxis);
                    }
                    if (ok && b.hasFlag(bone_flags::LocalAxis)) {
                        ok = readVec3(b.localAxisX) && readVec3(b.localAxisZ);
                    }
                    if (ok && b.hasFlag(bone_flags::ExternalParent)) {
                        ok = m_reader.read(b.externalParentKey);
                    }
                    if (ok && b.hasFlag(bone_flags::IK)) {
                        int32_t linkCount = 0;
                        ok = readIndex(boneSize, b.ikTargetIndex) && m_reader.read(b.ikLoopCount)
                            && m_reader.read(b.ikLimitAngle) && m_reader.read(linkCount);
                        if (ok && (linkCount < 0 || static_cast<uint64_t>(linkCount) > m_reader.remaining())) {
                            return sectionError("bones", std::format("bad IK link count {} on \"{}\"", linkCount, b.name));
                        }
                        if (ok) {
                            b.ikLinks.resize(static_cast<size_t>(linkCount));
                        }
                        for (auto& link : b.ikLinks) {
                            uint8_t hasLimit = 0;
                            ok = readIndex(boneSize, link.boneIndex) && m_reader.read(hasLimit);
                            link.hasLimit = hasLimit != 0;
                            if (ok && link.hasLimit) {
                                ok = readVec3(link.limitMin) && readVec3(link.limitMax);
                            }
                            if (!ok) break;
                        }
                    }
                    if (!ok) {
                        return sectionError("bones", std::format("truncated bone \"{}\"", b.name));
                    }
                    if (b.parentIndex >= static_cast<int32_t>(*count)) {
                        return sectionError("bones", std::format("bone \"{}\" has parent {} out of range",
                                                                 b.name, b.parentIndex));
                    }
                }
                return {};
            }

            BinaryReader m_reader;
            const PmxHeader* m_header = nullptr;
            std::optional<TextConverter> m_utf16;
        };
    }

    std::vector<SubMesh> ModelData::subMeshes() const
    {
        std::vector<SubMesh> out;
        out.reserve(materials.size());
        uint32_t start = 0;
        for (size_t i = 0; i < materials.size(); ++i) {
            const auto count = static_cast<uint32_t>(materials[i].indexCount);
            out.push_back({static_cast<uint32_t>(i), start, count});
            start += count;
        }
        return out;
    }

    bool ModelData::usesSdef() const
    {
        for (const auto& v : vertices) {
            if (v.weightType == VertexWeight::SDEF) {
                return true;
            }
        }
        return false;
    }

    int32_t ModelData::findBone(const std::string& name) const
    {
        for (size_t i = 0; i < bones.size(); ++i) {
            if (bones[i].name == name) {
                return static_cast<int32_t>(i);
            }
        }
        return -1;
    }

    core::Result<ModelData> parsePmx(std::span<const uint8_t> bytes)
    {
        ModelData model;
        PmxParser parser(bytes);
        if (auto r = parser.parse(model); !r) {
            return core::Unexpected(r.error());
        }
        return model;
    }

    core::Result<ModelData> loadPmx(const std::filesystem::path& path, const ProgressCallback& onProgress)
    {
        auto bytes = fetchFile(path, onProgress);
        if (!bytes) {
            return core::Unexpected(bytes.error());
        }
        auto model = parsePmx(*bytes);
        if (!model) {
            return core::Unexpected(std::format("{}: {}", path.filename().string(), model.error()));
        }
        core::Logger::info("Loaded PMX {} \"{}\": {} vertices, {} materials, {} bones",
                           path.filename().string(), model->header.modelName, model->vertices.size(),
                           model->materials.size(), model->bones.size());
        return model;
    }

}
