#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mmdv::assets {

    enum class PmxTextEncoding : uint8_t {
        Utf16Le = 0,
        Utf8 = 1
    };

    struct PmxHeader {
        float version = 2.0f;
        PmxTextEncoding encoding = PmxTextEncoding::Utf16Le;
        uint8_t additionalUvCount = 0;
        uint8_t vertexIndexSize = 4;
        uint8_t textureIndexSize = 4;
        uint8_t materialIndexSize = 4;
        uint8_t boneIndexSize = 4;
        uint8_t morphIndexSize = 4;
        uint8_t rigidBodyIndexSize = 4;

        std::string modelName;
        std::string englishModelName;
        std::string comment;
        std::string englishComment;
    };

    enum class VertexWeight : uint8_t {
        BDEF1 = 0,
        BDEF2 = 1,
        BDEF4 = 2,
        SDEF = 3,
        QDEF = 4
    };

    struct PmxVertex {
        glm::vec3 position{0.0f};
        glm::vec3 normal{0.0f};
        glm::vec2 uv{0.0f};
        std::array<glm::vec4, 4> additionalUv{};
        VertexWeight weightType = VertexWeight::BDEF1;
        std::array<int32_t, 4> boneIndices{-1, -1, -1, -1};
        std::array<float, 4> boneWeights{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 sdefC{0.0f};
        glm::vec3 sdefR0{0.0f};
        glm::vec3 sdefR1{0.0f};
        float edgeScale = 1.0f;
    };

    namespace material_flags {
        inline constexpr uint8_t DoubleSided = 0x01;
        inline constexpr uint8_t GroundShadow = 0x02;
        inline constexpr uint8_t CastSelfShadow = 0x04;
        inline constexpr uint8_t ReceiveSelfShadow = 0x08;
        inline constexpr uint8_t DrawEdge = 0x10;
    }

    struct PmxMaterial {
        std::string name;
        std::string englishName;
        glm::vec4 diffuse{1.0f};
        glm::vec3 specular{0.0f};
        float specularPower = 0.0f;
        glm::vec3 ambient{0.0f};
        uint8_t drawFlags = 0;
        glm::vec4 edgeColor{0.0f, 0.0f, 0.0f, 1.0f};
        float edgeSize = 0.0f;
        int32_t textureIndex = -1;
        int32_t sphereTextureIndex = -1;
        uint8_t sphereMode = 0;
        uint8_t toonMode = 0;   // 0 separate texture, 1 shared toonXX.bmp
        int32_t toonTextureIndex = -1;
        std::string memo;
        int32_t indexCount = 0;

        [[nodiscard]] bool hasFlag(uint8_t flag) const { return (drawFlags & flag) != 0; }
    };

    namespace bone_flags {
        inline constexpr uint16_t TailIsBone = 0x0001;
        inline constexpr uint16_t Rotatable = 0x0002;
        inline constexpr uint16_t Translatable = 0x0004;
        inline constexpr uint16_t Visible = 0x0008;
        inline constexpr uint16_t Controllable = 0x0010;
        inline constexpr uint16_t IK = 0x0020;
        inline constexpr uint16_t AppendLocal = 0x0080;
        inline constexpr uint16_t AppendRotate = 0x0100;
        inline constexpr uint16_t AppendTranslate = 0x0200;
        inline constexpr uint16_t FixedAxis = 0x0400;
        inline constexpr uint16_t LocalAxis = 0x0800;
        inline constexpr uint16_t DeformAfterPhysics = 0x1000;
        inline constexpr uint16_t ExternalParent = 0x2000;
    }

    struct PmxIkLink {
        int32_t boneIndex = -1;
        bool hasLimit = false;
        glm::vec3 limitMin{0.0f};
        glm::vec3 limitMax{0.0f};
    };

    struct PmxBone {
        std::string name;
        std::string englishName;
        glm::vec3 position{0.0f};
        int32_t parentIndex = -1;
        int32_t deformDepth = 0;
        uint16_t flags = 0;
        glm::vec3 tailOffset{0.0f};
        int32_t tailIndex = -1;
        int32_t appendIndex = -1;
        float appendWeight = 0.0f;
        glm::vec3 fixedAxis{0.0f};
        glm::vec3 localAxisX{1.0f, 0.0f, 0.0f};
        glm::vec3 localAxisZ{0.0f, 0.0f, 1.0f};
        int32_t externalParentKey = 0;
        int32_t ikTargetIndex = -1;
        int32_t ikLoopCount = 0;
        float ikLimitAngle = 0.0f;
        std::vector<PmxIkLink> ikLinks;

        [[nodiscard]] bool hasFlag(uint16_t flag) const { return (flags & flag) != 0; }
    };

    // Contiguous index range drawn with one material
    struct SubMesh {
        uint32_t materialIndex = 0;
        uint32_t indexStart = 0;
        uint32_t indexCount = 0;
    };

    struct ModelData {
        PmxHeader header;
        std::vector<PmxVertex> vertices;
        std::vector<uint32_t> indices;
        std::vector<std::string> textures;
        std::vector<PmxMaterial> materials;
        std::vector<PmxBone> bones;

        [[nodiscard]] std::vector<SubMesh> subMeshes() const;
        [[nodiscard]] bool usesSdef() const;
        [[nodiscard]] int32_t findBone(const std::string& name) const;
    };

}
