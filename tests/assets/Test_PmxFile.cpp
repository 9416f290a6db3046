#include <doctest/doctest.h>
#include "mmdv/assets/PmxFile.hpp"
#include "../TestBytes.hpp"

using namespace mmdv::assets;
using mmdv::test::ByteWriter;

namespace {

    struct PmxLayout {
        const char* magic = "PMX ";
        int32_t faceIndexCount = 3;
        uint8_t headParent = 0;
    };

    // UTF-8 model with one-byte indices: a triangle, one material, two bones
    ByteWriter buildPmx(const PmxLayout& layout = {}) {
        ByteWriter w;
        w.fixed(layout.magic, 4).f32(2.0f).u8(8);
        w.u8(1).u8(0).u8(1).u8(1).u8(1).u8(1).u8(1).u8(1);
        w.text("Cube").text("Cube en").text("").text("");

        w.i32(3);
        for (int i = 0; i < 3; ++i) {
            w.vec3(static_cast<float>(i), 1.0f, 0.0f).vec3(0.0f, 0.0f, -1.0f).f32(0.0f).f32(0.0f);
            w.u8(0).u8(1).f32(1.0f);
        }

        w.i32(layout.faceIndexCount);
        for (int32_t i = 0; i < layout.faceIndexCount; ++i) {
            w.u8(static_cast<uint8_t>(i % 3));
        }

        w.i32(1).text("tex\\body.bmp");

        w.i32(1).text("body").text("");
        w.f32(1.0f).f32(1.0f).f32(1.0f).f32(0.8f);
        w.vec3(0.0f, 0.0f, 0.0f).f32(5.0f).vec3(0.5f, 0.5f, 0.5f);
        w.u8(material_flags::DoubleSided | material_flags::CastSelfShadow);
        w.f32(0.0f).f32(0.0f).f32(0.0f).f32(1.0f).f32(1.0f);
        w.u8(0).u8(0xFF).u8(0).u8(1).u8(3);
        w.text("").i32(3);

        w.i32(2);
        w.text("center").text("").vec3(0.0f, 8.0f, 0.0f).u8(0xFF).i32(0);
        w.u16(bone_flags::Rotatable | bone_flags::Translatable).vec3(0.0f, 1.0f, 0.0f);
        w.text("head").text("").vec3(0.0f, 15.0f, 0.0f).u8(layout.headParent).i32(0);
        w.u16(bone_flags::TailIsBone | bone_flags::Rotatable).u8(0xFF);
        return w;
    }

}

TEST_CASE("PMX parsing") {
    const ByteWriter w = buildPmx();
    auto model = parsePmx(w.bytes());
    REQUIRE(model.has_value());

    SUBCASE("Header and model info") {
        CHECK(model->header.encoding == PmxTextEncoding::Utf8);
        CHECK(model->header.boneIndexSize == 1);
        CHECK(model->header.modelName == "Cube");
        CHECK(model->header.englishModelName == "Cube en");
    }

    SUBCASE("Geometry") {
        REQUIRE(model->vertices.size() == 3);
        CHECK(model->vertices[2].position.x == doctest::Approx(2.0f));
        CHECK(model->vertices[0].weightType == VertexWeight::BDEF1);
        CHECK(model->vertices[0].boneIndices[0] == 1);
        CHECK((model->indices == std::vector<uint32_t>{0, 1, 2}));
        CHECK_FALSE(model->usesSdef());
    }

    SUBCASE("Textures and materials") {
        REQUIRE(model->textures.size() == 1);
        CHECK(model->textures[0] == "tex\\body.bmp");

        REQUIRE(model->materials.size() == 1);
        const PmxMaterial& m = model->materials[0];
        CHECK(m.name == "body");
        CHECK(m.diffuse.a == doctest::Approx(0.8f));
        CHECK(m.hasFlag(material_flags::DoubleSided));
        CHECK_FALSE(m.hasFlag(material_flags::DrawEdge));
        CHECK(m.textureIndex == 0);
        CHECK(m.sphereTextureIndex == -1);
        CHECK(m.toonMode == 1);
        CHECK(m.toonTextureIndex == 3);
        CHECK(m.indexCount == 3);

        const auto subMeshes = model->subMeshes();
        REQUIRE(subMeshes.size() == 1);
        CHECK(subMeshes[0].indexStart == 0);
        CHECK(subMeshes[0].indexCount == 3);
    }

    SUBCASE("Bones") {
        REQUIRE(model->bones.size() == 2);
        CHECK(model->bones[0].parentIndex == -1);
        CHECK(model->bones[0].tailOffset.y == doctest::Approx(1.0f));
        CHECK(model->bones[1].parentIndex == 0);
        CHECK(model->bones[1].hasFlag(bone_flags::TailIsBone));
        CHECK(model->bones[1].tailIndex == -1);
        CHECK(model->findBone("head") == 1);
        CHECK(model->findBone("tail") == -1);
    }
}

TEST_CASE("PMX errors name the failing section") {
    SUBCASE("Missing signature") {
        PmxLayout layout;
        layout.magic = "PMD ";
        auto model = parsePmx(buildPmx(layout).bytes());
        REQUIRE_FALSE(model.has_value());
        CHECK(model.error().starts_with("PMX header"));
    }

    SUBCASE("Face index count not a multiple of three") {
        PmxLayout layout;
        layout.faceIndexCount = 4;
        auto model = parsePmx(buildPmx(layout).bytes());
        REQUIRE_FALSE(model.has_value());
        CHECK(model.error().starts_with("PMX faces"));
    }

    SUBCASE("Parent bone out of range") {
        PmxLayout layout;
        layout.headParent = 5;
        auto model = parsePmx(buildPmx(layout).bytes());
        REQUIRE_FALSE(model.has_value());
        CHECK(model.error().starts_with("PMX bones"));
    }

    SUBCASE("Truncated bone record") {
        std::vector<uint8_t> bytes = buildPmx().bytes();
        bytes.resize(bytes.size() - 5);
        auto model = parsePmx(bytes);
        REQUIRE_FALSE(model.has_value());
        CHECK(model.error().starts_with("PMX bones"));
    }
}
