#include <doctest/doctest.h>
#include "mmdv/assets/VmdFile.hpp"
#include "../TestBytes.hpp"

#include <string>

using namespace mmdv::assets;
using mmdv::test::ByteWriter;

namespace {

    void writeHeader(ByteWriter& w, const char* modelName) {
        w.fixed("Vocaloid Motion Data 0002", kVmdHeaderSize).fixed(modelName, kVmdModelNameSize);
    }

    void writeBoneKey(ByteWriter& w, const char* bone, uint32_t frame, float x, float y, float z) {
        w.fixed(bone, 15).u32(frame).vec3(x, y, z);
        w.f32(0.0f).f32(0.0f).f32(0.0f).f32(1.0f);
        w.zeros(64);
    }

    void writeMorphKey(ByteWriter& w, const char* morph, uint32_t frame, float weight) {
        w.fixed(morph, 15).u32(frame).f32(weight);
    }

    void writeCameraKey(ByteWriter& w, uint32_t frame, float distance) {
        w.u32(frame).f32(distance).vec3(0.0f, 10.0f, 0.0f).vec3(0.1f, 0.2f, 0.0f);
        for (int i = 0; i < 6; ++i) {
            w.u8(20).u8(107).u8(20).u8(107);
        }
        w.u32(45).u8(0);
    }

    ByteWriter bodyMotion() {
        ByteWriter w;
        writeHeader(w, "Miku");
        w.u32(2);
        writeBoneKey(w, "center", 0, 0.0f, 0.0f, 0.0f);
        writeBoneKey(w, "center", 30, 1.0f, 2.0f, 3.0f);
        w.u32(1);
        writeMorphKey(w, "smile", 45, 0.5f);
        return w;
    }

}

TEST_CASE("VMD parsing") {
    SUBCASE("Body motion without optional sections") {
        const ByteWriter w = bodyMotion();
        auto motion = parseVmd(w.bytes());
        REQUIRE(motion.has_value());

        CHECK(motion->modelName == "Miku");
        REQUIRE(motion->boneKeys.size() == 2);
        CHECK(motion->boneKeys[0].boneName == "center");
        CHECK(motion->boneKeys[1].frame == 30);
        CHECK(motion->boneKeys[1].translation.z == doctest::Approx(3.0f));
        CHECK(motion->boneKeys[1].rotation.w == doctest::Approx(1.0f));

        REQUIRE(motion->morphKeys.size() == 1);
        CHECK(motion->morphKeys[0].morphName == "smile");
        CHECK(motion->morphKeys[0].weight == doctest::Approx(0.5f));

        CHECK(motion->cameraKeys.empty());
        CHECK_FALSE(motion->isCameraMotion());
        CHECK(motion->lastFrame() == 45);
    }

    SUBCASE("Camera motion") {
        ByteWriter w;
        writeHeader(w, "camera");
        w.u32(0).u32(0);
        w.u32(2);
        writeCameraKey(w, 0, -45.0f);
        writeCameraKey(w, 120, -30.0f);

        auto motion = parseVmd(w.bytes());
        REQUIRE(motion.has_value());
        CHECK(motion->isCameraMotion());
        REQUIRE(motion->cameraKeys.size() == 2);
        CHECK(motion->cameraKeys[0].distance == doctest::Approx(-45.0f));
        CHECK(motion->cameraKeys[0].interest.y == doctest::Approx(10.0f));
        CHECK(motion->cameraKeys[1].viewAngle == 45);
        CHECK(motion->cameraKeys[1].interpolation[1] == 107);
        CHECK(motion->lastFrame() == 120);
        CHECK(motion->lightKeys.empty());
    }

    SUBCASE("Empty light and shadow sections are accepted") {
        ByteWriter w = bodyMotion();
        w.u32(0).u32(0).u32(0);
        auto motion = parseVmd(w.bytes());
        REQUIRE(motion.has_value());
        CHECK(motion->lightKeys.empty());
        CHECK(motion->shadowKeys.empty());
    }
}

TEST_CASE("VMD names with invalid Shift-JIS still load") {
    ByteWriter w;
    writeHeader(w, "Miku");
    w.u32(1);
    // 0x81 is a lead byte; a space is not a valid trail byte
    writeBoneKey(w, "ab\x81" " cd", 0, 1.0f, 0.0f, 0.0f);
    w.u32(0);

    auto motion = parseVmd(w.bytes());
    REQUIRE(motion.has_value());
    REQUIRE(motion->boneKeys.size() == 1);
    const std::string& name = motion->boneKeys[0].boneName;
    CHECK(name.starts_with("ab"));
    CHECK(name.ends_with("cd"));
    CHECK(name.find("\xEF\xBF\xBD") != std::string::npos);
    CHECK(motion->boneKeys[0].translation.x == doctest::Approx(1.0f));
}

TEST_CASE("VMD errors name the failing section") {
    SUBCASE("Wrong signature") {
        ByteWriter w;
        w.fixed("Vocaloid Motion Data file", kVmdHeaderSize).fixed("Miku", kVmdModelNameSize);
        w.u32(0).u32(0);
        auto motion = parseVmd(w.bytes());
        REQUIRE_FALSE(motion.has_value());
        CHECK(motion.error().starts_with("VMD header"));
    }

    SUBCASE("File shorter than the header") {
        ByteWriter w;
        w.fixed("Vocaloid", 8);
        auto motion = parseVmd(w.bytes());
        REQUIRE_FALSE(motion.has_value());
        CHECK(motion.error().starts_with("VMD header"));
    }

    SUBCASE("Bone count larger than the file") {
        ByteWriter w;
        writeHeader(w, "Miku");
        w.u32(3);
        writeBoneKey(w, "center", 0, 0.0f, 0.0f, 0.0f);
        auto motion = parseVmd(w.bytes());
        REQUIRE_FALSE(motion.has_value());
        CHECK(motion.error().starts_with("VMD bone keys"));
    }

    SUBCASE("Truncated camera section") {
        ByteWriter w = bodyMotion();
        w.u32(1).u32(0).f32(-45.0f);
        auto motion = parseVmd(w.bytes());
        REQUIRE_FALSE(motion.has_value());
        CHECK(motion.error().starts_with("VMD camera keys"));
    }
}
