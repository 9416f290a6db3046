#include <doctest/doctest.h>
#include "mmdv/assets/TextureDecoder.hpp"
#include "../TestBytes.hpp"

#include <memory>

using namespace mmdv::assets;
using mmdv::test::ByteWriter;

namespace {

    // 2x1 24-bit bottom-up bitmap: blue pixel, then red pixel
    std::vector<uint8_t> tinyBitmap() {
        ByteWriter w;
        w.u8('B').u8('M').u32(14 + 40 + 8).u16(0).u16(0).u32(14 + 40);
        w.u32(40).i32(2).i32(1).u16(1).u16(24).u32(0).u32(8).i32(2835).i32(2835).u32(0).u32(0);
        w.u8(255).u8(0).u8(0);
        w.u8(0).u8(0).u8(255);
        w.zeros(2);
        return w.bytes();
    }

}

TEST_CASE("TextureDecoderRegistry") {
    TextureDecoderRegistry registry;
    CHECK(registry.size() == 0);

    SUBCASE("Duplicate names are rejected") {
        CHECK(registry.registerDecoder(std::make_unique<BmpTextureDecoder>()));
        CHECK_FALSE(registry.registerDecoder(std::make_unique<BmpTextureDecoder>()));
        CHECK(registry.size() == 1);
        CHECK(registry.hasDecoder("bmp"));
    }

    SUBCASE("Bitmap decodes to RGBA8") {
        REQUIRE(registry.registerDecoder(std::make_unique<BmpTextureDecoder>()));
        auto image = registry.decode("tex/body.bmp", tinyBitmap());
        REQUIRE(image.has_value());
        CHECK(image->width == 2);
        CHECK(image->height == 1);
        REQUIRE(image->pixels.size() == 8);
        CHECK(image->pixels[2] == 255);
        CHECK(image->pixels[3] == 255);
        CHECK(image->pixels[4] == 255);
    }

    SUBCASE("Unknown format") {
        REQUIRE(registry.registerDecoder(std::make_unique<BmpTextureDecoder>()));
        const std::vector<uint8_t> png = {0x89, 'P', 'N', 'G'};
        auto image = registry.decode("tex/face.png", png);
        REQUIRE_FALSE(image.has_value());
        CHECK(image.error().find("face.png") != std::string::npos);
    }
}
