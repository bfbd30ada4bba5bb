#include <doctest/doctest.h>
#include <sff_image/sff_image.hpp>
#include <lodepng.h>

#include <cstdint>
#include <vector>

namespace {

using bytes = std::vector<std::uint8_t>;

// 4x2 palette PNG at 4 bits per pixel, indices {1,2,3,0 / 0,1,0,2}
bytes make_palette_png() {
    lodepng::State state;
    for (LodePNGColorMode* mode : {&state.info_raw, &state.info_png.color}) {
        mode->colortype = LCT_PALETTE;
        mode->bitdepth = 4;
        lodepng_palette_add(mode, 0, 0, 0, 255);
        lodepng_palette_add(mode, 255, 0, 0, 255);
        lodepng_palette_add(mode, 0, 255, 0, 255);
        lodepng_palette_add(mode, 0, 0, 255, 255);
    }
    state.encoder.auto_convert = 0;

    const bytes packed = {0x12, 0x30, 0x01, 0x02};
    bytes png;
    const unsigned error = lodepng::encode(png, packed, 4, 2, state);
    REQUIRE(error == 0);
    return png;
}

bytes make_rgba_png(const bytes& rgba, unsigned width, unsigned height) {
    bytes png;
    const unsigned error = lodepng::encode(png, rgba, width, height);
    REQUIRE(error == 0);
    return png;
}

} // namespace

TEST_CASE("PNG decoder: sniff") {
    SUBCASE("Valid signature") {
        const bytes png = make_rgba_png(bytes(4, 0xFF), 1, 1);
        CHECK(sff_image::png_decoder::sniff(png));
    }

    SUBCASE("Invalid signature") {
        const bytes data = {0x89, 'P', 'N', 'X', 0x0D, 0x0A, 0x1A, 0x0A};
        CHECK_FALSE(sff_image::png_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        const bytes data = {0x89, 'P', 'N', 'G'};
        CHECK_FALSE(sff_image::png_decoder::sniff(data));
    }
}

TEST_CASE("PNG decoder: RGBA") {
    const bytes rgba = {
        255, 0, 0, 255,    0, 255, 0, 128,
        0, 0, 255, 0,      10, 20, 30, 40,
    };
    const bytes png = make_rgba_png(rgba, 2, 2);

    SUBCASE("Pixels are decoded straight") {
        sff_image::memory_surface surface;
        auto result = sff_image::png_decoder::decode(png, surface);
        REQUIRE(result.ok);
        CHECK(surface.width() == 2);
        CHECK(surface.height() == 2);
        CHECK(surface.format() == sff_image::pixel_format::rgba8888);
        CHECK(bytes(surface.pixels().begin(), surface.pixels().end()) == rgba);
    }

    SUBCASE("Dimensions above the ceiling") {
        sff_image::extract_options options;
        options.max_width = 1;
        sff_image::memory_surface surface;
        auto result = sff_image::png_decoder::decode(png, surface, options);
        CHECK(result.error == sff_image::decode_error::invalid_dimensions);
    }

    SUBCASE("Not a palette PNG") {
        sff_image::memory_surface surface;
        auto result = sff_image::png_decoder::decode_indexed(png, surface);
        CHECK(result.error == sff_image::decode_error::decoding_failed);
    }

    SUBCASE("Corrupt stream") {
        bytes broken = png;
        broken.resize(broken.size() / 2);
        sff_image::memory_surface surface;
        auto result = sff_image::png_decoder::decode(broken, surface);
        CHECK(result.error == sff_image::decode_error::decoding_failed);
    }
}

TEST_CASE("PNG decoder: palette indices") {
    const bytes png = make_palette_png();

    sff_image::memory_surface surface;
    auto result = sff_image::png_decoder::decode_indexed(png, surface);
    REQUIRE(result.ok);
    CHECK(surface.width() == 4);
    CHECK(surface.height() == 2);
    CHECK(surface.format() == sff_image::pixel_format::indexed8);
    CHECK(bytes(surface.pixels().begin(), surface.pixels().end()) == bytes{1, 2, 3, 0, 0, 1, 0, 2});
}

TEST_CASE("PNG encoder") {
    SUBCASE("Indexed surface is expanded through its palette") {
        sff_image::png_surface surface;
        REQUIRE(surface.set_size(2, 1, sff_image::pixel_format::indexed8));
        const std::uint8_t indices[] = {0, 1};
        surface.write_pixels(0, 0, 2, indices);
        surface.set_palette_size(2);
        const bytes colors = {1, 2, 3, 200, 100, 50};
        surface.write_palette(0, colors);

        const auto png = surface.encode();
        REQUIRE_FALSE(png.empty());

        bytes decoded;
        unsigned width = 0;
        unsigned height = 0;
        REQUIRE(lodepng::decode(decoded, width, height, png) == 0);
        CHECK(width == 2);
        CHECK(height == 1);
        CHECK(decoded == bytes{1, 2, 3, 255, 200, 100, 50, 255});
    }

    SUBCASE("Empty surface encodes to nothing") {
        sff_image::memory_surface surface;
        CHECK(sff_image::encode_png(surface).empty());
    }
}
