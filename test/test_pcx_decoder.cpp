#include <doctest/doctest.h>
#include <sff_image/sff_image.hpp>

#include "helpers/sff_builder.hpp"

#include <cstdint>
#include <vector>

using sff_test::bytes;

TEST_CASE("PCX decoder: sniff") {
    SUBCASE("Valid manufacturer byte") {
        const auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        CHECK(sff_image::pcx_decoder::sniff(pcx));
    }

    SUBCASE("Wrong manufacturer byte") {
        auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        pcx[0] = 0x0B;
        CHECK_FALSE(sff_image::pcx_decoder::sniff(pcx));
    }

    SUBCASE("Header only") {
        bytes header(128, 0);
        header[0] = 0x0A;
        CHECK_FALSE(sff_image::pcx_decoder::sniff(header));
    }
}

TEST_CASE("PCX decoder: 8-bit images") {
    SUBCASE("Solid image with palette block") {
        auto palette = sff_test::gradient_palette();
        const auto pcx = sff_test::make_solid_pcx(100, 100, 7, palette);

        sff_image::memory_surface surface;
        auto result = sff_image::pcx_decoder::decode(pcx, surface);
        REQUIRE(result.ok);
        CHECK(surface.width() == 100);
        CHECK(surface.height() == 100);
        CHECK(surface.format() == sff_image::pixel_format::indexed8);

        bool all_seven = true;
        for (auto index : surface.pixels()) {
            all_seven = all_seven && index == 7;
        }
        CHECK(all_seven);

        REQUIRE(surface.palette().size() == 768);
        CHECK(surface.palette()[7 * 3 + 0] == 7);
        CHECK(surface.palette()[7 * 3 + 1] == 248);
    }

    SUBCASE("Literal bytes with the top bits set are escaped") {
        const bytes indices = {0xC1, 0x02, 0xFF, 0xFF};
        const auto pcx = sff_test::make_pcx(4, 1, indices, std::nullopt);

        sff_image::memory_surface surface;
        auto result = sff_image::pcx_decoder::decode(pcx, surface);
        REQUIRE(result.ok);
        CHECK(bytes(surface.pixels().begin(), surface.pixels().end()) == indices);
        CHECK(surface.palette().empty());
    }

    SUBCASE("Short data leaves remaining rows at index 0") {
        auto pcx = sff_test::make_solid_pcx(8, 4, 3, std::nullopt);
        // Keep the header and the first scanline only (one run packet)
        pcx.resize(128 + 2);

        sff_image::memory_surface surface;
        auto result = sff_image::pcx_decoder::decode(pcx, surface);
        REQUIRE(result.ok);
        const auto pixels = surface.pixels();
        CHECK(pixels[0] == 3);
        CHECK(pixels[7] == 3);
        CHECK(pixels[8] == 0);
        CHECK(pixels[31] == 0);
    }

    SUBCASE("Runs do not spill into the next scanline") {
        auto pcx = sff_test::make_pcx(2, 2, bytes{0, 0, 0, 0}, std::nullopt);
        pcx.resize(128);
        // A run of 3 on a 2-byte scanline, then a literal for row 1
        pcx.insert(pcx.end(), {0xC3, 0x05, 0x06, 0x07});

        sff_image::memory_surface surface;
        auto result = sff_image::pcx_decoder::decode(pcx, surface);
        REQUIRE(result.ok);
        CHECK(bytes(surface.pixels().begin(), surface.pixels().end()) == bytes{5, 5, 6, 7});
    }
}

TEST_CASE("PCX decoder: rejected headers") {
    SUBCASE("4 bits per pixel") {
        auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        pcx[3] = 4;
        sff_image::memory_surface surface;
        CHECK(sff_image::pcx_decoder::decode(pcx, surface).error ==
              sff_image::decode_error::decoding_failed);
    }

    SUBCASE("Multiple planes") {
        auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        pcx[65] = 3;
        sff_image::memory_surface surface;
        CHECK(sff_image::pcx_decoder::decode(pcx, surface).error ==
              sff_image::decode_error::decoding_failed);
    }

    SUBCASE("Bytes per line shorter than width") {
        auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        sff_test::put_le16(pcx, 66, 2);
        sff_image::memory_surface surface;
        CHECK(sff_image::pcx_decoder::decode(pcx, surface).error ==
              sff_image::decode_error::corrupted_data);
    }

    SUBCASE("Dimensions above the ceiling") {
        auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        sff_test::put_le16(pcx, 8, 5000);
        sff_image::memory_surface surface;
        CHECK(sff_image::pcx_decoder::decode(pcx, surface).error ==
              sff_image::decode_error::invalid_dimensions);
    }
}

TEST_CASE("PCX decoder: embedded palette") {
    SUBCASE("Marker present") {
        const auto pcx = sff_test::make_solid_pcx(4, 4, 1, sff_test::solid_palette(10, 20, 30));
        auto palette = sff_image::pcx_decoder::embedded_palette(pcx);
        REQUIRE(palette.has_value());
        CHECK(palette->red(200) == 10);
        CHECK(palette->green(200) == 20);
        CHECK(palette->blue(200) == 30);
        CHECK(palette->alpha(0) == 255);
    }

    SUBCASE("Marker missing") {
        auto pcx = sff_test::make_solid_pcx(4, 4, 1, sff_test::solid_palette(10, 20, 30));
        pcx[pcx.size() - 769] = 0x0B;
        CHECK_FALSE(sff_image::pcx_decoder::embedded_palette(pcx).has_value());
    }

    SUBCASE("Too short for a palette block") {
        const auto pcx = sff_test::make_solid_pcx(4, 4, 1, std::nullopt);
        CHECK_FALSE(sff_image::pcx_decoder::embedded_palette(pcx).has_value());
    }
}
