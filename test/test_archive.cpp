#include <doctest/doctest.h>
#include <sff_image/sff_image.hpp>

#include "helpers/sff_builder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using sff_test::bytes;

TEST_CASE("Archive sniffing") {
    SUBCASE("Buffers under 32 bytes are too small") {
        for (std::size_t size : {0, 1, 12, 31}) {
            INFO("size ", size);
            bytes data(size, 0);
            if (size >= 12) {
                std::memcpy(data.data(), "ElecbyteSpr", 12);
            }
            sff_image::archive_header header;
            CHECK(sff_image::sniff_archive(data, header).error ==
                  sff_image::decode_error::file_too_small);
        }
    }

    SUBCASE("Corrupted signature") {
        auto data = sff_test::make_sff_header(1);
        data[0] = 'e';
        sff_image::archive_header header;
        CHECK(sff_image::sniff_archive(data, header).error ==
              sff_image::decode_error::invalid_signature);
    }

    SUBCASE("Version byte 1 selects v1") {
        const auto data = sff_test::build_sff_v1({{9000, 0, sff_test::make_solid_pcx(4, 4, 1, std::nullopt)}});
        sff_image::archive_header header;
        REQUIRE(sff_image::sniff_archive(data, header).ok);
        CHECK(header.version == sff_image::archive_version::v1);
        CHECK(header.major_version() == 1);
        CHECK(header.sprite_count == 1);
        CHECK(header.first_subfile_offset == 512);
    }

    SUBCASE("Version byte 0 also selects v1") {
        auto data = sff_test::make_sff_header(0);
        sff_image::archive_header header;
        REQUIRE(sff_image::sniff_archive(data, header).ok);
        CHECK(header.version == sff_image::archive_version::v1);
    }

    SUBCASE("Version byte 2 and above selects v2") {
        for (std::uint8_t major : {2, 3, 255}) {
            auto data = sff_test::make_sff_header(major);
            sff_test::put_le32(data, 36, 128);
            sff_test::put_le32(data, 40, 7);
            sff_test::put_le32(data, 52, 400);
            sff_test::put_le32(data, 60, 900);
            sff_image::archive_header header;
            REQUIRE(sff_image::sniff_archive(data, header).ok);
            CHECK(header.version == sff_image::archive_version::v2);
            CHECK(header.sprite_list_offset == 128);
            CHECK(header.sprite_count == 7);
            CHECK(header.ldata_offset == 400);
            CHECK(header.tdata_offset == 900);
        }
    }
}

TEST_CASE("Sprite listing") {
    SUBCASE("v1 records") {
        const auto data = sff_test::build_sff_v1({
            {0, 0, sff_test::make_solid_pcx(20, 10, 1, sff_test::gradient_palette())},
            {9000, 1, sff_test::make_solid_pcx(90, 80, 1, std::nullopt), 0, true},
            {9000, 2, {}, 1},
        });

        std::vector<sff_image::sprite_info> sprites;
        REQUIRE(sff_image::list_sprites(data, sprites).ok);
        REQUIRE(sprites.size() == 3);

        CHECK(sprites[0].group == 0);
        CHECK(sprites[0].width == 20);
        CHECK(sprites[0].height == 10);
        CHECK(sprites[0].codec == "pcx");
        CHECK(sprites[0].color_depth == 8);

        CHECK(sprites[1].group == 9000);
        CHECK(sprites[1].image == 1);
        CHECK(sprites[1].width == 90);
        CHECK(sprites[1].shares_palette);
        CHECK_FALSE(sprites[1].linked);

        CHECK(sprites[2].linked);
        CHECK(sprites[2].data_length == 0);
        CHECK(sprites[2].width == 0);
    }

    SUBCASE("v2 records") {
        sff_test::v2_sprite raw;
        raw.group = 9000;
        raw.image = 0;
        raw.width = 4;
        raw.height = 2;
        raw.data = bytes(8, 1);

        sff_test::v2_sprite lz5;
        lz5.group = 0;
        lz5.image = 0;
        lz5.width = 10;
        lz5.height = 10;
        lz5.format = 4;
        lz5.palette = 3;
        lz5.linked = 0xFFFF;
        lz5.tdata = true;
        lz5.data = bytes{100, 0, 0, 0, 0x00, 0x05, 0x5C};

        sff_test::v2_sprite linked;
        linked.group = 5;
        linked.width = 4;
        linked.height = 2;
        linked.linked = 1;

        const auto data = sff_test::build_sff_v2({raw, lz5, linked}, {sff_test::gradient_v2_palette()});

        std::vector<sff_image::sprite_info> sprites;
        REQUIRE(sff_image::list_sprites(data, sprites).ok);
        REQUIRE(sprites.size() == 3);

        CHECK(sprites[0].codec == "raw");
        CHECK(sprites[0].format_code == 0);
        CHECK(sprites[0].data_length == 8);

        CHECK(sprites[1].codec == "lz5");
        CHECK(sprites[1].width == 10);
        CHECK(sprites[1].palette_index == 3);
        CHECK_FALSE(sprites[1].linked);

        CHECK(sprites[2].linked);
    }

    SUBCASE("Record cap bounds the listing") {
        std::vector<sff_test::v2_sprite> many(10);
        for (auto& s : many) {
            s.width = 1;
            s.height = 1;
            s.data = bytes{0};
        }
        const auto data = sff_test::build_sff_v2(many, {sff_test::gradient_v2_palette()});

        sff_image::extract_options options;
        options.v2_record_limit = 4;
        std::vector<sff_image::sprite_info> sprites;
        REQUIRE(sff_image::list_sprites(data, sprites, options).ok);
        CHECK(sprites.size() == 4);
    }

    SUBCASE("Sprite list offset outside the buffer") {
        auto data = sff_test::make_sff_header(2);
        sff_test::put_le32(data, 36, 100000);
        sff_test::put_le32(data, 40, 1);
        std::vector<sff_image::sprite_info> sprites;
        CHECK(sff_image::list_sprites(data, sprites).error ==
              sff_image::decode_error::corrupted_data);
    }
}

TEST_CASE("Error identifiers") {
    CHECK(std::string(sff_image::to_string(sff_image::decode_error::none)) == "none");
    CHECK(std::string(sff_image::to_string(sff_image::decode_error::sprite_not_found)) == "sprite_not_found");
    CHECK(std::string(sff_image::to_string(sff_image::decode_error::decoding_failed)) == "decoding_failed");
}
