#include <doctest/doctest.h>
#include <sff_image/sff_image.hpp>

#include "helpers/sff_builder.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using sff_test::bytes;

namespace {

namespace fs = std::filesystem;

// Fresh directory under the system temp path, removed on scope exit
class scratch_dir {
public:
    explicit scratch_dir(const std::string& name)
        : path_(fs::temp_directory_path() / ("sff_image_test_" + name)) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }

    ~scratch_dir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    scratch_dir(const scratch_dir&) = delete;
    scratch_dir& operator=(const scratch_dir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

void write_file(const fs::path& path, const bytes& data) {
    std::ofstream file(path, std::ios::binary);
    REQUIRE(file);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    REQUIRE(file);
}

bytes act_file(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    const auto palette = sff_test::solid_palette(r, g, b);
    return bytes(palette.begin(), palette.end());
}

// Portrait that relies on an outside palette
bytes unpaletted_portrait() {
    return sff_test::build_sff_v1({
        {9000, 1, sff_test::make_solid_pcx(100, 100, 1, std::nullopt), 0, true},
    });
}

std::uint8_t first_red(const sff_image::memory_surface& surface) {
    return surface.pixels()[0];
}

} // namespace

TEST_CASE("Extraction from files") {
    SUBCASE("Missing file") {
        sff_image::memory_surface surface;
        const fs::path missing = fs::temp_directory_path() / "sff_image_test_missing" / "none.sff";
        CHECK(sff_image::extract_portrait(missing, surface).error ==
              sff_image::decode_error::file_not_found);
        CHECK(sff_image::extract_stage_preview(missing, surface).error ==
              sff_image::decode_error::file_not_found);
        CHECK(sff_image::extract_sprite(missing, 9000, 1, surface).error ==
              sff_image::decode_error::file_not_found);
    }

    SUBCASE("Directory instead of a file") {
        scratch_dir dir("directory");
        sff_image::memory_surface surface;
        CHECK(sff_image::extract_portrait(dir.path(), surface).error ==
              sff_image::decode_error::file_not_found);
    }

    SUBCASE("Palette file beside the archive") {
        scratch_dir dir("sibling");
        write_file(dir.path() / "kfm.sff", unpaletted_portrait());
        write_file(dir.path() / "a.act", act_file(1, 1, 1));
        write_file(dir.path() / "kfm.act", act_file(90, 80, 70));

        sff_image::memory_surface surface;
        REQUIRE(sff_image::extract_portrait(dir.path() / "kfm.sff", surface).ok);
        CHECK(first_red(surface) == 90);
    }

    SUBCASE("Sprite by number uses the palette file beside the archive") {
        scratch_dir dir("sprite_sibling");
        write_file(dir.path() / "kfm.sff", unpaletted_portrait());
        write_file(dir.path() / "kfm.act", act_file(90, 80, 70));

        sff_image::memory_surface surface;
        REQUIRE(sff_image::extract_sprite(dir.path() / "kfm.sff", 9000, 1, surface).ok);
        CHECK(first_red(surface) == 90);
        CHECK(sff_image::extract_sprite(dir.path() / "kfm.sff", 9000, 2, surface).error ==
              sff_image::decode_error::sprite_not_found);
    }

    SUBCASE("First palette file in the directory") {
        scratch_dir dir("first_act");
        write_file(dir.path() / "fighter.sff", unpaletted_portrait());
        write_file(dir.path() / "b.ACT", act_file(20, 20, 20));
        write_file(dir.path() / "a.act", act_file(10, 10, 10));
        write_file(dir.path() / "0.pal", act_file(5, 5, 5));

        sff_image::memory_surface surface;
        REQUIRE(sff_image::extract_portrait(dir.path() / "fighter.sff", surface).ok);
        CHECK(first_red(surface) == 10);
    }

    SUBCASE("Short palette file is ignored") {
        scratch_dir dir("short_act");
        write_file(dir.path() / "fighter.sff", unpaletted_portrait());
        write_file(dir.path() / "fighter.act", bytes(100, 0x40));

        sff_image::memory_surface surface;
        REQUIRE(sff_image::extract_portrait(dir.path() / "fighter.sff", surface).ok);
        CHECK(first_red(surface) == 0);
    }

    SUBCASE("Stage preview from a file") {
        scratch_dir dir("stage");
        sff_test::v2_sprite bg;
        bg.width = 16;
        bg.height = 8;
        bg.data = bytes(128, 3);
        write_file(dir.path() / "stage.sff", sff_test::build_sff_v2({bg}, {sff_test::gradient_v2_palette()}));

        sff_image::memory_surface surface;
        REQUIRE(sff_image::extract_stage_preview(dir.path() / "stage.sff", surface).ok);
        CHECK(surface.width() == 16);
        CHECK(surface.height() == 8);
        CHECK(first_red(surface) == 3);
    }

    SUBCASE("Not an archive") {
        scratch_dir dir("garbage");
        write_file(dir.path() / "junk.sff", bytes(64, 0x55));

        sff_image::memory_surface surface;
        CHECK(sff_image::extract_portrait(dir.path() / "junk.sff", surface).error ==
              sff_image::decode_error::invalid_signature);
    }
}
