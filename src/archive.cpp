#include <sff_image/archive.hpp>
#include "codecs/byte_io.hpp"
#include "sprite_table.hpp"

#include <algorithm>
#include <cstring>

namespace sff_image {

namespace {

constexpr std::size_t MIN_HEADER_SIZE = 32;
constexpr char SIGNATURE[] = "ElecbyteSpr";
constexpr std::size_t SIGNATURE_SIZE = sizeof(SIGNATURE) - 1;   // NUL not compared

// Header field offsets
constexpr std::size_t OFF_VERSION = 12;
constexpr std::size_t OFF_V1_GROUPS = 16;
constexpr std::size_t OFF_V1_IMAGES = 20;
constexpr std::size_t OFF_V1_SUBFILE = 24;
constexpr std::size_t OFF_V2_SPRITE_LIST = 36;
constexpr std::size_t OFF_V2_SPRITE_COUNT = 40;
constexpr std::size_t OFF_V2_PALETTE_LIST = 44;
constexpr std::size_t OFF_V2_PALETTE_COUNT = 48;
constexpr std::size_t OFF_V2_LDATA = 52;
constexpr std::size_t OFF_V2_LDATA_LENGTH = 56;
constexpr std::size_t OFF_V2_TDATA = 60;
constexpr std::size_t OFF_V2_TDATA_LENGTH = 64;

} // namespace

decode_result sniff_archive(std::span<const std::uint8_t> data, archive_header& header) {
    if (data.size() < MIN_HEADER_SIZE) {
        return decode_result::failure(decode_error::file_too_small,
            "Archive is " + std::to_string(data.size()) + " bytes; the header needs 32");
    }

    if (std::memcmp(data.data(), SIGNATURE, SIGNATURE_SIZE) != 0) {
        return decode_result::failure(decode_error::invalid_signature,
            "Missing ElecbyteSpr signature");
    }

    header = archive_header{};
    std::copy_n(data.begin() + OFF_VERSION, header.version_bytes.size(), header.version_bytes.begin());
    header.version = header.major_version() >= 2 ? archive_version::v2 : archive_version::v1;

    // Fields past the end of a short buffer read as 0
    if (header.version == archive_version::v1) {
        header.group_count = read_le32(data, OFF_V1_GROUPS);
        header.sprite_count = read_le32(data, OFF_V1_IMAGES);
        header.first_subfile_offset = read_le32(data, OFF_V1_SUBFILE);
    } else {
        header.sprite_list_offset = read_le32(data, OFF_V2_SPRITE_LIST);
        header.sprite_count = read_le32(data, OFF_V2_SPRITE_COUNT);
        header.palette_list_offset = read_le32(data, OFF_V2_PALETTE_LIST);
        header.palette_count = read_le32(data, OFF_V2_PALETTE_COUNT);
        header.ldata_offset = read_le32(data, OFF_V2_LDATA);
        header.ldata_length = read_le32(data, OFF_V2_LDATA_LENGTH);
        header.tdata_offset = read_le32(data, OFF_V2_TDATA);
        header.tdata_length = read_le32(data, OFF_V2_TDATA_LENGTH);
    }

    return decode_result::success();
}

decode_result list_sprites(std::span<const std::uint8_t> data,
                           std::vector<sprite_info>& sprites,
                           const extract_options& options) {
    std::unique_ptr<sprite_table> table;
    auto result = make_sprite_table(data, std::nullopt, options, table);
    if (!result) {
        return result;
    }

    sprites.clear();
    sprites.reserve(table->records().size());
    for (const auto& rec : table->records()) {
        sprite_info info;
        info.group = rec.group;
        info.image = rec.image;
        info.width = std::max(rec.width, 0);
        info.height = std::max(rec.height, 0);
        info.format_code = rec.format_code;
        info.codec = table->codec_name(rec);
        info.color_depth = rec.color_depth;
        info.data_length = rec.data_length;
        info.palette_index = rec.palette_index;
        info.shares_palette = rec.shares_palette;
        info.linked = rec.linked;
        sprites.push_back(info);
    }

    return decode_result::success();
}

} // namespace sff_image
