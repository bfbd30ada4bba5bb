#include "sff_v2.hpp"
#include "codecs/byte_io.hpp"
#include "codecs/decode_helpers.hpp"

#include <sff_image/codec.hpp>

#include <algorithm>
#include <string>

namespace sff_image {

namespace {

// Sprite node field offsets
constexpr std::size_t OFF_GROUP = 0;
constexpr std::size_t OFF_IMAGE = 2;
constexpr std::size_t OFF_WIDTH = 4;
constexpr std::size_t OFF_HEIGHT = 6;
constexpr std::size_t OFF_LINKED = 12;
constexpr std::size_t OFF_FORMAT = 14;
constexpr std::size_t OFF_DEPTH = 15;
constexpr std::size_t OFF_DATA_OFFSET = 16;
constexpr std::size_t OFF_DATA_LENGTH = 20;
constexpr std::size_t OFF_PALETTE = 24;
constexpr std::size_t OFF_FLAGS = 26;

// Palette node field offsets
constexpr std::size_t OFF_COLOR_COUNT = 4;
constexpr std::size_t OFF_PAL_LINK = 6;
constexpr std::size_t OFF_PAL_OFFSET = 8;
constexpr std::size_t OFF_PAL_LENGTH = 12;

constexpr std::uint16_t FLAG_TDATA = 0x0001;
constexpr std::uint16_t LINK_NONE = 0xFFFF;

constexpr std::uint8_t FORMAT_PNG24 = 11;
constexpr std::uint8_t FORMAT_PNG32 = 12;

// Portrait size thresholds
constexpr int PORTRAIT_PREFERRED_MIN = 50;
constexpr int STANDIN_MIN = 30;

bool has_area(const sprite_record& rec) noexcept {
    return rec.width > 0 && rec.height > 0;
}

} // namespace

decode_result sff_v2_table::walk(std::span<const std::uint8_t> data,
                                  const archive_header& header,
                                  const extract_options& options,
                                  std::unique_ptr<sprite_table>& table) {
    if (header.sprite_count == 0 || header.sprite_list_offset >= data.size()) {
        return decode_result::failure(decode_error::corrupted_data,
            "Invalid sprite count or sprite list offset");
    }

    auto result = std::make_unique<sff_v2_table>(construct_tag{}, data, header);

    const std::size_t limit = std::min<std::size_t>(header.sprite_count,
        static_cast<std::size_t>(std::max(options.v2_record_limit, 0)));

    for (std::size_t i = 0; i < limit; ++i) {
        const std::size_t node = header.sprite_list_offset + i * sprite_node_size;
        if (!in_bounds(data, node, sprite_node_size)) {
            break;
        }

        sprite_record rec;
        rec.group = read_le16(data, node + OFF_GROUP);
        rec.image = read_le16(data, node + OFF_IMAGE);
        rec.width = read_le16(data, node + OFF_WIDTH);
        rec.height = read_le16(data, node + OFF_HEIGHT);
        rec.format_code = read_u8(data, node + OFF_FORMAT);
        rec.color_depth = read_u8(data, node + OFF_DEPTH);
        rec.data_length = read_le32(data, node + OFF_DATA_LENGTH);
        rec.palette_index = read_le16(data, node + OFF_PALETTE);

        const std::uint16_t linked = read_le16(data, node + OFF_LINKED);
        rec.linked = linked != 0 && linked != LINK_NONE;

        // The flag picks the region; the format code only picks the codec
        const std::uint16_t flags = read_le16(data, node + OFF_FLAGS);
        const std::size_t region = (flags & FLAG_TDATA) ? header.tdata_offset : header.ldata_offset;
        rec.data_offset = region + read_le32(data, node + OFF_DATA_OFFSET);

        result->records_.push_back(rec);
    }

    table = std::move(result);
    return decode_result::success();
}

std::vector<sprite_candidate> sff_v2_table::portrait_candidates() const {
    const sprite_record* preferred = nullptr;
    const sprite_record* fallback = nullptr;
    const sprite_record* standin = nullptr;

    for (const auto& rec : records_) {
        if (rec.linked) {
            continue;
        }
        if (rec.group == PORTRAIT_GROUP) {
            if (rec.width >= PORTRAIT_PREFERRED_MIN && rec.height >= PORTRAIT_PREFERRED_MIN) {
                if (!preferred) preferred = &rec;
            } else if (!fallback) {
                fallback = &rec;
            }
        }
        if (rec.group == 0 && rec.image == 0 && !standin &&
            rec.width > STANDIN_MIN && rec.height > STANDIN_MIN) {
            standin = &rec;
        }
    }

    std::vector<sprite_candidate> candidates;
    for (const auto* rec : {preferred, fallback, standin}) {
        if (rec) {
            candidates.push_back({rec, false});
        }
    }
    return candidates;
}

std::vector<sprite_candidate> sff_v2_table::stage_candidates() const {
    std::vector<sprite_candidate> candidates;
    for (const auto& rec : records_) {
        if (rec.group == PORTRAIT_GROUP && !rec.linked && has_area(rec)) {
            candidates.push_back({&rec, false});
        }
    }
    for (const auto& rec : records_) {
        if (rec.group == 0 && rec.image == 0 && !rec.linked && has_area(rec)) {
            candidates.push_back({&rec, false});
        }
    }
    return candidates;
}

std::optional<palette_table> sff_v2_table::resolve_palette(std::uint16_t index, int max_depth) const {
    std::uint16_t current = index;

    for (int hop = 0; hop <= max_depth; ++hop) {
        const std::size_t node = static_cast<std::size_t>(header_.palette_list_offset) +
                                 static_cast<std::size_t>(current) * palette_node_size;
        if (!in_bounds(data_, node, palette_node_size)) {
            return std::nullopt;
        }

        const std::uint16_t count = read_le16(data_, node + OFF_COLOR_COUNT);
        const std::uint16_t link = read_le16(data_, node + OFF_PAL_LINK);
        const std::uint32_t length = read_le32(data_, node + OFF_PAL_LENGTH);

        if (length == 0 && link != 0) {
            current = link;
            continue;
        }

        const std::size_t colors = static_cast<std::size_t>(header_.ldata_offset) +
                                   read_le32(data_, node + OFF_PAL_OFFSET);
        const std::size_t bytes = static_cast<std::size_t>(count) * 4;
        if (!in_bounds(data_, colors, bytes)) {
            return std::nullopt;
        }
        return palette_table::from_rgba(data_.subspan(colors, bytes), count);
    }

    // Link chain too long or cyclic
    return std::nullopt;
}

decode_result sff_v2_table::decode(const sprite_record& record,
                                    decoded_sprite& out,
                                    const extract_options& options) const {
    auto result = validate_dimensions(record.width, record.height, options);
    if (!result) {
        return result;
    }

    if (!in_bounds(data_, record.data_offset, record.data_length)) {
        return decode_result::failure(decode_error::corrupted_data,
            "Sprite data lies outside the archive");
    }

    const auto* codec = codec_registry::instance().find_codec(record.format_code);
    const bool palette_alpha = codec && codec->uses_palette_alpha();

    out.palette.reset();
    if (palette_alpha || (record.color_depth == 8 &&
        record.format_code != FORMAT_PNG24 && record.format_code != FORMAT_PNG32)) {
        out.palette = resolve_palette(record.palette_index, options.palette_link_depth);
        if (!out.palette) {
            return decode_result::failure(decode_error::corrupted_data,
                "Palette " + std::to_string(record.palette_index) + " could not be resolved");
        }
    }

    const auto payload = data_.subspan(record.data_offset, record.data_length);
    result = decode_sprite(record.format_code, payload, record.width, record.height,
                           record.color_depth, out.pixels, options);
    if (!result) {
        return result;
    }

    // Indices without colors would composite to a blank image
    if (out.pixels.format() == pixel_format::indexed8 && !out.palette) {
        return decode_result::failure(decode_error::corrupted_data,
            "Indexed sprite has no palette");
    }
    out.alpha = palette_alpha ? alpha_mode::palette : alpha_mode::keyed;

    return decode_result::success();
}

std::string_view sff_v2_table::codec_name(const sprite_record& record) const {
    const auto* codec = codec_registry::instance().find_codec(record.format_code);
    return codec ? codec->name() : std::string_view{};
}

} // namespace sff_image
