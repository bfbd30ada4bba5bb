#include "sff_v1.hpp"
#include "codecs/byte_io.hpp"

#include <sff_image/codecs/pcx.hpp>

#include <algorithm>
#include <string>

namespace sff_image {

namespace {

// Sub-header field offsets
constexpr std::size_t OFF_NEXT = 0;
constexpr std::size_t OFF_LENGTH = 4;
constexpr std::size_t OFF_GROUP = 12;
constexpr std::size_t OFF_IMAGE = 14;
constexpr std::size_t OFF_LINKED = 16;
constexpr std::size_t OFF_SAME_PALETTE = 18;

// PCX header fields used for listing
constexpr std::size_t PCX_HEADER_SIZE = 128;
constexpr std::size_t PCX_BITS_PER_PIXEL = 3;
constexpr std::size_t PCX_XMIN = 4;
constexpr std::size_t PCX_YMIN = 6;
constexpr std::size_t PCX_XMAX = 8;
constexpr std::size_t PCX_YMAX = 10;

void read_pcx_geometry(std::span<const std::uint8_t> payload, sprite_record& rec) {
    if (payload.size() < PCX_HEADER_SIZE) {
        return;
    }
    rec.width = static_cast<int>(read_le16(payload, PCX_XMAX)) -
                static_cast<int>(read_le16(payload, PCX_XMIN)) + 1;
    rec.height = static_cast<int>(read_le16(payload, PCX_YMAX)) -
                 static_cast<int>(read_le16(payload, PCX_YMIN)) + 1;
    rec.color_depth = read_u8(payload, PCX_BITS_PER_PIXEL);
}

} // namespace

decode_result sff_v1_table::walk(std::span<const std::uint8_t> data,
                                  const archive_header& header,
                                  const std::optional<palette_table>& external,
                                  const extract_options& options,
                                  std::unique_ptr<sprite_table>& table) {
    if (header.sprite_count == 0 || header.first_subfile_offset >= data.size()) {
        return decode_result::failure(decode_error::corrupted_data,
            "Invalid sprite count or first sub-file offset");
    }

    auto result = std::make_unique<sff_v1_table>(construct_tag{}, data);

    const std::size_t limit = std::min<std::size_t>(header.sprite_count,
        static_cast<std::size_t>(std::max(options.v1_record_limit, 0)));
    std::size_t offset = header.first_subfile_offset;

    for (std::size_t i = 0; i < limit; ++i) {
        if (!in_bounds(data, offset, subheader_size)) {
            break;
        }

        const std::uint32_t next = read_le32(data, offset + OFF_NEXT);

        sprite_record rec;
        rec.group = read_le16(data, offset + OFF_GROUP);
        rec.image = read_le16(data, offset + OFF_IMAGE);
        rec.linked = read_le16(data, offset + OFF_LINKED) != 0;
        rec.shares_palette = read_u8(data, offset + OFF_SAME_PALETTE) != 0;
        rec.data_offset = offset + subheader_size;

        // Lengths running past the end are clamped to what is there
        const std::size_t available = data.size() - rec.data_offset;
        rec.data_length = static_cast<std::uint32_t>(
            std::min<std::size_t>(read_le32(data, offset + OFF_LENGTH), available));

        const auto payload = data.subspan(rec.data_offset, rec.data_length);
        read_pcx_geometry(payload, rec);

        // The first sprite's own palette is the archive's primary palette
        if (i == 0 && rec.data_length > 0 && !rec.shares_palette) {
            result->shared_palette_ = pcx_decoder::embedded_palette(payload);
        }

        result->records_.push_back(rec);

        if (next == 0 || next <= offset) {
            break;
        }
        offset = next;
    }

    if (!result->shared_palette_) {
        result->shared_palette_ = external;
    }

    table = std::move(result);
    return decode_result::success();
}

const sprite_record* sff_v1_table::first_portrait(std::uint16_t image) const noexcept {
    for (const auto& rec : records_) {
        if (rec.group == PORTRAIT_GROUP && rec.image == image &&
            !rec.linked && rec.data_length > 0) {
            return &rec;
        }
    }
    return nullptr;
}

std::vector<sprite_candidate> sff_v1_table::portrait_candidates() const {
    // 9000,0 is the select icon, 9000,1 the portrait, 9000,2 an alternate
    const sprite_record* icon = first_portrait(0);
    const sprite_record* portrait = first_portrait(1);
    const sprite_record* alternate = first_portrait(2);

    std::vector<sprite_candidate> candidates;
    for (const auto* rec : {portrait, alternate}) {
        if (rec) {
            candidates.push_back({rec, true});
        }
    }
    for (const auto* rec : {portrait, alternate, icon}) {
        if (rec) {
            candidates.push_back({rec, false});
        }
    }
    return candidates;
}

std::vector<sprite_candidate> sff_v1_table::stage_candidates() const {
    std::vector<sprite_candidate> candidates;

    for (const auto& rec : records_) {
        if (rec.group == PORTRAIT_GROUP && !rec.linked && rec.data_length > 0) {
            candidates.push_back({&rec, false});
        }
    }

    // The largest block is most likely the full background
    const sprite_record* largest = nullptr;
    for (const auto& rec : records_) {
        if (!rec.linked && rec.data_length > 0 &&
            (!largest || rec.data_length > largest->data_length)) {
            largest = &rec;
        }
    }
    if (largest) {
        candidates.push_back({largest, false});
    }

    // Group 0,0 may only be an overlay, so it comes last
    for (const auto& rec : records_) {
        if (rec.group == 0 && rec.image == 0 && !rec.linked && rec.data_length > 0) {
            candidates.push_back({&rec, false});
        }
    }

    return candidates;
}

decode_result sff_v1_table::decode(const sprite_record& record,
                                    decoded_sprite& out,
                                    const extract_options& options) const {
    if (record.data_length == 0) {
        return decode_result::failure(decode_error::decoding_failed, "Sprite has no PCX data");
    }

    const auto payload = data_.subspan(record.data_offset, record.data_length);
    auto result = pcx_decoder::decode(payload, out.pixels, options);
    if (!result) {
        return result;
    }

    // Own palette first, then the shared one, else all black
    out.palette = pcx_decoder::embedded_palette(payload);
    if (!out.palette && record.shares_palette && shared_palette_) {
        out.palette = shared_palette_;
    }
    if (!out.palette) {
        out.palette = palette_table{};
    }
    out.alpha = alpha_mode::keyed;

    return decode_result::success();
}

std::string_view sff_v1_table::codec_name(const sprite_record&) const {
    return pcx_decoder::name;
}

} // namespace sff_image
