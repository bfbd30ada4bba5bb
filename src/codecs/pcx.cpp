#include <sff_image/codecs/pcx.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <vector>

namespace sff_image {

namespace {

constexpr std::size_t PCX_HEADER_SIZE = 128;
constexpr std::size_t VGA_PALETTE_SIZE = 769;  // 1 marker + 768 color bytes
constexpr std::uint8_t PCX_MANUFACTURER = 0x0A;
constexpr std::uint8_t PCX_ENCODING_RLE = 1;
constexpr std::uint8_t VGA_PALETTE_MARKER = 0x0C;
constexpr std::uint8_t RLE_MASK = 0xC0;
constexpr std::uint8_t RLE_COUNT_MASK = 0x3F;

// Header field offsets
constexpr std::size_t OFF_ENCODING = 2;
constexpr std::size_t OFF_BITS_PER_PIXEL = 3;
constexpr std::size_t OFF_XMIN = 4;
constexpr std::size_t OFF_YMIN = 6;
constexpr std::size_t OFF_XMAX = 8;
constexpr std::size_t OFF_YMAX = 10;
constexpr std::size_t OFF_NUM_PLANES = 65;
constexpr std::size_t OFF_BYTES_PER_LINE = 66;

bool has_palette_block(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= PCX_HEADER_SIZE + VGA_PALETTE_SIZE &&
           data[data.size() - VGA_PALETTE_SIZE] == VGA_PALETTE_MARKER;
}

} // namespace

bool pcx_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() > PCX_HEADER_SIZE && data[0] == PCX_MANUFACTURER;
}

decode_result pcx_decoder::parse_header(std::span<const std::uint8_t> data,
                                         header_info& info,
                                         const extract_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::decoding_failed,
            "Not a PCX image: bad manufacturer byte or shorter than 128 bytes");
    }

    info.has_rle = data[OFF_ENCODING] == PCX_ENCODING_RLE;
    info.bits_per_pixel = data[OFF_BITS_PER_PIXEL];
    info.num_planes = data[OFF_NUM_PLANES];
    info.bytes_per_line = read_le16(data.data() + OFF_BYTES_PER_LINE);

    // Dimensions are inclusive bounds
    const int x_min = read_le16(data.data() + OFF_XMIN);
    const int y_min = read_le16(data.data() + OFF_YMIN);
    const int x_max = read_le16(data.data() + OFF_XMAX);
    const int y_max = read_le16(data.data() + OFF_YMAX);
    info.width = x_max - x_min + 1;
    info.height = y_max - y_min + 1;

    auto result = validate_dimensions(info.width, info.height, options);
    if (!result) {
        return result;
    }

    if (info.bits_per_pixel != 8) {
        return decode_result::failure(decode_error::decoding_failed,
            "Unsupported PCX bit depth: " + std::to_string(info.bits_per_pixel));
    }

    // Some writers leave the plane count at 0 for 8-bit images
    if (info.num_planes > 1) {
        return decode_result::failure(decode_error::decoding_failed,
            "Unsupported number of PCX color planes");
    }

    if (info.bytes_per_line < info.width) {
        return decode_result::failure(decode_error::corrupted_data,
            "PCX bytes per line shorter than image width");
    }

    return decode_result::success();
}

std::optional<palette_table> pcx_decoder::embedded_palette(std::span<const std::uint8_t> data) noexcept {
    if (!has_palette_block(data)) {
        return std::nullopt;
    }
    return palette_table::from_rgb(data.last(VGA_PALETTE_SIZE - 1));
}

decode_result pcx_decoder::decode_scanlines(std::span<const std::uint8_t> data,
                                             const header_info& info,
                                             surface& surf) {
    const std::size_t scan_line_length = static_cast<std::size_t>(info.bytes_per_line);
    const std::size_t width = static_cast<std::size_t>(info.width);
    std::vector<std::uint8_t> scan_line(scan_line_length);

    const auto* src = data.data() + PCX_HEADER_SIZE;
    const auto* src_end = data.data() + data.size();

    // Don't read into the palette block
    if (has_palette_block(data)) {
        src_end -= VGA_PALETTE_SIZE;
    }

    for (int y = 0; y < info.height; ++y) {
        std::size_t line_pos = 0;
        std::fill(scan_line.begin(), scan_line.end(), 0);

        while (line_pos < scan_line_length && src < src_end) {
            std::uint8_t byte = *src++;

            if (info.has_rle && (byte & RLE_MASK) == RLE_MASK) {
                const std::size_t count = byte & RLE_COUNT_MASK;
                if (src >= src_end) {
                    break;
                }
                const std::uint8_t value = *src++;

                // Runs never carry over into the next scanline
                const std::size_t to_write = std::min(count, scan_line_length - line_pos);
                std::fill_n(scan_line.begin() + static_cast<std::ptrdiff_t>(line_pos), to_write, value);
                line_pos += to_write;
            } else {
                scan_line[line_pos++] = byte;
            }
        }

        // Short data leaves the remaining rows at index 0
        if (line_pos == 0 && src >= src_end) {
            break;
        }

        surf.write_pixels(0, y, static_cast<int>(width), scan_line.data());
    }

    return decode_result::success();
}

decode_result pcx_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const extract_options& options) {
    header_info info{};
    auto result = parse_header(data, info, options);
    if (!result) {
        return result;
    }

    if (!surf.set_size(info.width, info.height, pixel_format::indexed8)) {
        return decode_result::failure(decode_error::decoding_failed, "Failed to allocate surface");
    }

    result = decode_scanlines(data, info, surf);
    if (!result) {
        return result;
    }

    if (has_palette_block(data)) {
        surf.set_palette_size(256);
        surf.write_palette(0, data.last(VGA_PALETTE_SIZE - 1));
    }

    return decode_result::success();
}

} // namespace sff_image
