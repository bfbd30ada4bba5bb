#include <sff_image/codecs/rle5.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <vector>

namespace sff_image {

namespace {

constexpr std::uint8_t GROUP_LENGTH_MASK = 0x7F;
constexpr std::uint8_t LITERAL_COLOR_FLAG = 0x80;
constexpr std::uint8_t FOLLOW_COLOR_MASK = 0x1F;
constexpr int FOLLOW_RUN_SHIFT = 5;

decode_result truncated(std::size_t produced, std::size_t total) {
    return decode_result::failure(decode_error::decoding_failed,
        "RLE5 stream truncated after " + std::to_string(produced) + " of " +
        std::to_string(total) + " pixels");
}

} // namespace

decode_result rle5_decoder::decode(std::span<const std::uint8_t> data,
                                    int width, int height,
                                    surface& surf) {
    if (width <= 0 || height <= 0) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Invalid sprite dimensions: " + std::to_string(width) + "x" + std::to_string(height));
    }
    if (data.empty()) {
        return decode_result::failure(decode_error::decoding_failed, "RLE5 stream is empty");
    }

    const std::size_t total = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<std::uint8_t> pixels(total, 0);
    std::size_t dst = 0;

    byte_cursor src(data);
    while (dst < total) {
        std::uint8_t run_byte = 0;
        std::uint8_t group_byte = 0;
        if (!src.next(run_byte) || !src.next(group_byte)) {
            return truncated(dst, total);
        }

        int run = run_byte;
        int group = group_byte & GROUP_LENGTH_MASK;
        std::uint8_t color = 0;
        if (group_byte & LITERAL_COLOR_FLAG) {
            if (!src.next(color)) {
                return truncated(dst, total);
            }
        }

        for (;;) {
            if (dst < total) {
                pixels[dst++] = color;
            }
            if (--run >= 0) {
                continue;
            }
            if (--group < 0) {
                break;
            }
            // Output is complete; the rest of the packet is irrelevant
            if (dst >= total) {
                break;
            }
            std::uint8_t follow = 0;
            if (!src.next(follow)) {
                return truncated(dst, total);
            }
            color = follow & FOLLOW_COLOR_MASK;
            run = follow >> FOLLOW_RUN_SHIFT;
        }
    }

    return emit_pixels(surf, pixels, width, height, pixel_format::indexed8);
}

} // namespace sff_image
