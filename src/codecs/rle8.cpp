#include <sff_image/codecs/rle8.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <vector>

namespace sff_image {

namespace {

constexpr std::uint8_t RUN_MASK = 0xC0;
constexpr std::uint8_t RUN_MARKER = 0x40;
constexpr std::uint8_t RUN_COUNT_MASK = 0x3F;

} // namespace

decode_result rle8_decoder::decode(std::span<const std::uint8_t> data,
                                    int width, int height,
                                    surface& surf) {
    if (width <= 0 || height <= 0) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Invalid sprite dimensions: " + std::to_string(width) + "x" + std::to_string(height));
    }
    if (data.empty()) {
        return decode_result::failure(decode_error::decoding_failed, "RLE8 stream is empty");
    }

    const std::size_t total = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<std::uint8_t> pixels(total, 0);
    std::size_t dst = 0;

    byte_cursor src(data);
    while (dst < total) {
        std::uint8_t value = 0;
        if (!src.next(value)) {
            return decode_result::failure(decode_error::decoding_failed,
                "RLE8 stream truncated after " + std::to_string(dst) + " of " +
                std::to_string(total) + " pixels");
        }

        std::size_t run = 1;
        if ((value & RUN_MASK) == RUN_MARKER) {
            run = value & RUN_COUNT_MASK;
            if (!src.next(value)) {
                return decode_result::failure(decode_error::decoding_failed,
                    "RLE8 stream truncated inside a run");
            }
        }

        run = std::min(run, total - dst);
        std::fill_n(pixels.begin() + static_cast<std::ptrdiff_t>(dst), run, value);
        dst += run;
    }

    return emit_pixels(surf, pixels, width, height, pixel_format::indexed8);
}

} // namespace sff_image
