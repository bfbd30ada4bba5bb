#include "compositor.hpp"
#include "codecs/decode_helpers.hpp"

#include <string>
#include <vector>

namespace sff_image {

namespace {

constexpr std::uint8_t ALPHA_OPAQUE = 0xFF;
constexpr std::uint8_t ALPHA_CLEAR = 0x00;

} // namespace

decode_result composite(const decoded_sprite& sprite,
                        int expected_width, int expected_height,
                        surface& surf) {
    const memory_surface& src = sprite.pixels;
    if (src.width() != expected_width || src.height() != expected_height) {
        return decode_result::failure(decode_error::decoding_failed,
            "Decoded size " + std::to_string(src.width()) + "x" + std::to_string(src.height()) +
            " does not match declared " + std::to_string(expected_width) + "x" +
            std::to_string(expected_height));
    }

    const std::size_t count = static_cast<std::size_t>(src.width()) *
                              static_cast<std::size_t>(src.height());

    if (src.format() == pixel_format::rgba8888) {
        if (src.pixels().size() != count * 4) {
            return decode_result::failure(decode_error::decoding_failed,
                "RGBA buffer length does not match sprite dimensions");
        }
        std::vector<std::uint8_t> rgba(src.pixels().begin(), src.pixels().end());
        return emit_pixels(surf, rgba, src.width(), src.height(), pixel_format::rgba8888);
    }

    if (src.pixels().size() != count) {
        return decode_result::failure(decode_error::decoding_failed,
            "Index buffer length does not match sprite dimensions");
    }

    const palette_table palette = sprite.palette.value_or(palette_table{});
    const auto indices = src.pixels();
    std::vector<std::uint8_t> rgba(count * 4);

    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t index = indices[i];
        rgba[i * 4 + 0] = palette.red(index);
        rgba[i * 4 + 1] = palette.green(index);
        rgba[i * 4 + 2] = palette.blue(index);

        // Index 0 is the transparency key unless the palette carries alpha
        if (sprite.alpha == alpha_mode::palette) {
            rgba[i * 4 + 3] = palette.alpha(index);
        } else {
            rgba[i * 4 + 3] = index == 0 ? ALPHA_CLEAR : ALPHA_OPAQUE;
        }
    }

    return emit_pixels(surf, rgba, src.width(), src.height(), pixel_format::rgba8888);
}

} // namespace sff_image
