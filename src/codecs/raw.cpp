#include <sff_image/codecs/raw.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <vector>

namespace sff_image {

decode_result raw_decoder::decode(std::span<const std::uint8_t> data,
                                   int width, int height,
                                   pixel_format format,
                                   surface& surf) {
    if (width <= 0 || height <= 0) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Invalid sprite dimensions: " + std::to_string(width) + "x" + std::to_string(height));
    }

    const std::size_t total = static_cast<std::size_t>(width) *
                              static_cast<std::size_t>(height) *
                              bytes_per_pixel(format);

    // Missing tail bytes stay zero
    std::vector<std::uint8_t> pixels(total, 0);
    std::copy_n(data.begin(), std::min(total, data.size()), pixels.begin());

    return emit_pixels(surf, pixels, width, height, format);
}

} // namespace sff_image
