#pragma once

#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sff_image {

// Validate declared sprite dimensions: positive and within the configured ceiling
inline decode_result validate_dimensions(int width, int height, const extract_options& options) {
    if (width <= 0 || height <= 0 || width > options.max_width || height > options.max_height) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Invalid sprite dimensions: " + std::to_string(width) + "x" + std::to_string(height));
    }
    return decode_result::success();
}

// Hand a contiguous row-major buffer to surf one scanline at a time
inline void write_rows(surface& surf, const std::uint8_t* data,
                       std::size_t row_bytes, int height) {
    for (int y = 0; y < height; ++y) {
        surf.write_pixels(0, y, static_cast<int>(row_bytes),
                          data + static_cast<std::size_t>(y) * row_bytes);
    }
}

// Allocate surf and copy a complete decoded buffer into it. The buffer must
// hold exactly width * height pixels of the given format.
inline decode_result emit_pixels(surface& surf, const std::vector<std::uint8_t>& pixels,
                                 int width, int height, pixel_format format) {
    const std::size_t row_bytes = static_cast<std::size_t>(width) * bytes_per_pixel(format);
    if (pixels.size() != row_bytes * static_cast<std::size_t>(height)) {
        return decode_result::failure(decode_error::decoding_failed,
            "Decoded pixel count does not match sprite dimensions");
    }
    if (!surf.set_size(width, height, format)) {
        return decode_result::failure(decode_error::decoding_failed, "Failed to allocate surface");
    }
    write_rows(surf, pixels.data(), row_bytes, height);
    return decode_result::success();
}

// Index x of an MSB-first packed buffer at 1, 2, 4 or 8 bits per pixel
inline std::uint8_t extract_pixel(const std::uint8_t* packed, std::size_t x, int bits_per_pixel) {
    if (bits_per_pixel == 8) {
        return packed[x];
    }
    if (bits_per_pixel != 1 && bits_per_pixel != 2 && bits_per_pixel != 4) {
        return 0;
    }
    const std::size_t per_byte = 8 / static_cast<std::size_t>(bits_per_pixel);
    const int shift = 8 - bits_per_pixel * (static_cast<int>(x % per_byte) + 1);
    const int mask = (1 << bits_per_pixel) - 1;
    return static_cast<std::uint8_t>((packed[x / per_byte] >> shift) & mask);
}

} // namespace sff_image
