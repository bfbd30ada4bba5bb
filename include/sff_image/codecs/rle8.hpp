#ifndef SFF_IMAGE_CODECS_RLE8_HPP_
#define SFF_IMAGE_CODECS_RLE8_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace sff_image {

// ============================================================================
// RLE8 Decoder (SFF v2 format 2)
// ============================================================================

/**
 * Byte-oriented run-length stream producing 8-bit indices.
 *
 * Only bytes 0x40-0x7F are run markers: the low 6 bits are the run length
 * and the following byte is the repeated value. Every other byte, including
 * 0x80-0xFF, is a single literal pixel.
 */
class SFF_IMAGE_EXPORT rle8_decoder {
public:
    static constexpr std::string_view name = "rle8";
    static constexpr std::uint8_t format_code = 2;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               int width, int height,
                                               surface& surf);
};

} // namespace sff_image

#endif // SFF_IMAGE_CODECS_RLE8_HPP_
