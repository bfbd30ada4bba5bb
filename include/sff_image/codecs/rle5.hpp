#ifndef SFF_IMAGE_CODECS_RLE5_HPP_
#define SFF_IMAGE_CODECS_RLE5_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace sff_image {

// ============================================================================
// RLE5 Decoder (SFF v2 format 3)
// ============================================================================

/**
 * Packet stream producing 8-bit indices. Each packet is:
 *   run byte      - the first color is emitted run + 1 times
 *   group byte    - low 7 bits: number of follow-up bytes;
 *                   top bit set: a literal color byte follows, else color 0
 *   [color byte]
 *   follow-ups    - 3-bit run (top) and 5-bit color (low), emitted run + 1 times
 */
class SFF_IMAGE_EXPORT rle5_decoder {
public:
    static constexpr std::string_view name = "rle5";
    static constexpr std::uint8_t format_code = 3;

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               int width, int height,
                                               surface& surf);
};

} // namespace sff_image

#endif // SFF_IMAGE_CODECS_RLE5_HPP_
