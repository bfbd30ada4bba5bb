#ifndef SFF_IMAGE_CODECS_RAW_HPP_
#define SFF_IMAGE_CODECS_RAW_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace sff_image {

// ============================================================================
// Raw Decoder (SFF v2 format 0)
// ============================================================================

/**
 * Uncompressed sprite data: 8-bit indices or 32-bit RGBA, row-major.
 * A short payload is zero-padded; excess bytes are ignored.
 */
class SFF_IMAGE_EXPORT raw_decoder {
public:
    static constexpr std::string_view name = "raw";
    static constexpr std::uint8_t format_code = 0;

    /**
     * @param data Sprite payload
     * @param width Declared width
     * @param height Declared height
     * @param format indexed8 for 8-bit depth, rgba8888 for 32-bit depth
     * @param surf Destination surface
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               int width, int height,
                                               pixel_format format,
                                               surface& surf);
};

} // namespace sff_image

#endif // SFF_IMAGE_CODECS_RAW_HPP_
