#ifndef SFF_IMAGE_CODECS_PCX_HPP_
#define SFF_IMAGE_CODECS_PCX_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>
#include <sff_image/palette.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace sff_image {

// ============================================================================
// PCX Decoder (SFF v1 sprite payloads)
// ============================================================================

/**
 * Decoder for the 8-bit single-plane PCX images embedded in SFF v1 archives.
 *
 * Output is indexed8. When the payload ends with a 769-byte VGA palette block
 * (marker 0x0C followed by 768 RGB bytes) the palette is written to the
 * surface; otherwise the surface palette stays empty and the caller supplies
 * the shared palette.
 */
class SFF_IMAGE_EXPORT pcx_decoder {
public:
    static constexpr std::string_view name = "pcx";

    /**
     * Check if data appears to be a PCX image.
     * @param data Sprite payload
     * @return true if the manufacturer byte and header size match
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PCX image data to a surface.
     * @param data Sprite payload
     * @param surf Destination surface (indexed8)
     * @param options Extract options (dimension ceiling)
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const extract_options& options = {});

    struct header_info {
        int width;
        int height;
        int bits_per_pixel;
        int num_planes;
        int bytes_per_line;
        bool has_rle;
    };

    // Parse PCX header without decoding (also used for sprite listing)
    [[nodiscard]] static decode_result parse_header(std::span<const std::uint8_t> data,
                                                     header_info& info,
                                                     const extract_options& options);

    /**
     * Read the trailing VGA palette block, if present.
     * @param data Sprite payload
     * @return The palette, or nothing if the payload carries no marked block
     */
    [[nodiscard]] static std::optional<palette_table> embedded_palette(
        std::span<const std::uint8_t> data) noexcept;

private:
    [[nodiscard]] static decode_result decode_scanlines(std::span<const std::uint8_t> data,
                                                         const header_info& info,
                                                         surface& surf);
};

} // namespace sff_image

#endif // SFF_IMAGE_CODECS_PCX_HPP_
