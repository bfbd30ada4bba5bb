#ifndef SFF_IMAGE_CODECS_LZ5_HPP_
#define SFF_IMAGE_CODECS_LZ5_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sff_image {

// ============================================================================
// LZ5 Decoder (SFF v2 format 4)
// ============================================================================

/**
 * Bit-flagged LZ stream producing 8-bit indices.
 *
 * A control byte supplies one flag per packet, consumed from bit 0 to bit 7,
 * after which the next control byte is read. A clear flag is a literal run,
 * a set flag is a back-reference into the output.
 *
 * Literal packet (one byte d):
 *   d & 0xE0 != 0   run = d >> 5, value = d & 0x1F
 *   d & 0xE0 == 0   run = next + 8, value = d
 *
 * Back-reference packet (one byte d), copies length + 1 bytes:
 *   d & 0x3F == 0   offset = ((d << 2) | next) + 1, length = next + 2
 *   otherwise       length = d & 0x3F; the top two bits of d are recycled
 *                   into an accumulator (shifted right by 0, 2, 4, 6). The
 *                   first three short references read offset = next + 1;
 *                   the fourth takes offset = accumulator + 1 and resets it.
 */
class SFF_IMAGE_EXPORT lz5_decoder {
public:
    static constexpr std::string_view name = "lz5";
    static constexpr std::uint8_t format_code = 4;

    // Decoder state carried across packets
    struct state {
        std::uint8_t control = 0;       // current control byte
        unsigned control_bit = 8;       // next flag to consume; 8 = refill needed
        std::uint8_t recycled = 0;      // accumulated short-reference offset bits
        unsigned recycled_bits = 0;     // bits accumulated so far (0, 2, 4, 6)
    };

    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               int width, int height,
                                               surface& surf);

    /**
     * Decode into a caller-owned buffer, exposing the final state.
     * The buffer size is the expected output length.
     */
    [[nodiscard]] static decode_result decode_buffer(std::span<const std::uint8_t> data,
                                                      std::vector<std::uint8_t>& pixels,
                                                      state& st);
};

} // namespace sff_image

#endif // SFF_IMAGE_CODECS_LZ5_HPP_
