#pragma once

#include "sprite_table.hpp"

namespace sff_image {

/**
 * Convert a decoded sprite into straight-alpha RGBA on surf.
 *
 * Indexed pixels take RGB from the palette (black when the palette is
 * missing) and alpha per sprite.alpha. RGBA pixels pass through unchanged.
 * The decoded size must equal the expected size, else decoding_failed.
 */
[[nodiscard]] decode_result composite(const decoded_sprite& sprite,
                                      int expected_width, int expected_height,
                                      surface& surf);

} // namespace sff_image
