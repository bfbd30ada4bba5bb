#ifndef SFF_IMAGE_TYPES_HPP_
#define SFF_IMAGE_TYPES_HPP_

#include <sff_image/sff_image_export.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace sff_image {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    indexed8,   // 8-bit palette indices
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::indexed8: return 1;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    file_not_found,
    file_too_small,
    invalid_signature,
    unsupported_version,
    sprite_not_found,
    corrupted_data,
    decoding_failed,
    invalid_dimensions
};

[[nodiscard]] SFF_IMAGE_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Extract Options
// ============================================================================

struct extract_options {
    // Declared sprite dimensions above these are rejected before allocating
    int max_width = 4096;
    int max_height = 4096;

    // Preferred portrait size band (v1 archives)
    int portrait_min_size = 80;
    int portrait_max_size = 250;

    // Traversal caps
    int v1_record_limit = 2000;
    int v2_record_limit = 5000;

    // Maximum v2 palette link hops
    int palette_link_depth = 4;

    // Receives one line per rejected candidate while walking fallbacks
    std::function<void(std::string_view)> trace;
};

} // namespace sff_image

#endif // SFF_IMAGE_TYPES_HPP_
