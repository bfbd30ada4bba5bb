#include <sff_image/codecs/png.hpp>
#include "decode_helpers.hpp"
#include <lodepng.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

namespace sff_image {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// Convert lodepng's unsigned dimensions, rejecting anything over the ceiling
decode_result checked_dimensions(unsigned width, unsigned height,
                                 const extract_options& options,
                                 int& out_width, int& out_height) {
    constexpr auto max_int = static_cast<unsigned>(std::numeric_limits<int>::max());
    if (width > max_int || height > max_int) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "PNG dimensions exceed maximum supported size");
    }
    out_width = static_cast<int>(width);
    out_height = static_cast<int>(height);
    return validate_dimensions(out_width, out_height, options);
}

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= PNG_SIGNATURE_SIZE &&
           std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), data.begin());
}

decode_result png_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const extract_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::decoding_failed, "Not a valid PNG stream");
    }

    // Pre-decode dimension check to avoid inflating huge images
    unsigned width = 0;
    unsigned height = 0;
    int w = 0;
    int h = 0;
    {
        lodepng::State header_state;
        if (lodepng_inspect(&width, &height, &header_state, data.data(), data.size()) == 0) {
            auto result = checked_dimensions(width, height, options, w, h);
            if (!result) return result;
        }
    }

    std::vector<std::uint8_t> pixels;
    unsigned error = lodepng::decode(pixels, width, height, data.data(), data.size());
    if (error) {
        return decode_result::failure(decode_error::decoding_failed,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    auto result = checked_dimensions(width, height, options, w, h);
    if (!result) return result;

    return emit_pixels(surf, pixels, w, h, pixel_format::rgba8888);
}

decode_result png_decoder::decode_indexed(std::span<const std::uint8_t> data,
                                           surface& surf,
                                           const extract_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::decoding_failed, "Not a valid PNG stream");
    }

    unsigned width = 0;
    unsigned height = 0;
    lodepng::State state;
    unsigned error = lodepng_inspect(&width, &height, &state, data.data(), data.size());
    if (error) {
        return decode_result::failure(decode_error::decoding_failed,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    int w = 0;
    int h = 0;
    auto result = checked_dimensions(width, height, options, w, h);
    if (!result) return result;

    const LodePNGColorMode& color = state.info_png.color;
    if (color.colortype != LCT_PALETTE) {
        return decode_result::failure(decode_error::decoding_failed,
            "Palette-indexed sprite is not a palette PNG");
    }
    const int bit_depth = static_cast<int>(color.bitdepth);

    // Keep the stored indices; the archive palette supplies the colors
    state.decoder.color_convert = 0;
    std::vector<std::uint8_t> packed;
    error = lodepng::decode(packed, width, height, state, data.data(), data.size());
    if (error) {
        return decode_result::failure(decode_error::decoding_failed,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    // lodepng packs sub-byte pixels with no padding between scanlines
    const std::size_t total = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
    if ((total * static_cast<std::size_t>(bit_depth) + 7) / 8 > packed.size()) {
        return decode_result::failure(decode_error::decoding_failed,
            "PNG index data shorter than image dimensions");
    }

    std::vector<std::uint8_t> indices(total);
    for (std::size_t i = 0; i < total; ++i) {
        indices[i] = extract_pixel(packed.data(), i, bit_depth);
    }

    return emit_pixels(surf, indices, w, h, pixel_format::indexed8);
}

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.empty()) {
        return {};
    }

    const auto w = static_cast<unsigned>(surf.width());
    const auto h = static_cast<unsigned>(surf.height());
    std::vector<std::uint8_t> png_data;

    if (surf.format() == pixel_format::rgba8888) {
        if (lodepng::encode(png_data, surf.pixels().data(), w, h) != 0) {
            return {};
        }
        return png_data;
    }

    // Indexed surfaces expand through their RGB palette; entries past its end are black
    const auto palette = surf.palette();
    std::vector<std::uint8_t> rgba;
    rgba.reserve(static_cast<std::size_t>(w) * h * 4);
    for (const std::uint8_t index : surf.pixels()) {
        const std::size_t entry = static_cast<std::size_t>(index) * 3;
        const bool known = entry + 2 < palette.size();
        rgba.push_back(known ? palette[entry + 0] : 0);
        rgba.push_back(known ? palette[entry + 1] : 0);
        rgba.push_back(known ? palette[entry + 2] : 0);
        rgba.push_back(0xFF);
    }

    if (lodepng::encode(png_data, rgba, w, h) != 0) {
        return {};
    }
    return png_data;
}

bool save_png(const memory_surface& surf, const std::filesystem::path& path) {
    const auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return false;
    }
    return lodepng::save_file(png_data, path.string()) == 0;
}

// ============================================================================
// PNG Surface
// ============================================================================

std::vector<std::uint8_t> png_surface::encode() const {
    return encode_png(*this);
}

bool png_surface::save(const std::filesystem::path& path) const {
    return save_png(*this, path);
}

} // namespace sff_image
