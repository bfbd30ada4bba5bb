#ifndef SFF_IMAGE_CODECS_PNG_HPP_
#define SFF_IMAGE_CODECS_PNG_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace sff_image {

// ============================================================================
// PNG Decoder (SFF v2 formats 10, 11, 12)
// ============================================================================

class SFF_IMAGE_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw PNG data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG image data to an RGBA surface (formats 11 and 12).
     * @param data Raw PNG data
     * @param surf Destination surface
     * @param options Extract options (dimension ceiling)
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const extract_options& options = {});

    /**
     * Decode a palette-type PNG to its raw indices (format 10).
     * The colors stored in the PNG are ignored; the caller re-indexes the
     * result through the archive palette. Bit depths 1, 2, 4 and 8 are
     * accepted and unpacked to one index per byte.
     */
    [[nodiscard]] static decode_result decode_indexed(std::span<const std::uint8_t> data,
                                                       surface& surf,
                                                       const extract_options& options = {});
};

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a memory surface to PNG format.
 * @param surf Source surface (rgba8888, or indexed8 with a palette)
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] SFF_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] SFF_IMAGE_EXPORT bool save_png(const memory_surface& surf,
                                              const std::filesystem::path& path);

// ============================================================================
// PNG Surface
// ============================================================================

/**
 * Surface that can save its contents as PNG.
 * Inherits from memory_surface and adds save functionality.
 */
class SFF_IMAGE_EXPORT png_surface : public memory_surface {
public:
    png_surface() = default;
    ~png_surface() override = default;

    png_surface(const png_surface&) = delete;
    png_surface& operator=(const png_surface&) = delete;
    png_surface(png_surface&&) noexcept = default;
    png_surface& operator=(png_surface&&) noexcept = default;

    /**
     * Encode surface contents to PNG format.
     * @return PNG-encoded data, or empty vector on failure
     */
    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    /**
     * Save surface contents to a PNG file.
     * @param path Output file path
     * @return true on success
     */
    [[nodiscard]] bool save(const std::filesystem::path& path) const;
};

} // namespace sff_image

#endif // SFF_IMAGE_CODECS_PNG_HPP_
