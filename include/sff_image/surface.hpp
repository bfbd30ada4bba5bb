#ifndef SFF_IMAGE_SURFACE_HPP_
#define SFF_IMAGE_SURFACE_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sff_image {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for image surfaces.
 * Extraction writes its final RGBA image to a surface, so callers can
 * decode straight into their own texture or bitmap type.
 */
class SFF_IMAGE_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * For RGBA, use x = pixel_x * 4.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;

    /**
     * Set the palette size (for indexed formats).
     * @param count Number of palette entries (max 256)
     */
    virtual void set_palette_size(int count) { (void)count; }

    /**
     * Write palette entries.
     * @param start Starting palette index
     * @param colors RGB triplets (3 bytes per color)
     */
    virtual void write_palette(int start, std::span<const std::uint8_t> colors) {
        (void)start;
        (void)colors;
    }
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 * Stores pixels in a contiguous buffer with an optional RGB palette.
 * Also used internally as the decoded pixel buffer handed from the
 * codecs to the compositor.
 */
class SFF_IMAGE_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height, pixel_format format) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;
    void set_palette_size(int count) override;
    void write_palette(int start, std::span<const std::uint8_t> colors) override;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<const std::uint8_t> palette() const noexcept { return palette_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

    /**
     * Bytes of one pixel: 4 for rgba8888, 1 for indexed8.
     * Empty if (x, y) lies outside the surface.
     */
    [[nodiscard]] std::span<const std::uint8_t> pixel(int x, int y) const noexcept;

    /**
     * Byte size of a width x height buffer in the given format.
     * nullopt for non-positive sizes, overflow, or buffers over 256 MiB.
     */
    [[nodiscard]] static std::optional<std::size_t> buffer_size(int width, int height,
                                                                pixel_format format) noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<std::uint8_t> palette_;  // RGB triplets
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace sff_image

#endif // SFF_IMAGE_SURFACE_HPP_
