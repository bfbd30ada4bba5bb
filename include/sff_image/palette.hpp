#ifndef SFF_IMAGE_PALETTE_HPP_
#define SFF_IMAGE_PALETTE_HPP_

#include <sff_image/sff_image_export.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace sff_image {

// ============================================================================
// Palette Table
// ============================================================================
//
// Up to 256 RGBA entries. Colors not supplied by the source are black with
// zero alpha. Index 0 is the transparency key for indexed sprites; the
// compositor forces its alpha, the table itself stores what the archive says.

class SFF_IMAGE_EXPORT palette_table {
public:
    static constexpr std::size_t max_colors = 256;
    static constexpr std::size_t rgb_size = max_colors * 3;    // 768 bytes
    static constexpr std::size_t rgba_size = max_colors * 4;   // 1024 bytes

    palette_table() = default;

    /**
     * Build a table from packed RGB triplets (PCX trailer, .act file).
     * Alpha of every supplied entry is 255.
     */
    [[nodiscard]] static palette_table from_rgb(std::span<const std::uint8_t> rgb) noexcept;

    /**
     * Build a table from packed RGBA quadruplets (SFF v2 palette data).
     * @param rgba Source bytes
     * @param count Number of colors to read (clamped to 256 and to the source)
     */
    [[nodiscard]] static palette_table from_rgba(std::span<const std::uint8_t> rgba,
                                                 std::size_t count) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    [[nodiscard]] std::uint8_t red(std::uint8_t index) const noexcept { return entries_[index * 4u + 0]; }
    [[nodiscard]] std::uint8_t green(std::uint8_t index) const noexcept { return entries_[index * 4u + 1]; }
    [[nodiscard]] std::uint8_t blue(std::uint8_t index) const noexcept { return entries_[index * 4u + 2]; }
    [[nodiscard]] std::uint8_t alpha(std::uint8_t index) const noexcept { return entries_[index * 4u + 3]; }

    [[nodiscard]] std::span<const std::uint8_t, rgba_size> entries() const noexcept { return entries_; }

private:
    std::array<std::uint8_t, rgba_size> entries_{};
    std::size_t count_ = 0;
};

/**
 * Interpret an external palette file (e.g. a character's .act).
 * The first 768 bytes are used as RGB triplets.
 * @return The palette, or nothing if fewer than 768 bytes were supplied
 */
[[nodiscard]] SFF_IMAGE_EXPORT
std::optional<palette_table> external_palette(std::span<const std::uint8_t> data) noexcept;

} // namespace sff_image

#endif // SFF_IMAGE_PALETTE_HPP_
