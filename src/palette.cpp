#include <sff_image/palette.hpp>

#include <algorithm>

namespace sff_image {

palette_table palette_table::from_rgb(std::span<const std::uint8_t> rgb) noexcept {
    palette_table table;
    const std::size_t count = std::min(rgb.size() / 3, max_colors);
    for (std::size_t i = 0; i < count; ++i) {
        table.entries_[i * 4 + 0] = rgb[i * 3 + 0];
        table.entries_[i * 4 + 1] = rgb[i * 3 + 1];
        table.entries_[i * 4 + 2] = rgb[i * 3 + 2];
        table.entries_[i * 4 + 3] = 0xFF;
    }
    table.count_ = count;
    return table;
}

palette_table palette_table::from_rgba(std::span<const std::uint8_t> rgba,
                                       std::size_t count) noexcept {
    palette_table table;
    count = std::min({count, rgba.size() / 4, max_colors});
    std::copy_n(rgba.begin(), count * 4, table.entries_.begin());
    table.count_ = count;
    return table;
}

std::optional<palette_table> external_palette(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < palette_table::rgb_size) {
        return std::nullopt;
    }
    return palette_table::from_rgb(data.first(palette_table::rgb_size));
}

} // namespace sff_image
