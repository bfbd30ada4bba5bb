#include <sff_image/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace sff_image {

namespace {

// A 4096x4096 RGBA sprite is 64 MiB; anything past this is a corrupt header
constexpr std::size_t MAX_BUFFER_SIZE = 256ULL * 1024ULL * 1024ULL;

} // namespace

std::optional<std::size_t> memory_surface::buffer_size(int width, int height,
                                                       pixel_format format) noexcept {
    if (width <= 0 || height <= 0) {
        return std::nullopt;
    }

    constexpr std::size_t limit = std::numeric_limits<std::size_t>::max();
    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);
    const std::size_t bpp = bytes_per_pixel(format);

    if (w > limit / bpp || w * bpp > limit / h) {
        return std::nullopt;
    }

    const std::size_t total = w * bpp * h;
    if (total > MAX_BUFFER_SIZE) {
        return std::nullopt;
    }
    return total;
}

bool memory_surface::set_size(int width, int height, pixel_format format) {
    const auto total = buffer_size(width, height, format);
    if (!total) {
        return false;
    }

    try {
        pixels_.assign(*total, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = static_cast<std::size_t>(width) * bytes_per_pixel(format);
    palette_.clear();

    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (!pixels || count <= 0 || x < 0 || y < 0 || y >= height_) {
        return;
    }

    // x is a byte offset; clip the run to the end of its row
    const std::size_t column = static_cast<std::size_t>(x);
    if (column >= pitch_) {
        return;
    }
    const std::size_t run = std::min(static_cast<std::size_t>(count), pitch_ - column);
    std::memcpy(pixels_.data() + static_cast<std::size_t>(y) * pitch_ + column, pixels, run);
}

std::span<const std::uint8_t> memory_surface::pixel(int x, int y) const noexcept {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return {};
    }
    const std::size_t bpp = bytes_per_pixel(format_);
    return std::span<const std::uint8_t>(pixels_).subspan(
        static_cast<std::size_t>(y) * pitch_ + static_cast<std::size_t>(x) * bpp, bpp);
}

void memory_surface::set_palette_size(int count) {
    if (count > 0 && count <= 256) {
        palette_.assign(static_cast<std::size_t>(count) * 3, 0);
    }
}

void memory_surface::write_palette(int start, std::span<const std::uint8_t> colors) {
    if (start < 0) {
        return;
    }
    const std::size_t offset = static_cast<std::size_t>(start) * 3;
    if (offset >= palette_.size()) {
        return;
    }
    const std::size_t n = std::min(colors.size(), palette_.size() - offset);
    std::copy_n(colors.begin(), n, palette_.begin() + static_cast<std::ptrdiff_t>(offset));
}

} // namespace sff_image
