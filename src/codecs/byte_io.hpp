#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace sff_image {

// Little-endian readers (caller guarantees p points at enough bytes)
inline std::uint16_t read_le16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0]) |
           static_cast<std::uint16_t>(static_cast<std::uint16_t>(p[1]) << 8);
}

inline std::uint32_t read_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

// True if [offset, offset + length) lies inside data
inline bool in_bounds(std::span<const std::uint8_t> data, std::size_t offset, std::size_t length) {
    return offset <= data.size() && length <= data.size() - offset;
}

// Bounds-checked readers: out-of-range reads yield 0 and never touch memory
// outside the span.
inline std::uint8_t read_u8(std::span<const std::uint8_t> data, std::size_t offset) {
    return offset < data.size() ? data[offset] : 0;
}

inline std::uint16_t read_le16(std::span<const std::uint8_t> data, std::size_t offset) {
    return in_bounds(data, offset, 2) ? read_le16(data.data() + offset) : 0;
}

inline std::uint32_t read_le32(std::span<const std::uint8_t> data, std::size_t offset) {
    return in_bounds(data, offset, 4) ? read_le32(data.data() + offset) : 0;
}

// Sequential reader over a codec input stream. next() fails instead of
// reading past the end, so a truncated stream is reported, not overrun.
class byte_cursor {
public:
    explicit byte_cursor(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] bool next(std::uint8_t& value) noexcept {
        if (pos_ >= data_.size()) {
            return false;
        }
        value = data_[pos_++];
        return true;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

} // namespace sff_image
