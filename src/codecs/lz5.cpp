#include <sff_image/codecs/lz5.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

namespace sff_image {

namespace {

constexpr unsigned CONTROL_BITS = 8;
constexpr unsigned RECYCLE_LIMIT = 8;
constexpr std::uint8_t SHORT_LENGTH_MASK = 0x3F;
constexpr std::uint8_t RECYCLE_MASK = 0xC0;
constexpr std::uint8_t SHORT_LITERAL_MASK = 0xE0;
constexpr std::uint8_t LITERAL_VALUE_MASK = 0x1F;
constexpr int LITERAL_RUN_SHIFT = 5;
constexpr std::size_t LONG_LITERAL_BIAS = 8;
constexpr std::size_t LONG_COPY_BIAS = 2;

decode_result truncated(std::size_t produced, std::size_t total) {
    return decode_result::failure(decode_error::decoding_failed,
        "LZ5 stream truncated after " + std::to_string(produced) + " of " +
        std::to_string(total) + " pixels");
}

} // namespace

decode_result lz5_decoder::decode_buffer(std::span<const std::uint8_t> data,
                                          std::vector<std::uint8_t>& pixels,
                                          state& st) {
    if (data.empty()) {
        return decode_result::failure(decode_error::decoding_failed, "LZ5 stream is empty");
    }

    const std::size_t total = pixels.size();
    std::size_t dst = 0;
    byte_cursor src(data);

    while (dst < total) {
        if (st.control_bit >= CONTROL_BITS) {
            if (!src.next(st.control)) {
                return truncated(dst, total);
            }
            st.control_bit = 0;
        }

        std::uint8_t d = 0;
        if (!src.next(d)) {
            return truncated(dst, total);
        }

        const bool is_copy = (st.control & (1u << st.control_bit)) != 0;
        ++st.control_bit;

        if (is_copy) {
            std::size_t offset = 0;
            std::size_t length = 0;

            if ((d & SHORT_LENGTH_MASK) == 0) {
                std::uint8_t low = 0;
                std::uint8_t len = 0;
                if (!src.next(low) || !src.next(len)) {
                    return truncated(dst, total);
                }
                offset = ((static_cast<std::size_t>(d) << 2) | low) + 1;
                length = static_cast<std::size_t>(len) + LONG_COPY_BIAS;
            } else {
                st.recycled = static_cast<std::uint8_t>(
                    st.recycled | ((d & RECYCLE_MASK) >> st.recycled_bits));
                st.recycled_bits += 2;
                length = d & SHORT_LENGTH_MASK;

                if (st.recycled_bits < RECYCLE_LIMIT) {
                    std::uint8_t low = 0;
                    if (!src.next(low)) {
                        return truncated(dst, total);
                    }
                    offset = static_cast<std::size_t>(low) + 1;
                } else {
                    offset = static_cast<std::size_t>(st.recycled) + 1;
                    st.recycled = 0;
                    st.recycled_bits = 0;
                }
            }

            if (offset > dst) {
                return decode_result::failure(decode_error::decoding_failed,
                    "LZ5 back-reference before start of output");
            }

            // Copies length + 1 bytes; overlapping copies repeat the pattern
            for (std::size_t i = 0; i <= length && dst < total; ++i, ++dst) {
                pixels[dst] = pixels[dst - offset];
            }
        } else {
            std::size_t run = 0;
            std::uint8_t value = d;

            if ((d & SHORT_LITERAL_MASK) == 0) {
                std::uint8_t len = 0;
                if (!src.next(len)) {
                    return truncated(dst, total);
                }
                run = static_cast<std::size_t>(len) + LONG_LITERAL_BIAS;
            } else {
                run = static_cast<std::size_t>(d >> LITERAL_RUN_SHIFT);
                value = d & LITERAL_VALUE_MASK;
            }

            for (; run > 0 && dst < total; --run) {
                pixels[dst++] = value;
            }
        }
    }

    return decode_result::success();
}

decode_result lz5_decoder::decode(std::span<const std::uint8_t> data,
                                   int width, int height,
                                   surface& surf) {
    if (width <= 0 || height <= 0) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Invalid sprite dimensions: " + std::to_string(width) + "x" + std::to_string(height));
    }

    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), 0);
    state st;
    auto result = decode_buffer(data, pixels, st);
    if (!result) {
        return result;
    }

    return emit_pixels(surf, pixels, width, height, pixel_format::indexed8);
}

} // namespace sff_image
