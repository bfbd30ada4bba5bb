#include <sff_image/codec.hpp>
#include <sff_image/codecs/raw.hpp>
#include <sff_image/codecs/rle8.hpp>
#include <sff_image/codecs/rle5.hpp>
#include <sff_image/codecs/lz5.hpp>
#include <sff_image/codecs/png.hpp>

#include <string>

namespace sff_image {

// ============================================================================
// Codec Wrappers
// ============================================================================

namespace {

constexpr std::size_t SIZE_PREFIX = 4;

decode_result depth_mismatch(std::string_view codec, int color_depth) {
    return decode_result::failure(decode_error::decoding_failed,
        "Unsupported color depth " + std::to_string(color_depth) +
        " for " + std::string(codec) + " sprite");
}

class raw_codec_impl : public sprite_codec {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return raw_decoder::name;
    }

    [[nodiscard]] std::uint8_t format_code() const noexcept override {
        return raw_decoder::format_code;
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        int width, int height,
                                        int color_depth,
                                        surface& surf,
                                        const extract_options&) const override {
        switch (color_depth) {
            case 8:
                return raw_decoder::decode(data, width, height, pixel_format::indexed8, surf);
            case 32:
                return raw_decoder::decode(data, width, height, pixel_format::rgba8888, surf);
            default:
                return depth_mismatch(name(), color_depth);
        }
    }
};

// RLE8, RLE5 and LZ5 share everything but the decode call
template <typename Decoder>
class indexed_codec_impl : public sprite_codec {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Decoder::name;
    }

    [[nodiscard]] std::uint8_t format_code() const noexcept override {
        return Decoder::format_code;
    }

    [[nodiscard]] std::size_t payload_offset() const noexcept override {
        return SIZE_PREFIX;
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        int width, int height,
                                        int color_depth,
                                        surface& surf,
                                        const extract_options&) const override {
        if (color_depth != 8) {
            return depth_mismatch(name(), color_depth);
        }
        return Decoder::decode(data, width, height, surf);
    }
};

class png_indexed_codec_impl : public sprite_codec {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return "png-indexed";
    }

    [[nodiscard]] std::uint8_t format_code() const noexcept override {
        return 10;
    }

    [[nodiscard]] std::size_t payload_offset() const noexcept override {
        return SIZE_PREFIX;
    }

    [[nodiscard]] bool uses_palette_alpha() const noexcept override {
        return true;
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        int, int,
                                        int color_depth,
                                        surface& surf,
                                        const extract_options& options) const override {
        if (color_depth != 8) {
            return depth_mismatch(name(), color_depth);
        }
        return png_decoder::decode_indexed(data, surf, options);
    }
};

class png_codec_impl : public sprite_codec {
public:
    explicit png_codec_impl(std::uint8_t code) noexcept : code_(code) {}

    [[nodiscard]] std::string_view name() const noexcept override {
        return code_ == 11 ? "png24" : "png32";
    }

    [[nodiscard]] std::uint8_t format_code() const noexcept override {
        return code_;
    }

    [[nodiscard]] std::size_t payload_offset() const noexcept override {
        return SIZE_PREFIX;
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        int, int, int,
                                        surface& surf,
                                        const extract_options& options) const override {
        return png_decoder::decode(data, surf, options);
    }

private:
    std::uint8_t code_;
};

} // namespace

// ============================================================================
// Codec Registry
// ============================================================================

codec_registry& codec_registry::instance() {
    static codec_registry registry;
    return registry;
}

codec_registry::codec_registry() {
    register_builtin_codecs();
}

codec_registry::~codec_registry() = default;

void codec_registry::register_builtin_codecs() {
    codecs_.push_back(std::make_unique<raw_codec_impl>());
    codecs_.push_back(std::make_unique<indexed_codec_impl<rle8_decoder>>());
    codecs_.push_back(std::make_unique<indexed_codec_impl<rle5_decoder>>());
    codecs_.push_back(std::make_unique<indexed_codec_impl<lz5_decoder>>());
    codecs_.push_back(std::make_unique<png_indexed_codec_impl>());
    codecs_.push_back(std::make_unique<png_codec_impl>(11));
    codecs_.push_back(std::make_unique<png_codec_impl>(12));
}

void codec_registry::register_codec(std::unique_ptr<sprite_codec> codec) {
    if (codec) {
        codecs_.push_back(std::move(codec));
    }
}

const sprite_codec* codec_registry::find_codec(std::uint8_t format_code) const {
    // Newest registration wins
    for (auto it = codecs_.rbegin(); it != codecs_.rend(); ++it) {
        if ((*it)->format_code() == format_code) {
            return it->get();
        }
    }
    return nullptr;
}

const sprite_codec* codec_registry::find_codec(std::string_view name) const {
    for (auto it = codecs_.rbegin(); it != codecs_.rend(); ++it) {
        if ((*it)->name() == name) {
            return it->get();
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Function
// ============================================================================

decode_result decode_sprite(std::uint8_t format_code,
                            std::span<const std::uint8_t> payload,
                            int width, int height,
                            int color_depth,
                            surface& surf,
                            const extract_options& options) {
    const auto* codec = codec_registry::instance().find_codec(format_code);
    if (!codec) {
        return decode_result::failure(decode_error::decoding_failed,
            "Unknown sprite format code: " + std::to_string(format_code));
    }

    const std::size_t skip = codec->payload_offset();
    if (payload.size() < skip) {
        return decode_result::failure(decode_error::decoding_failed,
            std::string(codec->name()) + " payload shorter than its size prefix");
    }

    return codec->decode(payload.subspan(skip), width, height, color_depth, surf, options);
}

} // namespace sff_image
