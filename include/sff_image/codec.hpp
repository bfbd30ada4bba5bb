#ifndef SFF_IMAGE_CODEC_HPP_
#define SFF_IMAGE_CODEC_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace sff_image {

// ============================================================================
// Sprite Codec Interface
// ============================================================================

/**
 * Abstract base class for SFF v2 sprite payload decoders.
 * Each codec handles one storage-format code from the sprite record.
 * Used by the codec registry for runtime polymorphism.
 */
class SFF_IMAGE_EXPORT sprite_codec {
public:
    virtual ~sprite_codec() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::uint8_t format_code() const noexcept = 0;

    /**
     * Bytes preceding the codec stream inside the sprite payload.
     * Compressed formats store a 4-byte uncompressed size first.
     */
    [[nodiscard]] virtual std::size_t payload_offset() const noexcept { return 0; }

    /**
     * True if indexed output should take alpha from the palette's stored
     * alpha channel instead of keying index 0.
     */
    [[nodiscard]] virtual bool uses_palette_alpha() const noexcept { return false; }

    /**
     * Decode a codec stream (prefix already removed).
     * @param data Codec stream
     * @param width Declared sprite width
     * @param height Declared sprite height
     * @param color_depth Declared color depth in bits
     * @param surf Destination surface (indexed8 or rgba8888)
     * @param options Extract options
     */
    [[nodiscard]] virtual decode_result decode(std::span<const std::uint8_t> data,
                                                int width, int height,
                                                int color_depth,
                                                surface& surf,
                                                const extract_options& options) const = 0;
};

// ============================================================================
// Codec Registry
// ============================================================================

/**
 * Registry of sprite codecs keyed by storage-format code.
 * Built-in codecs (0, 2, 3, 4, 10, 11, 12) are registered by default.
 * User code can add codecs at runtime; a later registration for the same
 * format code takes precedence.
 *
 * The registry is not synchronized. Finish all registration before any
 * extraction starts; after that lookups are read-only and may run from
 * several threads at once.
 */
class SFF_IMAGE_EXPORT codec_registry {
public:
    /**
     * Get the global codec registry instance.
     */
    [[nodiscard]] static codec_registry& instance();

    /**
     * Register a codec. Must not run concurrently with lookups or extraction.
     * @param codec Unique pointer to codec (ownership transferred)
     */
    void register_codec(std::unique_ptr<sprite_codec> codec);

    /**
     * Find codec by storage-format code.
     * @return Pointer to codec if found, nullptr otherwise
     */
    [[nodiscard]] const sprite_codec* find_codec(std::uint8_t format_code) const;

    /**
     * Find codec by name (e.g., "lz5").
     * @return Pointer to codec if found, nullptr otherwise
     */
    [[nodiscard]] const sprite_codec* find_codec(std::string_view name) const;

    [[nodiscard]] std::size_t codec_count() const noexcept {
        return codecs_.size();
    }

    [[nodiscard]] const sprite_codec* codec_at(std::size_t index) const noexcept {
        return index < codecs_.size() ? codecs_[index].get() : nullptr;
    }

private:
    codec_registry();
    ~codec_registry();

    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;

    void register_builtin_codecs();

    std::vector<std::unique_ptr<sprite_codec>> codecs_;
};

// ============================================================================
// Convenience Decode Function
// ============================================================================

/**
 * Decode a complete v2 sprite payload with the codec for format_code.
 * The codec's payload prefix is skipped here.
 * @return decoding_failed for an unknown format code or a payload shorter
 *         than its prefix, otherwise the codec's result
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result decode_sprite(std::uint8_t format_code,
                                                            std::span<const std::uint8_t> payload,
                                                            int width, int height,
                                                            int color_depth,
                                                            surface& surf,
                                                            const extract_options& options = {});

} // namespace sff_image

#endif // SFF_IMAGE_CODEC_HPP_
