#pragma once

#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>
#include <sff_image/palette.hpp>
#include <sff_image/archive.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace sff_image {

constexpr std::uint16_t PORTRAIT_GROUP = 9000;

// How indexed pixels get their alpha
enum class alpha_mode {
    keyed,      // index 0 transparent, everything else opaque
    palette     // the palette's stored alpha for every index
};

// A located but undecoded sprite
struct sprite_record {
    std::uint16_t group = 0;
    std::uint16_t image = 0;
    int width = 0;
    int height = 0;
    std::uint8_t format_code = 0;
    int color_depth = 0;
    std::size_t data_offset = 0;    // absolute, into the archive buffer
    std::uint32_t data_length = 0;
    std::uint16_t palette_index = 0;
    bool shares_palette = false;
    bool linked = false;
};

// Decoder output handed to the compositor
struct decoded_sprite {
    memory_surface pixels;
    std::optional<palette_table> palette;   // indexed sprites only
    alpha_mode alpha = alpha_mode::keyed;
};

struct sprite_candidate {
    const sprite_record* record = nullptr;
    bool size_banded = false;   // accept only if the decoded size is inside the portrait band
};

// Version-independent view of an archive's sprite table. The buffer must
// outlive the table.
class sprite_table {
public:
    virtual ~sprite_table() = default;

    [[nodiscard]] const std::vector<sprite_record>& records() const noexcept { return records_; }

    // First owned (non-linked) record with this group and image
    [[nodiscard]] const sprite_record* find(std::uint16_t group, std::uint16_t image) const noexcept;

    // Ordered candidate lists; earlier entries are preferred
    [[nodiscard]] virtual std::vector<sprite_candidate> portrait_candidates() const = 0;
    [[nodiscard]] virtual std::vector<sprite_candidate> stage_candidates() const = 0;

    [[nodiscard]] virtual decode_result decode(const sprite_record& record,
                                                decoded_sprite& out,
                                                const extract_options& options) const = 0;

    // Codec name reported by list_sprites
    [[nodiscard]] virtual std::string_view codec_name(const sprite_record& record) const = 0;

protected:
    std::vector<sprite_record> records_;
};

/**
 * Sniff the archive and walk the matching sprite table.
 * @param external Palette used when a v1 archive has no primary palette
 *        (ignored for v2)
 */
[[nodiscard]] decode_result make_sprite_table(std::span<const std::uint8_t> data,
                                              const std::optional<palette_table>& external,
                                              const extract_options& options,
                                              std::unique_ptr<sprite_table>& table);

} // namespace sff_image
