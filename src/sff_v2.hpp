#pragma once

#include "sprite_table.hpp"

namespace sff_image {

// ============================================================================
// SFF v2 Sprite Table
// ============================================================================
//
// Sprite node (28 bytes):
//   +0   u16  group            +14  u8   storage format
//   +2   u16  image            +15  u8   color depth
//   +4   u16  width            +16  u32  data offset
//   +6   u16  height           +20  u32  data length
//   +8   s16  x axis           +24  u16  palette index
//   +10  s16  y axis           +26  u16  flags (bit 0: t-data, else l-data)
//   +12  u16  linked index (0 or 0xFFFF = owns its data)
//
// Palette node (16 bytes):
//   +0   u16  group            +8   u32  data offset (l-data relative)
//   +2   u16  item             +12  u32  data length (0 = linked)
//   +4   u16  color count
//   +6   u16  linked index

class sff_v2_table final : public sprite_table {
    // Only walk() creates tables
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    static constexpr std::size_t sprite_node_size = 28;
    static constexpr std::size_t palette_node_size = 16;

    sff_v2_table(construct_tag, std::span<const std::uint8_t> data, const archive_header& header) noexcept
        : data_(data), header_(header) {}

    [[nodiscard]] static decode_result walk(std::span<const std::uint8_t> data,
                                            const archive_header& header,
                                            const extract_options& options,
                                            std::unique_ptr<sprite_table>& table);

    [[nodiscard]] std::vector<sprite_candidate> portrait_candidates() const override;
    [[nodiscard]] std::vector<sprite_candidate> stage_candidates() const override;

    [[nodiscard]] decode_result decode(const sprite_record& record,
                                        decoded_sprite& out,
                                        const extract_options& options) const override;

    [[nodiscard]] std::string_view codec_name(const sprite_record& record) const override;

    /**
     * Resolve a palette node, following links from empty nodes.
     * @return The palette, or nothing if a node or its colors lie outside
     *         the buffer or the link chain exceeds max_depth hops
     */
    [[nodiscard]] std::optional<palette_table> resolve_palette(std::uint16_t index,
                                                               int max_depth) const;

private:
    std::span<const std::uint8_t> data_;
    archive_header header_;
};

} // namespace sff_image
