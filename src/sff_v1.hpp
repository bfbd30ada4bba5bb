#pragma once

#include "sprite_table.hpp"

namespace sff_image {

// ============================================================================
// SFF v1 Sprite Table
// ============================================================================
//
// Sub-files form a forward-only linked list starting at the header's first
// sub-file offset. Each 32-byte sub-header is followed by a PCX image:
//
//   +0   u32  next sub-file offset
//   +4   u32  PCX data length
//   +8   s16  x axis
//   +10  s16  y axis
//   +12  u16  group
//   +14  u16  image
//   +16  u16  linked index (0 = owns its data)
//   +18  u8   same palette as the first sprite
//
// The walk stops at the record cap, a next offset of zero, a next offset that
// does not move forward, or a sub-header that would run past the buffer.

class sff_v1_table final : public sprite_table {
    // Only walk() creates tables
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    static constexpr std::size_t subheader_size = 32;

    sff_v1_table(construct_tag, std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] static decode_result walk(std::span<const std::uint8_t> data,
                                            const archive_header& header,
                                            const std::optional<palette_table>& external,
                                            const extract_options& options,
                                            std::unique_ptr<sprite_table>& table);

    [[nodiscard]] std::vector<sprite_candidate> portrait_candidates() const override;
    [[nodiscard]] std::vector<sprite_candidate> stage_candidates() const override;

    [[nodiscard]] decode_result decode(const sprite_record& record,
                                        decoded_sprite& out,
                                        const extract_options& options) const override;

    [[nodiscard]] std::string_view codec_name(const sprite_record& record) const override;

    // Palette of the first sprite, else the external one
    [[nodiscard]] const std::optional<palette_table>& shared_palette() const noexcept {
        return shared_palette_;
    }

private:
    [[nodiscard]] const sprite_record* first_portrait(std::uint16_t image) const noexcept;

    std::span<const std::uint8_t> data_;
    std::optional<palette_table> shared_palette_;
};

} // namespace sff_image
