#include "sprite_table.hpp"
#include "sff_v1.hpp"
#include "sff_v2.hpp"

namespace sff_image {

const sprite_record* sprite_table::find(std::uint16_t group, std::uint16_t image) const noexcept {
    for (const auto& rec : records_) {
        if (rec.group == group && rec.image == image && !rec.linked) {
            return &rec;
        }
    }
    return nullptr;
}

decode_result make_sprite_table(std::span<const std::uint8_t> data,
                                const std::optional<palette_table>& external,
                                const extract_options& options,
                                std::unique_ptr<sprite_table>& table) {
    archive_header header;
    auto result = sniff_archive(data, header);
    if (!result) {
        return result;
    }

    switch (header.version) {
        case archive_version::v1:
            return sff_v1_table::walk(data, header, external, options, table);
        case archive_version::v2:
            return sff_v2_table::walk(data, header, options, table);
    }

    return decode_result::failure(decode_error::unsupported_version, "Unknown archive version");
}

} // namespace sff_image
