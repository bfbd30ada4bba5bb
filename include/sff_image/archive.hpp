#ifndef SFF_IMAGE_ARCHIVE_HPP_
#define SFF_IMAGE_ARCHIVE_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace sff_image {

// ============================================================================
// Archive Header
// ============================================================================

enum class archive_version {
    v1,     // linked list of PCX sub-files
    v2      // flat sprite index with l-data / t-data regions
};

/**
 * Parsed SFF header. Offsets are absolute file offsets as stored; they are
 * not validated against the buffer until a table walk uses them.
 */
struct archive_header {
    archive_version version = archive_version::v1;
    std::array<std::uint8_t, 4> version_bytes{};    // bytes 12..15, major last

    std::uint32_t sprite_count = 0;

    // v1
    std::uint32_t group_count = 0;
    std::uint32_t first_subfile_offset = 0;

    // v2
    std::uint32_t sprite_list_offset = 0;
    std::uint32_t palette_list_offset = 0;
    std::uint32_t palette_count = 0;
    std::uint32_t ldata_offset = 0;
    std::uint32_t ldata_length = 0;
    std::uint32_t tdata_offset = 0;
    std::uint32_t tdata_length = 0;

    [[nodiscard]] std::uint8_t major_version() const noexcept { return version_bytes[3]; }
};

/**
 * Classify an archive and parse its header.
 * @param data Complete archive bytes
 * @param header Receives the parsed header on success
 * @return file_too_small under 32 bytes, invalid_signature if the
 *         "ElecbyteSpr" signature is missing, otherwise success
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result sniff_archive(std::span<const std::uint8_t> data,
                                                            archive_header& header);

// ============================================================================
// Sprite Listing
// ============================================================================

struct sprite_info {
    std::uint16_t group = 0;
    std::uint16_t image = 0;
    int width = 0;                  // v1: from the PCX header, 0 if unreadable
    int height = 0;
    std::uint8_t format_code = 0;   // v2 storage format; 0 for v1
    std::string_view codec;         // "pcx" for v1, registry name for v2, "" if unknown
    int color_depth = 0;
    std::uint32_t data_length = 0;
    std::uint16_t palette_index = 0;    // v2
    bool shares_palette = false;        // v1
    bool linked = false;                // reuses another sprite's pixels; never decoded
};

/**
 * Walk an archive's sprite table and describe every record reached.
 * Traversal caps and guards are the same as for extraction.
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result list_sprites(std::span<const std::uint8_t> data,
                                                           std::vector<sprite_info>& sprites,
                                                           const extract_options& options = {});

} // namespace sff_image

#endif // SFF_IMAGE_ARCHIVE_HPP_
