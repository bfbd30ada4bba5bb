#ifndef SFF_IMAGE_EXTRACT_HPP_
#define SFF_IMAGE_EXTRACT_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>

namespace sff_image {

// ============================================================================
// Extraction
// ============================================================================
//
// Every call sniffs the archive, walks its sprite table, resolves the
// palette, decodes and composites one sprite into surf as rgba8888 with
// straight alpha. Failed candidates are skipped (and reported through
// options.trace); sprite_not_found means every candidate was rejected.
// Calls share no state and may run concurrently.

/**
 * Extract a character portrait (group 9000).
 * @param data Complete archive bytes
 * @param surf Destination surface
 * @param options Extract options
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_portrait(std::span<const std::uint8_t> data,
                                                               surface& surf,
                                                               const extract_options& options = {});

/**
 * Extract a character portrait using an external palette (e.g. an .act file).
 * The external palette backs "same palette" sprites of v1 archives whose
 * first sprite has no palette of its own. Fewer than 768 bytes means no
 * external palette.
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_portrait(std::span<const std::uint8_t> data,
                                                               std::span<const std::uint8_t> external_palette,
                                                               surface& surf,
                                                               const extract_options& options = {});

/**
 * Extract a stage preview: group 9000 first, then (v1) the largest sprite,
 * then group 0 image 0.
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_stage_preview(std::span<const std::uint8_t> data,
                                                                    surface& surf,
                                                                    const extract_options& options = {});

/**
 * Extract one sprite by group and image number.
 * @return sprite_not_found if no owned record matches, otherwise the
 *         result of decoding that record
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_sprite(std::span<const std::uint8_t> data,
                                                             std::uint16_t group,
                                                             std::uint16_t image,
                                                             surface& surf,
                                                             const extract_options& options = {},
                                                             std::span<const std::uint8_t> external_palette = {});

// ============================================================================
// File Convenience Forms
// ============================================================================

/**
 * Read an archive from disk and extract its portrait.
 * The external palette is <stem>.act beside the archive, else the first
 * .act file (by name) in the same directory, if any.
 * @return file_not_found if the archive cannot be read
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_portrait(const std::filesystem::path& path,
                                                               surface& surf,
                                                               const extract_options& options = {});

[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_stage_preview(const std::filesystem::path& path,
                                                                    surface& surf,
                                                                    const extract_options& options = {});

/**
 * Read an archive from disk and extract one sprite, with the same external
 * palette lookup as the portrait form.
 */
[[nodiscard]] SFF_IMAGE_EXPORT decode_result extract_sprite(const std::filesystem::path& path,
                                                             std::uint16_t group,
                                                             std::uint16_t image,
                                                             surface& surf,
                                                             const extract_options& options = {});

} // namespace sff_image

#endif // SFF_IMAGE_EXTRACT_HPP_
