#ifndef SFF_IMAGE_SFF_IMAGE_HPP_
#define SFF_IMAGE_SFF_IMAGE_HPP_

#include <sff_image/sff_image_export.h>
#include <sff_image/types.hpp>
#include <sff_image/surface.hpp>
#include <sff_image/palette.hpp>
#include <sff_image/archive.hpp>
#include <sff_image/codec.hpp>
#include <sff_image/extract.hpp>
#include <sff_image/codecs/pcx.hpp>
#include <sff_image/codecs/raw.hpp>
#include <sff_image/codecs/rle8.hpp>
#include <sff_image/codecs/rle5.hpp>
#include <sff_image/codecs/lz5.hpp>
#include <sff_image/codecs/png.hpp>

namespace sff_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:    pixel_format, decode_error, decode_result, extract_options
//   - surface.hpp:  surface interface, memory_surface
//   - palette.hpp:  palette_table, external_palette()
//   - archive.hpp:  sniff_archive(), list_sprites()
//   - codec.hpp:    sprite_codec, codec_registry, decode_sprite()
//   - extract.hpp:  extract_portrait(), extract_stage_preview(), extract_sprite()
//   - codecs/*.hpp: Individual codec implementations

} // namespace sff_image

#endif // SFF_IMAGE_SFF_IMAGE_HPP_
