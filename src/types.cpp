#include <sff_image/types.hpp>

namespace sff_image {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                return "none";
        case decode_error::file_not_found:      return "file_not_found";
        case decode_error::file_too_small:      return "file_too_small";
        case decode_error::invalid_signature:   return "invalid_signature";
        case decode_error::unsupported_version: return "unsupported_version";
        case decode_error::sprite_not_found:    return "sprite_not_found";
        case decode_error::corrupted_data:      return "corrupted_data";
        case decode_error::decoding_failed:     return "decoding_failed";
        case decode_error::invalid_dimensions:  return "invalid_dimensions";
    }
    return "unknown";
}

} // namespace sff_image
