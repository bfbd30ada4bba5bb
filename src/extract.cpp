#include <sff_image/extract.hpp>
#include <sff_image/palette.hpp>
#include "compositor.hpp"
#include "sprite_table.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace sff_image {

namespace {

std::optional<std::vector<std::uint8_t>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }

    const auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) {
        return std::nullopt;
    }

    return data;
}

bool has_act_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".act";
}

// <stem>.act beside the archive, else the first .act in its directory
std::optional<palette_table> find_external_palette(const std::filesystem::path& archive) {
    auto sibling = archive;
    sibling.replace_extension(".act");
    if (auto data = read_file(sibling)) {
        if (auto palette = external_palette(*data)) {
            return palette;
        }
    }

    std::error_code ec;
    const auto dir = archive.has_parent_path() ? archive.parent_path() : std::filesystem::path(".");
    std::vector<std::filesystem::path> acts;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && has_act_extension(it->path())) {
            acts.push_back(it->path());
        }
    }
    std::sort(acts.begin(), acts.end());

    for (const auto& path : acts) {
        if (auto data = read_file(path)) {
            return external_palette(*data);
        }
    }

    return std::nullopt;
}

void trace_rejection(const extract_options& options, const sprite_record& rec,
                     const decode_result& result) {
    if (!options.trace) {
        return;
    }
    options.trace("group " + std::to_string(rec.group) + ", image " + std::to_string(rec.image) +
                  ": " + to_string(result.error) + ": " + result.message);
}

bool in_portrait_band(const memory_surface& pixels, const extract_options& options) {
    auto in_range = [&](int v) {
        return v >= options.portrait_min_size && v <= options.portrait_max_size;
    };
    return in_range(pixels.width()) && in_range(pixels.height());
}

decode_result finish(const sprite_record& rec, const decoded_sprite& sprite, surface& surf) {
    return composite(sprite, rec.width, rec.height, surf);
}

decode_result first_decodable(const sprite_table& table,
                              const std::vector<sprite_candidate>& candidates,
                              std::string_view use_case,
                              surface& surf,
                              const extract_options& options) {
    for (const auto& candidate : candidates) {
        const sprite_record& rec = *candidate.record;

        decoded_sprite sprite;
        auto result = table.decode(rec, sprite, options);
        if (result && candidate.size_banded && !in_portrait_band(sprite.pixels, options)) {
            if (options.trace) {
                options.trace("group " + std::to_string(rec.group) + ", image " +
                              std::to_string(rec.image) + ": " +
                              std::to_string(sprite.pixels.width()) + "x" +
                              std::to_string(sprite.pixels.height()) +
                              " is outside the preferred portrait size");
            }
            continue;
        }
        if (result) {
            result = finish(rec, sprite, surf);
        }
        if (result) {
            return result;
        }
        trace_rejection(options, rec, result);
    }

    return decode_result::failure(decode_error::sprite_not_found,
        "No decodable " + std::string(use_case) + " sprite");
}

decode_result extract_portrait_impl(std::span<const std::uint8_t> data,
                                    const std::optional<palette_table>& external,
                                    surface& surf,
                                    const extract_options& options) {
    std::unique_ptr<sprite_table> table;
    auto result = make_sprite_table(data, external, options, table);
    if (!result) {
        return result;
    }
    return first_decodable(*table, table->portrait_candidates(), "portrait", surf, options);
}

decode_result extract_sprite_impl(std::span<const std::uint8_t> data,
                                  const std::optional<palette_table>& external,
                                  std::uint16_t group,
                                  std::uint16_t image,
                                  surface& surf,
                                  const extract_options& options) {
    std::unique_ptr<sprite_table> table;
    auto result = make_sprite_table(data, external, options, table);
    if (!result) {
        return result;
    }

    const sprite_record* rec = table->find(group, image);
    if (!rec) {
        return decode_result::failure(decode_error::sprite_not_found,
            "Sprite not found: group " + std::to_string(group) + ", image " + std::to_string(image));
    }

    decoded_sprite sprite;
    result = table->decode(*rec, sprite, options);
    if (!result) {
        return result;
    }
    return finish(*rec, sprite, surf);
}

} // namespace

decode_result extract_portrait(std::span<const std::uint8_t> data,
                               surface& surf,
                               const extract_options& options) {
    return extract_portrait_impl(data, std::nullopt, surf, options);
}

decode_result extract_portrait(std::span<const std::uint8_t> data,
                               std::span<const std::uint8_t> external,
                               surface& surf,
                               const extract_options& options) {
    return extract_portrait_impl(data, external_palette(external), surf, options);
}

decode_result extract_stage_preview(std::span<const std::uint8_t> data,
                                    surface& surf,
                                    const extract_options& options) {
    std::unique_ptr<sprite_table> table;
    auto result = make_sprite_table(data, std::nullopt, options, table);
    if (!result) {
        return result;
    }
    return first_decodable(*table, table->stage_candidates(), "stage preview", surf, options);
}

decode_result extract_sprite(std::span<const std::uint8_t> data,
                             std::uint16_t group,
                             std::uint16_t image,
                             surface& surf,
                             const extract_options& options,
                             std::span<const std::uint8_t> external) {
    return extract_sprite_impl(data, external_palette(external), group, image, surf, options);
}

decode_result extract_portrait(const std::filesystem::path& path,
                               surface& surf,
                               const extract_options& options) {
    auto data = read_file(path);
    if (!data) {
        return decode_result::failure(decode_error::file_not_found,
            "Cannot read " + path.string());
    }
    return extract_portrait_impl(*data, find_external_palette(path), surf, options);
}

decode_result extract_stage_preview(const std::filesystem::path& path,
                                    surface& surf,
                                    const extract_options& options) {
    auto data = read_file(path);
    if (!data) {
        return decode_result::failure(decode_error::file_not_found,
            "Cannot read " + path.string());
    }
    return extract_stage_preview(std::span<const std::uint8_t>(*data), surf, options);
}

decode_result extract_sprite(const std::filesystem::path& path,
                             std::uint16_t group,
                             std::uint16_t image,
                             surface& surf,
                             const extract_options& options) {
    auto data = read_file(path);
    if (!data) {
        return decode_result::failure(decode_error::file_not_found,
            "Cannot read " + path.string());
    }
    return extract_sprite_impl(*data, find_external_palette(path), group, image, surf, options);
}

} // namespace sff_image
