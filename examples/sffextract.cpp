#include <sff_image/sff_image.hpp>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <file.sff> [output.png]\n";
    std::cerr << "Extracts a sprite from an SFF archive to PNG format.\n";
    std::cerr << "Without options the character portrait is extracted.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -l, --list            List the archive's sprites\n";
    std::cerr << "  -s, --stage           Extract the stage preview\n";
    std::cerr << "  -g, --sprite G I      Extract sprite group G, image I\n";
    std::cerr << "  -v, --verbose         Report rejected candidates\n";
    std::cerr << "  -c, --codecs          List available sprite codecs\n";
    std::cerr << "  -h, --help            Show this help\n";
}

void list_codecs() {
    std::cout << "Available codecs:\n";
    const auto& registry = sff_image::codec_registry::instance();
    for (std::size_t i = 0; i < registry.codec_count(); ++i) {
        const auto* codec = registry.codec_at(i);
        std::cout << "  " << static_cast<int>(codec->format_code()) << " " << codec->name() << "\n";
    }
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

int list_archive(const std::filesystem::path& input_path) {
    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    sff_image::archive_header header;
    auto result = sff_image::sniff_archive(data, header);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    std::vector<sff_image::sprite_info> sprites;
    result = sff_image::list_sprites(data, sprites);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    std::cout << "SFF v" << static_cast<int>(header.major_version()) << ", "
              << sprites.size() << " sprites\n";
    for (const auto& s : sprites) {
        std::cout << "  " << s.group << "," << s.image << "  "
                  << s.width << "x" << s.height << "  "
                  << (s.codec.empty() ? std::string_view("?") : s.codec)
                  << "  " << s.color_depth << "bpp  " << s.data_length << " bytes";
        if (s.linked) std::cout << "  linked";
        if (s.shares_palette) std::cout << "  shared-palette";
        std::cout << "\n";
    }
    return 0;
}

enum class mode { portrait, stage, sprite };

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    mode what = mode::portrait;
    std::uint16_t group = 0;
    std::uint16_t image = 0;
    bool verbose = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--codecs") == 0) {
            list_codecs();
            return 0;
        }
        if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--list") == 0) {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            return list_archive(argv[i + 1]);
        }
        if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--stage") == 0) {
            what = mode::stage;
        } else if (std::strcmp(arg, "-g") == 0 || std::strcmp(arg, "--sprite") == 0) {
            if (i + 2 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            what = mode::sprite;
            group = static_cast<std::uint16_t>(std::strtoul(argv[++i], nullptr, 10));
            image = static_cast<std::uint16_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
        } else {
            positional.emplace_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(positional[0]);

    sff_image::extract_options options;
    if (verbose) {
        options.trace = [](std::string_view line) { std::cerr << "  skipped " << line << "\n"; };
    }

    sff_image::png_surface surface;
    sff_image::decode_result result;
    switch (what) {
        case mode::portrait:
            result = sff_image::extract_portrait(input_path, surface, options);
            break;
        case mode::stage:
            result = sff_image::extract_stage_preview(input_path, surface, options);
            break;
        case mode::sprite:
            result = sff_image::extract_sprite(input_path, group, image, surface, options);
            break;
    }

    if (!result) {
        std::cerr << "Error: " << sff_image::to_string(result.error) << ": " << result.message << "\n";
        return 1;
    }

    std::cout << "Decoded: " << surface.width() << "x" << surface.height() << "\n";

    // Second positional argument is the output path, else same name with .png
    std::filesystem::path output_path;
    if (positional.size() >= 2) {
        output_path = positional[1];
    } else {
        output_path = input_path;
        output_path.replace_extension(".png");
    }

    if (!surface.save(output_path)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << "\n";

    return 0;
}
