#include "ico_encoder.hpp"
#include "ico_format.hpp"
#include "dib.hpp"
#include "raster_stb.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <image_path> [options]\n"
              << "       " << prog << " --info <icon_path>\n"
              << "\n"
              << "Square PNG to multi-resolution Windows icon (.ico) converter\n"
              << "\n"
              << "Options:\n"
              << "  -o, --output <path>  Output file (default: input with .ico extension)\n"
              << "  --sizes <a,b,...>    Extra sizes before the 256px image (default: 48,32,16)\n"
              << "  --exact-size         Include AND mask bytes in the directory data size\n"
              << "  --sequential         Resample one size at a time\n"
              << "  --info <path>        Print the directory of an existing .ico file\n"
              << "  --quiet              Only print errors\n"
              << "  --help               Show this help message\n";
}

static bool parse_sizes(const std::string& text, std::vector<int>& sizes) {
    std::vector<int> parsed;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        try {
            size_t used = 0;
            int v = std::stoi(item, &used);
            if (used != item.size()) return false;
            parsed.push_back(v);
        } catch (const std::exception&) {
            return false;
        }
    }
    if (parsed.empty()) return false;
    sizes = parsed;
    return true;
}

static std::string default_output_path(const std::string& input) {
    size_t slash = input.find_last_of("/\\");
    size_t dot = input.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return input + ".ico";
    }
    return input.substr(0, dot) + ".ico";
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + path);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    out.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

static void print_info(const std::string& path) {
    auto data = read_file(path);
    auto dir = parse_ico_directory(data);

    std::cout << "File:    " << path << " (" << data.size() << " bytes)" << std::endl;
    std::cout << "Images:  " << dir.entries.size() << std::endl;
    for (size_t i = 0; i < dir.entries.size(); i++) {
        const auto& e = dir.entries[i];
        std::cout << "  [" << i << "] " << e.pixel_width() << "x" << e.pixel_width()
                  << ", " << e.bit_count << " bpp, " << e.data_size
                  << " bytes at offset " << e.offset << std::endl;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Parse arguments
    std::string image_path;
    std::string output_path;
    std::string info_path;
    bool quiet = false;
    IcoOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--sizes" && i + 1 < argc) {
            std::string text = argv[++i];
            if (!parse_sizes(text, options.sizes)) {
                std::cerr << "Invalid size list: " << text << std::endl;
                return 1;
            }
        } else if (arg == "--exact-size") {
            options.exact_data_size = true;
        } else if (arg == "--sequential") {
            options.parallel_resize = false;
        } else if (arg == "--info" && i + 1 < argc) {
            info_path = argv[++i];
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg[0] != '-') {
            image_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        if (!info_path.empty()) {
            print_info(info_path);
            return 0;
        }

        if (image_path.empty()) {
            std::cerr << "Error: Please specify an image file." << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        if (output_path.empty()) {
            output_path = default_output_path(image_path);
        }

        if (!quiet) std::cout << "Loading: " << image_path << std::endl;
        auto source = load_raster_source(image_path);
        if (!quiet) {
            std::cout << "Source:  " << source->width() << "x" << source->height()
                      << " " << raster_format_name(source->format()) << std::endl;
        }

        auto images = select_icon_images(*source, options);
        if (!quiet) {
            for (const auto& img : images) {
                std::cout << "  " << img.width() << "x" << img.height() << ": "
                          << color_map_size(img.width()) << " + " << mask_size(img.width())
                          << " bytes" << std::endl;
            }
        }

        auto ico = images_to_ico(images, options);
        write_file(output_path, ico);
        if (!quiet) {
            std::cout << "Wrote " << output_path << " (" << ico.size() << " bytes)" << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
