#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

static const int ICO_HEADER_SIZE = 6;
static const int ICO_DIR_ENTRY_SIZE = 16;
static const int BMP_INFO_HEADER_SIZE = 40;
static const int ICO_MAX_DIMENSION = 256;
static const int ICO_BITS_PER_PIXEL = 32;
static const uint16_t ICO_TYPE_ICON = 1;

/// ICONDIRENTRY — one per embedded image
struct IconDirEntry {
    uint8_t width = 0;        // 0 means 256
    uint8_t height = 0;
    uint8_t color_count = 0;
    uint8_t reserved = 0;
    uint16_t planes = 1;
    uint16_t bit_count = ICO_BITS_PER_PIXEL;
    uint32_t data_size = 0;
    uint32_t offset = 0;

    int pixel_width() const { return width == 0 ? ICO_MAX_DIMENSION : width; }
};

/// BITMAPINFOHEADER preceding each image's pixel payload
struct BitmapInfoHeader {
    uint32_t header_size = BMP_INFO_HEADER_SIZE;
    int32_t width = 0;
    int32_t height = 0;       // doubled: color map + mask
    uint16_t planes = 1;
    uint16_t bit_count = ICO_BITS_PER_PIXEL;
    uint32_t compression = 0;
    uint32_t image_size = 0;
    int32_t x_pels_per_meter = 0;
    int32_t y_pels_per_meter = 0;
    uint32_t colors_used = 0;
    uint32_t colors_important = 0;
};

/// Parsed ICONDIR header plus its entries
struct IconDirectory {
    uint16_t type = 0;
    std::vector<IconDirEntry> entries;
};

/// Build the 6-byte ICONDIR header
std::vector<uint8_t> build_file_header(uint16_t image_count);

/// Build a directory entry; data_size = raw_size + 40
IconDirEntry build_dir_entry(int width, uint32_t raw_size, uint32_t offset);

/// Build the info header for a square image of the given width
BitmapInfoHeader build_bitmap_info_header(int width);

/// Append little-endian encodings to a byte stream
void write_dir_entry(std::vector<uint8_t>& out, const IconDirEntry& entry);
void write_bitmap_info_header(std::vector<uint8_t>& out, const BitmapInfoHeader& header);

/// Parse header and directory of an .ico buffer.
/// Throws IcoError(InvalidInput) on a truncated or non-icon buffer.
IconDirectory parse_ico_directory(const std::vector<uint8_t>& data);
