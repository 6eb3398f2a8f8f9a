#include "ico_format.hpp"
#include "ico_error.hpp"

#include <sstream>

// https://en.wikipedia.org/wiki/ICO_(file_format)

static void put_u8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}

static void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xFF));
    out.push_back((uint8_t)((v >> 8) & 0xFF));
}

static void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back((uint8_t)(v & 0xFF));
    out.push_back((uint8_t)((v >> 8) & 0xFF));
    out.push_back((uint8_t)((v >> 16) & 0xFF));
    out.push_back((uint8_t)((v >> 24) & 0xFF));
}

static uint16_t get_u16(const std::vector<uint8_t>& data, size_t pos) {
    return (uint16_t)(data[pos] | (data[pos + 1] << 8));
}

static uint32_t get_u32(const std::vector<uint8_t>& data, size_t pos) {
    return (uint32_t)data[pos] | ((uint32_t)data[pos + 1] << 8) |
           ((uint32_t)data[pos + 2] << 16) | ((uint32_t)data[pos + 3] << 24);
}

std::vector<uint8_t> build_file_header(uint16_t image_count) {
    std::vector<uint8_t> buf;
    buf.reserve(ICO_HEADER_SIZE);
    put_u16(buf, 0);              // reserved
    put_u16(buf, ICO_TYPE_ICON);  // 1 = icon, 2 = cursor
    put_u16(buf, image_count);
    return buf;
}

IconDirEntry build_dir_entry(int width, uint32_t raw_size, uint32_t offset) {
    IconDirEntry entry;
    entry.width = width >= ICO_MAX_DIMENSION ? 0 : (uint8_t)width;
    entry.height = entry.width;
    entry.color_count = 0;
    entry.reserved = 0;
    entry.planes = 1;
    entry.bit_count = ICO_BITS_PER_PIXEL;
    entry.data_size = raw_size + BMP_INFO_HEADER_SIZE;
    entry.offset = offset;
    return entry;
}

BitmapInfoHeader build_bitmap_info_header(int width) {
    BitmapInfoHeader header;
    header.width = width;
    // Even without an AND mask the BMP header must specify a doubled height
    header.height = width * 2;
    return header;
}

void write_dir_entry(std::vector<uint8_t>& out, const IconDirEntry& entry) {
    put_u8(out, entry.width);
    put_u8(out, entry.height);
    put_u8(out, entry.color_count);
    put_u8(out, entry.reserved);
    put_u16(out, entry.planes);
    put_u16(out, entry.bit_count);
    put_u32(out, entry.data_size);
    put_u32(out, entry.offset);
}

void write_bitmap_info_header(std::vector<uint8_t>& out, const BitmapInfoHeader& header) {
    put_u32(out, header.header_size);
    put_u32(out, (uint32_t)header.width);
    put_u32(out, (uint32_t)header.height);
    put_u16(out, header.planes);
    put_u16(out, header.bit_count);
    put_u32(out, header.compression);
    put_u32(out, header.image_size);
    put_u32(out, (uint32_t)header.x_pels_per_meter);
    put_u32(out, (uint32_t)header.y_pels_per_meter);
    put_u32(out, header.colors_used);
    put_u32(out, header.colors_important);
}

IconDirectory parse_ico_directory(const std::vector<uint8_t>& data) {
    if (data.size() < (size_t)ICO_HEADER_SIZE) {
        throw make_ico_error(IcoErrorKind::InvalidInput, "ICO header truncated");
    }

    uint16_t reserved = get_u16(data, 0);
    uint16_t type = get_u16(data, 2);
    uint16_t count = get_u16(data, 4);

    if (reserved != 0 || type != ICO_TYPE_ICON) {
        std::ostringstream oss;
        oss << "Not an icon file (reserved=" << reserved << ", type=" << type << ")";
        throw make_ico_error(IcoErrorKind::InvalidInput, oss.str());
    }

    size_t dir_end = ICO_HEADER_SIZE + (size_t)count * ICO_DIR_ENTRY_SIZE;
    if (data.size() < dir_end) {
        std::ostringstream oss;
        oss << "ICO directory truncated: " << count << " entries declared, "
            << data.size() << " bytes available";
        throw make_ico_error(IcoErrorKind::InvalidInput, oss.str());
    }

    IconDirectory dir;
    dir.type = type;
    dir.entries.reserve(count);
    for (size_t i = 0; i < count; i++) {
        size_t p = ICO_HEADER_SIZE + i * ICO_DIR_ENTRY_SIZE;
        IconDirEntry e;
        e.width = data[p + 0];
        e.height = data[p + 1];
        e.color_count = data[p + 2];
        e.reserved = data[p + 3];
        e.planes = get_u16(data, p + 4);
        e.bit_count = get_u16(data, p + 6);
        e.data_size = get_u32(data, p + 8);
        e.offset = get_u32(data, p + 12);
        dir.entries.push_back(e);
    }
    return dir;
}
