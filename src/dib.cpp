#include "dib.hpp"

// https://en.wikipedia.org/wiki/BMP_file_format
// Bitmap data starts with the lower left corner of the image.

int mask_row_stride(int width) {
    if (width % 32 == 0) {
        return width / 8;
    }
    return 4 * (width / 32 + 1);
}

size_t color_map_size(int width) {
    return (size_t)width * width * 4;
}

size_t mask_size(int width) {
    return (size_t)mask_row_stride(width) * width;
}

static void encode_color_map(const RasterImage& image, std::vector<uint8_t>& buf) {
    int width = image.width();
    int height = image.height();

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            Rgba px = image.pixel(y, x);
            uint32_t color = (uint32_t)px.b | ((uint32_t)px.g << 8) |
                             ((uint32_t)px.r << 16) | ((uint32_t)px.a << 24);

            size_t pos = ((size_t)(height - 1 - y) * width + x) * 4;
            buf[pos + 0] = (uint8_t)(color & 0xFF);
            buf[pos + 1] = (uint8_t)((color >> 8) & 0xFF);
            buf[pos + 2] = (uint8_t)((color >> 16) & 0xFF);
            buf[pos + 3] = (uint8_t)((color >> 24) & 0xFF);
        }
    }
}

static void encode_mask(const RasterImage& image, std::vector<uint8_t>& buf, size_t mask_start) {
    int width = image.width();
    int height = image.height();
    size_t stride = (size_t)mask_row_stride(width);

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            uint8_t bit = image.pixel(y, x).a > 0 ? 0 : 1;
            if (!bit) continue;  // buffer is zero-filled (opaque)

            size_t bit_num = (size_t)(height - 1 - y) * width + x;
            size_t line = bit_num / width;
            size_t col = bit_num % width;

            size_t pos = mask_start + line * stride + col / 8;
            buf[pos] |= (uint8_t)(bit << (7 - col % 8));
        }
    }
}

std::vector<uint8_t> encode_dib(const RasterImage& image) {
    int width = image.width();
    size_t raw = color_map_size(width);
    std::vector<uint8_t> buf(raw + mask_size(width), 0);

    encode_color_map(image, buf);
    encode_mask(image, buf, raw);

    return buf;
}
