#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_resize.h>
#include "raster_stb.hpp"
#include "ico_error.hpp"

#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

StbRasterSource::StbRasterSource(int width, int height, RasterFormat format, std::vector<uint8_t> rgba)
    : width_(width), height_(height), format_(format), rgba_(std::move(rgba)) {}

static stbir_filter to_stbir_filter(ResampleKernel kernel) {
    switch (kernel) {
    case ResampleKernel::Cubic:
        return STBIR_FILTER_CATMULLROM;
    }
    return STBIR_FILTER_DEFAULT;
}

std::unique_ptr<RasterSource> StbRasterSource::resize(int width, int height,
                                                      ResampleKernel kernel) const {
    if (width <= 0 || height <= 0 || rgba_.empty()) {
        throw make_ico_error(IcoErrorKind::ResizeFailure);
    }

    std::vector<uint8_t> out((size_t)width * height * 4);
    int ok = stbir_resize_uint8_generic(
        rgba_.data(), width_, height_, 0,
        out.data(), width, height, 0,
        4, 3, 0,
        STBIR_EDGE_CLAMP, to_stbir_filter(kernel), STBIR_COLORSPACE_LINEAR,
        nullptr);
    if (!ok) {
        throw make_ico_error(IcoErrorKind::ResizeFailure);
    }

    return std::make_unique<StbRasterSource>(width, height, format_, std::move(out));
}

RasterImage StbRasterSource::pixels() const {
    if (width_ != height_) {
        throw make_ico_error(IcoErrorKind::InvalidInput);
    }
    return RasterImage(width_, rgba_);
}

// --- Format detection ---

static const uint8_t PNG_SIGNATURE[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
static const uint8_t JPEG_SIGNATURE[] = {0xFF, 0xD8, 0xFF};

static bool starts_with(const std::vector<uint8_t>& bytes, const uint8_t* sig, size_t len) {
    return bytes.size() >= len && std::memcmp(bytes.data(), sig, len) == 0;
}

RasterFormat detect_raster_format(const std::vector<uint8_t>& bytes) {
    if (starts_with(bytes, PNG_SIGNATURE, sizeof(PNG_SIGNATURE))) return RasterFormat::Png;
    if (starts_with(bytes, JPEG_SIGNATURE, sizeof(JPEG_SIGNATURE))) return RasterFormat::Jpeg;
    if (starts_with(bytes, (const uint8_t*)"GIF8", 4)) return RasterFormat::Gif;
    if (starts_with(bytes, (const uint8_t*)"BM", 2)) return RasterFormat::Bmp;
    return RasterFormat::Unknown;
}

// --- Loading ---

std::unique_ptr<RasterSource> load_raster_source_from_memory(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw make_ico_error(IcoErrorKind::InvalidInput, "Image data is empty");
    }
    RasterFormat format = detect_raster_format(bytes);

    int w, h, channels;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(),
                                                &w, &h, &channels, 4);  // Force RGBA
    if (!data) {
        throw make_ico_error(IcoErrorKind::InvalidInput,
                             std::string("Failed to decode image (") + stbi_failure_reason() + ")");
    }

    std::vector<uint8_t> rgba(data, data + (size_t)w * h * 4);
    stbi_image_free(data);

    return create_raster_source(w, h, std::move(rgba), format);
}

std::unique_ptr<RasterSource> load_raster_source(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw make_ico_error(IcoErrorKind::InvalidInput, "Failed to open image: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    return load_raster_source_from_memory(bytes);
}

std::unique_ptr<RasterSource> create_raster_source(int width, int height,
                                                   std::vector<uint8_t> rgba,
                                                   RasterFormat format) {
    if (width <= 0 || height <= 0 || rgba.size() != (size_t)width * height * 4) {
        throw make_ico_error(IcoErrorKind::InvalidInput, "RGBA buffer does not match image dimensions");
    }
    return std::make_unique<StbRasterSource>(width, height, format, std::move(rgba));
}
