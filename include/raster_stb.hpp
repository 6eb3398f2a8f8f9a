#pragma once

#include "raster_source.hpp"
#include <string>
#include <vector>

/// stb_image / stb_image_resize backed raster source
class StbRasterSource : public RasterSource {
public:
    StbRasterSource(int width, int height, RasterFormat format, std::vector<uint8_t> rgba);

    int width() const override { return width_; }
    int height() const override { return height_; }
    RasterFormat format() const override { return format_; }

    std::unique_ptr<RasterSource> resize(int width, int height,
                                         ResampleKernel kernel) const override;
    RasterImage pixels() const override;

private:
    int width_;
    int height_;
    RasterFormat format_;
    std::vector<uint8_t> rgba_;
};

/// Sniff the container format from leading magic bytes
RasterFormat detect_raster_format(const std::vector<uint8_t>& bytes);

/// Decode an encoded image held in memory (forced to RGBA8)
std::unique_ptr<RasterSource> load_raster_source_from_memory(const std::vector<uint8_t>& bytes);

/// Read and decode an image file
std::unique_ptr<RasterSource> load_raster_source(const std::string& path);

/// Wrap already decoded RGBA8 pixels
std::unique_ptr<RasterSource> create_raster_source(int width, int height,
                                                   std::vector<uint8_t> rgba,
                                                   RasterFormat format = RasterFormat::Png);
