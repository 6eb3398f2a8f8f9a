#include "raster.hpp"
#include "raster_source.hpp"
#include "ico_error.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

RasterImage::RasterImage(int size, std::vector<uint8_t> rgba)
    : size_(size), data_(std::move(rgba)) {
    if (size_ <= 0 || data_.size() != (size_t)size_ * size_ * 4) {
        throw make_ico_error(IcoErrorKind::InvalidInput);
    }
}

Rgba RasterImage::pixel(int row, int col) const {
    if (row < 0 || row >= size_ || col < 0 || col >= size_) {
        std::ostringstream oss;
        oss << "Pixel (" << row << ", " << col << ") outside "
            << size_ << "x" << size_ << " image";
        throw std::out_of_range(oss.str());
    }
    size_t pos = ((size_t)row * size_ + col) * 4;
    return {data_[pos + 0], data_[pos + 1], data_[pos + 2], data_[pos + 3]};
}

const char* raster_format_name(RasterFormat format) {
    switch (format) {
    case RasterFormat::Png:  return "png";
    case RasterFormat::Jpeg: return "jpeg";
    case RasterFormat::Gif:  return "gif";
    case RasterFormat::Bmp:  return "bmp";
    case RasterFormat::Unknown: break;
    }
    return "unknown";
}
