#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/// One RGBA8 sample
struct Rgba {
    uint8_t r, g, b, a;
};

/// Square RGBA8 image, top-down row-major. Immutable once constructed.
class RasterImage {
public:
    /// Throws IcoError(InvalidInput) if rgba.size() != size * size * 4
    RasterImage(int size, std::vector<uint8_t> rgba);

    int width() const { return size_; }
    int height() const { return size_; }

    /// Raw RGBA8 bytes and their length
    const std::vector<uint8_t>& data() const { return data_; }
    size_t byte_length() const { return data_.size(); }

    /// Bounds-checked pixel read; throws std::out_of_range
    Rgba pixel(int row, int col) const;

private:
    int size_;
    std::vector<uint8_t> data_;
};
