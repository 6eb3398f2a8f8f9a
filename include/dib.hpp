#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "raster.hpp"

/// Bytes per AND-mask row, padded to a 32-bit boundary
int mask_row_stride(int width);

/// Size of the 32bpp color map (XOR map)
size_t color_map_size(int width);

/// Size of the transparency mask (AND map)
size_t mask_size(int width);

/// Encode the color map followed by the transparency mask, both bottom-up.
/// Pixels with alpha == 0 get mask bit 1 (transparent).
std::vector<uint8_t> encode_dib(const RasterImage& image);
