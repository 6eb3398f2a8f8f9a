#pragma once

#include <cstdint>
#include <vector>
#include "raster.hpp"
#include "raster_source.hpp"

/// Size of the canonical (largest) icon entry
static const int ICO_CANONICAL_SIZE = 256;

struct IcoOptions {
    /// Extra resolutions, emitted in this order before the canonical image
    std::vector<int> sizes = {48, 32, 16};

    /// Count mask bytes in the directory data size. Off reproduces the
    /// established layout where only the color map and info header are declared.
    bool exact_data_size = false;

    /// Issue the resample requests concurrently
    bool parallel_resize = true;
};

/// Validate the source and produce the ordered image list:
/// options.sizes followed by the 256x256 canonical image.
std::vector<RasterImage> select_icon_images(const RasterSource& source,
                                            const IcoOptions& options = IcoOptions());

/// Assemble an .ico container from an ordered list of square images
std::vector<uint8_t> images_to_ico(const std::vector<RasterImage>& images,
                                   const IcoOptions& options = IcoOptions());

/// Convert a square PNG source into a multi-resolution .ico buffer
std::vector<uint8_t> to_ico(const RasterSource& source,
                            const IcoOptions& options = IcoOptions());
