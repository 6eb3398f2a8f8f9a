#pragma once

#include "raster.hpp"
#include <memory>

/// Container format the source image was decoded from
enum class RasterFormat {
    Unknown,
    Png,
    Jpeg,
    Gif,
    Bmp,
};

/// Resampling filter used when producing a target resolution
enum class ResampleKernel {
    Cubic,
};

/// Abstract image backend — decoding and resampling live behind this
class RasterSource {
public:
    virtual ~RasterSource() = default;

    /// Declared dimensions and format of the current image
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual RasterFormat format() const = 0;

    /// Resampled copy at the given size.
    /// Throws IcoError(ResizeFailure) if the request cannot be satisfied.
    /// Must be safe to call concurrently on the same source.
    virtual std::unique_ptr<RasterSource> resize(int width, int height,
                                                 ResampleKernel kernel) const = 0;

    /// Raw RGBA8 pixels of the current image
    virtual RasterImage pixels() const = 0;
};

const char* raster_format_name(RasterFormat format);
