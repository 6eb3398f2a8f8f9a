#include "ico_encoder.hpp"
#include "ico_format.hpp"
#include "ico_error.hpp"
#include "dib.hpp"

#include <functional>
#include <future>
#include <memory>

static RasterImage resample(const RasterSource& source, int size) {
    return source.resize(size, size, ResampleKernel::Cubic)->pixels();
}

std::vector<RasterImage> select_icon_images(const RasterSource& source, const IcoOptions& options) {
    int size = source.width();
    if (source.format() != RasterFormat::Png || size != source.height()) {
        throw make_ico_error(IcoErrorKind::InvalidInput);
    }
    for (int s : options.sizes) {
        if (s <= 0 || s > ICO_MAX_DIMENSION) {
            throw make_ico_error(IcoErrorKind::InvalidInput);
        }
    }

    std::unique_ptr<RasterSource> resized;
    const RasterSource* canonical = &source;
    if (size != ICO_CANONICAL_SIZE) {
        resized = source.resize(ICO_CANONICAL_SIZE, ICO_CANONICAL_SIZE, ResampleKernel::Cubic);
        canonical = resized.get();
    }

    std::vector<RasterImage> images;
    images.reserve(options.sizes.size() + 1);

    if (options.parallel_resize) {
        std::vector<std::future<RasterImage>> tasks;
        tasks.reserve(options.sizes.size());
        for (int s : options.sizes) {
            tasks.push_back(std::async(std::launch::async, resample, std::cref(*canonical), s));
        }
        // Join in list order; get() rethrows the first failure
        for (auto& task : tasks) {
            images.push_back(task.get());
        }
    } else {
        for (int s : options.sizes) {
            images.push_back(resample(*canonical, s));
        }
    }

    images.push_back(canonical->pixels());
    return images;
}

std::vector<uint8_t> images_to_ico(const std::vector<RasterImage>& images, const IcoOptions& options) {
    if (images.size() > 0xFFFF) {
        throw make_ico_error(IcoErrorKind::InvalidInput);
    }
    for (const auto& img : images) {
        if (img.width() > ICO_MAX_DIMENSION) {
            throw make_ico_error(IcoErrorKind::InvalidInput);
        }
    }

    std::vector<uint8_t> header = build_file_header((uint16_t)images.size());
    std::vector<uint8_t> dir;
    std::vector<uint8_t> body;
    dir.reserve(images.size() * ICO_DIR_ENTRY_SIZE);

    size_t len = header.size() + (size_t)ICO_DIR_ENTRY_SIZE * images.size();
    size_t offset = len;

    for (const auto& img : images) {
        std::vector<uint8_t> dib = encode_dib(img);

        // The declared size normally leaves out the AND mask; offsets never do.
        size_t declared = options.exact_data_size ? dib.size() : img.byte_length();
        IconDirEntry entry = build_dir_entry(img.width(), (uint32_t)declared, (uint32_t)offset);

        write_dir_entry(dir, entry);
        write_bitmap_info_header(body, build_bitmap_info_header(img.width()));
        body.insert(body.end(), dib.begin(), dib.end());

        len += ICO_DIR_ENTRY_SIZE + BMP_INFO_HEADER_SIZE + dib.size();
        offset += BMP_INFO_HEADER_SIZE + dib.size();
    }

    std::vector<uint8_t> out;
    out.reserve(len);
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), dir.begin(), dir.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::vector<uint8_t> to_ico(const RasterSource& source, const IcoOptions& options) {
    return images_to_ico(select_icon_images(source, options), options);
}
