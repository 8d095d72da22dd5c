#include "tilemosaic/cog.h"

#include "aixlog.hpp"

#include <tiffio.h>

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <deque>
#include <exception>
#include <limits>
#include <map>
#include <mutex>

namespace tilemosaic {

namespace {

constexpr ttag_t kTagModelPixelScale = 33550;
constexpr ttag_t kTagModelTiepoint = 33922;
constexpr ttag_t kTagModelTransformation = 34264;

const TIFFFieldInfo kGeoTiffFields[] = {
    {kTagModelPixelScale, -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char *>("ModelPixelScale")},
    {kTagModelTiepoint, -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char *>("ModelTiepoint")},
    {kTagModelTransformation, -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char *>("ModelTransformation")},
};

TIFFExtendProc parent_extender = nullptr;

void geotiff_tag_extender(TIFF *tif) {
    TIFFMergeFieldInfo(tif, kGeoTiffFields, sizeof(kGeoTiffFields) / sizeof(kGeoTiffFields[0]));
    if (parent_extender != nullptr) {
        parent_extender(tif);
    }
}

std::string format_libtiff_message(const char *module, const char *fmt, va_list ap) {
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    std::string message = "libtiff";
    if (module != nullptr) {
        message += " ";
        message += module;
    }
    message += ": ";
    message += buffer;
    return message;
}

void libtiff_error_handler(const char *module, const char *fmt, va_list ap) {
    LOG(ERROR) << format_libtiff_message(module, fmt, ap) << "\n";
}

void libtiff_warning_handler(const char *module, const char *fmt, va_list ap) {
    LOG(DEBUG) << format_libtiff_message(module, fmt, ap) << "\n";
}

void install_libtiff_hooks() {
    static std::once_flag once;
    std::call_once(once, []() {
        parent_extender = TIFFSetTagExtender(geotiff_tag_extender);
        TIFFSetErrorHandler(libtiff_error_handler);
        TIFFSetWarningHandler(libtiff_warning_handler);
    });
}

}  // namespace

// Random-access view of a remote or local file for libtiff. Reads are served
// from fixed-size aligned blocks kept in a small oldest-first cache.
class RangeReader {
public:
    RangeReader(std::string locator, std::shared_ptr<Fetcher> fetcher, std::size_t block_size,
                std::size_t max_blocks)
        : _locator(std::move(locator)),
          _fetcher(std::move(fetcher)),
          _block_size(std::max<std::size_t>(block_size, 4096)),
          _max_blocks(std::max<std::size_t>(max_blocks, 1)) {}

    void open() { _size = _fetcher->contentLength(_locator); }

    tmsize_t read(void *buffer, tmsize_t length) {
        try {
            if (length <= 0 || _position >= _size) {
                return 0;
            }
            const std::uint64_t wanted = std::min<std::uint64_t>(static_cast<std::uint64_t>(length), _size - _position);
            auto *out = static_cast<unsigned char *>(buffer);
            std::uint64_t copied = 0;
            while (copied < wanted) {
                const std::uint64_t index = _position / _block_size;
                const std::string &data = block(index);
                const std::uint64_t offset = _position - index * _block_size;
                if (offset >= data.size()) {
                    break;
                }
                const std::uint64_t take = std::min<std::uint64_t>(wanted - copied, data.size() - offset);
                std::memcpy(out + copied, data.data() + offset, static_cast<std::size_t>(take));
                copied += take;
                _position += take;
            }
            return static_cast<tmsize_t>(copied);
        } catch (...) {
            // libtiff is C; the failure is rethrown once control is back in C++
            _failure = std::current_exception();
            return static_cast<tmsize_t>(-1);
        }
    }

    toff_t seek(toff_t offset, int whence) {
        switch (whence) {
            case SEEK_SET:
                _position = offset;
                break;
            case SEEK_CUR:
                _position += offset;
                break;
            case SEEK_END:
                _position = _size + offset;
                break;
            default:
                return static_cast<toff_t>(-1);
        }
        return _position;
    }

    toff_t size() const { return _size; }

    void rethrowFailure() {
        if (_failure) {
            std::exception_ptr failure = _failure;
            _failure = nullptr;
            std::rethrow_exception(failure);
        }
    }

private:
    const std::string &block(std::uint64_t index) {
        const auto cached = _blocks.find(index);
        if (cached != _blocks.end()) {
            return cached->second;
        }
        while (_blocks.size() >= _max_blocks && !_order.empty()) {
            _blocks.erase(_order.front());
            _order.pop_front();
        }
        const std::uint64_t offset = index * _block_size;
        const std::uint64_t length = std::min<std::uint64_t>(_block_size, _size - offset);
        std::string data = _fetcher->fetchRange(_locator, offset, length);
        _order.push_back(index);
        return _blocks.emplace(index, std::move(data)).first->second;
    }

    std::string _locator;
    std::shared_ptr<Fetcher> _fetcher;
    std::size_t _block_size;
    std::size_t _max_blocks;
    std::uint64_t _size = 0;
    std::uint64_t _position = 0;
    std::map<std::uint64_t, std::string> _blocks;
    std::deque<std::uint64_t> _order;
    std::exception_ptr _failure;
};

namespace {

tmsize_t range_read(thandle_t handle, void *buffer, tmsize_t size) {
    return static_cast<RangeReader *>(handle)->read(buffer, size);
}

tmsize_t range_write(thandle_t, void *, tmsize_t) {
    return 0;
}

toff_t range_seek(thandle_t handle, toff_t offset, int whence) {
    return static_cast<RangeReader *>(handle)->seek(offset, whence);
}

int range_close(thandle_t) {
    return 0;
}

toff_t range_size(thandle_t handle) {
    return static_cast<RangeReader *>(handle)->size();
}

int range_map(thandle_t, void **, toff_t *) {
    return 0;
}

void range_unmap(thandle_t, void *, toff_t) {}

}  // namespace

GeoTransform geotransform_from_tags(const double *pixel_scale, std::size_t scale_count, const double *tiepoint,
                                    std::size_t tiepoint_count, const double *transformation,
                                    std::size_t transformation_count) {
    if (pixel_scale != nullptr && scale_count >= 2 && tiepoint != nullptr && tiepoint_count >= 6) {
        return {tiepoint[3] - tiepoint[0] * pixel_scale[0], pixel_scale[0], 0.0,
                tiepoint[4] + tiepoint[1] * std::fabs(pixel_scale[1]), 0.0, -std::fabs(pixel_scale[1])};
    }
    if (transformation != nullptr && transformation_count >= 16) {
        return {transformation[3], transformation[0], transformation[1],
                transformation[7], transformation[4], transformation[5]};
    }
    throw malformed_input_error("No geotransform available in COG");
}

std::vector<unsigned char> expand_mask_bits(const unsigned char *data, std::size_t size, std::uint32_t width,
                                            std::uint32_t height, int bits_per_sample, int samples_per_pixel) {
    if (samples_per_pixel >= 2) {
        throw malformed_input_error("Mask image must have exactly 1 channel");
    }
    const std::size_t pixels = static_cast<std::size_t>(width) * height;
    std::vector<unsigned char> alpha(pixels, 0);

    if (bits_per_sample == 8) {
        std::memcpy(alpha.data(), data, std::min(size, pixels));
        return alpha;
    }
    if (bits_per_sample != 1) {
        throw malformed_input_error("Unsupported mask bitsPerSample: " + std::to_string(bits_per_sample));
    }

    const std::size_t row_bytes = (static_cast<std::size_t>(width) + 7) / 8;
    for (std::uint32_t row = 0; row < height; ++row) {
        for (std::uint32_t col = 0; col < width; ++col) {
            const std::size_t byte = row * row_bytes + col / 8;
            if (byte >= size) {
                return alpha;
            }
            const int bit = (data[byte] >> (7 - col % 8)) & 1;
            alpha[static_cast<std::size_t>(row) * width + col] = bit ? 255 : 0;
        }
    }
    return alpha;
}

GeoTiff::GeoTiff(std::string locator, std::shared_ptr<Fetcher> fetcher, std::size_t block_size,
                 std::size_t max_blocks)
    : _locator(std::move(locator)),
      _source(std::make_unique<RangeReader>(_locator, std::move(fetcher), block_size, max_blocks)) {
    install_libtiff_hooks();
    _source->open();

    _tiff = TIFFClientOpen(_locator.c_str(), "rm", static_cast<thandle_t>(_source.get()), range_read, range_write,
                           range_seek, range_close, range_size, range_map, range_unmap);
    if (_tiff == nullptr) {
        _source->rethrowFailure();
        throw unknown_error("Failed to load COG from " + _locator);
    }

    try {
        classifyPlanes();
    } catch (...) {
        TIFFClose(_tiff);
        _tiff = nullptr;
        throw;
    }
}

GeoTiff::~GeoTiff() {
    if (_tiff != nullptr) {
        TIFFClose(_tiff);
    }
}

void GeoTiff::fail(const std::string &message) {
    _source->rethrowFailure();
    throw malformed_input_error(message + " in " + _locator);
}

void GeoTiff::classifyPlanes() {
    std::optional<std::size_t> reference;
    do {
        TiffPlane plane;
        plane.directory = static_cast<unsigned int>(TIFFCurrentDirectory(_tiff));

        std::uint32_t subfile_type = 0;
        TIFFGetFieldDefaulted(_tiff, TIFFTAG_SUBFILETYPE, &subfile_type);
        plane.kind = (subfile_type & FILETYPE_MASK) ? PlaneKind::Mask : PlaneKind::Color;

        if (!TIFFGetField(_tiff, TIFFTAG_IMAGEWIDTH, &plane.width) ||
            !TIFFGetField(_tiff, TIFFTAG_IMAGELENGTH, &plane.height) || plane.width == 0 || plane.height == 0) {
            fail("TIFF directory " + std::to_string(plane.directory) + " is missing width/height");
        }

        plane.tiled = TIFFIsTiled(_tiff) != 0;
        if (plane.tiled) {
            TIFFGetField(_tiff, TIFFTAG_TILEWIDTH, &plane.block_width);
            TIFFGetField(_tiff, TIFFTAG_TILELENGTH, &plane.block_height);
        } else {
            std::uint32_t rows_per_strip = 0;
            TIFFGetFieldDefaulted(_tiff, TIFFTAG_ROWSPERSTRIP, &rows_per_strip);
            plane.block_width = plane.width;
            plane.block_height = std::min(rows_per_strip, plane.height);
        }
        if (plane.block_width == 0 || plane.block_height == 0) {
            fail("TIFF directory " + std::to_string(plane.directory) + " has no block layout");
        }

        TIFFGetFieldDefaulted(_tiff, TIFFTAG_BITSPERSAMPLE, &plane.bits_per_sample);
        TIFFGetFieldDefaulted(_tiff, TIFFTAG_SAMPLESPERPIXEL, &plane.samples_per_pixel);
        TIFFGetFieldDefaulted(_tiff, TIFFTAG_COMPRESSION, &plane.compression);
        TIFFGetFieldDefaulted(_tiff, TIFFTAG_PLANARCONFIG, &plane.planar_config);
        if (!TIFFGetField(_tiff, TIFFTAG_PHOTOMETRIC, &plane.photometric)) {
            plane.photometric = plane.samples_per_pixel >= 3 ? PHOTOMETRIC_RGB : PHOTOMETRIC_MINISBLACK;
        }

        if (plane.kind == PlaneKind::Color && !reference) {
            reference = _planes.size();

            std::uint16_t scale_count = 0;
            double *scale = nullptr;
            std::uint16_t tiepoint_count = 0;
            double *tiepoint = nullptr;
            std::uint16_t transformation_count = 0;
            double *transformation = nullptr;
            if (!TIFFGetField(_tiff, kTagModelPixelScale, &scale_count, &scale)) {
                scale = nullptr;
                scale_count = 0;
            }
            if (!TIFFGetField(_tiff, kTagModelTiepoint, &tiepoint_count, &tiepoint)) {
                tiepoint = nullptr;
                tiepoint_count = 0;
            }
            if (!TIFFGetField(_tiff, kTagModelTransformation, &transformation_count, &transformation)) {
                transformation = nullptr;
                transformation_count = 0;
            }
            _geotransform = geotransform_from_tags(scale, scale_count, tiepoint, tiepoint_count, transformation,
                                                   transformation_count);
        }

        _planes.push_back(plane);
    } while (TIFFReadDirectory(_tiff));
    _source->rethrowFailure();

    if (!reference) {
        LOG(WARNING) << "COG " << _locator << " has no color image\n";
        return;
    }

    const TiffPlane &base = _planes[*reference];
    const double base_res_x = std::fabs(_geotransform[1]);
    const double base_res_y = std::fabs(_geotransform[5]);
    const std::uint32_t base_width = base.width;
    const std::uint32_t base_height = base.height;

    std::size_t colors = 0;
    std::size_t masks = 0;
    for (TiffPlane &plane : _planes) {
        plane.origin_x = _geotransform[0];
        plane.origin_y = _geotransform[3];
        plane.resolution_x = base_res_x * base_width / plane.width;
        plane.resolution_y = base_res_y * base_height / plane.height;
        if (plane.kind == PlaneKind::Color) {
            ++colors;
        } else {
            ++masks;
        }
    }

    for (TiffPlane &plane : _planes) {
        if (plane.kind != PlaneKind::Mask) {
            continue;
        }
        for (std::size_t i = 0; i < _planes.size(); ++i) {
            if (_planes[i].kind == PlaneKind::Color && _planes[i].width == plane.width &&
                _planes[i].height == plane.height) {
                plane.paired_color = i;
                break;
            }
        }
        if (!plane.paired_color) {
            LOG(WARNING) << "Mask " << plane.width << "x" << plane.height << " in " << _locator
                         << " matches no color image\n";
            continue;
        }
        // a mask covers exactly the pixels of its color image
        const TiffPlane &color = _planes[*plane.paired_color];
        plane.origin_x = color.origin_x;
        plane.origin_y = color.origin_y;
        plane.resolution_x = color.resolution_x;
        plane.resolution_y = color.resolution_y;
    }
    if (masks > 0 && masks != colors) {
        LOG(WARNING) << "COG " << _locator << " has " << colors << " color images but " << masks << " masks\n";
    }

    LOG(DEBUG) << "COG " << _locator << ": " << colors << " color images, " << masks << " masks\n";
}

std::vector<TiffPlane> GeoTiff::planes(PlaneKind kind) const {
    std::vector<TiffPlane> selected;
    for (const TiffPlane &plane : _planes) {
        if (plane.kind == kind) {
            selected.push_back(plane);
        }
    }
    std::stable_sort(selected.begin(), selected.end(),
                     [](const TiffPlane &a, const TiffPlane &b) { return a.resolution_x < b.resolution_x; });
    return selected;
}

void GeoTiff::selectDirectory(const TiffPlane &plane) {
    if (!TIFFSetDirectory(_tiff, static_cast<tdir_t>(plane.directory))) {
        fail("Unable to select TIFF directory " + std::to_string(plane.directory));
    }
    if (plane.compression == COMPRESSION_JPEG && plane.photometric == PHOTOMETRIC_YCBCR) {
        TIFFSetField(_tiff, TIFFTAG_JPEGCOLORMODE, JPEGCOLORMODE_RGB);
    }
}

RGBAImage GeoTiff::readRegion(const TiffPlane &plane, int x0, int y0, int x1, int y1) {
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min<int>(x1, static_cast<int>(plane.width));
    y1 = std::min<int>(y1, static_cast<int>(plane.height));
    if (x0 >= x1 || y0 >= y1) {
        return RGBAImage();
    }

    int samples = plane.samples_per_pixel;
    if (plane.kind == PlaneKind::Mask) {
        if (plane.samples_per_pixel >= 2) {
            throw malformed_input_error("Mask image must have exactly 1 channel");
        }
        if (plane.bits_per_sample != 1 && plane.bits_per_sample != 8) {
            throw malformed_input_error("Unsupported mask bitsPerSample: " + std::to_string(plane.bits_per_sample));
        }
    } else {
        if (plane.bits_per_sample != 8) {
            throw malformed_input_error("Unsupported color bitsPerSample: " + std::to_string(plane.bits_per_sample));
        }
        if (plane.photometric == PHOTOMETRIC_PALETTE) {
            throw malformed_input_error("Palette color GeoTIFFs are not supported");
        }
        if (plane.samples_per_pixel > 1 && plane.planar_config != PLANARCONFIG_CONTIG) {
            throw malformed_input_error("Planar separate GeoTIFFs are not supported");
        }
        if (plane.compression == COMPRESSION_JPEG && plane.photometric == PHOTOMETRIC_YCBCR) {
            samples = 3;
        }
        if (samples < 1 || samples > 4) {
            throw malformed_input_error("Unsupported samples per pixel: " + std::to_string(samples));
        }
    }

    RGBAImage region(x1 - x0, y1 - y0);

    std::lock_guard<std::mutex> lock(_mutex);
    selectDirectory(plane);

    const tmsize_t block_bytes = plane.tiled ? TIFFTileSize(_tiff) : TIFFStripSize(_tiff);
    if (block_bytes <= 0) {
        fail("Unable to size TIFF blocks");
    }
    std::vector<unsigned char> block(static_cast<std::size_t>(block_bytes));

    const std::uint32_t bw = plane.block_width;
    const std::uint32_t bh = plane.block_height;
    for (std::uint32_t by = (static_cast<std::uint32_t>(y0) / bh) * bh; by < static_cast<std::uint32_t>(y1); by += bh) {
        for (std::uint32_t bx = (static_cast<std::uint32_t>(x0) / bw) * bw; bx < static_cast<std::uint32_t>(x1);
             bx += bw) {
            const tmsize_t read = plane.tiled
                ? TIFFReadEncodedTile(_tiff, TIFFComputeTile(_tiff, bx, by, 0, 0), block.data(), block_bytes)
                : TIFFReadEncodedStrip(_tiff, TIFFComputeStrip(_tiff, by, 0), block.data(), block_bytes);
            if (read < 0) {
                fail("Failed to read block at " + std::to_string(bx) + "," + std::to_string(by));
            }
            const std::size_t available = static_cast<std::size_t>(read);
            const std::uint32_t rows = plane.tiled ? bh : std::min(bh, plane.height - by);

            std::vector<unsigned char> alpha;
            if (plane.kind == PlaneKind::Mask) {
                alpha = expand_mask_bits(block.data(), available, bw, rows, plane.bits_per_sample,
                                         plane.samples_per_pixel);
            }

            const std::uint32_t row_end = std::min<std::uint32_t>(by + rows, static_cast<std::uint32_t>(y1));
            const std::uint32_t col_end = std::min<std::uint32_t>(bx + bw, static_cast<std::uint32_t>(x1));
            for (std::uint32_t row = std::max<std::uint32_t>(by, y0); row < row_end; ++row) {
                for (std::uint32_t col = std::max<std::uint32_t>(bx, x0); col < col_end; ++col) {
                    const std::size_t local = static_cast<std::size_t>(row - by) * bw + (col - bx);
                    unsigned char *dst =
                        &region.pixels[(static_cast<std::size_t>(row - y0) * region.width + (col - x0)) * 4];
                    if (plane.kind == PlaneKind::Mask) {
                        dst[3] = alpha[local];
                        continue;
                    }
                    const std::size_t src = local * samples;
                    if (src + samples > available) {
                        continue;
                    }
                    const unsigned char *px = &block[src];
                    switch (samples) {
                        case 1:
                            dst[0] = dst[1] = dst[2] = px[0];
                            dst[3] = 255;
                            break;
                        case 2:
                            dst[0] = dst[1] = dst[2] = px[0];
                            dst[3] = px[1];
                            break;
                        case 3:
                            dst[0] = px[0];
                            dst[1] = px[1];
                            dst[2] = px[2];
                            dst[3] = 255;
                            break;
                        default:
                            std::memcpy(dst, px, 4);
                            break;
                    }
                }
            }
        }
    }
    return region;
}

}  // namespace tilemosaic
