#ifndef TILEMOSAIC_COG_H
#define TILEMOSAIC_COG_H
#pragma once

#include "tilemosaic/archive.h"
#include "tilemosaic/common.h"
#include "tilemosaic/fetch.h"
#include "tilemosaic/fifo_cache.h"
#include "tilemosaic/image.h"
#include "tilemosaic/lazy_init.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

typedef struct tiff TIFF;

namespace tilemosaic {

class RangeReader;

// Ordered list of locator prefixes a GeoTIFF may be read from.
class UrlPolicy {
public:
    UrlPolicy() = default;
    explicit UrlPolicy(std::vector<std::string> prefixes);

    static UrlPolicy defaults();

    bool allows(const std::string &locator) const;
    // Throws forbidden_error when `locator` matches no prefix.
    void check(const std::string &locator) const;

    void add(const std::string &prefix) { _prefixes.push_back(prefix); }
    const std::vector<std::string> &prefixes() const { return _prefixes; }

private:
    std::vector<std::string> _prefixes;
};

enum class PlaneKind {
    Color,
    Mask,
};

// One internal image of a GeoTIFF: the full-resolution image, an overview,
// or a transparency mask. Coordinates are in the file's projected units.
struct TiffPlane {
    PlaneKind kind = PlaneKind::Color;
    unsigned int directory = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t block_width = 0;
    std::uint32_t block_height = 0;
    bool tiled = true;
    std::uint16_t bits_per_sample = 8;
    std::uint16_t samples_per_pixel = 1;
    std::uint16_t compression = 1;
    std::uint16_t photometric = 0;
    std::uint16_t planar_config = 1;
    double resolution_x = 0.0;
    double resolution_y = 0.0;
    double origin_x = 0.0;
    double origin_y = 0.0;
    // Mask planes: index of the color plane with the same pixel size.
    std::optional<std::size_t> paired_color;
};

// [origin x, pixel width, 0, origin y, 0, pixel height]; pixel height is negative for north-up rasters.
using GeoTransform = std::array<double, 6>;

// Pixel window of a plane that covers part of one output tile, and where it lands on the tile.
struct TileFragment {
    std::size_t plane = 0;
    int src_x0 = 0;
    int src_y0 = 0;
    int src_x1 = 0;
    int src_y1 = 0;
    int dst_x = 0;
    int dst_y = 0;
    int dst_width = 0;
    int dst_height = 0;
    // Tile footprint inside the source window, in window pixels.
    double window_x0 = 0.0;
    double window_y0 = 0.0;
    double window_x1 = 0.0;
    double window_y1 = 0.0;
};

// Walks `planes` (finest first) from the coarsest end and picks the first
// plane whose resolution is no more than 0.01 coarser than `target`.
std::size_t select_overview(const std::vector<TiffPlane> &planes, double target_resolution);

std::optional<TileFragment> plan_fragment(const std::vector<TiffPlane> &planes, const TileCoordinate &tile,
                                          int tile_size = 256);

// Unpacks one block of mask samples into 8-bit opacity. 1-bit samples are
// MSB first with every row starting on a byte boundary.
std::vector<unsigned char> expand_mask_bits(const unsigned char *data, std::size_t size, std::uint32_t width,
                                            std::uint32_t height, int bits_per_sample, int samples_per_pixel);

// Replaces the alpha channel of `color` with the alpha channel of `mask`.
void fold_alpha(RGBAImage &color, const RGBAImage &mask);

GeoTransform geotransform_from_tags(const double *pixel_scale, std::size_t scale_count, const double *tiepoint,
                                    std::size_t tiepoint_count, const double *transformation,
                                    std::size_t transformation_count);

class GeoTiff {
  public:
    GeoTiff(std::string locator, std::shared_ptr<Fetcher> fetcher, std::size_t block_size = 64 * 1024,
            std::size_t max_blocks = 128);
    ~GeoTiff();

    GeoTiff(const GeoTiff &) = delete;
    GeoTiff &operator=(const GeoTiff &) = delete;

    // Directory order.
    const std::vector<TiffPlane> &planes() const { return _planes; }
    // Planes of one kind, finest resolution first.
    std::vector<TiffPlane> planes(PlaneKind kind) const;

    const GeoTransform &geotransform() const { return _geotransform; }
    const std::string &locator() const { return _locator; }

    // RGBA pixels of the window [x0, x1) x [y0, y1). Mask planes yield black with the mask as alpha.
    RGBAImage readRegion(const TiffPlane &plane, int x0, int y0, int x1, int y1);

  private:
    void classifyPlanes();
    void selectDirectory(const TiffPlane &plane);
    [[noreturn]] void fail(const std::string &message);

    std::string _locator;
    std::unique_ptr<RangeReader> _source;
    TIFF *_tiff = nullptr;
    std::mutex _mutex;
    std::vector<TiffPlane> _planes;
    GeoTransform _geotransform{};
};

struct CogInfo {
    LonLatBox bbox;
    LonLat center;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t tile_width = 0;
    std::uint32_t tile_height = 0;
    double resolution_x = 0.0;
    double resolution_y = 0.0;
    std::size_t image_count = 0;
    int compression = 0;
    int photometric = 0;

    nlohmann::json toJson() const;
};

struct CogOptions {
    std::size_t cache_capacity = 100;
    int tile_size = 256;
    float webp_quality = 80.0f;
    std::size_t block_size = 64 * 1024;
    std::size_t max_blocks = 128;
};

class CogCompositor {
  public:
    explicit CogCompositor(UrlPolicy policy = UrlPolicy::defaults(),
                           std::shared_ptr<Fetcher> fetcher = default_fetcher(), CogOptions options = {});

    std::optional<TileData> getTile(const std::string &url, int z, int x, int y,
                                    ImageFormat format = ImageFormat::PNG);
    CogInfo getInfo(const std::string &url);

    std::size_t cachedFiles() const { return _cache.size(); }
    bool isCached(const std::string &url) const { return _cache.contains(url); }
    const UrlPolicy &policy() const { return _policy; }

  private:
    struct Entry {
        LazyInit init;
        std::unique_ptr<GeoTiff> tiff;
    };

    std::shared_ptr<Entry> open(const std::string &url);
    std::optional<RGBAImage> render(GeoTiff &tiff, PlaneKind kind, const TileCoordinate &tile);
    std::optional<TileData> composite(GeoTiff &tiff, const TileCoordinate &tile, ImageFormat format);

    UrlPolicy _policy;
    std::shared_ptr<Fetcher> _fetcher;
    CogOptions _options;
    FifoCache<std::string, std::shared_ptr<Entry>> _cache;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_COG_H
