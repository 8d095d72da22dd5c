#include "tilemosaic/cog.h"

#include "aixlog.hpp"

#include <algorithm>
#include <cmath>

namespace tilemosaic {

namespace {

constexpr double kMercatorOrigin = 20037508.342789244;
constexpr double kResolutionTolerance = 0.01;
constexpr std::size_t kMaxRegionPixels = 16 * 1024 * 1024;

}  // namespace

UrlPolicy::UrlPolicy(std::vector<std::string> prefixes) : _prefixes(std::move(prefixes)) {}

UrlPolicy UrlPolicy::defaults() {
    return UrlPolicy({"https://github.com/ramSeraph/", "http://127.0.0.1:8080/"});
}

bool UrlPolicy::allows(const std::string &locator) const {
    return std::any_of(_prefixes.begin(), _prefixes.end(),
                       [&](const std::string &prefix) { return starts_with(locator, prefix); });
}

void UrlPolicy::check(const std::string &locator) const {
    if (!allows(locator)) {
        throw forbidden_error("URL not allowed: " + locator);
    }
}

std::size_t select_overview(const std::vector<TiffPlane> &planes, double target_resolution) {
    for (std::size_t i = planes.size(); i-- > 0;) {
        if (planes[i].resolution_x - target_resolution <= kResolutionTolerance) {
            return i;
        }
    }
    return 0;
}

std::optional<TileFragment> plan_fragment(const std::vector<TiffPlane> &planes, const TileCoordinate &tile,
                                          int tile_size) {
    if (planes.empty() || !tile.valid() || tile_size <= 0) {
        return std::nullopt;
    }

    const double span = 2.0 * kMercatorOrigin / std::ldexp(1.0, tile.z);
    const double min_x = -kMercatorOrigin + tile.x * span;
    const double max_x = min_x + span;
    const double max_y = kMercatorOrigin - tile.y * span;
    const double min_y = max_y - span;

    TileFragment fragment;
    fragment.plane = select_overview(planes, span / tile_size);
    const TiffPlane &plane = planes[fragment.plane];
    if (plane.resolution_x <= 0.0 || plane.resolution_y <= 0.0) {
        return std::nullopt;
    }

    const double px0 = (min_x - plane.origin_x) / plane.resolution_x;
    const double px1 = (max_x - plane.origin_x) / plane.resolution_x;
    const double py0 = (plane.origin_y - max_y) / plane.resolution_y;
    const double py1 = (plane.origin_y - min_y) / plane.resolution_y;

    const double clip_x0 = std::max(px0, 0.0);
    const double clip_y0 = std::max(py0, 0.0);
    const double clip_x1 = std::min(px1, static_cast<double>(plane.width));
    const double clip_y1 = std::min(py1, static_cast<double>(plane.height));
    if (clip_x0 >= clip_x1 || clip_y0 >= clip_y1) {
        return std::nullopt;
    }

    fragment.src_x0 = static_cast<int>(std::floor(clip_x0));
    fragment.src_y0 = static_cast<int>(std::floor(clip_y0));
    fragment.src_x1 = static_cast<int>(std::ceil(clip_x1));
    fragment.src_y1 = static_cast<int>(std::ceil(clip_y1));

    const double scale_x = tile_size / (px1 - px0);
    const double scale_y = tile_size / (py1 - py0);
    const int dst_x0 = std::clamp(static_cast<int>(std::lround((clip_x0 - px0) * scale_x)), 0, tile_size - 1);
    const int dst_y0 = std::clamp(static_cast<int>(std::lround((clip_y0 - py0) * scale_y)), 0, tile_size - 1);
    const int dst_x1 = std::clamp(static_cast<int>(std::lround((clip_x1 - px0) * scale_x)), dst_x0 + 1, tile_size);
    const int dst_y1 = std::clamp(static_cast<int>(std::lround((clip_y1 - py0) * scale_y)), dst_y0 + 1, tile_size);
    fragment.dst_x = dst_x0;
    fragment.dst_y = dst_y0;
    fragment.dst_width = dst_x1 - dst_x0;
    fragment.dst_height = dst_y1 - dst_y0;

    fragment.window_x0 = clip_x0 - fragment.src_x0;
    fragment.window_y0 = clip_y0 - fragment.src_y0;
    fragment.window_x1 = clip_x1 - fragment.src_x0;
    fragment.window_y1 = clip_y1 - fragment.src_y0;
    return fragment;
}

void fold_alpha(RGBAImage &color, const RGBAImage &mask) {
    if (color.width != mask.width || color.height != mask.height) {
        throw malformed_input_error("Mask render does not match color render size");
    }
    const std::size_t count = static_cast<std::size_t>(color.width) * color.height;
    for (std::size_t i = 0; i < count; ++i) {
        color.pixels[i * 4 + 3] = mask.pixels[i * 4 + 3];
    }
}

nlohmann::json CogInfo::toJson() const {
    nlohmann::json out;
    out["bbox"] = {bbox.min_lon, bbox.min_lat, bbox.max_lon, bbox.max_lat};
    out["center"] = {center.lon, center.lat};
    out["bounds"] = {{"west", bbox.min_lon}, {"south", bbox.min_lat}, {"east", bbox.max_lon}, {"north", bbox.max_lat}};
    out["size"] = {{"width", width}, {"height", height}};
    out["tileSize"] = {{"width", tile_width}, {"height", tile_height}};
    out["resolution"] = {resolution_x, resolution_y};
    out["imageCount"] = image_count;
    out["compression"] = compression;
    out["photometric"] = photometric;
    return out;
}

CogCompositor::CogCompositor(UrlPolicy policy, std::shared_ptr<Fetcher> fetcher, CogOptions options)
    : _policy(std::move(policy)),
      _fetcher(std::move(fetcher)),
      _options(options),
      _cache(options.cache_capacity) {}

std::shared_ptr<CogCompositor::Entry> CogCompositor::open(const std::string &url) {
    _policy.check(url);

    std::shared_ptr<Entry> entry = _cache.getOrInsert(url, []() { return std::make_shared<Entry>(); });
    bool opened_here = false;
    try {
        entry->init.ensure([&]() {
            opened_here = true;
            LOG(INFO) << "Opening COG " << url << "\n";
            entry->tiff = std::make_unique<GeoTiff>(url, _fetcher, _options.block_size, _options.max_blocks);
        });
    } catch (const std::exception &) {
        // waiters leave the cache alone; a retry may already have replaced the entry
        if (opened_here) {
            _cache.erase(url, entry);
        }
        throw;
    }
    return entry;
}

std::optional<RGBAImage> CogCompositor::render(GeoTiff &tiff, PlaneKind kind, const TileCoordinate &tile) {
    const std::vector<TiffPlane> planes = tiff.planes(kind);
    const std::optional<TileFragment> fragment = plan_fragment(planes, tile, _options.tile_size);
    if (!fragment) {
        return std::nullopt;
    }

    const std::size_t region = static_cast<std::size_t>(fragment->src_x1 - fragment->src_x0) *
                               static_cast<std::size_t>(fragment->src_y1 - fragment->src_y0);
    if (region > kMaxRegionPixels) {
        LOG(WARNING) << "Skipping " << region << " pixel window of " << tiff.locator() << " for tile " << tile.z
                     << "/" << tile.x << "/" << tile.y << "\n";
        return std::nullopt;
    }

    const RGBAImage window = tiff.readRegion(planes[fragment->plane], fragment->src_x0, fragment->src_y0,
                                             fragment->src_x1, fragment->src_y1);
    RGBAImage canvas(_options.tile_size, _options.tile_size);
    if (!window.empty()) {
        const RGBAImage part = window.resampled(fragment->window_x0, fragment->window_y0, fragment->window_x1,
                                                fragment->window_y1, fragment->dst_width, fragment->dst_height);
        canvas.paste(part, fragment->dst_x, fragment->dst_y);
    }
    return canvas;
}

std::optional<TileData> CogCompositor::composite(GeoTiff &tiff, const TileCoordinate &tile, ImageFormat format) {
    std::optional<RGBAImage> color = render(tiff, PlaneKind::Color, tile);
    if (!color) {
        return std::nullopt;
    }

    if (!tiff.planes(PlaneKind::Mask).empty()) {
        const std::optional<RGBAImage> mask = render(tiff, PlaneKind::Mask, tile);
        if (mask) {
            fold_alpha(*color, *mask);
        }
    }

    TileData data;
    data.bytes = format == ImageFormat::WEBP ? color->encodeWebp(_options.webp_quality) : color->encodePng();
    data.media_type = image_media_type(format);
    return data;
}

std::optional<TileData> CogCompositor::getTile(const std::string &url, int z, int x, int y, ImageFormat format) {
    const TileCoordinate tile{z, x, y};
    if (!tile.valid()) {
        _policy.check(url);
        return std::nullopt;
    }

    try {
        std::shared_ptr<Entry> entry = open(url);
        return composite(*entry->tiff, tile, format);
    } catch (const tilemosaic_error &) {
        throw;
    } catch (const std::exception &ex) {
        throw unknown_error(std::string("Error processing tile: ") + ex.what());
    }
}

CogInfo CogCompositor::getInfo(const std::string &url) {
    std::shared_ptr<Entry> entry;
    try {
        entry = open(url);
    } catch (const tilemosaic_error &) {
        throw;
    } catch (const std::exception &ex) {
        throw unknown_error(std::string("Error reading COG info: ") + ex.what());
    }

    const GeoTiff &tiff = *entry->tiff;
    const std::vector<TiffPlane> colors = tiff.planes(PlaneKind::Color);
    if (colors.empty()) {
        throw malformed_input_error("COG has no color image: " + url);
    }

    // first color plane in directory order is the full-resolution image
    const TiffPlane *base = nullptr;
    for (const TiffPlane &plane : tiff.planes()) {
        if (plane.kind == PlaneKind::Color) {
            base = &plane;
            break;
        }
    }

    const double min_x = base->origin_x;
    const double max_y = base->origin_y;
    const double max_x = min_x + base->resolution_x * base->width;
    const double min_y = max_y - base->resolution_y * base->height;
    const LonLat south_west = web_mercator_to_lonlat(min_x, min_y);
    const LonLat north_east = web_mercator_to_lonlat(max_x, max_y);

    CogInfo info;
    info.bbox = {south_west.lon, south_west.lat, north_east.lon, north_east.lat};
    info.center = {(south_west.lon + north_east.lon) / 2.0, (south_west.lat + north_east.lat) / 2.0};
    info.width = base->width;
    info.height = base->height;
    info.tile_width = base->block_width;
    info.tile_height = base->block_height;
    info.resolution_x = base->resolution_x;
    info.resolution_y = base->resolution_y;
    info.image_count = tiff.planes().size();
    info.compression = base->compression;
    info.photometric = base->photometric;
    return info;
}

}  // namespace tilemosaic
