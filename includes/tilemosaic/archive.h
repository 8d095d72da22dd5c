#ifndef TILEMOSAIC_ARCHIVE_H
#define TILEMOSAIC_ARCHIVE_H
#pragma once

#include "tilemosaic/common.h"
#include "tilemosaic/fetch.h"
#include "tilemosaic/lazy_init.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;

namespace tilemosaic {

struct ArchiveHeader {
    FixedBox bounds;
    std::int32_t center_lon = 0;
    std::int32_t center_lat = 0;
    int min_zoom = 0;
    int max_zoom = 0;
    int center_zoom = 0;
    TileFormat tile_format = TileFormat::Unknown;
    TileCompression tile_compression = TileCompression::Unknown;
};

struct ArchiveMetadata {
    std::string name;
    std::string description;
    std::string version;
    std::string attribution;
    nlohmann::json vector_layers;  // null when the archive carries no schema
};

struct SourceInfo {
    ArchiveHeader header;
    ArchiveMetadata metadata;
};

// `bytes` are never transfer-compressed; gzipped archive tiles are inflated on read.
struct TileData {
    std::string bytes;
    std::string media_type;
};

// TileJSON 3.0.0 document without the `tiles` template.
nlohmann::json to_tilejson(const SourceInfo &info);

extern const char *const kCommunityCredit;
std::string extend_attribution(const std::string &attribution, bool community_credit);

// A logical tile source: one archive or a mosaic of many.
class TileSource {
public:
    virtual ~TileSource() = default;

    // std::nullopt when no stored tile covers the coordinate.
    virtual std::optional<TileData> getTile(int z, int x, int y) = 0;
    virtual SourceInfo getMetadata() = 0;
};

// Read-only MBTiles archive. One SQLite connection shared behind a mutex.
class MBTiles {
  public:
    explicit MBTiles(const std::string &path);
    ~MBTiles();

    MBTiles(const MBTiles &) = delete;
    MBTiles &operator=(const MBTiles &) = delete;

    std::map<std::string, std::string> metadata() const;
    std::optional<std::string> tile(int z, int x, int y) const;

    ArchiveHeader header() const;
    ArchiveMetadata describe() const;

    const std::string &path() const { return _path; }

  private:
    std::optional<int> queryZoom(const char *sql) const;
    std::optional<std::string> firstTile() const;

    std::string _path;
    sqlite3 *_db;
    mutable std::mutex _mutex;
};

struct ArchiveOptions {
    bool community_attribution = true;
    // Remote archives are downloaded here once. Empty means <tmp>/tilemosaic-archives.
    std::string cache_dir;
};

class ArchiveResolver : public TileSource {
  public:
    explicit ArchiveResolver(std::string locator, ArchiveOptions options = {},
                             std::shared_ptr<Fetcher> fetcher = default_fetcher());

    std::optional<TileData> getTile(int z, int x, int y) override;
    SourceInfo getMetadata() override;

    const std::string &locator() const { return _locator; }

  private:
    void ensureOpen();
    // Local path of the archive, downloading remote ones into the cache first.
    std::string localCopy() const;

    std::string _locator;
    ArchiveOptions _options;
    std::shared_ptr<Fetcher> _fetcher;
    LazyInit _init;
    std::unique_ptr<MBTiles> _archive;
    SourceInfo _info;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_ARCHIVE_H
