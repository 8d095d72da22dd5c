#ifndef TILEMOSAIC_MOSAIC_H
#define TILEMOSAIC_MOSAIC_H
#pragma once

#include "tilemosaic/archive.h"
#include "tilemosaic/fetch.h"
#include "tilemosaic/lazy_init.h"
#include "tilemosaic/spatial_index.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tilemosaic {

// One shard as listed in a mosaic descriptor.
struct ShardSpec {
    std::string key;
    ArchiveHeader header;
    ArchiveMetadata metadata;
};

// Generation 0 is a flat object of key -> {header, metadata}. Later
// generations carry {version, header, metadata, slices}.
struct MosaicDescriptor {
    int generation = 0;
    std::vector<ShardSpec> shards;  // descriptor order
    std::optional<ArchiveHeader> header;
    std::optional<ArchiveMetadata> metadata;

    static MosaicDescriptor parse(const std::string &text);
};

ArchiveHeader parse_mosaic_header(const nlohmann::ordered_json &value);
ArchiveMetadata parse_mosaic_metadata(const nlohmann::ordered_json &value);

// Pointwise header merge: minimum of the lower bounds and min zoom, maximum of
// the upper bounds, max zoom and center zoom. Tile type, compression, center
// point and descriptive metadata come from the first shard.
SourceInfo merge_shards(const std::vector<ShardSpec> &shards);

// Where a shard key points, relative to the descriptor at `descriptor_locator`.
std::string resolve_shard_key(const std::string &descriptor_locator, const std::string &key, int generation);

struct MosaicOptions {
    bool community_attribution = true;
    // Zoom levels with fewer shards than this are scanned linearly.
    std::size_t index_threshold = 8;
    // Where remote shards are downloaded; see ArchiveOptions::cache_dir.
    std::string archive_cache_dir;
};

struct ShardEntry {
    std::string key;
    std::string locator;
    ArchiveHeader header;
    ArchiveMetadata metadata;
    std::shared_ptr<ArchiveResolver> archive;
};

class MosaicResolver : public TileSource {
  public:
    explicit MosaicResolver(std::string locator, std::shared_ptr<Fetcher> fetcher = default_fetcher(),
                            MosaicOptions options = {});

    std::optional<TileData> getTile(int z, int x, int y) override;
    SourceInfo getMetadata() override;

    // Locator of the shard serving (z, x, y), if any.
    std::optional<std::string> resolveShard(int z, int x, int y);

    std::size_t shardCount();
    int generation();
    bool zoomIndexed(int z);

    const std::string &locator() const { return _locator; }

  private:
    struct ZoomBucket {
        std::vector<std::size_t> shards;
        BoxIndex index;
        bool indexed = false;
    };

    void ensureLoaded();
    void load();
    std::optional<std::size_t> findShard(int z, int x, int y) const;

    std::string _locator;
    std::shared_ptr<Fetcher> _fetcher;
    MosaicOptions _options;
    LazyInit _init;

    int _generation = 0;
    std::vector<ShardEntry> _shards;
    std::map<int, ZoomBucket> _buckets;
    SourceInfo _info;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_MOSAIC_H
