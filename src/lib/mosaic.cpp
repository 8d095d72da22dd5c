#include "tilemosaic/mosaic.h"

#include "aixlog.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace tilemosaic {

namespace {

using json = nlohmann::ordered_json;

constexpr int kMaxZoom = 30;

std::int64_t require_integer(const json &object, const char *field) {
    const auto it = object.find(field);
    if (it == object.end() || !it->is_number()) {
        throw malformed_input_error(std::string("Mosaic header is missing numeric field '") + field + "'");
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    return static_cast<std::int64_t>(std::llround(it->get<double>()));
}

std::optional<std::int64_t> optional_integer(const json &object, const char *field) {
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return require_integer(object, field);
}

std::int32_t as_fixed(std::int64_t value, const char *field) {
    if (value > std::numeric_limits<std::int32_t>::max() || value < std::numeric_limits<std::int32_t>::min()) {
        throw malformed_input_error(std::string("Mosaic header field '") + field + "' is out of range");
    }
    return static_cast<std::int32_t>(value);
}

std::string field_text(const json &object, const char *field) {
    const auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

int parse_generation(const json &doc) {
    const auto it = doc.find("version");
    if (it == doc.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return it->get<int>();
    }
    if (it->is_number()) {
        return static_cast<int>(std::floor(it->get<double>()));
    }
    if (it->is_string()) {
        const std::string text = trim(it->get<std::string>());
        if (const auto value = parse_int(text)) {
            return *value;
        }
        if (const auto value = parse_double(text)) {
            return static_cast<int>(std::floor(*value));
        }
    }
    throw malformed_input_error("Unsupported mosaic version " + it->dump());
}

std::optional<ShardSpec> parse_slice(const std::string &key, const json &entry) {
    if (!entry.is_object()) {
        LOG(WARNING) << "Skipping mosaic entry '" << key << "': not an object\n";
        return std::nullopt;
    }
    try {
        ShardSpec shard;
        shard.key = key;
        const auto header = entry.find("header");
        shard.header = parse_mosaic_header(header != entry.end() ? *header : entry);
        const auto metadata = entry.find("metadata");
        if (metadata != entry.end()) {
            shard.metadata = parse_mosaic_metadata(*metadata);
        }
        return shard;
    } catch (const tilemosaic_error &ex) {
        LOG(WARNING) << "Skipping mosaic entry '" << key << "': " << ex.what() << "\n";
    } catch (const json::exception &ex) {
        LOG(WARNING) << "Skipping mosaic entry '" << key << "': " << ex.what() << "\n";
    }
    return std::nullopt;
}

}  // namespace

ArchiveHeader parse_mosaic_header(const json &value) {
    if (!value.is_object()) {
        throw malformed_input_error("Mosaic header must be an object");
    }
    ArchiveHeader header;
    header.bounds.min_lon = as_fixed(require_integer(value, "min_lon_e7"), "min_lon_e7");
    header.bounds.min_lat = as_fixed(require_integer(value, "min_lat_e7"), "min_lat_e7");
    header.bounds.max_lon = as_fixed(require_integer(value, "max_lon_e7"), "max_lon_e7");
    header.bounds.max_lat = as_fixed(require_integer(value, "max_lat_e7"), "max_lat_e7");
    header.min_zoom = static_cast<int>(require_integer(value, "min_zoom"));
    header.max_zoom = static_cast<int>(require_integer(value, "max_zoom"));
    if (header.min_zoom < 0 || header.max_zoom < header.min_zoom) {
        throw malformed_input_error("Mosaic header has an invalid zoom range " + std::to_string(header.min_zoom) +
                                    "-" + std::to_string(header.max_zoom));
    }

    const auto center_lon = optional_integer(value, "center_lon_e7");
    const auto center_lat = optional_integer(value, "center_lat_e7");
    header.center_lon = center_lon ? as_fixed(*center_lon, "center_lon_e7")
                                   : static_cast<std::int32_t>((static_cast<std::int64_t>(header.bounds.min_lon) +
                                                                header.bounds.max_lon) / 2);
    header.center_lat = center_lat ? as_fixed(*center_lat, "center_lat_e7")
                                   : static_cast<std::int32_t>((static_cast<std::int64_t>(header.bounds.min_lat) +
                                                                header.bounds.max_lat) / 2);
    header.center_zoom = static_cast<int>(optional_integer(value, "center_zoom").value_or(header.min_zoom));

    header.tile_format = parse_tile_format(field_text(value, "tile_type"));
    header.tile_compression = parse_tile_compression(field_text(value, "tile_compression"));
    return header;
}

ArchiveMetadata parse_mosaic_metadata(const json &value) {
    ArchiveMetadata metadata;
    if (!value.is_object()) {
        return metadata;
    }
    metadata.name = field_text(value, "name");
    metadata.description = field_text(value, "description");
    metadata.version = field_text(value, "version");
    metadata.attribution = field_text(value, "attribution");
    const auto layers = value.find("vector_layers");
    if (layers != value.end() && !layers->is_null()) {
        metadata.vector_layers = nlohmann::json::parse(layers->dump());
    }
    return metadata;
}

MosaicDescriptor MosaicDescriptor::parse(const std::string &text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error &ex) {
        throw malformed_input_error(std::string("Mosaic descriptor is not valid JSON: ") + ex.what());
    }
    if (!doc.is_object()) {
        throw malformed_input_error("Mosaic descriptor must be a JSON object");
    }

    MosaicDescriptor descriptor;
    descriptor.generation = parse_generation(doc);

    if (descriptor.generation == 0) {
        for (const auto &item : doc.items()) {
            if (item.key() == "version") {
                continue;
            }
            if (auto shard = parse_slice(item.key(), item.value())) {
                descriptor.shards.push_back(std::move(*shard));
            }
        }
        return descriptor;
    }

    const auto slices = doc.find("slices");
    if (slices == doc.end() || !slices->is_object()) {
        throw malformed_input_error("Mosaic descriptor version " + std::to_string(descriptor.generation) +
                                    " has no 'slices' object");
    }
    for (const auto &item : slices->items()) {
        if (auto shard = parse_slice(item.key(), item.value())) {
            descriptor.shards.push_back(std::move(*shard));
        }
    }

    const auto header = doc.find("header");
    if (header != doc.end() && header->is_object()) {
        descriptor.header = parse_mosaic_header(*header);
    }
    const auto metadata = doc.find("metadata");
    if (metadata != doc.end() && metadata->is_object()) {
        descriptor.metadata = parse_mosaic_metadata(*metadata);
    }
    return descriptor;
}

SourceInfo merge_shards(const std::vector<ShardSpec> &shards) {
    if (shards.empty()) {
        throw malformed_input_error("Cannot merge an empty mosaic");
    }
    SourceInfo merged;
    const ShardSpec &first = shards.front();
    merged.metadata = first.metadata;
    merged.header = first.header;
    for (std::size_t i = 1; i < shards.size(); ++i) {
        const ArchiveHeader &header = shards[i].header;
        merged.header.bounds = merged.header.bounds.merge(header.bounds);
        merged.header.min_zoom = std::min(merged.header.min_zoom, header.min_zoom);
        merged.header.max_zoom = std::max(merged.header.max_zoom, header.max_zoom);
        merged.header.center_zoom = std::max(merged.header.center_zoom, header.center_zoom);
    }
    return merged;
}

std::string resolve_shard_key(const std::string &descriptor_locator, const std::string &key, int generation) {
    // legacy descriptors wrote keys relative to a sibling directory
    const std::string relative = generation == 0 ? strip_parent_prefix(key) : key;
    return resolve_locator(descriptor_locator, relative);
}

MosaicResolver::MosaicResolver(std::string locator, std::shared_ptr<Fetcher> fetcher, MosaicOptions options)
    : _locator(std::move(locator)), _fetcher(std::move(fetcher)), _options(options) {
    if (!_fetcher) {
        _fetcher = default_fetcher();
    }
}

void MosaicResolver::ensureLoaded() {
    _init.ensure([this]() { load(); });
}

void MosaicResolver::load() {
    const MosaicDescriptor descriptor = MosaicDescriptor::parse(_fetcher->fetch(_locator));
    if (descriptor.shards.empty()) {
        throw malformed_input_error("Mosaic descriptor " + _locator + " lists no usable shards");
    }

    std::vector<ShardEntry> shards;
    shards.reserve(descriptor.shards.size());
    ArchiveOptions archive_options;
    archive_options.community_attribution = false;
    archive_options.cache_dir = _options.archive_cache_dir;
    for (const ShardSpec &spec : descriptor.shards) {
        ShardEntry entry;
        entry.key = spec.key;
        entry.locator = resolve_shard_key(_locator, spec.key, descriptor.generation);
        entry.header = spec.header;
        entry.metadata = spec.metadata;
        entry.archive = std::make_shared<ArchiveResolver>(entry.locator, archive_options, _fetcher);
        shards.push_back(std::move(entry));
    }

    SourceInfo info;
    if (descriptor.generation == 0 || !descriptor.header) {
        if (descriptor.generation != 0) {
            LOG(WARNING) << "Mosaic " << _locator << " has no top-level header; merging slice headers\n";
        }
        info = merge_shards(descriptor.shards);
    } else {
        info.header = *descriptor.header;
        info.metadata = descriptor.metadata ? *descriptor.metadata : descriptor.shards.front().metadata;
    }
    info.metadata.attribution = extend_attribution(info.metadata.attribution, _options.community_attribution);

    std::map<int, ZoomBucket> buckets;
    for (std::size_t i = 0; i < shards.size(); ++i) {
        const int lo = std::max(0, shards[i].header.min_zoom);
        const int hi = std::min(kMaxZoom, shards[i].header.max_zoom);
        for (int z = lo; z <= hi; ++z) {
            buckets[z].shards.push_back(i);
        }
    }
    for (auto &bucket : buckets) {
        ZoomBucket &zoom_bucket = bucket.second;
        if (zoom_bucket.shards.size() < _options.index_threshold) {
            continue;
        }
        std::vector<BoxIndex::Entry> entries;
        entries.reserve(zoom_bucket.shards.size());
        for (const std::size_t id : zoom_bucket.shards) {
            entries.push_back({shards[id].header.bounds, id});
        }
        zoom_bucket.index.build(std::move(entries));
        zoom_bucket.indexed = true;
    }

    LOG(INFO) << "Loaded mosaic " << _locator << " (generation " << descriptor.generation << ", "
              << shards.size() << " shards, " << buckets.size() << " zoom levels)\n";

    _generation = descriptor.generation;
    _shards = std::move(shards);
    _buckets = std::move(buckets);
    _info = std::move(info);
}

std::optional<std::size_t> MosaicResolver::findShard(int z, int x, int y) const {
    const TileCoordinate coord{z, x, y};
    if (!coord.valid()) {
        return std::nullopt;
    }
    const auto bucket = _buckets.find(z);
    if (bucket == _buckets.end()) {
        return std::nullopt;
    }

    const FixedBox tile_box = to_fixed(coord.bounds());
    const ZoomBucket &zoom_bucket = bucket->second;
    const std::vector<std::size_t> candidates =
        zoom_bucket.indexed ? zoom_bucket.index.query(tile_box) : zoom_bucket.shards;
    for (const std::size_t id : candidates) {
        if (_shards[id].header.bounds.contains(tile_box)) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<TileData> MosaicResolver::getTile(int z, int x, int y) {
    ensureLoaded();
    const auto shard = findShard(z, x, y);
    if (!shard) {
        return std::nullopt;
    }
    const ShardEntry &entry = _shards[*shard];
    auto tile = entry.archive->getTile(z, x, y);
    if (tile && entry.header.tile_format != TileFormat::Unknown) {
        tile->media_type = media_type(entry.header.tile_format);
    }
    return tile;
}

SourceInfo MosaicResolver::getMetadata() {
    ensureLoaded();
    return _info;
}

std::optional<std::string> MosaicResolver::resolveShard(int z, int x, int y) {
    ensureLoaded();
    const auto shard = findShard(z, x, y);
    if (!shard) {
        return std::nullopt;
    }
    return _shards[*shard].locator;
}

std::size_t MosaicResolver::shardCount() {
    ensureLoaded();
    return _shards.size();
}

int MosaicResolver::generation() {
    ensureLoaded();
    return _generation;
}

bool MosaicResolver::zoomIndexed(int z) {
    ensureLoaded();
    const auto bucket = _buckets.find(z);
    return bucket != _buckets.end() && bucket->second.indexed;
}

}  // namespace tilemosaic
