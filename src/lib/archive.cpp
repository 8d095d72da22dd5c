#include "tilemosaic/archive.h"
#include "tilemosaic/fetch.h"

#include "aixlog.hpp"
#include "sqlite3.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace tilemosaic {

const char *const kCommunityCredit = "<a href=\"https://datameet.org\" target=\"_blank\">DataMeet</a>";

namespace {

struct stmt_deleter {
    void operator()(sqlite3_stmt *stmt) const noexcept {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
    }
};

std::unique_ptr<sqlite3_stmt, stmt_deleter> prepare(sqlite3 *db, const char *sql) {
    sqlite3_stmt *raw_stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw_stmt, nullptr) != SQLITE_OK) {
        if (raw_stmt != nullptr) {
            sqlite3_finalize(raw_stmt);
        }
        throw malformed_input_error(std::string("Failed to prepare '") + sql + "': " + sqlite3_errmsg(db));
    }
    return std::unique_ptr<sqlite3_stmt, stmt_deleter>(raw_stmt);
}

std::optional<std::string> find_metadata_value(const std::map<std::string, std::string> &metadata,
                                              const std::string &key) {
    const auto direct = metadata.find(key);
    if (direct != metadata.end()) {
        return direct->second;
    }
    const std::string lowered_key = to_lower(key);
    for (const auto &entry : metadata) {
        if (to_lower(entry.first) == lowered_key) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::optional<LonLatBox> parse_bounds(const std::string &value) {
    const auto parts = split(value, ',');
    if (parts.size() != 4) {
        return std::nullopt;
    }
    const auto min_lon = parse_double(parts[0]);
    const auto min_lat = parse_double(parts[1]);
    const auto max_lon = parse_double(parts[2]);
    const auto max_lat = parse_double(parts[3]);
    if (!min_lon || !min_lat || !max_lon || !max_lat) {
        return std::nullopt;
    }
    LonLatBox bounds;
    bounds.min_lon = *min_lon;
    bounds.min_lat = *min_lat;
    bounds.max_lon = *max_lon;
    bounds.max_lat = *max_lat;
    return bounds;
}

struct CenterInfo {
    double lon = 0.0;
    double lat = 0.0;
    std::optional<int> zoom;
};

std::optional<CenterInfo> parse_center(const std::string &value) {
    const auto parts = split(value, ',');
    if (parts.size() < 2) {
        return std::nullopt;
    }
    const auto lon = parse_double(parts[0]);
    const auto lat = parse_double(parts[1]);
    if (!lon || !lat) {
        return std::nullopt;
    }
    CenterInfo info;
    info.lon = *lon;
    info.lat = *lat;
    if (parts.size() >= 3) {
        info.zoom = parse_int(parts[2]);
    }
    return info;
}

}  // namespace

nlohmann::json to_tilejson(const SourceInfo &info) {
    const LonLatBox bounds = from_fixed(info.header.bounds);
    nlohmann::json doc;
    doc["tilejson"] = "3.0.0";
    doc["scheme"] = "xyz";
    if (!info.metadata.vector_layers.is_null()) {
        doc["vector_layers"] = info.metadata.vector_layers;
    }
    doc["attribution"] = info.metadata.attribution;
    doc["description"] = info.metadata.description;
    doc["name"] = info.metadata.name;
    doc["version"] = info.metadata.version;
    doc["bounds"] = {bounds.min_lon, bounds.min_lat, bounds.max_lon, bounds.max_lat};
    doc["center"] = {from_fixed(info.header.center_lon), from_fixed(info.header.center_lat),
                     info.header.center_zoom};
    doc["minzoom"] = info.header.min_zoom;
    doc["maxzoom"] = info.header.max_zoom;
    return doc;
}

std::string extend_attribution(const std::string &attribution, bool community_credit) {
    if (!community_credit) {
        return attribution;
    }
    if (attribution.empty()) {
        return kCommunityCredit;
    }
    return attribution + " | " + kCommunityCredit;
}

MBTiles::MBTiles(const std::string &path) : _path(path), _db(nullptr) {
    if (path.empty()) {
        throw bad_request_error("MBTiles path must not be empty");
    }
    if (sqlite3_open_v2(path.c_str(), &_db, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
        std::string message = "Unable to open MBTiles file: " + path;
        if (_db != nullptr) {
            message += ": ";
            message += sqlite3_errmsg(_db);
            sqlite3_close(_db);
            _db = nullptr;
        }
        throw resource_unavailable_error(message);
    }
}

MBTiles::~MBTiles() {
    if (_db != nullptr) {
        sqlite3_close(_db);
    }
}

std::map<std::string, std::string> MBTiles::metadata() const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto stmt = prepare(_db, "SELECT name, value FROM metadata");
    std::map<std::string, std::string> entries;
    while (true) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_ROW) {
            throw malformed_input_error("SQLite error while reading metadata from '" + _path +
                                        "': " + sqlite3_errmsg(_db));
        }
        const unsigned char *name = sqlite3_column_text(stmt.get(), 0);
        const unsigned char *value = sqlite3_column_text(stmt.get(), 1);
        if (name == nullptr) {
            continue;
        }
        entries[reinterpret_cast<const char *>(name)] =
            value != nullptr ? reinterpret_cast<const char *>(value) : "";
    }
    return entries;
}

std::optional<std::string> MBTiles::tile(int z, int x, int y) const {
    const TileCoordinate coord{z, x, y};
    if (!coord.valid()) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    auto stmt = prepare(_db, "SELECT tile_data FROM tiles WHERE zoom_level=? AND tile_column=? AND tile_row=? LIMIT 1");
    sqlite3_bind_int(stmt.get(), 1, z);
    sqlite3_bind_int(stmt.get(), 2, x);
    sqlite3_bind_int(stmt.get(), 3, xyz_to_tms_y(y, z));

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw malformed_input_error("SQLite error while reading tile from '" + _path + "': " + sqlite3_errmsg(_db));
    }

    const void *blob = sqlite3_column_blob(stmt.get(), 0);
    const int size = sqlite3_column_bytes(stmt.get(), 0);
    if (blob == nullptr || size <= 0) {
        return std::nullopt;
    }
    return std::string(static_cast<const char *>(blob), static_cast<std::size_t>(size));
}

std::optional<int> MBTiles::queryZoom(const char *sql) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto stmt = prepare(_db, sql);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW && sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return std::nullopt;
}

std::optional<std::string> MBTiles::firstTile() const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto stmt = prepare(_db, "SELECT tile_data FROM tiles LIMIT 1");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    const void *blob = sqlite3_column_blob(stmt.get(), 0);
    const int size = sqlite3_column_bytes(stmt.get(), 0);
    if (blob == nullptr || size <= 0) {
        return std::nullopt;
    }
    return std::string(static_cast<const char *>(blob), static_cast<std::size_t>(size));
}

ArchiveHeader MBTiles::header() const {
    const auto entries = metadata();
    ArchiveHeader header;

    std::optional<int> min_zoom;
    if (const auto value = find_metadata_value(entries, "minzoom")) {
        min_zoom = parse_int(trim(*value));
    }
    if (!min_zoom) {
        min_zoom = queryZoom("SELECT MIN(zoom_level) FROM tiles");
    }
    std::optional<int> max_zoom;
    if (const auto value = find_metadata_value(entries, "maxzoom")) {
        max_zoom = parse_int(trim(*value));
    }
    if (!max_zoom) {
        max_zoom = queryZoom("SELECT MAX(zoom_level) FROM tiles");
    }
    header.min_zoom = min_zoom.value_or(0);
    header.max_zoom = std::max(max_zoom.value_or(header.min_zoom), header.min_zoom);

    LonLatBox bounds{-180.0, -85.0511287798, 180.0, 85.0511287798};
    if (const auto value = find_metadata_value(entries, "bounds")) {
        if (const auto parsed = parse_bounds(*value)) {
            bounds = *parsed;
        } else {
            LOG(WARNING) << "Ignoring malformed bounds '" << *value << "' in " << _path << "\n";
        }
    }
    header.bounds = to_fixed(bounds);

    std::optional<CenterInfo> center;
    if (const auto value = find_metadata_value(entries, "center")) {
        center = parse_center(*value);
    }
    if (center) {
        header.center_lon = to_fixed(center->lon);
        header.center_lat = to_fixed(center->lat);
    } else {
        header.center_lon = to_fixed((bounds.min_lon + bounds.max_lon) / 2.0);
        header.center_lat = to_fixed((bounds.min_lat + bounds.max_lat) / 2.0);
    }
    int center_zoom = header.min_zoom;
    if (center && center->zoom) {
        center_zoom = *center->zoom;
    }
    header.center_zoom = std::clamp(center_zoom, header.min_zoom, header.max_zoom);

    if (const auto value = find_metadata_value(entries, "format")) {
        header.tile_format = parse_tile_format(*value);
    }
    std::optional<std::string> sample;
    if (header.tile_format == TileFormat::Unknown) {
        sample = firstTile();
        if (sample) {
            header.tile_format = detect_tile_format(*sample);
        }
    }

    if (header.tile_format == TileFormat::Mvt) {
        if (!sample) {
            sample = firstTile();
        }
        const bool gzipped = sample && is_gzipped(*sample);
        header.tile_compression = gzipped ? TileCompression::Gzip : TileCompression::None;
    } else if (header.tile_format != TileFormat::Unknown) {
        header.tile_compression = TileCompression::None;
    }
    return header;
}

ArchiveMetadata MBTiles::describe() const {
    const auto entries = metadata();
    ArchiveMetadata info;
    info.name = find_metadata_value(entries, "name").value_or("");
    info.description = find_metadata_value(entries, "description").value_or("");
    info.version = find_metadata_value(entries, "version").value_or("");
    info.attribution = find_metadata_value(entries, "attribution").value_or("");

    if (const auto json_text = find_metadata_value(entries, "json")) {
        const auto doc = nlohmann::json::parse(*json_text, nullptr, false);
        if (doc.is_discarded()) {
            LOG(WARNING) << "Ignoring malformed json metadata in " << _path << "\n";
        } else if (doc.is_object() && doc.contains("vector_layers")) {
            info.vector_layers = doc["vector_layers"];
        }
    }
    return info;
}

ArchiveResolver::ArchiveResolver(std::string locator, ArchiveOptions options, std::shared_ptr<Fetcher> fetcher)
    : _locator(std::move(locator)), _options(std::move(options)), _fetcher(std::move(fetcher)) {}

std::string ArchiveResolver::localCopy() const {
    if (!is_remote(_locator)) {
        return local_path(_locator);
    }

    namespace fs = std::filesystem;
    const fs::path dir = _options.cache_dir.empty() ? fs::temp_directory_path() / "tilemosaic-archives"
                                                    : fs::path(_options.cache_dir);
    const fs::path target = dir / (std::to_string(std::hash<std::string>{}(_locator)) + ".mbtiles");

    std::error_code ec;
    if (fs::is_regular_file(target, ec)) {
        LOG(DEBUG) << "Using cached copy of " << _locator << " at " << target.string() << "\n";
        return target.string();
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw resource_unavailable_error("Cannot create archive cache " + dir.string() + ": " + ec.message());
    }

    LOG(INFO) << "Downloading archive " << _locator << "\n";
    const std::string bytes = _fetcher->fetch(_locator);

    // renamed into place once complete
    const fs::path partial = target.string() + ".part-" + std::to_string(reinterpret_cast<std::uintptr_t>(this));
    {
        std::ofstream out(partial, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            throw resource_unavailable_error("Failed to write " + partial.string());
        }
    }
    fs::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw resource_unavailable_error("Failed to store " + _locator + " at " + target.string() + ": " +
                                         ec.message());
    }
    LOG(INFO) << "Stored " << bytes.size() << " bytes of " << _locator << " at " << target.string() << "\n";
    return target.string();
}

void ArchiveResolver::ensureOpen() {
    _init.ensure([this]() {
        auto archive = std::make_unique<MBTiles>(localCopy());
        SourceInfo info;
        info.header = archive->header();
        info.metadata = archive->describe();
        info.metadata.attribution = extend_attribution(info.metadata.attribution, _options.community_attribution);
        LOG(INFO) << "Opened archive " << _locator << " (zoom " << info.header.min_zoom << "-"
                  << info.header.max_zoom << ", " << format_name(info.header.tile_format) << ", "
                  << compression_name(info.header.tile_compression) << ")\n";
        _info = std::move(info);
        _archive = std::move(archive);
    });
}

std::optional<TileData> ArchiveResolver::getTile(int z, int x, int y) {
    ensureOpen();
    if (!TileCoordinate{z, x, y}.valid()) {
        return std::nullopt;
    }
    auto payload = _archive->tile(z, x, y);
    if (!payload) {
        return std::nullopt;
    }
    TileFormat format = _info.header.tile_format;
    if (format == TileFormat::Unknown) {
        format = detect_tile_format(*payload);
    }
    TileData tile;
    tile.media_type = media_type(format);
    tile.bytes = is_gzipped(*payload) ? gunzip(*payload) : std::move(*payload);
    return tile;
}

SourceInfo ArchiveResolver::getMetadata() {
    ensureOpen();
    return _info;
}

}  // namespace tilemosaic
