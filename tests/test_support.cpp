#include "test_support.h"

#include "tilemosaic/common.h"

#include "sqlite3.h"
#include <tiffio.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <thread>

namespace tilemosaic {
namespace test {

namespace {

std::atomic<int> temp_counter{0};

struct db_closer {
    void operator()(sqlite3 *db) const noexcept { sqlite3_close(db); }
};

struct stmt_deleter {
    void operator()(sqlite3_stmt *stmt) const noexcept { sqlite3_finalize(stmt); }
};

void exec(sqlite3 *db, const char *sql) {
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        const std::string message = error != nullptr ? error : "unknown error";
        sqlite3_free(error);
        throw std::runtime_error(std::string("SQLite error in '") + sql + "': " + message);
    }
}

std::unique_ptr<sqlite3_stmt, stmt_deleter> prepare(sqlite3 *db, const char *sql) {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare '") + sql + "': " + sqlite3_errmsg(db));
    }
    return std::unique_ptr<sqlite3_stmt, stmt_deleter>(stmt);
}

const TIFFFieldInfo kGeoFields[] = {
    {33550, -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char *>("ModelPixelScale")},
    {33922, -1, -1, TIFF_DOUBLE, FIELD_CUSTOM, 1, 1, const_cast<char *>("ModelTiepoint")},
};

void write_tiles(TIFF *tif, const std::vector<unsigned char> &pixels, int width, int height, int block,
                 int bytes_per_row_of_block, int bytes_per_pixel) {
    std::vector<unsigned char> tile(static_cast<std::size_t>(bytes_per_row_of_block) * block, 0);
    for (int ty = 0; ty < height; ty += block) {
        for (int tx = 0; tx < width; tx += block) {
            std::fill(tile.begin(), tile.end(), 0);
            for (int row = 0; row < block && ty + row < height; ++row) {
                for (int col = 0; col < block && tx + col < width; ++col) {
                    const std::size_t src = (static_cast<std::size_t>(ty + row) * width + (tx + col)) * bytes_per_pixel;
                    const std::size_t dst = static_cast<std::size_t>(row) * bytes_per_row_of_block + col * bytes_per_pixel;
                    std::copy(pixels.begin() + src, pixels.begin() + src + bytes_per_pixel, tile.begin() + dst);
                }
            }
            const ttile_t index = TIFFComputeTile(tif, tx, ty, 0, 0);
            if (TIFFWriteEncodedTile(tif, index, tile.data(), static_cast<tmsize_t>(tile.size())) < 0) {
                throw std::runtime_error("Failed to write GeoTIFF tile");
            }
        }
    }
}

void write_color(TIFF *tif, const GeoTiffSpec &spec, int size, std::uint32_t subfile, bool geotags) {
    TIFFSetField(tif, TIFFTAG_SUBFILETYPE, subfile);
    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, static_cast<std::uint32_t>(size));
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, static_cast<std::uint32_t>(size));
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, static_cast<std::uint32_t>(spec.block));
    TIFFSetField(tif, TIFFTAG_TILELENGTH, static_cast<std::uint32_t>(spec.block));
    if (geotags) {
        const double pixel = kTestExtent / size;
        double scale[3] = {pixel, pixel, 0.0};
        double tiepoint[6] = {0.0, 0.0, 0.0, kTestOriginX, kTestOriginY, 0.0};
        TIFFSetField(tif, 33550, static_cast<std::uint16_t>(3), scale);
        TIFFSetField(tif, 33922, static_cast<std::uint16_t>(6), tiepoint);
    }

    std::vector<unsigned char> pixels(static_cast<std::size_t>(size) * size * 3);
    for (std::size_t i = 0; i < pixels.size(); i += 3) {
        pixels[i] = spec.red;
        pixels[i + 1] = spec.green;
        pixels[i + 2] = spec.blue;
    }
    write_tiles(tif, pixels, size, size, spec.block, spec.block * 3, 3);
    if (!TIFFWriteDirectory(tif)) {
        throw std::runtime_error("Failed to write GeoTIFF directory");
    }
}

void write_mask(TIFF *tif, const GeoTiffSpec &spec, int size) {
    TIFFSetField(tif, TIFFTAG_SUBFILETYPE, static_cast<std::uint32_t>(FILETYPE_MASK));
    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, static_cast<std::uint32_t>(size));
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, static_cast<std::uint32_t>(size));
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, spec.mask_bits);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, spec.mask_samples);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, spec.mask_samples == 1 ? PHOTOMETRIC_MASK : PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, static_cast<std::uint32_t>(spec.block));
    TIFFSetField(tif, TIFFTAG_TILELENGTH, static_cast<std::uint32_t>(spec.block));

    const int half = size / 2;
    if (spec.mask_bits == 1) {
        const int row_bytes = spec.block / 8;
        std::vector<unsigned char> tile(static_cast<std::size_t>(row_bytes) * spec.block);
        for (int ty = 0; ty < size; ty += spec.block) {
            for (int tx = 0; tx < size; tx += spec.block) {
                std::fill(tile.begin(), tile.end(), 0);
                for (int row = 0; row < spec.block; ++row) {
                    for (int col = 0; col < spec.block; ++col) {
                        if (tx + col < half) {
                            tile[static_cast<std::size_t>(row) * row_bytes + col / 8] |=
                                static_cast<unsigned char>(0x80 >> (col % 8));
                        }
                    }
                }
                if (TIFFWriteEncodedTile(tif, TIFFComputeTile(tif, tx, ty, 0, 0), tile.data(),
                                         static_cast<tmsize_t>(tile.size())) < 0) {
                    throw std::runtime_error("Failed to write GeoTIFF mask tile");
                }
            }
        }
    } else {
        const int bytes = spec.mask_samples * ((spec.mask_bits + 7) / 8);
        std::vector<unsigned char> pixels(static_cast<std::size_t>(size) * size * bytes, 0);
        for (int row = 0; row < size; ++row) {
            for (int col = 0; col < half; ++col) {
                for (int b = 0; b < bytes; ++b) {
                    pixels[(static_cast<std::size_t>(row) * size + col) * bytes + b] = 255;
                }
            }
        }
        write_tiles(tif, pixels, size, size, spec.block, spec.block * bytes, bytes);
    }
    if (!TIFFWriteDirectory(tif)) {
        throw std::runtime_error("Failed to write GeoTIFF mask directory");
    }
}

}  // namespace

TempDir::TempDir() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    _root = std::filesystem::temp_directory_path() /
            ("tilemosaic-test-" + std::to_string(stamp) + "-" + std::to_string(temp_counter++));
    std::filesystem::create_directories(_root);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_root, ec);
}

std::string TempDir::path(const std::string &name) const {
    const std::filesystem::path full = _root / name;
    std::filesystem::create_directories(full.parent_path());
    return full.string();
}

void write_mbtiles(const std::string &path, const std::map<std::string, std::string> &metadata,
                   const std::vector<StoredTile> &tiles) {
    sqlite3 *raw = nullptr;
    if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
        const std::string message = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
        sqlite3_close(raw);
        throw std::runtime_error("Unable to create " + path + ": " + message);
    }
    std::unique_ptr<sqlite3, db_closer> db(raw);

    exec(db.get(), "CREATE TABLE metadata (name TEXT, value TEXT)");
    exec(db.get(),
         "CREATE TABLE tiles (zoom_level INTEGER, tile_column INTEGER, tile_row INTEGER, tile_data BLOB)");

    auto meta = prepare(db.get(), "INSERT INTO metadata (name, value) VALUES (?, ?)");
    for (const auto &entry : metadata) {
        sqlite3_bind_text(meta.get(), 1, entry.first.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(meta.get(), 2, entry.second.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(meta.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("Failed to insert metadata: ") + sqlite3_errmsg(db.get()));
        }
        sqlite3_reset(meta.get());
    }

    auto insert = prepare(db.get(),
                          "INSERT INTO tiles (zoom_level, tile_column, tile_row, tile_data) VALUES (?, ?, ?, ?)");
    for (const StoredTile &tile : tiles) {
        sqlite3_bind_int(insert.get(), 1, tile.z);
        sqlite3_bind_int(insert.get(), 2, tile.x);
        sqlite3_bind_int(insert.get(), 3, (1 << tile.z) - 1 - tile.y);
        sqlite3_bind_blob(insert.get(), 4, tile.data.data(), static_cast<int>(tile.data.size()), SQLITE_TRANSIENT);
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("Failed to insert tile: ") + sqlite3_errmsg(db.get()));
        }
        sqlite3_reset(insert.get());
    }
}

std::string gzip(const std::string &bytes) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflateInit2 failed");
    }
    std::string out(deflateBound(&stream, static_cast<uLong>(bytes.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(bytes.data()));
    stream.avail_in = static_cast<uInt>(bytes.size());
    stream.next_out = reinterpret_cast<Bytef *>(&out[0]);
    stream.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("zlib deflate failed with code " + std::to_string(rc));
    }
    out.resize(stream.total_out);
    return out;
}

void MemoryFetcher::put(const std::string &locator, std::string bytes) {
    std::lock_guard<std::mutex> lock(_mutex);
    _files[locator] = std::move(bytes);
}

void MemoryFetcher::remove(const std::string &locator) {
    std::lock_guard<std::mutex> lock(_mutex);
    _files.erase(locator);
}

std::string MemoryFetcher::lookup(const std::string &locator) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_calls;
    }
    if (_delay.count() > 0) {
        std::this_thread::sleep_for(_delay);
    }
    std::lock_guard<std::mutex> lock(_mutex);
    const auto it = _files.find(locator);
    if (it == _files.end()) {
        throw resource_unavailable_error("No such test resource: " + locator);
    }
    return it->second;
}

std::string MemoryFetcher::fetch(const std::string &locator) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_fetches[locator];
    }
    return lookup(locator);
}

std::string MemoryFetcher::fetchRange(const std::string &locator, std::uint64_t offset, std::uint64_t length) {
    const std::string bytes = lookup(locator);
    if (offset >= bytes.size()) {
        return {};
    }
    return bytes.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
}

std::uint64_t MemoryFetcher::contentLength(const std::string &locator) {
    return lookup(locator).size();
}

int MemoryFetcher::fetchCount(const std::string &locator) const {
    std::lock_guard<std::mutex> lock(_mutex);
    const auto it = _fetches.find(locator);
    return it == _fetches.end() ? 0 : it->second;
}

int MemoryFetcher::totalCalls() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _calls;
}

void MemoryTableReader::put(const std::string &locator, std::vector<nlohmann::json> rows) {
    std::lock_guard<std::mutex> lock(_mutex);
    _tables[locator] = std::move(rows);
}

std::vector<nlohmann::json> MemoryTableReader::readRows(const std::string &locator) {
    std::lock_guard<std::mutex> lock(_mutex);
    ++_reads[locator];
    const auto it = _tables.find(locator);
    if (it == _tables.end()) {
        throw malformed_input_error("Unreadable table " + locator);
    }
    return it->second;
}

int MemoryTableReader::reads(const std::string &locator) const {
    std::lock_guard<std::mutex> lock(_mutex);
    const auto it = _reads.find(locator);
    return it == _reads.end() ? 0 : it->second;
}

nlohmann::json mosaic_header(double min_lon, double min_lat, double max_lon, double max_lat, int min_zoom,
                             int max_zoom, int tile_type) {
    nlohmann::json header;
    header["min_lon_e7"] = static_cast<std::int64_t>(std::llround(min_lon * kCoordScale));
    header["min_lat_e7"] = static_cast<std::int64_t>(std::llround(min_lat * kCoordScale));
    header["max_lon_e7"] = static_cast<std::int64_t>(std::llround(max_lon * kCoordScale));
    header["max_lat_e7"] = static_cast<std::int64_t>(std::llround(max_lat * kCoordScale));
    header["min_zoom"] = min_zoom;
    header["max_zoom"] = max_zoom;
    header["tile_type"] = tile_type;
    header["tile_compression"] = 1;
    return header;
}

void write_geotiff(const std::string &path, const GeoTiffSpec &spec) {
    TIFF *tif = TIFFOpen(path.c_str(), "w");
    if (tif == nullptr) {
        throw std::runtime_error("Unable to create " + path);
    }
    std::unique_ptr<TIFF, void (*)(TIFF *)> guard(tif, TIFFClose);
    TIFFMergeFieldInfo(tif, kGeoFields, sizeof(kGeoFields) / sizeof(kGeoFields[0]));

    write_color(tif, spec, spec.size, 0, spec.geotags);
    if (spec.mask) {
        write_mask(tif, spec, spec.size);
    }
    if (spec.overview) {
        write_color(tif, spec, spec.size / 2, FILETYPE_REDUCEDIMAGE, false);
    }
}

}  // namespace test
}  // namespace tilemosaic
