#ifndef TILEMOSAIC_TEST_SUPPORT_H
#define TILEMOSAIC_TEST_SUPPORT_H
#pragma once

#include "tilemosaic/catalog.h"
#include "tilemosaic/fetch.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tilemosaic {
namespace test {

// Scratch directory removed with everything in it on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    std::string path(const std::string &name) const;
    const std::filesystem::path &root() const { return _root; }

private:
    std::filesystem::path _root;
};

// Tile addressed in the XYZ scheme; written with the TMS row flip.
struct StoredTile {
    int z = 0;
    int x = 0;
    int y = 0;
    std::string data;
};

void write_mbtiles(const std::string &path, const std::map<std::string, std::string> &metadata,
                   const std::vector<StoredTile> &tiles);

// Wraps `bytes` in a gzip stream, the way vector tile archives store them.
std::string gzip(const std::string &bytes);

// Fetcher over an in-memory map of locator -> bytes that counts every call.
class MemoryFetcher : public Fetcher {
public:
    void put(const std::string &locator, std::string bytes);
    void remove(const std::string &locator);
    void setDelay(std::chrono::milliseconds delay) { _delay = delay; }

    std::string fetch(const std::string &locator) override;
    std::string fetchRange(const std::string &locator, std::uint64_t offset, std::uint64_t length) override;
    std::uint64_t contentLength(const std::string &locator) override;

    int fetchCount(const std::string &locator) const;
    int totalCalls() const;

private:
    std::string lookup(const std::string &locator);

    mutable std::mutex _mutex;
    std::map<std::string, std::string> _files;
    std::map<std::string, int> _fetches;
    int _calls = 0;
    std::chrono::milliseconds _delay{0};
};

// Feature rows served from memory, keyed by backing-file locator. Unknown
// locators fail like an unreadable file.
class MemoryTableReader : public FeatureTableReader {
public:
    void put(const std::string &locator, std::vector<nlohmann::json> rows);
    std::vector<nlohmann::json> readRows(const std::string &locator) override;
    int reads(const std::string &locator) const;

private:
    mutable std::mutex _mutex;
    std::map<std::string, std::vector<nlohmann::json>> _tables;
    std::map<std::string, int> _reads;
};

// Mosaic header object in degrees, scaled to the _e7 integer fields.
nlohmann::json mosaic_header(double min_lon, double min_lat, double max_lon, double max_lat, int min_zoom,
                             int max_zoom, int tile_type = 1);

// The Web-Mercator extent of tile 2/2/1, the footprint of every test GeoTIFF.
constexpr double kTestOriginX = 0.0;
constexpr double kTestOriginY = 10018754.171394622;
constexpr double kTestExtent = 10018754.171394622;

struct GeoTiffSpec {
    int size = 256;
    int block = 128;
    unsigned char red = 200;
    unsigned char green = 100;
    unsigned char blue = 50;
    bool overview = false;
    // Adds a 1-bit mask, opaque over the left half of the image.
    bool mask = false;
    int mask_bits = 1;
    int mask_samples = 1;
    bool geotags = true;
};

void write_geotiff(const std::string &path, const GeoTiffSpec &spec);

}  // namespace test
}  // namespace tilemosaic

#endif // TILEMOSAIC_TEST_SUPPORT_H
