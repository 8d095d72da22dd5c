#ifndef TILEMOSAIC_COMMON_H
#define TILEMOSAIC_COMMON_H
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tilemosaic {

enum class ErrorKind {
    BadRequest,
    Forbidden,
    ResourceUnavailable,
    MalformedInput,
    Unknown,
};

class tilemosaic_error : public std::runtime_error {
public:
    tilemosaic_error(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), _kind(kind) {}

    ErrorKind kind() const noexcept { return _kind; }

private:
    ErrorKind _kind;
};

class bad_request_error : public tilemosaic_error {
public:
    explicit bad_request_error(const std::string &message)
        : tilemosaic_error(ErrorKind::BadRequest, message) {}
};

class forbidden_error : public tilemosaic_error {
public:
    explicit forbidden_error(const std::string &message)
        : tilemosaic_error(ErrorKind::Forbidden, message) {}
};

// Upstream fetch failed; the same request may succeed later.
class resource_unavailable_error : public tilemosaic_error {
public:
    explicit resource_unavailable_error(const std::string &message)
        : tilemosaic_error(ErrorKind::ResourceUnavailable, message) {}
};

class malformed_input_error : public tilemosaic_error {
public:
    explicit malformed_input_error(const std::string &message)
        : tilemosaic_error(ErrorKind::MalformedInput, message) {}
};

class unknown_error : public tilemosaic_error {
public:
    explicit unknown_error(const std::string &message)
        : tilemosaic_error(ErrorKind::Unknown, message) {}
};

int http_status(ErrorKind kind);
const char *error_kind_name(ErrorKind kind);

enum class LogLevel {
    Trace,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

private:
    struct Impl;
    static Impl &impl();
};

// Coordinates stored in archive headers are degrees scaled by 1e7.
constexpr double kCoordScale = 1e7;
constexpr double kEarthRadius = 6378137.0;

std::int32_t to_fixed(double degrees);
double from_fixed(std::int32_t value);

struct LonLat {
    double lon = 0.0;
    double lat = 0.0;
};

struct LonLatBox {
    double min_lon = 0.0;
    double min_lat = 0.0;
    double max_lon = 0.0;
    double max_lat = 0.0;

    bool intersects(const LonLatBox &other) const;
};

struct FixedBox {
    std::int32_t min_lon = 0;
    std::int32_t min_lat = 0;
    std::int32_t max_lon = 0;
    std::int32_t max_lat = 0;

    // All four edges must hold; shared edges count as contained.
    bool contains(const FixedBox &other) const;
    bool intersects(const FixedBox &other) const;
    FixedBox merge(const FixedBox &other) const;
};

FixedBox to_fixed(const LonLatBox &box);
LonLatBox from_fixed(const FixedBox &box);

double tile_x_to_lon(int x, int z);
double tile_y_to_lat(int y, int z);
int xyz_to_tms_y(int xyz_y, int z);

struct TileCoordinate {
    int z = 0;
    int x = 0;
    int y = 0;

    bool valid() const;
    LonLatBox bounds() const;
};

LonLat web_mercator_to_lonlat(double x, double y);
double resolution_at_zoom(int z, int tile_size = 256);

enum class TileFormat {
    Unknown,
    Mvt,
    Png,
    Jpeg,
    Webp,
    Avif,
};

enum class TileCompression {
    Unknown,
    None,
    Gzip,
    Brotli,
    Zstd,
};

std::string media_type(TileFormat format);
std::string tile_extension(TileFormat format);
std::string format_name(TileFormat format);
std::string compression_name(TileCompression compression);
TileFormat parse_tile_format(const std::string &value);
TileCompression parse_tile_compression(const std::string &value);
TileFormat detect_tile_format(const std::string &payload);

bool is_gzipped(const std::string &payload);
// Inflates a gzip stream. Throws malformed_input_error for corrupt or truncated input.
std::string gunzip(const std::string &payload);

std::string trim(const std::string &value);
std::string to_lower(std::string value);
std::vector<std::string> split(const std::string &value, char separator);
bool starts_with(const std::string &value, const std::string &prefix);
std::optional<int> parse_int(const std::string &value);
std::optional<double> parse_double(const std::string &value);
std::string format_double(double value);

}  // namespace tilemosaic

#endif // TILEMOSAIC_COMMON_H
