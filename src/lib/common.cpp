#include "tilemosaic/common.h"

#include "aixlog.hpp"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <memory>
#include <sstream>

namespace tilemosaic {

namespace {

constexpr double kPi = 3.141592653589793238462643383279502884;

AixLog::Severity to_aixlog_severity(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return AixLog::Severity::trace;
        case LogLevel::DEBUG:
            return AixLog::Severity::debug;
        case LogLevel::INFO:
            return AixLog::Severity::info;
        case LogLevel::WARNING:
            return AixLog::Severity::warning;
        case LogLevel::ERROR:
            return AixLog::Severity::error;
        case LogLevel::FATAL:
            return AixLog::Severity::fatal;
    }
    return AixLog::Severity::warning;
}

}  // namespace

int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:
            return 400;
        case ErrorKind::Forbidden:
            return 403;
        case ErrorKind::ResourceUnavailable:
            return 424;
        case ErrorKind::MalformedInput:
        case ErrorKind::Unknown:
            return 500;
    }
    return 500;
}

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest:
            return "BadRequest";
        case ErrorKind::Forbidden:
            return "Forbidden";
        case ErrorKind::ResourceUnavailable:
            return "ResourceUnavailable";
        case ErrorKind::MalformedInput:
            return "MalformedInput";
        case ErrorKind::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

struct Logger::Impl {
    LogLevel level = LogLevel::WARNING;

    void apply() {
        AixLog::Filter filter;
        filter.add_filter(to_aixlog_severity(level));
        auto sink = std::make_shared<AixLog::SinkCout>(filter, "[#severity] #message");
        AixLog::Log::init({sink});
    }
};

Logger::Impl &Logger::impl() {
    static Logger::Impl instance = []() {
        Logger::Impl state;
        state.apply();
        return state;
    }();
    return instance;
}

void Logger::set_level(LogLevel level) {
    auto &state = impl();
    if (state.level == level) {
        return;
    }
    state.level = level;
    state.apply();
}

LogLevel Logger::level() {
    return impl().level;
}

std::int32_t to_fixed(double degrees) {
    const double scaled = std::round(degrees * kCoordScale);
    if (scaled > std::numeric_limits<std::int32_t>::max() || scaled < std::numeric_limits<std::int32_t>::min()) {
        throw malformed_input_error("Coordinate " + format_double(degrees) + " is outside the fixed-point range");
    }
    return static_cast<std::int32_t>(scaled);
}

double from_fixed(std::int32_t value) {
    return static_cast<double>(value) / kCoordScale;
}

bool LonLatBox::intersects(const LonLatBox &other) const {
    return min_lon <= other.max_lon && max_lon >= other.min_lon &&
           min_lat <= other.max_lat && max_lat >= other.min_lat;
}

bool FixedBox::contains(const FixedBox &other) const {
    return min_lon <= other.min_lon && min_lat <= other.min_lat &&
           max_lon >= other.max_lon && max_lat >= other.max_lat;
}

bool FixedBox::intersects(const FixedBox &other) const {
    return min_lon <= other.max_lon && max_lon >= other.min_lon &&
           min_lat <= other.max_lat && max_lat >= other.min_lat;
}

FixedBox FixedBox::merge(const FixedBox &other) const {
    FixedBox merged;
    merged.min_lon = std::min(min_lon, other.min_lon);
    merged.min_lat = std::min(min_lat, other.min_lat);
    merged.max_lon = std::max(max_lon, other.max_lon);
    merged.max_lat = std::max(max_lat, other.max_lat);
    return merged;
}

FixedBox to_fixed(const LonLatBox &box) {
    FixedBox fixed;
    fixed.min_lon = to_fixed(box.min_lon);
    fixed.min_lat = to_fixed(box.min_lat);
    fixed.max_lon = to_fixed(box.max_lon);
    fixed.max_lat = to_fixed(box.max_lat);
    return fixed;
}

LonLatBox from_fixed(const FixedBox &box) {
    LonLatBox degrees;
    degrees.min_lon = from_fixed(box.min_lon);
    degrees.min_lat = from_fixed(box.min_lat);
    degrees.max_lon = from_fixed(box.max_lon);
    degrees.max_lat = from_fixed(box.max_lat);
    return degrees;
}

double tile_x_to_lon(int x, int z) {
    const double n = static_cast<double>(x) / static_cast<double>(1LL << z);
    return n * 360.0 - 180.0;
}

double tile_y_to_lat(int y, int z) {
    const double n = kPi - 2.0 * kPi * static_cast<double>(y) / static_cast<double>(1LL << z);
    return 180.0 / kPi * std::atan(0.5 * (std::exp(n) - std::exp(-n)));
}

int xyz_to_tms_y(int xyz_y, int z) {
    const long long max_value = (1LL << z) - 1;
    const long long result = max_value - static_cast<long long>(xyz_y);
    if (result < 0 || result > std::numeric_limits<int>::max()) {
        throw bad_request_error("Tile row is outside representable range for zoom level " + std::to_string(z));
    }
    return static_cast<int>(result);
}

bool TileCoordinate::valid() const {
    if (z < 0 || z > 30 || x < 0 || y < 0) {
        return false;
    }
    const long long count = 1LL << z;
    return x < count && y < count;
}

LonLatBox TileCoordinate::bounds() const {
    LonLatBox box;
    box.min_lon = tile_x_to_lon(x, z);
    box.max_lon = tile_x_to_lon(x + 1, z);
    box.max_lat = tile_y_to_lat(y, z);
    box.min_lat = tile_y_to_lat(y + 1, z);
    return box;
}

LonLat web_mercator_to_lonlat(double x, double y) {
    LonLat point;
    point.lon = (x / kEarthRadius) * 180.0 / kPi;
    point.lat = (std::atan(std::exp(y / kEarthRadius)) * 2.0 - kPi / 2.0) * 180.0 / kPi;
    return point;
}

double resolution_at_zoom(int z, int tile_size) {
    return (2.0 * kPi * kEarthRadius) / (static_cast<double>(tile_size) * static_cast<double>(1LL << z));
}

std::string media_type(TileFormat format) {
    switch (format) {
        case TileFormat::Mvt:
            return "application/vnd.mapbox-vector-tile";
        case TileFormat::Png:
            return "image/png";
        case TileFormat::Jpeg:
            return "image/jpeg";
        case TileFormat::Webp:
            return "image/webp";
        case TileFormat::Avif:
            return "image/avif";
        case TileFormat::Unknown:
            break;
    }
    return "application/octet-stream";
}

std::string tile_extension(TileFormat format) {
    switch (format) {
        case TileFormat::Mvt:
            return "pbf";
        case TileFormat::Png:
            return "png";
        case TileFormat::Jpeg:
            return "jpg";
        case TileFormat::Webp:
            return "webp";
        case TileFormat::Avif:
            return "avif";
        case TileFormat::Unknown:
            break;
    }
    return "bin";
}

std::string format_name(TileFormat format) {
    if (format == TileFormat::Mvt) {
        return "mvt";
    }
    if (format == TileFormat::Unknown) {
        return "unknown";
    }
    return tile_extension(format);
}

std::string compression_name(TileCompression compression) {
    switch (compression) {
        case TileCompression::None:
            return "none";
        case TileCompression::Gzip:
            return "gzip";
        case TileCompression::Brotli:
            return "brotli";
        case TileCompression::Zstd:
            return "zstd";
        case TileCompression::Unknown:
            break;
    }
    return "unknown";
}

TileFormat parse_tile_format(const std::string &value) {
    std::string token = to_lower(trim(value));
    if (!token.empty() && token.front() == '.') {
        token.erase(token.begin());
    }

    // numeric codes follow the PMTiles header enumeration
    if (token == "mvt" || token == "pbf" || token == "1") {
        return TileFormat::Mvt;
    }
    if (token == "png" || token == "2") {
        return TileFormat::Png;
    }
    if (token == "jpg" || token == "jpeg" || token == "3") {
        return TileFormat::Jpeg;
    }
    if (token == "webp" || token == "4") {
        return TileFormat::Webp;
    }
    if (token == "avif" || token == "5") {
        return TileFormat::Avif;
    }
    return TileFormat::Unknown;
}

TileCompression parse_tile_compression(const std::string &value) {
    const std::string token = to_lower(trim(value));
    if (token == "none" || token == "1") {
        return TileCompression::None;
    }
    if (token == "gzip" || token == "2") {
        return TileCompression::Gzip;
    }
    if (token == "brotli" || token == "br" || token == "3") {
        return TileCompression::Brotli;
    }
    if (token == "zstd" || token == "4") {
        return TileCompression::Zstd;
    }
    return TileCompression::Unknown;
}

TileFormat detect_tile_format(const std::string &payload) {
    if (payload.size() < 4) {
        return TileFormat::Unknown;
    }
    const unsigned char *bytes = reinterpret_cast<const unsigned char *>(payload.data());
    if (payload.size() >= 8 && bytes[0] == 0x89 && bytes[1] == 0x50 && bytes[2] == 0x4E && bytes[3] == 0x47) {
        return TileFormat::Png;
    }
    if (bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return TileFormat::Jpeg;
    }
    if (payload.size() >= 12 && bytes[0] == 0x52 && bytes[1] == 0x49 && bytes[2] == 0x46 &&
        bytes[3] == 0x46 && bytes[8] == 0x57 && bytes[9] == 0x45 && bytes[10] == 0x42 && bytes[11] == 0x50) {
        return TileFormat::Webp;
    }
    if (payload.size() >= 12 && payload.compare(4, 8, "ftypavif") == 0) {
        return TileFormat::Avif;
    }
    // vector tiles are stored gzip-compressed
    if (bytes[0] == 0x1F && bytes[1] == 0x8B) {
        return TileFormat::Mvt;
    }
    return TileFormat::Unknown;
}

bool is_gzipped(const std::string &payload) {
    return payload.size() >= 2 && static_cast<unsigned char>(payload[0]) == 0x1F &&
           static_cast<unsigned char>(payload[1]) == 0x8B;
}

std::string gunzip(const std::string &payload) {
    z_stream stream{};
    if (inflateInit2(&stream, 15 + 16) != Z_OK) {
        throw unknown_error("zlib inflateInit2 failed");
    }

    std::string out(std::max<std::size_t>(payload.size() * 4, 1024), '\0');
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(payload.data()));
    stream.avail_in = static_cast<uInt>(payload.size());

    std::size_t total = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (total == out.size()) {
            out.resize(out.size() * 2);
        }
        stream.next_out = reinterpret_cast<Bytef *>(&out[total]);
        stream.avail_out = static_cast<uInt>(out.size() - total);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            throw malformed_input_error("Failed to inflate gzip tile (zlib code " + std::to_string(rc) + ")");
        }
        total = stream.total_out;
    }
    inflateEnd(&stream);
    out.resize(total);
    return out;
}

std::string trim(const std::string &value) {
    const auto first = value.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(first, last - first + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::vector<std::string> split(const std::string &value, char separator) {
    std::stringstream ss(value);
    std::string token;
    std::vector<std::string> parts;
    while (std::getline(ss, token, separator)) {
        parts.emplace_back(trim(token));
    }
    return parts;
}

bool starts_with(const std::string &value, const std::string &prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::optional<int> parse_int(const std::string &value) {
    try {
        std::size_t processed = 0;
        const int parsed = std::stoi(value, &processed);
        if (processed == value.size()) {
            return parsed;
        }
    } catch (const std::exception &) {
    }
    return std::nullopt;
}

std::optional<double> parse_double(const std::string &value) {
    try {
        std::size_t processed = 0;
        const double parsed = std::stod(value, &processed);
        if (processed == value.size()) {
            return parsed;
        }
    } catch (const std::exception &) {
    }
    return std::nullopt;
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(12) << value;
    std::string result = oss.str();
    const auto dot = result.find('.');
    if (dot != std::string::npos && result.find('e') == std::string::npos) {
        while (!result.empty() && result.back() == '0') {
            result.pop_back();
        }
        if (!result.empty() && result.back() == '.') {
            result.pop_back();
        }
    }
    if (result.empty()) {
        result = "0";
    }
    return result;
}

}  // namespace tilemosaic
