#include "tilemosaic/geometry.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <vector>

namespace tilemosaic {

namespace {

enum WkbType : std::uint32_t {
    kPoint = 1,
    kLineString = 2,
    kPolygon = 3,
    kMultiPoint = 4,
    kMultiLineString = 5,
    kMultiPolygon = 6,
    kGeometryCollection = 7,
};

constexpr std::uint32_t kEwkbZ = 0x80000000u;
constexpr std::uint32_t kEwkbM = 0x40000000u;
constexpr std::uint32_t kEwkbSrid = 0x20000000u;
constexpr int kMaxDepth = 32;

class WkbReader {
public:
    WkbReader(const std::uint8_t *data, std::size_t size) : _data(data), _size(size) {}

    nlohmann::json geometry(int depth) {
        if (depth > kMaxDepth) {
            throw malformed_input_error("WKB nesting too deep");
        }

        const std::uint8_t order = byte();
        if (order > 1) {
            throw malformed_input_error("Invalid WKB byte order " + std::to_string(order));
        }
        _little = order == 1;

        std::uint32_t code = uint32();
        bool has_z = (code & kEwkbZ) != 0;
        bool has_m = (code & kEwkbM) != 0;
        if (code & kEwkbSrid) {
            uint32();
        }
        code &= 0x0FFFFFFFu;
        switch (code / 1000) {
            case 0:
                break;
            case 1:
                has_z = true;
                break;
            case 2:
                has_m = true;
                break;
            case 3:
                has_z = true;
                has_m = true;
                break;
            default:
                throw malformed_input_error("Unsupported WKB geometry type " + std::to_string(code));
        }
        _dims = 2 + (has_z ? 1 : 0) + (has_m ? 1 : 0);
        _has_z = has_z;

        nlohmann::json out;
        switch (code % 1000) {
            case kPoint: {
                out["type"] = "Point";
                nlohmann::json position = point();
                out["coordinates"] = position.is_null() ? nlohmann::json::array() : position;
                break;
            }
            case kLineString:
                out["type"] = "LineString";
                out["coordinates"] = points();
                break;
            case kPolygon:
                out["type"] = "Polygon";
                out["coordinates"] = rings();
                break;
            case kMultiPoint:
            case kMultiLineString:
            case kMultiPolygon:
                out = multi(code % 1000, depth);
                break;
            case kGeometryCollection: {
                out["type"] = "GeometryCollection";
                nlohmann::json members = nlohmann::json::array();
                const std::uint32_t count = uint32();
                for (std::uint32_t i = 0; i < count; ++i) {
                    members.push_back(geometry(depth + 1));
                }
                out["geometries"] = members;
                break;
            }
            default:
                throw malformed_input_error("Unsupported WKB geometry type " + std::to_string(code));
        }
        return out;
    }

private:
    nlohmann::json multi(std::uint32_t type, int depth) {
        static const char *const kNames[] = {"", "", "", "", "MultiPoint", "MultiLineString", "MultiPolygon"};
        nlohmann::json coordinates = nlohmann::json::array();
        const std::uint32_t count = uint32();
        for (std::uint32_t i = 0; i < count; ++i) {
            nlohmann::json part = geometry(depth + 1);
            coordinates.push_back(part["coordinates"]);
        }
        nlohmann::json out;
        out["type"] = kNames[type];
        out["coordinates"] = coordinates;
        return out;
    }

    nlohmann::json rings() {
        nlohmann::json out = nlohmann::json::array();
        const std::uint32_t count = uint32();
        for (std::uint32_t i = 0; i < count; ++i) {
            out.push_back(points());
        }
        return out;
    }

    nlohmann::json points() {
        nlohmann::json out = nlohmann::json::array();
        const std::uint32_t count = uint32();
        if (static_cast<std::uint64_t>(count) * _dims * 8 > _size - _pos) {
            throw malformed_input_error("Truncated WKB coordinate list");
        }
        for (std::uint32_t i = 0; i < count; ++i) {
            out.push_back(point());
        }
        return out;
    }

    // null for the NaN-encoded empty point
    nlohmann::json point() {
        const double x = float64();
        const double y = float64();
        double z = 0.0;
        if (_has_z) {
            z = float64();
        }
        for (int extra = _has_z ? 3 : 2; extra < _dims; ++extra) {
            float64();
        }
        if (std::isnan(x) && std::isnan(y)) {
            return nullptr;
        }
        if (_has_z) {
            return {x, y, z};
        }
        return {x, y};
    }

    void need(std::size_t bytes) const {
        if (_size - _pos < bytes) {
            throw malformed_input_error("Truncated WKB geometry");
        }
    }

    std::uint8_t byte() {
        need(1);
        return _data[_pos++];
    }

    std::uint32_t uint32() {
        need(4);
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            const std::uint32_t b = _data[_pos + (_little ? i : 3 - i)];
            value |= b << (8 * i);
        }
        _pos += 4;
        return value;
    }

    double float64() {
        need(8);
        std::uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            const std::uint64_t b = _data[_pos + (_little ? i : 7 - i)];
            bits |= b << (8 * i);
        }
        _pos += 8;
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    const std::uint8_t *_data;
    std::size_t _size;
    std::size_t _pos = 0;
    bool _little = true;
    bool _has_z = false;
    int _dims = 2;
};

void extend_envelope(const nlohmann::json &coordinates, std::optional<LonLatBox> &box) {
    if (!coordinates.is_array() || coordinates.empty()) {
        return;
    }
    if (coordinates[0].is_number()) {
        if (coordinates.size() < 2 || !coordinates[1].is_number()) {
            return;
        }
        const double lon = coordinates[0].get<double>();
        const double lat = coordinates[1].get<double>();
        if (!box) {
            box = LonLatBox{lon, lat, lon, lat};
            return;
        }
        box->min_lon = std::min(box->min_lon, lon);
        box->min_lat = std::min(box->min_lat, lat);
        box->max_lon = std::max(box->max_lon, lon);
        box->max_lat = std::max(box->max_lat, lat);
        return;
    }
    for (const auto &child : coordinates) {
        extend_envelope(child, box);
    }
}

LonLatBox checked_bbox(const std::vector<double> &values) {
    if (values.size() != 4 && values.size() != 6) {
        throw bad_request_error("bbox must have 4 or 6 numbers");
    }
    // 3D boxes are minx,miny,minz,maxx,maxy,maxz
    const std::size_t hi = values.size() / 2;
    LonLatBox box{values[0], values[1], values[hi], values[hi + 1]};
    if (box.min_lon > box.max_lon || box.min_lat > box.max_lat) {
        throw bad_request_error("bbox minimum exceeds maximum");
    }
    return box;
}

}  // namespace

nlohmann::json wkb_to_geojson(const std::uint8_t *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return nullptr;
    }
    WkbReader reader(data, size);
    return reader.geometry(0);
}

std::optional<LonLatBox> geometry_envelope(const nlohmann::json &geometry) {
    std::optional<LonLatBox> box;
    if (!geometry.is_object()) {
        return box;
    }
    const auto geometries = geometry.find("geometries");
    if (geometries != geometry.end() && geometries->is_array()) {
        for (const auto &member : *geometries) {
            const std::optional<LonLatBox> inner = geometry_envelope(member);
            if (!inner) {
                continue;
            }
            if (!box) {
                box = inner;
            } else {
                box->min_lon = std::min(box->min_lon, inner->min_lon);
                box->min_lat = std::min(box->min_lat, inner->min_lat);
                box->max_lon = std::max(box->max_lon, inner->max_lon);
                box->max_lat = std::max(box->max_lat, inner->max_lat);
            }
        }
        return box;
    }
    const auto coordinates = geometry.find("coordinates");
    if (coordinates != geometry.end()) {
        extend_envelope(*coordinates, box);
    }
    return box;
}

LonLatBox parse_bbox(const std::string &text) {
    std::vector<double> values;
    for (const std::string &part : split(text, ',')) {
        const std::optional<double> value = parse_double(trim(part));
        if (!value) {
            throw bad_request_error("Invalid bbox: " + text);
        }
        values.push_back(*value);
    }
    return checked_bbox(values);
}

LonLatBox parse_bbox(const nlohmann::json &value) {
    if (value.is_string()) {
        return parse_bbox(value.get<std::string>());
    }
    if (!value.is_array()) {
        throw bad_request_error("bbox must be a string or an array");
    }
    std::vector<double> values;
    for (const auto &item : value) {
        if (!item.is_number()) {
            throw bad_request_error("bbox must contain only numbers");
        }
        values.push_back(item.get<double>());
    }
    return checked_bbox(values);
}

}  // namespace tilemosaic
