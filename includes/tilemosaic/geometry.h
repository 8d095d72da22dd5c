#ifndef TILEMOSAIC_GEOMETRY_H
#define TILEMOSAIC_GEOMETRY_H
#pragma once

#include "tilemosaic/common.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace tilemosaic {

// Well-known binary to a GeoJSON geometry object. Accepts both byte orders,
// ISO (+1000/+2000/+3000) and EWKB Z/M/SRID flags; M values are dropped.
nlohmann::json wkb_to_geojson(const std::uint8_t *data, std::size_t size);

// Bounding box of every position in a GeoJSON geometry, or nullopt when it has none.
std::optional<LonLatBox> geometry_envelope(const nlohmann::json &geometry);

// "minLon,minLat,maxLon,maxLat". Throws bad_request_error on anything else.
LonLatBox parse_bbox(const std::string &text);
LonLatBox parse_bbox(const nlohmann::json &value);

}  // namespace tilemosaic

#endif // TILEMOSAIC_GEOMETRY_H
