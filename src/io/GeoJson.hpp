#pragma once
#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// GeoJSON Feature with a LineString geometry. Coordinates are
// [lon, lat, ele], ele defaulting to 0 when a sample has none.
// Returns null for an empty track.
nlohmann::json track_to_geojson(const std::vector<GeoPoint> &points,
                                const std::string &name = "Track");

// Inverse of the above, accepting any LineString Feature or bare geometry.
// Throws std::runtime_error if `j` is neither.
std::vector<GeoPoint> track_from_geojson(const nlohmann::json &j);
