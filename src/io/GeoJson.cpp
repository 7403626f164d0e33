#include "io/GeoJson.hpp"

#include <stdexcept>

using json = nlohmann::json;

json track_to_geojson(const std::vector<GeoPoint> &points,
                      const std::string &name) {
  if (points.empty())
    return nullptr;

  json coordinates = json::array();
  for (const auto &p : points)
    coordinates.push_back({p.lon, p.lat, p.elevation.value_or(0.0)});

  return json{{"type", "Feature"},
              {"geometry",
               {{"type", "LineString"}, {"coordinates", coordinates}}},
              {"properties", {{"name", name.empty() ? "Track" : name}}}};
}

std::vector<GeoPoint> track_from_geojson(const json &j) {
  if (!j.is_object())
    throw std::runtime_error("GeoJSON input is not an object");
  const json *geom = &j;
  if (j.value("type", "") == "Feature") {
    if (!j.contains("geometry") || !j["geometry"].is_object())
      throw std::runtime_error("GeoJSON Feature has no geometry");
    geom = &j["geometry"];
  }
  if (!geom->is_object() || geom->value("type", "") != "LineString")
    throw std::runtime_error("GeoJSON geometry is not a LineString");

  std::vector<GeoPoint> out;
  const auto &coords = geom->value("coordinates", json::array());
  out.reserve(coords.size());
  for (const auto &pt : coords) {
    // for each position check it has at least [lon, lat]
    if (!pt.is_array() || pt.size() < 2)
      continue;
    GeoPoint p;
    p.lon = pt[0].get<double>();
    p.lat = pt[1].get<double>();
    if (pt.size() >= 3 && pt[2].is_number())
      p.elevation = pt[2].get<double>();
    out.push_back(p);
  }
  return out;
}
