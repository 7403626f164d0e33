#pragma once

#include <cstdint>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using Json = nlohmann::json;

// A single track sample as produced by the upstream GPX/FIT parser.
struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> elevation; // metres
  std::optional<double> time;      // seconds (epoch or relative)
};

// Convenience alias for a full parsed track.
using Track = std::vector<GeoPoint>;

enum class RouteType : uint8_t { Loop, OutAndBack, PointToPoint };

inline const char *RouteTypeToString(RouteType type) {
  switch (type) {
  case RouteType::Loop:
    return "loop";
  case RouteType::OutAndBack:
    return "out_and_back";
  case RouteType::PointToPoint:
    return "point_to_point";
  }
  return "point_to_point";
}

inline RouteType RouteTypeFromString(const std::string &s) {
  if (s == "loop")
    return RouteType::Loop;
  if (s == "out_and_back")
    return RouteType::OutAndBack;
  return RouteType::PointToPoint;
}

// Value-level outcome carried by every computed result. Nothing in the core
// throws for these; callers inspect the status.
enum class CoreStatus : uint8_t {
  Ok = 0,
  EmptyOrDegenerateTrack, // fewer than 2 points, metrics are zeroed
  InsufficientData,       // pacing cannot be planned on this geometry
  Unavailable             // prediction impossible (zero distance)
};

inline const char *CoreStatusToString(CoreStatus status) {
  switch (status) {
  case CoreStatus::Ok:
    return "ok";
  case CoreStatus::EmptyOrDegenerateTrack:
    return "empty_or_degenerate_track";
  case CoreStatus::InsufficientData:
    return "insufficient_data";
  case CoreStatus::Unavailable:
    return "unavailable";
  }
  return "unknown";
}

// --- GeoPoint ----
// Elevation may arrive as "ele" (GPX), "elv" or "elevation", either as a
// number or a numeric string. Null or unparsable values mean "no elevation".
inline void from_json(const Json &j, GeoPoint &p) {
  p.lat = j.value("lat", 0.0);
  p.lon = j.value("lon", 0.0);
  auto parse_optional = [](const Json &x) -> std::optional<double> {
    if (x.is_number())
      return x.get<double>();
    if (x.is_string()) {
      const auto &s = x.get_ref<const std::string &>();
      char *end = nullptr;
      const double v = std::strtod(s.c_str(), &end);
      if (end != s.c_str() && *end == '\0')
        return v;
    }
    return std::nullopt;
  };
  p.elevation.reset();
  if (j.contains("ele"))
    p.elevation = parse_optional(j["ele"]);
  else if (j.contains("elv"))
    p.elevation = parse_optional(j["elv"]);
  else if (j.contains("elevation"))
    p.elevation = parse_optional(j["elevation"]);

  p.time.reset();
  if (j.contains("time"))
    p.time = parse_optional(j["time"]);
}

inline void to_json(Json &j, const GeoPoint &p) {
  j = Json{{"lat", p.lat}, {"lon", p.lon}};
  j["ele"] = p.elevation ? Json(*p.elevation) : Json(nullptr);
  if (p.time)
    j["time"] = *p.time;
}
