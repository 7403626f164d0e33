#pragma once

#include "models/CoreTypes.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <vector>

// Finishing time for one of the fixed speed/climb profiles.
struct ProfileEstimate {
  std::string profile; // "hiker", "runner", "elite"
  double hours = 0.0;
  std::string formatted; // e.g. "5h07"
};

// Terrain tags inferred from the aggregate metrics.
struct TrackAttributes {
  bool is_high_mountain = false;
  std::vector<std::string> tags; // "high_mountain", "vertical", "skyrunning"
};

// Everything the metrics engine derives from one track. Built fresh on every
// call and never mutated afterwards.
struct TrackMetrics {
  CoreStatus status = CoreStatus::EmptyOrDegenerateTrack;

  // ================== Distance / elevation ==================
  double distance_km = 0.0;
  double elevation_gain_m = 0.0; // raw sum of positive deltas
  double elevation_loss_m = 0.0; // raw sum of negative deltas (positive value)
  double max_altitude_m = 0.0;
  double min_altitude_m = 0.0;
  double avg_altitude_m = 0.0;
  double longest_climb_m = 0.0;

  // ================== Slope (50 m chunks) ==================
  double max_slope_pct = 0.0; // largest absolute chunk slope
  double avg_uphill_slope_pct = 0.0;

  // ================== Effort ==================
  double effort_score = 0.0; // km-effort
  int ibp_index = 0;
  int estimated_itra_points = 0; // 0..6

  RouteType route_type = RouteType::PointToPoint;
  std::vector<ProfileEstimate> estimated_times; // hiker, runner, elite
  TrackAttributes attributes;

  std::optional<GeoPoint> start_point;
  std::optional<GeoPoint> end_point;
  std::string track_uid; // hex SHA-256 of normalized geometry
};

inline double round_to(double v, int decimals) {
  const double f = std::pow(10.0, decimals);
  return std::round(v * f) / f;
}

inline void to_json(Json &j, const ProfileEstimate &e) {
  j = Json{{"profile", e.profile},
           {"hours", round_to(e.hours, 2)},
           {"formatted", e.formatted}};
}

inline void to_json(Json &j, const TrackAttributes &a) {
  j = Json{{"is_high_mountain", a.is_high_mountain}, {"tags", a.tags}};
}

// Rounding here is presentation only; the struct keeps full precision.
inline void to_json(Json &j, const TrackMetrics &m) {
  j = Json::object();
  j["status"] = CoreStatusToString(m.status);
  j["distance_km"] = round_to(m.distance_km, 2);
  j["elevation_gain"] = static_cast<int>(m.elevation_gain_m);
  j["elevation_loss"] = static_cast<int>(m.elevation_loss_m);
  j["max_altitude"] = static_cast<int>(m.max_altitude_m);
  j["min_altitude"] = static_cast<int>(m.min_altitude_m);
  j["avg_altitude"] = static_cast<int>(m.avg_altitude_m);
  j["longest_climb"] = static_cast<int>(m.longest_climb_m);
  j["max_slope"] = round_to(m.max_slope_pct, 1);
  j["avg_slope_uphill"] = round_to(m.avg_uphill_slope_pct, 1);
  j["km_effort"] = round_to(m.effort_score, 1);
  j["ibp_index"] = m.ibp_index;
  j["itra_points_estim"] = m.estimated_itra_points;
  j["route_type"] = RouteTypeToString(m.route_type);

  Json times = Json::object();
  for (const auto &e : m.estimated_times)
    times[e.profile] = e.formatted;
  j["estimated_times"] = times;
  j["attributes"] = m.attributes;

  auto coords = [](const std::optional<GeoPoint> &p) -> Json {
    if (!p)
      return nullptr;
    return Json::array({p->lat, p->lon});
  };
  j["start_coords"] = coords(m.start_point);
  j["end_coords"] = coords(m.end_point);
  j["track_uid"] = m.track_uid;
}
