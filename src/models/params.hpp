#pragma once

#include "models/Waypoint.hpp"
#include <nlohmann/json.hpp>
#include <vector>

// Caller-supplied parameters for one pacing simulation.
struct PacingParams {
  double target_minutes = 0.0;
  double start_hour = 6.0;        // time of day at the gun, hours
  double fatigue_intensity = 0.2; // +20% cost drift from start to finish
  std::vector<Waypoint> waypoints;

  static PacingParams from_json(const nlohmann::json &j) {
    PacingParams p;
    if (j.contains("target_minutes"))
      p.target_minutes = j.at("target_minutes").get<double>();
    if (j.contains("start_hour"))
      p.start_hour = j.at("start_hour").get<double>();
    if (j.contains("fatigue_intensity"))
      p.fatigue_intensity = j.at("fatigue_intensity").get<double>();
    if (j.contains("waypoints") && j["waypoints"].is_array()) {
      for (const auto &w : j["waypoints"])
        p.waypoints.push_back(w.get<Waypoint>());
    }
    return p;
  }
};
