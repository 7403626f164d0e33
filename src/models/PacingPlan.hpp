#pragma once

#include "models/CoreTypes.hpp"
#include "models/TrackMetrics.hpp" // round_to
#include "models/Waypoint.hpp"
#include <string>
#include <vector>

// One row of a race plan: arrival at a waypoint.
struct PlanPoint {
  std::string name;
  WaypointKind kind = WaypointKind::Checkpoint;

  // Cumulative quantities since the start
  double cumulative_km = 0.0;
  double cumulative_elevation_gain_m = 0.0;
  double altitude_m = 0.0;       // elevation where the segment closed
  double elapsed_minutes = 0.0;  // main strategy
  std::string elapsed;           // "HHhMM"
  std::string time_of_day;       // "HH:MM", main strategy
  std::string time_of_day_fast;  // aggressive strategy
  std::string time_of_day_slow;  // conservative strategy

  // Segment from the previous waypoint to this one
  double segment_distance_km = 0.0;
  double segment_elevation_gain_m = 0.0;
  double segment_elevation_loss_m = 0.0;
  double segment_minutes = 0.0;
  std::string segment_duration; // "HHhMM", "-" for the start row
};

struct PacingPlan {
  CoreStatus status = CoreStatus::Ok;
  double target_minutes = 0.0;
  double fatigue_intensity = 0.0;
  double start_hour = 0.0;
  std::vector<PlanPoint> points; // ascending distance, first is the start
};

inline void to_json(Json &j, const PlanPoint &p) {
  j = Json::object();
  j["name"] = p.name;
  j["type"] = WaypointKindToString(p.kind);
  j["km"] = round_to(p.cumulative_km, 1);
  j["altitude"] = static_cast<int>(p.altitude_m);
  j["d_plus_cumul"] = static_cast<int>(p.cumulative_elevation_gain_m);
  j["elapsed_minutes"] = round_to(p.elapsed_minutes, 2);
  j["time_race"] = p.elapsed;
  j["time_day"] = p.time_of_day;
  j["time_fast_tod"] = p.time_of_day_fast;
  j["time_slow_tod"] = p.time_of_day_slow;
  j["segment_dist"] = round_to(p.segment_distance_km, 1);
  j["segment_d_plus"] = static_cast<int>(p.segment_elevation_gain_m);
  j["segment_d_minus"] = static_cast<int>(p.segment_elevation_loss_m);
  j["segment_minutes"] = round_to(p.segment_minutes, 2);
  j["segment_time"] = p.segment_duration;
}

inline void to_json(Json &j, const PacingPlan &plan) {
  j = Json::object();
  j["status"] = CoreStatusToString(plan.status);
  j["strategy"] = {{"target_time", plan.target_minutes},
                   {"fatigue_intensity", plan.fatigue_intensity},
                   {"start_hour", plan.start_hour}};
  j["points"] = plan.points;
}
