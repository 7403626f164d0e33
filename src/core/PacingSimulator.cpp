// PacingSimulator: turns a goal time into arrival times at each waypoint.

#include "core/PacingSimulator.hpp"

#include "core/GeoUtils.hpp"
#include "core/MetricsEngine.hpp"
#include "core/TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

double PacingSimulator::stepCost(const GeoPoint &a, const GeoPoint &b) {
  const double dist_m = GeoUtils::haversine(a, b);
  const double ele_diff = GeoUtils::elevationDelta(a, b);
  const double d_plus_m = std::max(0.0, ele_diff);

  double cost = dist_m / 1000.0 + d_plus_m / MetricsEngine::kEffortMetresPerKm;
  const double slope = dist_m > 0 ? ele_diff / dist_m * 100.0 : 0.0;
  if (std::fabs(slope) > kSteepSlopePct)
    cost *= kSteepPenalty;
  return cost;
}

std::vector<Waypoint>
PacingSimulator::normalizeWaypoints(std::vector<Waypoint> wps,
                                    double total_km) {
  wps.erase(std::remove_if(wps.begin(), wps.end(),
                           [](const Waypoint &w) {
                             if (std::isfinite(w.distance_km))
                               return false;
                             std::cerr << "[pacing] waypoint '" << w.name
                                       << "' has no usable distance ("
                                       << w.distance_km << "), dropped\n";
                             return true;
                           }),
            wps.end());

  std::stable_sort(wps.begin(), wps.end(),
                   [](const Waypoint &a, const Waypoint &b) {
                     return a.distance_km < b.distance_km;
                   });

  for (auto &w : wps) {
    const double clamped = std::clamp(w.distance_km, 0.0, total_km);
    if (clamped != w.distance_km) {
      std::cerr << "[pacing] waypoint '" << w.name << "' at " << w.distance_km
                << " km clamped to " << clamped << " km\n";
      w.distance_km = clamped;
    }
  }

  std::vector<Waypoint> active;
  active.reserve(wps.size() + 2);
  if (wps.empty() || wps.front().distance_km > kBracketToleranceKm)
    active.push_back(Waypoint{0.0, "Start", WaypointKind::Start});
  for (auto &w : wps)
    active.push_back(w);
  active.front().distance_km = 0.0;

  if (active.size() < 2 ||
      active.back().distance_km < total_km - kBracketToleranceKm)
    active.push_back(Waypoint{total_km, "Finish", WaypointKind::Finish});
  active.back().distance_km = total_km;
  return active;
}

std::vector<SegmentCost>
PacingSimulator::accumulateSegments(const std::vector<GeoPoint> &points,
                                    const std::vector<Waypoint> &active) {
  std::vector<SegmentCost> segments;
  if (active.size() < 2)
    return segments;
  segments.reserve(active.size() - 1);

  const size_t finish_idx = active.size() - 1;
  size_t next = 1; // waypoint the current segment runs to
  SegmentCost current;
  current.from = active[0];
  current.to = active[1];

  double cumulative_km = 0.0;
  double last_altitude = 0.0;
  if (!points.empty() && points.front().elevation)
    last_altitude = *points.front().elevation;

  auto close_segment = [&]() {
    current.end_altitude_m = last_altitude;
    segments.push_back(current);
    ++next;
    current = SegmentCost{};
    if (next <= finish_idx) {
      current.from = active[next - 1];
      current.to = active[next];
    }
  };

  for (size_t i = 1; i < points.size(); ++i) {
    // Waypoints already reached at points[i-1] close before this step is
    // counted. Several in a row give zero-length segments. The finish only
    // closes once the scan is over so it takes the whole tail.
    while (next < finish_idx &&
           cumulative_km + kCrossingEpsKm >= active[next].distance_km)
      close_segment();

    const GeoPoint &p1 = points[i - 1];
    const GeoPoint &p2 = points[i];
    const double dist_km = GeoUtils::haversine(p1, p2) / 1000.0;
    const double ele_diff = GeoUtils::elevationDelta(p1, p2);

    current.distance_km += dist_km;
    current.elevation_gain_m += std::max(0.0, ele_diff);
    current.elevation_loss_m += std::max(0.0, -ele_diff);
    current.raw_cost += stepCost(p1, p2);
    cumulative_km += dist_km;
    if (p2.elevation)
      last_altitude = *p2.elevation;
  }

  while (next <= finish_idx)
    close_segment();
  return segments;
}

std::vector<double>
PacingSimulator::weightedCosts(const std::vector<SegmentCost> &segments,
                               double fatigue_intensity) {
  std::vector<double> out;
  out.reserve(segments.size());
  const double total_raw = std::accumulate(
      segments.begin(), segments.end(), 0.0,
      [](double acc, const SegmentCost &s) { return acc + s.raw_cost; });
  if (total_raw <= 0) {
    for (const auto &s : segments)
      out.push_back(s.raw_cost);
    return out;
  }

  double progress_cost = 0.0;
  for (const auto &s : segments) {
    const double drift = 1.0 + (progress_cost / total_raw) * fatigue_intensity;
    out.push_back(s.raw_cost * drift);
    progress_cost += s.raw_cost;
  }
  return out;
}

std::vector<double>
PacingSimulator::distributeTime(const std::vector<SegmentCost> &segments,
                                double target_minutes,
                                double fatigue_intensity) {
  const auto weighted = weightedCosts(segments, fatigue_intensity);
  const double total = std::accumulate(weighted.begin(), weighted.end(), 0.0);
  std::vector<double> minutes(weighted.size(), 0.0);
  if (total <= 0)
    return minutes;

  const double pace_factor = target_minutes / total;
  for (size_t i = 0; i < weighted.size(); ++i)
    minutes[i] = weighted[i] * pace_factor;
  return minutes;
}

PacingPlan PacingSimulator::plan(const std::vector<GeoPoint> &points,
                                 const PacingParams &params) const {
  return plan(points, params.waypoints, params.target_minutes,
              params.start_hour, params.fatigue_intensity);
}

PacingPlan PacingSimulator::plan(const std::vector<GeoPoint> &points,
                                 const std::vector<Waypoint> &waypoints,
                                 double target_minutes, double start_hour,
                                 double fatigue_intensity) const {
  PacingPlan out;
  out.target_minutes = target_minutes;
  out.fatigue_intensity = fatigue_intensity;
  out.start_hour = start_hour;
  if (!std::isfinite(target_minutes) || !std::isfinite(start_hour) ||
      !std::isfinite(fatigue_intensity)) {
    std::cerr << "[pacing] non-finite input (target " << target_minutes
              << " min, start hour " << start_hour << ", fatigue "
              << fatigue_intensity << "), no plan built\n";
    out.status = CoreStatus::InsufficientData;
    return out;
  }
  if (target_minutes < 0) {
    std::cerr << "[pacing] negative target time " << target_minutes
              << " min clamped to 0\n";
    target_minutes = 0;
  }
  if (fatigue_intensity < 0) {
    std::cerr << "[pacing] negative fatigue intensity " << fatigue_intensity
              << " clamped to 0\n";
    fatigue_intensity = 0;
  }
  out.target_minutes = target_minutes;
  out.fatigue_intensity = fatigue_intensity;

  if (points.size() < 2) {
    out.status = CoreStatus::InsufficientData;
    return out;
  }

  double total_km = 0.0;
  for (size_t i = 1; i < points.size(); ++i)
    total_km += GeoUtils::haversine(points[i - 1], points[i]) / 1000.0;

  const auto active = normalizeWaypoints(waypoints, total_km);
  auto segments = accumulateSegments(points, active);
  const double total_raw = std::accumulate(
      segments.begin(), segments.end(), 0.0,
      [](double acc, const SegmentCost &s) { return acc + s.raw_cost; });
  if (total_raw <= 0) {
    out.status = CoreStatus::InsufficientData;
    return out;
  }

  const auto weighted = weightedCosts(segments, fatigue_intensity);
  for (size_t i = 0; i < segments.size(); ++i)
    segments[i].weighted_cost = weighted[i];

  const auto main_times =
      distributeTime(segments, target_minutes, fatigue_intensity);
  const auto fast_times =
      distributeTime(segments, target_minutes, kAggressiveFatigue);
  const auto slow_times =
      distributeTime(segments, target_minutes, kConservativeFatigue);

  const double start_tod = start_hour * 60.0;

  PlanPoint first;
  first.name = active.front().name;
  first.kind = active.front().kind;
  first.altitude_m = points.front().elevation.value_or(0.0);
  first.elapsed = format_elapsed(0.0);
  first.time_of_day = format_time_of_day(start_tod);
  first.time_of_day_fast = first.time_of_day;
  first.time_of_day_slow = first.time_of_day;
  first.segment_duration = "-";
  out.points.push_back(first);

  double cumul_gain = 0.0;
  double cumul_main = 0.0, cumul_fast = 0.0, cumul_slow = 0.0;
  for (size_t i = 0; i < segments.size(); ++i) {
    const SegmentCost &seg = segments[i];
    cumul_main += main_times[i];
    cumul_fast += fast_times[i];
    cumul_slow += slow_times[i];
    cumul_gain += seg.elevation_gain_m;

    PlanPoint pp;
    pp.name = seg.to.name;
    pp.kind = seg.to.kind;
    pp.cumulative_km = seg.to.distance_km;
    pp.cumulative_elevation_gain_m = cumul_gain;
    pp.altitude_m = seg.end_altitude_m;
    pp.elapsed_minutes = cumul_main;
    pp.elapsed = format_elapsed(cumul_main);
    pp.time_of_day = format_time_of_day(start_tod + cumul_main);
    pp.time_of_day_fast = format_time_of_day(start_tod + cumul_fast);
    pp.time_of_day_slow = format_time_of_day(start_tod + cumul_slow);
    pp.segment_distance_km = seg.distance_km;
    pp.segment_elevation_gain_m = seg.elevation_gain_m;
    pp.segment_elevation_loss_m = seg.elevation_loss_m;
    pp.segment_minutes = main_times[i];
    pp.segment_duration = format_elapsed(main_times[i]);
    out.points.push_back(std::move(pp));
  }
  out.status = CoreStatus::Ok;
  return out;
}
