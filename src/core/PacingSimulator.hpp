#pragma once
#include "models/CoreTypes.hpp"
#include "models/PacingPlan.hpp"
#include "models/Waypoint.hpp"
#include "models/params.hpp"
#include <vector>

// Accumulated physical cost between two consecutive waypoints. Only lives for
// the duration of one plan() call.
struct SegmentCost {
  Waypoint from;
  Waypoint to;
  double distance_km = 0.0;
  double elevation_gain_m = 0.0;
  double elevation_loss_m = 0.0;
  double end_altitude_m = 0.0;
  double raw_cost = 0.0;      // km-effort, with the steep-step penalty
  double weighted_cost = 0.0; // raw_cost after fatigue drift
};

//------------------------------------------------------------------------------
// PacingSimulator: spreads a target finishing time over waypoint segments in
// proportion to their effort cost, later segments weighted up by fatigue.
//------------------------------------------------------------------------------
class PacingSimulator {
public:
  static constexpr double kSteepSlopePct = 20.0;
  static constexpr double kSteepPenalty = 1.2;
  static constexpr double kDefaultFatigue = 0.2;
  static constexpr double kAggressiveFatigue = 0.25; // fast start, slow end
  static constexpr double kConservativeFatigue = 0.0;
  // A caller waypoint this close to either end of the track is taken as the
  // start/finish instead of synthesizing one.
  static constexpr double kBracketToleranceKm = 0.1;
  // Absorbs rounding in cumulative distance when testing waypoint crossings.
  static constexpr double kCrossingEpsKm = 1e-6;

  PacingSimulator() = default;

  // status == InsufficientData when the track has fewer than two points or
  // no measurable cost, or when target, start hour or fatigue is not finite.
  PacingPlan plan(const std::vector<GeoPoint> &points,
                  const std::vector<Waypoint> &waypoints, double target_minutes,
                  double start_hour,
                  double fatigue_intensity = kDefaultFatigue) const;

  PacingPlan plan(const std::vector<GeoPoint> &points,
                  const PacingParams &params) const;

  // km-effort of a single step, steep steps penalised.
  static double stepCost(const GeoPoint &a, const GeoPoint &b);

  // Sorted, clamped to [0,total] and bracketed by a start and a finish.
  // Waypoints with a non-finite distance are dropped.
  static std::vector<Waypoint> normalizeWaypoints(std::vector<Waypoint> wps,
                                                  double total_km);

  // One linear scan; returns exactly active.size() - 1 segments.
  static std::vector<SegmentCost>
  accumulateSegments(const std::vector<GeoPoint> &points,
                     const std::vector<Waypoint> &active);

  // raw_cost * (1 + progress * fatigue), progress = share of total raw cost
  // already behind the runner when the segment starts.
  static std::vector<double>
  weightedCosts(const std::vector<SegmentCost> &segments,
                double fatigue_intensity);

  // Minutes per segment; always sums to target_minutes.
  static std::vector<double>
  distributeTime(const std::vector<SegmentCost> &segments,
                 double target_minutes, double fatigue_intensity);
};
