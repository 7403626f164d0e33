#pragma once
#include "models/CoreTypes.hpp"
#include "models/TrackMetrics.hpp"
#include <cstddef>
#include <vector>

// Turns a raw point sequence into TrackMetrics. Stateless: compute() is a pure
// function of its input, so one engine can be shared freely.
class MetricsEngine {
public:
  // Constants the downstream consumers rely on
  static constexpr double kEffortMetresPerKm = 100.0; // 100 m D+ ~ 1 flat km
  static constexpr double kSlopeWindowM = 50.0;
  static constexpr double kLoopThresholdM = 200.0;
  static constexpr double kClimbBreakLossM = 20.0;
  static constexpr double kHighMountainM = 2000.0;

  MetricsEngine() = default;

  TrackMetrics compute(const std::vector<GeoPoint> &points) const;

  struct SlopeStats {
    double max_abs_pct = 0.0;
    double avg_uphill_pct = 0.0;
    std::size_t chunks = 0;
  };
  // Slope over consecutive chunks of at least `window_m` metres.
  static SlopeStats sampleSlopes(const std::vector<GeoPoint> &points,
                                 double window_m = kSlopeWindowM);

  // Largest gain accumulated without descending more than kClimbBreakLossM
  // in between.
  static double longestClimb(const std::vector<GeoPoint> &points);

  static double effortScore(double distance_km, double elevation_gain_m);
  static int itraPoints(double effort_score);
  static RouteType classifyRoute(const GeoPoint &start, const GeoPoint &end);
  static std::vector<ProfileEstimate> estimateTimes(double distance_km,
                                                    double elevation_gain_m);
  static TrackAttributes inferAttributes(const TrackMetrics &m);
};
