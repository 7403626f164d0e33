#include "core/TrailCore.hpp"

#include "core/FinishPredictor.hpp"
#include "core/MetricsEngine.hpp"
#include "core/PacingSimulator.hpp"
#include "core/TrackSimplifier.hpp"

TrackMetrics compute_metrics(const std::vector<GeoPoint> &points) {
  return MetricsEngine().compute(points);
}

std::vector<GeoPoint> simplify(const std::vector<GeoPoint> &points,
                               double tolerance_deg) {
  return TrackSimplifier(tolerance_deg).simplify(points);
}

PacingPlan plan_pacing(const std::vector<GeoPoint> &points,
                       const std::vector<Waypoint> &waypoints,
                       double target_minutes, double start_hour,
                       double fatigue_intensity) {
  return PacingSimulator().plan(points, waypoints, target_minutes, start_hour,
                                fatigue_intensity);
}

PredictionResult predict_finish(const TrackMetrics &metrics,
                                double performance_index,
                                const PredictionConfig &config) {
  return FinishPredictor().predict(metrics, performance_index, config);
}

PredictionResult predict_finish(const TrackMetrics &metrics,
                                const PerformanceIndices &indices,
                                const PredictionConfig &config) {
  return FinishPredictor().predict(metrics, select_performance_index(indices),
                                   config);
}

double select_performance_index(const PerformanceIndices &indices) {
  return FinishPredictor::selectPerformanceIndex(indices);
}
