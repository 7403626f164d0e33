#pragma once
// Entry points the surrounding application calls. Each one is a pure,
// synchronous function over in-memory data; they are safe to call from
// several threads at once as long as each caller owns its inputs.

#include "models/CoreTypes.hpp"
#include "models/PacingPlan.hpp"
#include "models/Prediction.hpp"
#include "models/PredictionConfig.hpp"
#include "models/TrackMetrics.hpp"
#include "models/Waypoint.hpp"
#include <vector>

TrackMetrics compute_metrics(const std::vector<GeoPoint> &points);

std::vector<GeoPoint> simplify(const std::vector<GeoPoint> &points,
                               double tolerance_deg = 0.0001);

// status == InsufficientData when no plan can be built
PacingPlan plan_pacing(const std::vector<GeoPoint> &points,
                       const std::vector<Waypoint> &waypoints,
                       double target_minutes, double start_hour = 6.0,
                       double fatigue_intensity = 0.2);

// available == false when the metrics carry no distance. `config` is read
// only; pass a snapshot if another thread may be editing the original.
PredictionResult predict_finish(const TrackMetrics &metrics,
                                double performance_index,
                                const PredictionConfig &config);

PredictionResult predict_finish(const TrackMetrics &metrics,
                                const PerformanceIndices &indices,
                                const PredictionConfig &config);

// Best of the runner's ratings; 400 when none is usable.
double select_performance_index(const PerformanceIndices &indices);
