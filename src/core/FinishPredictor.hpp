#pragma once
#include "models/PredictionConfig.hpp"
#include "models/Prediction.hpp"
#include "models/TrackMetrics.hpp"

// Finish-time estimate for three intensities from aggregate track metrics and
// a runner performance index. All tunables come from the PredictionConfig
// passed in; nothing is cached between calls.
class FinishPredictor {
public:
  static constexpr double kDefaultPerformanceIndex = 400.0; // novice
  static constexpr double kAbsoluteMinSpeedKmeh = 2.5;
  static constexpr double kVo2maxDivisor = 11.6;

  FinishPredictor() = default;

  // Unavailable (available == false) when distance_km is not positive.
  PredictionResult predict(const TrackMetrics &metrics,
                           double performance_index,
                           const PredictionConfig &config) const;

  PredictionResult predict(double distance_km, double elevation_gain_m,
                           double performance_index,
                           const PredictionConfig &config) const;

  // Best of the supplied ratings, or kDefaultPerformanceIndex.
  static double selectPerformanceIndex(const PerformanceIndices &indices);

  // Average-grade penalty. The steepest threshold exceeded wins.
  static double technicalityFactor(double gradient_ratio,
                                   const PredictionConfig &config);

  // Long-race derating on total km-effort.
  static double decayFactor(double effort_km, const PredictionConfig &config);
};
