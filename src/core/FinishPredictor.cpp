#include "core/FinishPredictor.hpp"

#include "core/MetricsEngine.hpp"
#include "core/TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {

// Hours at the intensity named by `key`. A multiplier that would make the
// time negative, zero or non-finite is replaced by its built-in default.
double intensity_hours(double effort_km, double speed_kmeh,
                       const PredictionConfig &config, const char *key) {
  const double m = config.get(key);
  const double hours = effort_km / (speed_kmeh * m);
  if (m > 0 && std::isfinite(hours) && hours > 0)
    return hours;
  const double fallback = PredictionConfig::defaultValues().at(key);
  std::cerr << "[predict] coefficient '" << key << "' = " << m
            << " gives no usable time, using " << fallback << "\n";
  return effort_km / (speed_kmeh * fallback);
}

} // namespace

double
FinishPredictor::selectPerformanceIndex(const PerformanceIndices &indices) {
  double best = 0.0;
  bool found = false;
  for (const auto &v :
       {indices.utmb_index, indices.itra_score, indices.betrail_score}) {
    if (!v || !std::isfinite(*v) || *v <= 0)
      continue;
    best = found ? std::max(best, *v) : *v;
    found = true;
  }
  return found ? best : kDefaultPerformanceIndex;
}

double FinishPredictor::technicalityFactor(double gradient_ratio,
                                           const PredictionConfig &config) {
  double factor = 1.0;
  if (gradient_ratio > config.get(kTech1Threshold)) // hilly
    factor = config.get(kTech1Factor);
  if (gradient_ratio > config.get(kTech2Threshold)) // mountain
    factor = config.get(kTech2Factor);
  if (gradient_ratio > config.get(kTech3Threshold)) // alpine / vertical
    factor = config.get(kTech3Factor);
  return factor;
}

double FinishPredictor::decayFactor(double effort_km,
                                    const PredictionConfig &config) {
  const double start = config.get(kDecayStartKm);
  const double step = config.get(kDecayStepKm);
  if (effort_km <= start || step <= 0)
    return 1.0;

  double decay = (effort_km - start) / step * config.get(kDecayRatePerStep);
  decay = std::min(decay, config.get(kDecayMaxTotal));
  return 1.0 - decay;
}

PredictionResult FinishPredictor::predict(const TrackMetrics &metrics,
                                          double performance_index,
                                          const PredictionConfig &config) const {
  return predict(metrics.distance_km, metrics.elevation_gain_m,
                 performance_index, config);
}

PredictionResult FinishPredictor::predict(double distance_km,
                                          double elevation_gain_m,
                                          double performance_index,
                                          const PredictionConfig &config) const {
  PredictionResult r;
  if (!std::isfinite(distance_km) || distance_km <= 0) {
    r.available = false;
    r.status = CoreStatus::Unavailable;
    return r;
  }
  if (!std::isfinite(performance_index))
    performance_index = kDefaultPerformanceIndex;
  if (!std::isfinite(elevation_gain_m) || elevation_gain_m < 0)
    elevation_gain_m = 0;

  r.available = true;
  r.status = CoreStatus::Ok;
  r.performance_index = performance_index;
  r.vo2max_estimate = performance_index / kVo2maxDivisor;

  // Same normalisation as the metrics engine, recomputed here so the
  // predictor only needs two numbers.
  r.effort_km = MetricsEngine::effortScore(distance_km, elevation_gain_m);
  r.gradient_ratio = elevation_gain_m / distance_km;

  r.base_speed_kmeh = config.get(kBaseSpeedSlope) * performance_index -
                      config.get(kBaseSpeedIntercept);
  r.base_speed_kmeh = std::max(r.base_speed_kmeh, config.get(kMinSpeed));

  r.technicality_factor = technicalityFactor(r.gradient_ratio, config);
  r.decay_factor = decayFactor(r.effort_km, config);

  r.adjusted_speed_kmeh =
      r.base_speed_kmeh * r.technicality_factor * r.decay_factor;
  if (!std::isfinite(r.adjusted_speed_kmeh) ||
      r.adjusted_speed_kmeh < kAbsoluteMinSpeedKmeh)
    r.adjusted_speed_kmeh = kAbsoluteMinSpeedKmeh;

  r.endurance_hours = intensity_hours(r.effort_km, r.adjusted_speed_kmeh,
                                      config, kEnduranceMultiplier);
  r.race_hours = r.effort_km / r.adjusted_speed_kmeh;
  r.push_hours = intensity_hours(r.effort_km, r.adjusted_speed_kmeh, config,
                                 kPushMultiplier);

  r.endurance = format_hours_capped(r.endurance_hours);
  r.race = format_hours_capped(r.race_hours);
  r.push = format_hours_capped(r.push_hours);
  return r;
}
