#pragma once

#include "models/CoreTypes.hpp"
#include "models/TrackMetrics.hpp" // round_to
#include <optional>
#include <string>

// External runner ratings. Only their numeric values matter here.
struct PerformanceIndices {
  std::optional<double> utmb_index;
  std::optional<double> itra_score;
  std::optional<double> betrail_score;
};

// Output of the finish-time predictor for one track and one runner.
struct PredictionResult {
  bool available = false;
  CoreStatus status = CoreStatus::Unavailable;

  double performance_index = 0.0;
  double vo2max_estimate = 0.0; // ml/kg/min proxy
  double effort_km = 0.0;
  double gradient_ratio = 0.0; // m of climb per km
  double base_speed_kmeh = 0.0;
  double technicality_factor = 1.0;
  double decay_factor = 1.0;
  double adjusted_speed_kmeh = 0.0; // km-effort per hour

  double endurance_hours = 0.0;
  double race_hours = 0.0;
  double push_hours = 0.0;
  std::string endurance; // "HhMM" or ">99h"
  std::string race;
  std::string push;
};

inline void from_json(const Json &j, PerformanceIndices &p) {
  auto opt = [&j](const char *key) -> std::optional<double> {
    if (j.contains(key) && j[key].is_number())
      return j[key].get<double>();
    return std::nullopt;
  };
  p.utmb_index = opt("utmb_index");
  p.itra_score = opt("itra_score");
  p.betrail_score = opt("betrail_score");
}

inline void to_json(Json &j, const PredictionResult &r) {
  if (!r.available) {
    j = Json{{"prediction_available", false},
             {"status", CoreStatusToString(r.status)}};
    return;
  }
  j = Json::object();
  j["prediction_available"] = true;
  j["status"] = CoreStatusToString(r.status);
  j["user_index"] = r.performance_index;
  j["vo2max_est"] = round_to(r.vo2max_estimate, 1);
  j["km_effort"] = round_to(r.effort_km, 1);
  j["adjusted_speed_kmeh"] = round_to(r.adjusted_speed_kmeh, 2);
  j["times"] = {{"endurance", r.endurance}, {"race", r.race}, {"push", r.push}};
  j["raw_hours"] = {{"race", round_to(r.race_hours, 2)}};
}
