#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

//------------------------------------------------------------------------------
// PredictionConfig: named coefficients for the finish-time predictor.
//
// A default-constructed config holds the built-in defaults. Overrides (from a
// caller or from the coefficient file) replace individual keys; keys they do
// not mention keep their default. Instances are plain values: pass a copy or
// a const reference into the predictor and it never changes them.
//------------------------------------------------------------------------------

// Coefficient names
inline constexpr const char *kBaseSpeedSlope = "base_speed_slope";
inline constexpr const char *kBaseSpeedIntercept = "base_speed_intercept";
inline constexpr const char *kMinSpeed = "min_speed_kmeh";
inline constexpr const char *kTech1Threshold = "tech_factor_1_threshold";
inline constexpr const char *kTech1Factor = "tech_factor_1_hilly";
inline constexpr const char *kTech2Threshold = "tech_factor_2_threshold";
inline constexpr const char *kTech2Factor = "tech_factor_2_mountain";
inline constexpr const char *kTech3Threshold = "tech_factor_3_threshold";
inline constexpr const char *kTech3Factor = "tech_factor_3_alpine";
inline constexpr const char *kDecayStartKm = "decay_start_km";
inline constexpr const char *kDecayStepKm = "decay_step_km";
inline constexpr const char *kDecayRatePerStep = "decay_rate_per_step";
inline constexpr const char *kDecayMaxTotal = "decay_max_total";
inline constexpr const char *kEnduranceMultiplier = "endurance_multiplier";
inline constexpr const char *kPushMultiplier = "push_multiplier";

class PredictionConfig {
public:
  using Overrides = std::unordered_map<std::string, double>;

  PredictionConfig();

  static const Overrides &defaultValues();

  // Defaults with every recognised numeric key of `j` applied on top.
  static PredictionConfig fromJson(const nlohmann::json &j);

  // Read a coefficient file and merge it over the defaults. Throws
  // std::runtime_error if the file cannot be opened or is not valid JSON.
  static PredictionConfig loadFromFile(const std::string &filepath);

  // loadFromFile, but a missing or broken file only logs a warning and the
  // built-in defaults are returned.
  static PredictionConfig loadOrDefaults(const std::string &filepath);

  // Extract numeric overrides from a JSON object. Unknown keys and values
  // that are not numbers (or numeric strings) are skipped with a warning.
  static Overrides overridesFromJson(const nlohmann::json &j);

  // Copy of this config with `overrides` applied; override wins.
  PredictionConfig merged(const Overrides &overrides) const;

  bool contains(const std::string &key) const;

  // Throws std::runtime_error if key is not a known coefficient.
  double get(const std::string &key) const;

  const Overrides &values() const { return coeffs_; }
  nlohmann::json toJson() const;

private:
  Overrides coeffs_;
};
