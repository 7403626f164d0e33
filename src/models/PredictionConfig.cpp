#include "models/PredictionConfig.hpp"

#include "debug/json_debug.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

const PredictionConfig::Overrides &PredictionConfig::defaultValues() {
  static const Overrides defaults = {
      {kBaseSpeedSlope, 0.024},     {kBaseSpeedIntercept, 4.0},
      {kMinSpeed, 3.0},             {kTech1Threshold, 40.0},
      {kTech1Factor, 0.95},         {kTech2Threshold, 60.0},
      {kTech2Factor, 0.85},         {kTech3Threshold, 90.0},
      {kTech3Factor, 0.70},         {kDecayStartKm, 40.0},
      {kDecayStepKm, 20.0},         {kDecayRatePerStep, 0.05},
      {kDecayMaxTotal, 0.40},       {kEnduranceMultiplier, 0.85},
      {kPushMultiplier, 1.15},
  };
  return defaults;
}

PredictionConfig::PredictionConfig() : coeffs_(defaultValues()) {}

PredictionConfig::Overrides
PredictionConfig::overridesFromJson(const json &j) {
  Overrides out;
  if (!j.is_object()) {
    std::cerr << "[config] prediction overrides must be a JSON object, got "
              << j.type_name() << " (ignored)\n";
    return out;
  }
  const auto &known = defaultValues();
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string &key = it.key();
    if (known.find(key) == known.end()) {
      std::cerr << "[config] unknown coefficient '" << key << "' (skipped)\n";
      continue;
    }
    const json &v = it.value();
    if (v.is_number()) {
      out[key] = v.get<double>();
    } else if (v.is_string()) {
      const auto &s = v.get_ref<const std::string &>();
      char *end = nullptr;
      const double d = std::strtod(s.c_str(), &end);
      if (end != s.c_str() && *end == '\0')
        out[key] = d;
      else
        std::cerr << "[config] coefficient '" << key
                  << "' is not numeric: \"" << s << "\" (skipped)\n";
    } else {
      std::cerr << "[config] coefficient '" << key << "' has type "
                << v.type_name() << ", expected number (skipped)\n";
    }
  }
  return out;
}

PredictionConfig PredictionConfig::merged(const Overrides &overrides) const {
  PredictionConfig out = *this;
  for (const auto &kv : overrides) {
    if (!out.contains(kv.first)) {
      std::cerr << "[config] unknown coefficient '" << kv.first
                << "' (skipped)\n";
      continue;
    }
    out.coeffs_[kv.first] = kv.second;
  }
  return out;
}

PredictionConfig PredictionConfig::fromJson(const json &j) {
  return PredictionConfig().merged(overridesFromJson(j));
}

PredictionConfig PredictionConfig::loadFromFile(const std::string &filepath) {
  std::ifstream in(filepath);
  if (!in) {
    throw std::runtime_error("Cannot open prediction config: " + filepath);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  const std::string text = buffer.str();

  json body;
  try {
    body = json::parse(text);
  } catch (const json::parse_error &e) {
    throw std::runtime_error(
        describe_json_error(filepath, text, e.byte, "invalid JSON"));
  }
  return fromJson(body);
}

PredictionConfig
PredictionConfig::loadOrDefaults(const std::string &filepath) {
  try {
    return loadFromFile(filepath);
  } catch (const std::runtime_error &e) {
    std::cerr << "[config] " << e.what() << "\n"
              << "[config] using built-in prediction defaults\n";
  }
  return PredictionConfig();
}

bool PredictionConfig::contains(const std::string &key) const {
  return coeffs_.find(key) != coeffs_.end();
}

double PredictionConfig::get(const std::string &key) const {
  auto it = coeffs_.find(key);
  if (it == coeffs_.end()) {
    throw std::runtime_error("Coefficient '" + key +
                             "' not found in prediction config.");
  }
  return it->second;
}

json PredictionConfig::toJson() const {
  // std::map for a stable key order in the written file
  std::map<std::string, double> ordered(coeffs_.begin(), coeffs_.end());
  json j = json::object();
  for (const auto &kv : ordered)
    j[kv.first] = kv.second;
  return j;
}
