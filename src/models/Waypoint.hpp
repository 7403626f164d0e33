#pragma once

#include "models/CoreTypes.hpp"
#include <cctype>
#include <string>

// What the runner finds at a waypoint.
enum class WaypointKind : uint8_t {
  Start = 0,
  Finish,
  Checkpoint,
  Water,
  Food,
  BaseCamp
};

inline const char *WaypointKindToString(WaypointKind kind) {
  switch (kind) {
  case WaypointKind::Start:
    return "start";
  case WaypointKind::Finish:
    return "finish";
  case WaypointKind::Checkpoint:
    return "checkpoint";
  case WaypointKind::Water:
    return "water";
  case WaypointKind::Food:
    return "food";
  case WaypointKind::BaseCamp:
    return "base_camp";
  }
  return "checkpoint";
}

// Accepts the labels the upstream event data uses, case-insensitively.
// Anything unrecognised is a plain checkpoint.
inline WaypointKind WaypointKindFromString(const std::string &value) {
  std::string s;
  s.reserve(value.size());
  for (char c : value)
    s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "start" || s == "depart")
    return WaypointKind::Start;
  if (s == "finish" || s == "arrivee")
    return WaypointKind::Finish;
  if (s == "water")
    return WaypointKind::Water;
  if (s == "food" || s == "ravito")
    return WaypointKind::Food;
  if (s == "base_camp" || s == "basecamp" || s == "base_vie")
    return WaypointKind::BaseCamp;
  return WaypointKind::Checkpoint;
}

// A named checkpoint at a given distance along the track.
struct Waypoint {
  double distance_km = 0.0;
  std::string name;
  WaypointKind kind = WaypointKind::Checkpoint;
};

// --- Waypoint ----
inline void from_json(const Json &j, Waypoint &w) {
  if (j.contains("km"))
    w.distance_km = j.at("km").get<double>();
  else
    w.distance_km = j.value("distance_km", 0.0);
  w.name = j.value("name", "");
  if (j.contains("type"))
    w.kind = WaypointKindFromString(j.at("type").get<std::string>());
  else if (j.contains("kind"))
    w.kind = WaypointKindFromString(j.at("kind").get<std::string>());
  else
    w.kind = WaypointKind::Checkpoint;
}

inline void to_json(Json &j, const Waypoint &w) {
  j = Json{{"km", w.distance_km},
           {"name", w.name},
           {"type", WaypointKindToString(w.kind)}};
}
