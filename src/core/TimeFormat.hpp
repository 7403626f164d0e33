#pragma once
#include <cmath>
#include <cstdio>
#include <string>

// Display formats shared by the metrics engine, the pacing simulator and the
// predictor. Values are truncated to whole minutes; the tiny bias absorbs
// floating error so that 29.9999999 min prints as 30.

// Largest magnitude whole_minutes() returns (~1.9 million years).
constexpr long kMaxWholeMinutes = 1000000000000L;

// NaN reads as 0, anything beyond +-kMaxWholeMinutes saturates.
inline long whole_minutes(double minutes) {
  if (std::isnan(minutes))
    return 0;
  const double m = std::floor(minutes + 1e-6);
  if (m >= static_cast<double>(kMaxWholeMinutes))
    return kMaxWholeMinutes;
  if (m <= -static_cast<double>(kMaxWholeMinutes))
    return -kMaxWholeMinutes;
  return static_cast<long>(m);
}

// 5.12 h -> "5h07"
inline std::string format_hours_compact(double hours) {
  if (!std::isfinite(hours) || hours < 0)
    hours = 0;
  const long total = whole_minutes(hours * 60.0);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%ldh%02ld", total / 60, total % 60);
  return buf;
}

// Same as format_hours_compact, but anything above 99 h reads ">99h".
inline std::string format_hours_capped(double hours) {
  if (hours > 99)
    return ">99h";
  return format_hours_compact(hours);
}

// 95 min -> "01h35"
inline std::string format_elapsed(double minutes) {
  if (!std::isfinite(minutes) || minutes < 0)
    minutes = 0;
  const long total = whole_minutes(minutes);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02ldh%02ld", total / 60, total % 60);
  return buf;
}

// Minutes since midnight (any magnitude) -> "HH:MM", wrapped to 24 h.
inline std::string format_time_of_day(double minutes_since_midnight) {
  constexpr long kDay = 24 * 60;
  if (!std::isfinite(minutes_since_midnight))
    minutes_since_midnight = 0;
  long total = whole_minutes(minutes_since_midnight) % kDay;
  if (total < 0)
    total += kDay;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
  return buf;
}
