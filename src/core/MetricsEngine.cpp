// MetricsEngine: distance, elevation, slope and effort statistics for a track.
//
// Elevation gain and loss are raw sums of point-to-point deltas. No smoothing
// is applied, so noisy barometric or DEM data inflates both figures; every
// downstream number (effort, ITRA tier, predictor input) is built on these
// raw sums.

#include "core/MetricsEngine.hpp"

#include "core/GeoUtils.hpp"
#include "core/TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace {

struct FlatClimbProfile {
  const char *name;
  double flat_kmh;
  double climb_mh;
};

constexpr FlatClimbProfile kProfiles[] = {
    {"hiker", 4.0, 300.0},
    {"runner", 8.0, 600.0},
    {"elite", 12.0, 1200.0},
};

constexpr double kItraThresholds[] = {25, 40, 65, 90, 140, 190};

// Fold state for the slope sampler: where the current chunk started and how
// far we have walked since.
struct SlopeFold {
  const GeoPoint *chunk_start = nullptr;
  double accumulated_m = 0.0;
  double max_abs = 0.0;
  double uphill_sum = 0.0;
  std::size_t uphill_count = 0;
  std::size_t chunks = 0;
};

} // namespace

double MetricsEngine::effortScore(double distance_km, double elevation_gain_m) {
  return distance_km + elevation_gain_m / kEffortMetresPerKm;
}

int MetricsEngine::itraPoints(double effort_score) {
  int tier = 0;
  for (double t : kItraThresholds) {
    if (effort_score >= t)
      ++tier;
  }
  return tier;
}

RouteType MetricsEngine::classifyRoute(const GeoPoint &start,
                                       const GeoPoint &end) {
  // OutAndBack is never inferred: start/end proximity alone cannot tell it
  // apart from a point-to-point course.
  return GeoUtils::haversine(start, end) < kLoopThresholdM
             ? RouteType::Loop
             : RouteType::PointToPoint;
}

std::vector<ProfileEstimate>
MetricsEngine::estimateTimes(double distance_km, double elevation_gain_m) {
  std::vector<ProfileEstimate> out;
  out.reserve(std::size(kProfiles));
  for (const auto &p : kProfiles) {
    const double hours =
        distance_km / p.flat_kmh + elevation_gain_m / p.climb_mh;
    out.push_back(ProfileEstimate{p.name, hours, format_hours_compact(hours)});
  }
  return out;
}

MetricsEngine::SlopeStats
MetricsEngine::sampleSlopes(const std::vector<GeoPoint> &points,
                            double window_m) {
  SlopeStats stats;
  if (points.size() < 2)
    return stats;

  SlopeFold fold;
  fold.chunk_start = &points.front();
  for (size_t i = 1; i < points.size(); ++i) {
    const GeoPoint &p = points[i];
    fold.accumulated_m += GeoUtils::haversine(points[i - 1], p);
    if (fold.accumulated_m < window_m)
      continue;

    const double slope_pct =
        GeoUtils::elevationDelta(*fold.chunk_start, p) / fold.accumulated_m *
        100.0;
    fold.max_abs = std::max(fold.max_abs, std::fabs(slope_pct));
    if (slope_pct > 0) {
      fold.uphill_sum += slope_pct;
      ++fold.uphill_count;
    }
    ++fold.chunks;

    // reset
    fold.chunk_start = &p;
    fold.accumulated_m = 0.0;
  }

  stats.max_abs_pct = fold.max_abs;
  stats.avg_uphill_pct =
      fold.uphill_count ? fold.uphill_sum / fold.uphill_count : 0.0;
  stats.chunks = fold.chunks;
  return stats;
}

double MetricsEngine::longestClimb(const std::vector<GeoPoint> &points) {
  double longest = 0.0;
  double current_gain = 0.0;
  double loss_buffer = 0.0;
  bool have_last = false;
  double last_ele = 0.0;

  for (const auto &p : points) {
    if (!p.elevation)
      continue;
    const double ele = *p.elevation;
    if (!have_last) {
      last_ele = ele;
      have_last = true;
      continue;
    }
    const double diff = ele - last_ele;
    if (diff > 0) {
      // a dip shorter than the break threshold does not end the climb
      current_gain += diff;
      loss_buffer = 0.0;
    } else if (diff < 0) {
      loss_buffer += -diff;
      if (loss_buffer > kClimbBreakLossM) {
        longest = std::max(longest, current_gain);
        current_gain = 0.0;
        loss_buffer = 0.0;
      }
    }
    last_ele = ele;
  }
  return std::max(longest, current_gain);
}

TrackAttributes MetricsEngine::inferAttributes(const TrackMetrics &m) {
  TrackAttributes a;
  if (m.max_altitude_m > kHighMountainM) {
    a.is_high_mountain = true;
    a.tags.push_back("high_mountain");
  }
  const double ratio =
      m.distance_km > 0 ? m.elevation_gain_m / m.distance_km : 0.0;
  if (ratio > 150) // m of D+ per km
    a.tags.push_back("vertical");
  if (m.max_altitude_m > kHighMountainM && m.max_slope_pct > 30)
    a.tags.push_back("skyrunning");
  return a;
}

TrackMetrics MetricsEngine::compute(const std::vector<GeoPoint> &points) const {
  TrackMetrics m;
  m.estimated_times = estimateTimes(0.0, 0.0);
  if (points.size() < 2) {
    m.status = CoreStatus::EmptyOrDegenerateTrack;
    return m;
  }
  m.status = CoreStatus::Ok;

  // 1) distance + raw elevation deltas
  double distance_m = 0.0;
  for (size_t i = 1; i < points.size(); ++i) {
    distance_m += GeoUtils::haversine(points[i - 1], points[i]);
    const double diff = GeoUtils::elevationDelta(points[i - 1], points[i]);
    if (diff > 0)
      m.elevation_gain_m += diff;
    else
      m.elevation_loss_m += -diff;
  }
  m.distance_km = distance_m / 1000.0;

  // 2) altitude stats over samples that carry an elevation
  double ele_sum = 0.0;
  size_t ele_count = 0;
  double ele_min = 0.0, ele_max = 0.0;
  for (const auto &p : points) {
    if (!p.elevation)
      continue;
    const double e = *p.elevation;
    if (ele_count == 0) {
      ele_min = ele_max = e;
    } else {
      ele_min = std::min(ele_min, e);
      ele_max = std::max(ele_max, e);
    }
    ele_sum += e;
    ++ele_count;
  }
  if (ele_count) {
    m.max_altitude_m = ele_max;
    m.min_altitude_m = ele_min;
    m.avg_altitude_m = ele_sum / static_cast<double>(ele_count);
  }

  // 3) slopes
  const SlopeStats slopes = sampleSlopes(points);
  m.max_slope_pct = slopes.max_abs_pct;
  m.avg_uphill_slope_pct = slopes.avg_uphill_pct;
  m.longest_climb_m = longestClimb(points);

  // 4) effort
  m.effort_score = effortScore(m.distance_km, m.elevation_gain_m);
  const double ibp =
      m.avg_uphill_slope_pct > 10 ? m.effort_score * 1.1 : m.effort_score;
  m.ibp_index = static_cast<int>(ibp);
  m.estimated_itra_points = itraPoints(m.effort_score);
  m.estimated_times = estimateTimes(m.distance_km, m.elevation_gain_m);

  // 5) shape
  m.start_point = points.front();
  m.end_point = points.back();
  m.route_type = classifyRoute(points.front(), points.back());
  m.attributes = inferAttributes(m);
  m.track_uid = GeoUtils::trackFingerprint(points);
  return m;
}
