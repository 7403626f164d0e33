// TrackSimplifier: iterative Douglas-Peucker over lat/lon degrees.

#include "core/TrackSimplifier.hpp"

#include "core/GeoUtils.hpp"
#include <utility>

std::vector<size_t>
TrackSimplifier::keptIndices(const std::vector<GeoPoint> &points) const {
  const size_t n = points.size();
  std::vector<size_t> out;
  if (n <= 2) {
    for (size_t i = 0; i < n; ++i)
      out.push_back(i);
    return out;
  }

  std::vector<bool> keep(n, false);
  keep.front() = true;
  keep.back() = true;

  // explicit stack of [first,last] spans instead of recursion, long tracks
  // have hundreds of thousands of points
  std::vector<std::pair<size_t, size_t>> spans;
  spans.emplace_back(0, n - 1);
  while (!spans.empty()) {
    const auto [first, last] = spans.back();
    spans.pop_back();
    if (last <= first + 1)
      continue;

    double worst = -1.0;
    size_t worst_idx = first;
    for (size_t i = first + 1; i < last; ++i) {
      const double d = GeoUtils::perpendicularDistanceDeg(
          points[i], points[first], points[last]);
      if (d > worst) {
        worst = d;
        worst_idx = i;
      }
    }
    if (worst > tolerance_) {
      keep[worst_idx] = true;
      spans.emplace_back(first, worst_idx);
      spans.emplace_back(worst_idx, last);
    }
  }

  for (size_t i = 0; i < n; ++i) {
    if (keep[i])
      out.push_back(i);
  }
  return out;
}

std::vector<GeoPoint>
TrackSimplifier::simplify(const std::vector<GeoPoint> &points) const {
  std::vector<GeoPoint> out;
  const auto idx = keptIndices(points);
  out.reserve(idx.size());
  for (size_t i : idx)
    out.push_back(points[i]);
  return out;
}
