#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <vector>

// Douglas-Peucker reduction for storage and map display. The result is lossy:
// feed the original points, not the simplified ones, to the metrics engine.
class TrackSimplifier {
public:
  // ~10 m of latitude
  static constexpr double kDefaultToleranceDeg = 0.0001;

  explicit TrackSimplifier(double tolerance_deg = kDefaultToleranceDeg)
      : tolerance_(tolerance_deg) {}

  // Ordered subset of `points`; first and last are always kept.
  std::vector<GeoPoint> simplify(const std::vector<GeoPoint> &points) const;

  // Indices of the retained points, ascending.
  std::vector<size_t> keptIndices(const std::vector<GeoPoint> &points) const;

  double tolerance() const noexcept { return tolerance_; }

private:
  double tolerance_;
};
