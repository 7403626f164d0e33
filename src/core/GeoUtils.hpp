#pragma once
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;

  // haversine formulas, result in metres
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const GeoPoint &p1, const GeoPoint &p2);

  // Elevation change from a to b; 0 when either sample lacks elevation.
  static double elevationDelta(const GeoPoint &a, const GeoPoint &b);

  // Distance from p to the segment [a,b] measured in the raw lat/lon plane
  // (degree units). Used by the simplifier, whose tolerance is in degrees.
  static double perpendicularDistanceDeg(const GeoPoint &p, const GeoPoint &a,
                                         const GeoPoint &b);

  // Stable identity of a track's geometry: SHA-256 over coordinates rounded
  // to 1e-6 deg with consecutive duplicates removed, hex encoded. Elevation
  // and time do not take part.
  static std::string trackFingerprint(const std::vector<GeoPoint> &pts);
};
