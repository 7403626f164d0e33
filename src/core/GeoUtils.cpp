#include "core/GeoUtils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_lambda = (lon2 - lon1) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_lambda / 2), 2);
  return 2 * kEarthRadiusM * asin(sqrt(std::min(1.0, h)));
}

double GeoUtils::haversine(const GeoPoint &p1, const GeoPoint &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}

double GeoUtils::elevationDelta(const GeoPoint &a, const GeoPoint &b) {
  if (!a.elevation || !b.elevation)
    return 0.0;
  return *b.elevation - *a.elevation;
}

double GeoUtils::perpendicularDistanceDeg(const GeoPoint &p,
                                          const GeoPoint &a,
                                          const GeoPoint &b) {
  // x = lon, y = lat
  const double vx = b.lon - a.lon, vy = b.lat - a.lat;
  const double wx = p.lon - a.lon, wy = p.lat - a.lat;
  const double L2 = vx * vx + vy * vy;
  if (L2 <= 0.0)
    return std::hypot(wx, wy); // degenerate chord: distance to the point a
  double t = (wx * vx + wy * vy) / L2;
  t = std::max(0.0, std::min(1.0, t));
  const double fx = a.lon + t * vx, fy = a.lat + t * vy;
  return std::hypot(p.lon - fx, p.lat - fy);
}

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

static inline bool near_eq(double a, double b, double eps = 1e-7) {
  return std::abs(a - b) <= eps;
}

std::string GeoUtils::trackFingerprint(const std::vector<GeoPoint> &pts) {
  // 1) normalize geometry in forward order
  std::vector<std::pair<double, double>> norm;
  norm.reserve(pts.size());
  for (const auto &p : pts) {
    double rlat = std::round(p.lat * 1e6) / 1e6;
    double rlon = std::round(p.lon * 1e6) / 1e6;
    if (norm.empty() || !near_eq(norm.back().first, rlat) ||
        !near_eq(norm.back().second, rlon))
      norm.emplace_back(rlat, rlon);
  }

  // 2) fingerprint payload: "v1|EPSG:4326|F|lat,lon;lat,lon;..."
  std::ostringstream csv;
  csv << std::fixed << std::setprecision(6);
  for (size_t i = 0; i < norm.size(); ++i) {
    if (i)
      csv << ';';
    csv << norm[i].first << ',' << norm[i].second;
  }
  const std::string material = "v1|EPSG:4326|F|" + csv.str();

  // 3) SHA-256
  std::array<uint8_t, SHA256_DIGEST_LENGTH> uid{};
  SHA256(reinterpret_cast<const unsigned char *>(material.data()),
         material.size(), uid.data());
  return to_hex(uid.data(), uid.size());
}
