#include <catch2/catch.hpp>

#include "core/GeoUtils.hpp"
#include "track_fixtures.hpp"

using fixtures::pt;

TEST_CASE("haversine measures great-circle distance in metres", "[geo]") {
  REQUIRE(GeoUtils::haversine(45.0, 6.0, 45.0, 6.0) == 0.0);
  // one degree of latitude on the 6371 km sphere
  REQUIRE(GeoUtils::haversine(45.0, 6.0, 46.0, 6.0) ==
          Approx(111194.9266).margin(0.01));
  REQUIRE(GeoUtils::haversine(pt(45.0, 6.0), pt(45.0 + fixtures::kDegPerKm,
                                                 6.0)) ==
          Approx(1000.0).margin(1e-6));

  // symmetric
  const double ab = GeoUtils::haversine(45.8, 6.8, 45.9, 7.1);
  const double ba = GeoUtils::haversine(45.9, 7.1, 45.8, 6.8);
  REQUIRE(ab == Approx(ba));

  // antipodes stay finite
  REQUIRE(GeoUtils::haversine(0.0, 0.0, 0.0, 180.0) ==
          Approx(M_PI * GeoUtils::kEarthRadiusM));
}

TEST_CASE("elevationDelta ignores samples without elevation", "[geo]") {
  REQUIRE(GeoUtils::elevationDelta(pt(0, 0, 100.0), pt(0, 0, 140.0)) == 40.0);
  REQUIRE(GeoUtils::elevationDelta(pt(0, 0, 140.0), pt(0, 0, 100.0)) == -40.0);
  REQUIRE(GeoUtils::elevationDelta(pt(0, 0), pt(0, 0, 140.0)) == 0.0);
  REQUIRE(GeoUtils::elevationDelta(pt(0, 0, 100.0), pt(0, 0)) == 0.0);
}

TEST_CASE("perpendicularDistanceDeg measures to the segment", "[geo]") {
  const GeoPoint a = pt(0.0, 0.0);
  const GeoPoint b = pt(0.0, 1.0);

  SECTION("point beside the chord") {
    REQUIRE(GeoUtils::perpendicularDistanceDeg(pt(0.5, 0.5), a, b) ==
            Approx(0.5));
  }
  SECTION("point past the end is measured to the endpoint") {
    REQUIRE(GeoUtils::perpendicularDistanceDeg(pt(0.0, 2.0), a, b) ==
            Approx(1.0));
  }
  SECTION("degenerate chord") {
    REQUIRE(GeoUtils::perpendicularDistanceDeg(pt(3.0, 4.0), a, a) ==
            Approx(5.0));
  }
}

TEST_CASE("trackFingerprint identifies geometry only", "[geo][fingerprint]") {
  const Track base = fixtures::meridian(20, 3.0, 1000.0, 1200.0);
  const std::string uid = GeoUtils::trackFingerprint(base);

  REQUIRE(uid.size() == 64);
  REQUIRE(uid.find_first_not_of("0123456789abcdef") == std::string::npos);
  REQUIRE(GeoUtils::trackFingerprint(base) == uid);

  SECTION("elevation and time do not change it") {
    Track other = fixtures::meridian(20, 3.0, 0.0, 0.0);
    for (auto &p : other)
      p.time = 42.0;
    REQUIRE(GeoUtils::trackFingerprint(other) == uid);
  }

  SECTION("consecutive duplicates collapse") {
    Track dup = base;
    dup.insert(dup.begin() + 5, dup[5]);
    REQUIRE(GeoUtils::trackFingerprint(dup) == uid);
  }

  SECTION("sub-micro-degree jitter is rounded away") {
    Track jitter = base;
    jitter[3].lon += 1e-8;
    REQUIRE(GeoUtils::trackFingerprint(jitter) == uid);
  }

  SECTION("different geometry differs") {
    Track moved = base;
    moved[10].lon += 0.001;
    REQUIRE(GeoUtils::trackFingerprint(moved) != uid);

    Track reversed(base.rbegin(), base.rend());
    REQUIRE(GeoUtils::trackFingerprint(reversed) != uid);
  }
}
