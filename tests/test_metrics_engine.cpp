#include <catch2/catch.hpp>

#include "core/MetricsEngine.hpp"
#include "track_fixtures.hpp"
#include <algorithm>

using fixtures::pt;

namespace {
bool hasTag(const TrackAttributes &a, const std::string &tag) {
  return std::find(a.tags.begin(), a.tags.end(), tag) != a.tags.end();
}
} // namespace

TEST_CASE("flat square loop", "[metrics]") {
  const TrackMetrics m = MetricsEngine().compute(fixtures::squareLoop());

  REQUIRE(m.status == CoreStatus::Ok);
  REQUIRE(m.distance_km == Approx(4.0).margin(0.01));
  REQUIRE(m.elevation_gain_m == 0.0);
  REQUIRE(m.elevation_loss_m == 0.0);
  REQUIRE(m.route_type == RouteType::Loop);
  REQUIRE(m.effort_score == Approx(m.distance_km));
  REQUIRE(m.estimated_itra_points == 0);
  REQUIRE(m.max_slope_pct == 0.0);
  REQUIRE(m.avg_altitude_m == 500.0);
  REQUIRE(m.attributes.tags.empty());
  REQUIRE_FALSE(m.attributes.is_high_mountain);
}

TEST_CASE("single steady climb", "[metrics]") {
  // 10 points, 1000 m -> 1500 m over 5 km
  const Track track = fixtures::meridian(10, 5.0, 1000.0, 1500.0);
  const TrackMetrics m = MetricsEngine().compute(track);

  REQUIRE(m.status == CoreStatus::Ok);
  REQUIRE(m.distance_km == Approx(5.0).margin(1e-9));
  REQUIRE(m.elevation_gain_m == Approx(500.0));
  REQUIRE(m.elevation_loss_m == Approx(0.0).margin(1e-9));
  REQUIRE(m.effort_score == Approx(10.0));
  REQUIRE(m.max_altitude_m == 1500.0);
  REQUIRE(m.min_altitude_m == 1000.0);
  REQUIRE(m.avg_altitude_m == Approx(1250.0));
  REQUIRE(m.longest_climb_m == Approx(500.0));
  REQUIRE(m.max_slope_pct == Approx(10.0));
  REQUIRE(m.avg_uphill_slope_pct == Approx(10.0));
  REQUIRE(m.route_type == RouteType::PointToPoint);
  REQUIRE(m.estimated_itra_points == 0);

  REQUIRE(m.start_point);
  REQUIRE(m.end_point);
  REQUIRE(m.start_point->lat == track.front().lat);
  REQUIRE(m.end_point->lat == track.back().lat);
  REQUIRE(m.track_uid.size() == 64);

  REQUIRE(m.estimated_times.size() == 3);
  REQUIRE(m.estimated_times[1].profile == "runner");
  REQUIRE(m.estimated_times[1].hours == Approx(5.0 / 8 + 500.0 / 600));
  REQUIRE(m.estimated_times[1].formatted == "1h27");
}

TEST_CASE("descent counts as slope but not as climbing", "[metrics]") {
  const TrackMetrics m =
      MetricsEngine().compute(fixtures::meridian(10, 5.0, 1500.0, 1000.0));
  REQUIRE(m.elevation_gain_m == Approx(0.0).margin(1e-9));
  REQUIRE(m.elevation_loss_m == Approx(500.0));
  REQUIRE(m.max_slope_pct == Approx(10.0));
  REQUIRE(m.avg_uphill_slope_pct == 0.0);
  REQUIRE(m.longest_climb_m == 0.0);
}

TEST_CASE("compute is deterministic", "[metrics]") {
  const Track track = fixtures::meridianProfile(
      {812, 830, 855, 841, 870, 902, 899, 940, 921, 960, 1003}, 0.25);
  const MetricsEngine engine;
  const Json first = engine.compute(track);
  const Json second = engine.compute(track);
  REQUIRE(first.dump() == second.dump());
}

TEST_CASE("degenerate tracks give zeroed metrics", "[metrics]") {
  const MetricsEngine engine;
  for (const Track &t : {Track{}, Track{pt(45.0, 6.0, 1000.0)}}) {
    const TrackMetrics m = engine.compute(t);
    REQUIRE(m.status == CoreStatus::EmptyOrDegenerateTrack);
    REQUIRE(m.distance_km == 0.0);
    REQUIRE(m.elevation_gain_m == 0.0);
    REQUIRE(m.effort_score == 0.0);
    REQUIRE(m.estimated_itra_points == 0);
    REQUIRE_FALSE(m.start_point);
    REQUIRE(m.track_uid.empty());
    REQUIRE(m.estimated_times.size() == 3);
    for (const auto &e : m.estimated_times)
      REQUIRE(e.formatted == "0h00");
  }
}

TEST_CASE("missing elevation contributes nothing", "[metrics]") {
  SECTION("no elevation at all") {
    Track t = fixtures::meridian(6, 2.0);
    for (auto &p : t)
      p.elevation.reset();
    const TrackMetrics m = MetricsEngine().compute(t);
    REQUIRE(m.status == CoreStatus::Ok);
    REQUIRE(m.distance_km == Approx(2.0));
    REQUIRE(m.elevation_gain_m == 0.0);
    REQUIRE(m.max_altitude_m == 0.0);
    REQUIRE(m.max_slope_pct == 0.0);
    REQUIRE(m.avg_uphill_slope_pct == 0.0);
  }

  SECTION("gaps break the delta at that point") {
    Track t = fixtures::meridianProfile({100, 0, 160, 150}, 0.1);
    t[1].elevation.reset();
    const TrackMetrics m = MetricsEngine().compute(t);
    REQUIRE(m.elevation_gain_m == 0.0);
    REQUIRE(m.elevation_loss_m == Approx(10.0));
    REQUIRE(m.max_altitude_m == 160.0);
    REQUIRE(m.min_altitude_m == 100.0);
  }
}

TEST_CASE("sampleSlopes works on chunks of at least 50 m", "[metrics][slope]") {
  // 20 m spacing: a chunk closes every third step
  const Track t = fixtures::meridianProfile({0, 0, 0, 0, 6, 12, 18}, 0.02);
  const auto stats = MetricsEngine::sampleSlopes(t);
  REQUIRE(stats.chunks == 2);
  REQUIRE(stats.max_abs_pct == Approx(30.0));
  REQUIRE(stats.avg_uphill_pct == Approx(30.0));

  // a trailing partial chunk is dropped
  const Track shortTrack = fixtures::meridianProfile({0, 10}, 0.02);
  REQUIRE(MetricsEngine::sampleSlopes(shortTrack).chunks == 0);
}

TEST_CASE("longestClimb tolerates short dips", "[metrics][climb]") {
  SECTION("a 10 m dip keeps the climb going") {
    const Track t = fixtures::meridianProfile({100, 150, 140, 200}, 0.1);
    REQUIRE(MetricsEngine::longestClimb(t) == Approx(110.0));
  }
  SECTION("a 30 m descent ends it") {
    const Track t =
        fixtures::meridianProfile({100, 150, 140, 200, 170, 260}, 0.1);
    REQUIRE(MetricsEngine::longestClimb(t) == Approx(110.0));
  }
  SECTION("the later climb can win") {
    const Track t = fixtures::meridianProfile({100, 130, 90, 300}, 0.1);
    REQUIRE(MetricsEngine::longestClimb(t) == Approx(210.0));
  }
}

TEST_CASE("itraPoints tiers", "[metrics][itra]") {
  REQUIRE(MetricsEngine::itraPoints(0.0) == 0);
  REQUIRE(MetricsEngine::itraPoints(24.9) == 0);
  REQUIRE(MetricsEngine::itraPoints(25.0) == 1);
  REQUIRE(MetricsEngine::itraPoints(39.9) == 1);
  REQUIRE(MetricsEngine::itraPoints(40.0) == 2);
  REQUIRE(MetricsEngine::itraPoints(65.0) == 3);
  REQUIRE(MetricsEngine::itraPoints(90.0) == 4);
  REQUIRE(MetricsEngine::itraPoints(140.0) == 5);
  REQUIRE(MetricsEngine::itraPoints(189.9) == 5);
  REQUIRE(MetricsEngine::itraPoints(190.0) == 6);
  REQUIRE(MetricsEngine::itraPoints(400.0) == 6);
}

TEST_CASE("ibp index rewards steep climbing", "[metrics]") {
  // 100 m steps climbing 20 m each: 20 % grade
  const TrackMetrics steep =
      MetricsEngine().compute(fixtures::meridian(11, 1.0, 0.0, 200.0));
  REQUIRE(steep.effort_score == Approx(3.0));
  REQUIRE(steep.ibp_index == 3); // 3.0 * 1.1

  // 5 % grade, no bonus
  const TrackMetrics gentle =
      MetricsEngine().compute(fixtures::meridian(11, 1.0, 0.0, 50.0));
  REQUIRE(gentle.effort_score == Approx(1.5));
  REQUIRE(gentle.ibp_index == 1);
}

TEST_CASE("classifyRoute uses the 200 m loop threshold", "[metrics]") {
  const GeoPoint start = pt(45.0, 6.0);
  REQUIRE(MetricsEngine::classifyRoute(
              start, pt(45.0 + 0.15 * fixtures::kDegPerKm, 6.0)) ==
          RouteType::Loop);
  REQUIRE(MetricsEngine::classifyRoute(
              start, pt(45.0 + 0.25 * fixtures::kDegPerKm, 6.0)) ==
          RouteType::PointToPoint);
}

TEST_CASE("estimateTimes uses fixed profiles", "[metrics]") {
  const auto times = MetricsEngine::estimateTimes(10.0, 1000.0);
  REQUIRE(times.size() == 3);
  REQUIRE(times[0].profile == "hiker");
  REQUIRE(times[0].formatted == "5h50");
  REQUIRE(times[1].profile == "runner");
  REQUIRE(times[1].formatted == "2h55");
  REQUIRE(times[2].profile == "elite");
  REQUIRE(times[2].formatted == "1h40");
}

TEST_CASE("inferAttributes tags", "[metrics]") {
  TrackMetrics m;
  m.distance_km = 10.0;
  m.elevation_gain_m = 1000.0;
  m.max_altitude_m = 2500.0;
  m.max_slope_pct = 35.0;

  auto a = MetricsEngine::inferAttributes(m);
  REQUIRE(a.is_high_mountain);
  REQUIRE(hasTag(a, "high_mountain"));
  REQUIRE(hasTag(a, "skyrunning"));
  REQUIRE_FALSE(hasTag(a, "vertical"));

  m.distance_km = 5.0; // 200 m D+ per km
  m.max_altitude_m = 2000.0;
  a = MetricsEngine::inferAttributes(m);
  REQUIRE_FALSE(a.is_high_mountain);
  REQUIRE(hasTag(a, "vertical"));
  REQUIRE_FALSE(hasTag(a, "skyrunning"));

  m.distance_km = 0.0;
  REQUIRE(MetricsEngine::inferAttributes(m).tags.empty());
}
