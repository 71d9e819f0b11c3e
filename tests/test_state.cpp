#include "trip_state/request_keys.hpp"
#include "trip_state/state.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using namespace trip_state;
using namespace std::chrono_literals;

TEST_CASE("tick purges every cache and sweeps jobs", "[state][tick]") {
  ManualClock clock;
  StateConfig cfg;
  cfg.directions.ttl = Duration(1000);
  cfg.imagery.ttl = Duration(1000);
  cfg.feasibility.ttl = Duration(1000);
  cfg.speculative.retention = Duration(1000);
  TripState state(cfg, clock);

  const std::vector<Waypoint> route{{35.0116, 135.7681}, {34.9671, 135.7727}};
  auto fetch = [](const CancellationToken &) -> std::optional<std::string> {
    return "distance_m=4950";
  };
  REQUIRE(state.directions()
              .get(directions_key(TravelMode::Walking, route), fetch)
              .has_value());
  REQUIRE(state.imagery()
              .get(imagery_key("Kyoto, Japan"),
                [](const CancellationToken &) -> std::optional<std::string> {
                  return "https://images.example/kyoto.jpg";
                })
              .has_value());
  state.feasibility().put("US", "Kyoto, Japan", {"yes", 91, ""});
  state.speculative().start(11);

  auto t = state.tick();
  CHECK(t.directions_purged + t.imagery_purged + t.feasibility_purged == 0);
  CHECK(t.jobs_swept == 0);

  clock.advance(1500ms);
  t = state.tick();
  CHECK(t.directions_purged == 1);
  CHECK(t.imagery_purged == 1);
  CHECK(t.feasibility_purged == 1);
  CHECK(t.jobs_swept == 1);
  CHECK(state.directions_cache().size() == 0);
  CHECK(state.imagery_cache().size() == 0);
}

TEST_CASE("tick honours the per-tick purge budget", "[state][tick]") {
  ManualClock clock;
  StateConfig cfg;
  cfg.imagery.ttl = Duration(10);
  cfg.purge_per_tick = 3;
  TripState state(cfg, clock);
  for (int i = 0; i < 5; ++i)
    state.imagery_cache().set("img" + std::to_string(i), "u");
  clock.advance(20ms);
  CHECK(state.tick().imagery_purged == 3);
  CHECK(state.tick().imagery_purged == 2);
}

TEST_CASE("attached sweeper drives the same tick", "[state][sweeper]") {
  ManualClock clock;
  StateConfig cfg;
  cfg.speculative.retention = Duration(1000);
  TripState state(cfg, clock);
  Sweeper sweeper(cfg.speculative.sweep_interval);
  state.attach(sweeper);

  state.speculative().start(5);
  clock.advance(2000ms);
  sweeper.run_once();
  CHECK_FALSE(state.speculative().get_job(5).has_value());
}

TEST_CASE("info prefixes each component", "[state][info]") {
  TripState state(StateConfig{});
  const auto info = state.info();
  CHECK(info.find("directions_max_size:500\n") != std::string::npos);
  CHECK(info.find("imagery_keys:0\n") != std::string::npos);
  CHECK(info.find("feasibility_size:0\n") != std::string::npos);
  CHECK(info.find("speculative_score_threshold:80\n") != std::string::npos);
}
