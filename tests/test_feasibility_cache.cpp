#include "trip_state/feasibility_cache.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

using namespace trip_state;
using namespace std::chrono_literals;

TEST_CASE("reports are shared across cities of one country",
          "[feasibility][keys]") {
  ManualClock clock;
  FeasibilityCache fc({}, clock);
  fc.put("India", "Tokyo, Japan", {"yes", 92, "visa on arrival"});
  auto r = fc.get("india", "Osaka, Japan");
  REQUIRE(r.has_value());
  CHECK(r->verdict == "yes");
  CHECK(r->score == 92);
  CHECK_FALSE(fc.get("India", "Seoul, South Korea").has_value());
}

TEST_CASE("reports expire after a day", "[feasibility][ttl]") {
  ManualClock clock;
  FeasibilityCache fc({}, clock);
  fc.put("US", "Portugal", {"yes", 85, ""});
  clock.advance(std::chrono::hours(23));
  CHECK(fc.get("US", "Portugal").has_value());
  clock.advance(std::chrono::hours(2));
  CHECK_FALSE(fc.get("US", "Portugal").has_value());
}

TEST_CASE("capacity evicts least recently used corridor",
          "[feasibility][lru]") {
  ManualClock clock;
  FeasibilityCacheConfig cfg;
  cfg.max_entries = 2;
  FeasibilityCache fc(cfg, clock);
  fc.put("US", "France", {"yes", 90, ""});
  fc.put("US", "Spain", {"yes", 88, ""});
  fc.get("US", "France");
  fc.put("US", "Italy", {"no", 20, ""});
  CHECK(fc.get("US", "France").has_value());
  CHECK_FALSE(fc.get("US", "Spain").has_value());
  CHECK(fc.stats().evictions == 1);
}

TEST_CASE("stats track hit rate and warm-up", "[feasibility][stats]") {
  ManualClock clock;
  FeasibilityCache fc({}, clock);
  fc.warm({{"UK", "Paris, France", {"yes", 95, ""}},
           {"UK", "Berlin, Germany", {"yes", 94, ""}}});
  fc.get("uk", "Lyon, France");
  fc.get("uk", "Munich, Germany");
  fc.get("uk", "Rome, Italy");
  fc.get("uk", "Nice, France");

  const auto s = fc.stats();
  CHECK(s.size == 2);
  CHECK(s.hits == 3);
  CHECK(s.misses == 1);
  CHECK(s.hit_rate == 75.0);
  CHECK(fc.info().find("hit_rate:75.0%") != std::string::npos);

  fc.clear();
  CHECK(fc.stats().size == 0);
}

TEST_CASE("high confidence reports start speculative generation once",
          "[feasibility][speculative]") {
  ManualClock clock;
  SpeculativeJobTracker tracker({}, clock);
  CHECK_FALSE(maybe_start_speculative(tracker, 1, {"yes", 70, ""}));
  CHECK_FALSE(maybe_start_speculative(tracker, 1, {"warning", 95, ""}));
  CHECK_FALSE(tracker.get_job(1).has_value());

  REQUIRE(maybe_start_speculative(tracker, 1, {"yes", 88, ""}));
  tracker.update(1, 2);
  CHECK_FALSE(maybe_start_speculative(tracker, 1, {"yes", 90, ""}));
  CHECK(tracker.get_job(1)->days_generated == 2);

  tracker.update(1, 3);
  CHECK(maybe_start_speculative(tracker, 1, {"yes", 90, ""}));
  CHECK(tracker.get_job(1)->days_generated == 0);
}
