#include "trip_state/config.hpp"

#include <catch2/catch.hpp>

#include <fstream>
#include <string>

using namespace trip_state;

TEST_CASE("defaults follow the documented constants", "[config]") {
  StateConfig cfg;
  CHECK(cfg.speculative.score_threshold == 80);
  CHECK(cfg.speculative.max_speculative_days == 3);
  CHECK(cfg.speculative.retention == std::chrono::minutes(10));
  CHECK(cfg.speculative.sweep_interval == std::chrono::minutes(5));
  CHECK(cfg.feasibility.max_entries == 1000);
  CHECK(cfg.feasibility.ttl == std::chrono::hours(24));
  CHECK(cfg.directions.max_size == 500);
}

TEST_CASE("config file overrides and clamps values", "[config]") {
  const char *path = "trip_state_config_good.json";
  std::ofstream out(path);
  out << R"({
    "directions_cache_size": 0,
    "directions_ttl_ms": 60000,
    "imagery_ttl_ms": 0,
    "speculative_score_threshold": 250,
    "max_speculative_days": 5,
    "speculative_retention_ms": 10,
    "sweep_interval_ms": 30000,
    "log_level": "warn"
  })";
  out.close();

  StateConfig cfg;
  std::string err;
  REQUIRE(load_config(path, cfg, &err));
  CHECK(cfg.directions.max_size == 1);
  CHECK(cfg.directions.ttl == Duration(60000));
  CHECK_FALSE(cfg.imagery.ttl.has_value());
  CHECK(cfg.speculative.score_threshold == 100);
  CHECK(cfg.speculative.max_speculative_days == 5);
  CHECK(cfg.speculative.retention == Duration(1000));
  CHECK(cfg.speculative.sweep_interval == Duration(30000));
  CHECK(cfg.log_level == LogLevel::Warn);
  CHECK(cfg.feasibility.max_entries == 1000);

  const auto d = describe(cfg);
  CHECK(d.find("imagery_ttl_ms:-1\n") != std::string::npos);
  CHECK(d.find("max_speculative_days:5\n") != std::string::npos);
}

TEST_CASE("invalid config is rejected atomically", "[config]") {
  StateConfig cfg;
  std::string err;
  CHECK_FALSE(parse_config("not-json", cfg, &err));
  CHECK(err == "invalid schema");

  CHECK_FALSE(parse_config(
      R"({"max_speculative_days": 9, "log_level": "chatty"})", cfg, &err));
  CHECK(err.find("log_level") != std::string::npos);
  CHECK(cfg.speculative.max_speculative_days == 3);

  CHECK_FALSE(load_config("does/not/exist.json", cfg, &err));
  CHECK(err.find("not found") != std::string::npos);
}

TEST_CASE("command arguments reject values that do not fit", "[config][args]") {
  int n = 7;
  CHECK(parse_int("3", n));
  CHECK(n == 3);
  CHECK(parse_int("-5", n));
  CHECK(n == -5);

  n = 7;
  CHECK_FALSE(parse_int("4294967299", n));
  CHECK_FALSE(parse_int("-2147483649", n));
  CHECK_FALSE(parse_int("99999999999999999999", n));
  CHECK_FALSE(parse_int("3days", n));
  CHECK_FALSE(parse_int("", n));
  CHECK(n == 7);

  std::int64_t id = 0;
  CHECK(parse_i64("4294967299", id));
  CHECK(id == 4294967299LL);
}
