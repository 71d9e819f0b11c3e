#pragma once

#include "trip_state/bounded_cache.hpp"
#include "trip_state/feasibility_cache.hpp"
#include "trip_state/log.hpp"
#include "trip_state/speculative.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace trip_state {

struct StateConfig {
  BoundedCacheConfig directions{500, std::chrono::hours(24)};
  BoundedCacheConfig imagery{500, std::chrono::hours(24)};
  FeasibilityCacheConfig feasibility{};
  SpeculativeConfig speculative{};
  std::size_t purge_per_tick{128};
  LogLevel log_level{LogLevel::Info};
};

// Reads a flat JSON object. Unknown keys are ignored and known ones are
// clamped to sane ranges. On failure `cfg` is left untouched.
bool load_config(const std::string &path, StateConfig &cfg,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, StateConfig &cfg,
                  std::string *err = nullptr);

std::string describe(const StateConfig &cfg);

// Whole-string integer parsing for command arguments. Out-of-range or
// trailing text fails and leaves `out` unchanged.
bool parse_i64(const std::string &s, std::int64_t &out);
bool parse_int(const std::string &s, int &out);

} // namespace trip_state
