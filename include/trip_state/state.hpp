#pragma once

#include "trip_state/bounded_cache.hpp"
#include "trip_state/cached_lookup.hpp"
#include "trip_state/config.hpp"
#include "trip_state/feasibility_cache.hpp"
#include "trip_state/speculative.hpp"
#include "trip_state/sweeper.hpp"

#include <string>

namespace trip_state {

using PayloadCache = BoundedCache<std::string, std::string>;

struct TickStats {
  std::size_t directions_purged{0};
  std::size_t imagery_purged{0};
  std::size_t feasibility_purged{0};
  std::size_t jobs_swept{0};
};

// The process's shared lookup caches and speculative tracker, built from one
// StateConfig and handed by reference to whatever needs them.
class TripState {
public:
  explicit TripState(const StateConfig &cfg,
                     const IClock &clock = system_clock());

  TripState(const TripState &) = delete;
  TripState &operator=(const TripState &) = delete;

  PayloadCache &directions_cache() { return directions_cache_; }
  PayloadCache &imagery_cache() { return imagery_cache_; }
  CachedLookup<std::string> &directions() { return directions_; }
  CachedLookup<std::string> &imagery() { return imagery_; }
  FeasibilityCache &feasibility() { return feasibility_; }
  SpeculativeJobTracker &speculative() { return speculative_; }

  // Bounded expiry purge on every cache plus a tracker sweep.
  TickStats tick();
  void attach(Sweeper &sweeper);

  std::string info() const;

private:
  std::size_t purge_per_tick_;
  PayloadCache directions_cache_;
  PayloadCache imagery_cache_;
  CachedLookup<std::string> directions_;
  CachedLookup<std::string> imagery_;
  FeasibilityCache feasibility_;
  SpeculativeJobTracker speculative_;
};

} // namespace trip_state
