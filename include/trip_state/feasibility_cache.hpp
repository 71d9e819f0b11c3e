#pragma once

#include "trip_state/bounded_cache.hpp"
#include "trip_state/speculative.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trip_state {

struct FeasibilityReport {
  std::string verdict{"no"}; // "yes" | "no" | "warning"
  int score{0};              // 0-100
  std::string summary;
};

struct FeasibilityCorridor {
  std::string passport;
  std::string destination;
  FeasibilityReport report;
};

struct FeasibilityCacheConfig {
  std::size_t max_entries{1000};
  Duration ttl{std::chrono::hours(24)};
};

struct FeasibilityCacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::size_t size{0};
  double hit_rate{0.0}; // percent
};

// Feasibility reports keyed by passport and destination country.
class FeasibilityCache {
public:
  explicit FeasibilityCache(FeasibilityCacheConfig cfg = {},
                            const IClock &clock = system_clock());

  std::optional<FeasibilityReport> get(const std::string &passport,
                                       const std::string &destination);
  void put(const std::string &passport, const std::string &destination,
           const FeasibilityReport &report);
  void warm(const std::vector<FeasibilityCorridor> &corridors);
  void clear();
  std::size_t purge_expired(std::size_t limit);

  FeasibilityCacheStats stats() const;
  std::string info() const;

private:
  BoundedCache<std::string, FeasibilityReport> cache_;
};

// Starts speculative generation for `trip_id` when the report clears the
// tracker's trigger and no job is already running for the trip.
bool maybe_start_speculative(SpeculativeJobTracker &tracker, TripId trip_id,
                             const FeasibilityReport &report);

} // namespace trip_state
