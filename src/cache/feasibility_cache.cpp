#include "trip_state/feasibility_cache.hpp"

#include "trip_state/log.hpp"
#include "trip_state/request_keys.hpp"

#include <iomanip>
#include <sstream>

namespace trip_state {
namespace {
constexpr const char *kComponent = "feasibility_cache";
} // namespace

FeasibilityCache::FeasibilityCache(FeasibilityCacheConfig cfg,
                                   const IClock &clock)
    : cache_({cfg.max_entries, cfg.ttl}, clock) {}

std::optional<FeasibilityReport>
FeasibilityCache::get(const std::string &passport,
                      const std::string &destination) {
  const auto key = feasibility_key(passport, destination);
  auto report = cache_.get(key);
  if (report)
    log_debug(kComponent, "hit: " + key);
  return report;
}

void FeasibilityCache::put(const std::string &passport,
                           const std::string &destination,
                           const FeasibilityReport &report) {
  const auto key = feasibility_key(passport, destination);
  cache_.set(key, report);
  log_debug(kComponent,
            "cached: " + key + " (score: " + std::to_string(report.score) + ")");
}

void FeasibilityCache::warm(const std::vector<FeasibilityCorridor> &corridors) {
  for (const auto &c : corridors)
    put(c.passport, c.destination, c.report);
  log_info(kComponent,
           "warmed with " + std::to_string(corridors.size()) + " entries");
}

void FeasibilityCache::clear() {
  cache_.clear();
  log_info(kComponent, "cleared");
}

std::size_t FeasibilityCache::purge_expired(std::size_t limit) {
  return cache_.purge_expired(limit);
}

FeasibilityCacheStats FeasibilityCache::stats() const {
  const auto cs = cache_.stats();
  FeasibilityCacheStats s;
  s.hits = cs.hits;
  s.misses = cs.misses;
  s.evictions = cs.evictions;
  s.size = cache_.size();
  const auto total = s.hits + s.misses;
  if (total > 0)
    s.hit_rate = 100.0 * static_cast<double>(s.hits) / static_cast<double>(total);
  return s;
}

std::string FeasibilityCache::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "size:" << s.size << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "hit_rate:" << std::fixed << std::setprecision(1) << s.hit_rate
     << "%\n";
  return os.str();
}

bool maybe_start_speculative(SpeculativeJobTracker &tracker, TripId trip_id,
                             const FeasibilityReport &report) {
  if (!tracker.should_trigger(report.verdict, report.score))
    return false;
  return tracker.start_if_idle(trip_id);
}

} // namespace trip_state
