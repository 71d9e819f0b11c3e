#include "trip_state/state.hpp"

#include "trip_state/log.hpp"

#include <sstream>

namespace trip_state {

TripState::TripState(const StateConfig &cfg, const IClock &clock)
    : purge_per_tick_(cfg.purge_per_tick),
      directions_cache_(cfg.directions, clock),
      imagery_cache_(cfg.imagery, clock),
      directions_(directions_cache_, "directions"),
      imagery_(imagery_cache_, "imagery"),
      feasibility_(cfg.feasibility, clock),
      speculative_(cfg.speculative, clock) {}

TickStats TripState::tick() {
  TickStats t;
  t.directions_purged = directions_cache_.purge_expired(purge_per_tick_);
  t.imagery_purged = imagery_cache_.purge_expired(purge_per_tick_);
  t.feasibility_purged = feasibility_.purge_expired(purge_per_tick_);
  t.jobs_swept = speculative_.sweep();
  const auto total = t.directions_purged + t.imagery_purged +
                     t.feasibility_purged + t.jobs_swept;
  if (total > 0)
    log_debug("state", "tick removed " + std::to_string(total) + " records");
  return t;
}

void TripState::attach(Sweeper &sweeper) {
  sweeper.add_task("trip_state", [this] { tick(); });
}

std::string TripState::info() const {
  const auto prefixed = [](const std::string &prefix, const std::string &body) {
    std::istringstream in(body);
    std::string out;
    std::string line;
    while (std::getline(in, line))
      out += prefix + "_" + line + "\n";
    return out;
  };
  std::string out;
  out += prefixed("directions", directions_cache_.info());
  out += prefixed("imagery", imagery_cache_.info());
  out += prefixed("feasibility", feasibility_.info());
  out += prefixed("speculative", speculative_.info());
  return out;
}

} // namespace trip_state
