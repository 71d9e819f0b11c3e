#pragma once

#include "trip_state/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace trip_state {

using TripId = std::int64_t;

enum class JobStatus { Running, Complete, Aborted };

const char *to_string(JobStatus status);

struct SpeculativeConfig {
  int score_threshold{80};
  int max_speculative_days{3};
  Duration retention{std::chrono::minutes(10)};
  // Cadence the host should call sweep() at; the tracker never reads it.
  Duration sweep_interval{std::chrono::minutes(5)};
};

struct SpeculativeJob {
  TripId trip_id{0};
  TimePoint started_at{};
  JobStatus status{JobStatus::Running};
  int days_generated{0};
};

struct SpeculativeStats {
  std::size_t active_jobs{0};
  std::size_t completed_jobs{0};
  std::int64_t total_days_generated{0};
};

// Tracks opportunistic itinerary generation started ahead of an explicit
// request. Jobs move Running -> Complete once enough days exist, or
// Running -> Aborted on cancellation; both are terminal. Records of any
// status stay queryable until sweep() finds them older than the retention
// window.
//
// Unknown trips are a normal caller state: queries on them return neutral
// values and mutations are no-ops.
class SpeculativeJobTracker {
public:
  explicit SpeculativeJobTracker(SpeculativeConfig cfg = {},
                                 const IClock &clock = system_clock());

  SpeculativeJobTracker(const SpeculativeJobTracker &) = delete;
  SpeculativeJobTracker &operator=(const SpeculativeJobTracker &) = delete;

  bool should_trigger(const std::string &verdict, int score) const;

  // Replaces any existing record for the trip, discarding its progress.
  void start(TripId trip_id);
  // Starts the trip only when it has no Running job; the check and the
  // insert happen under one lock. Returns whether a job was started.
  bool start_if_idle(TripId trip_id);
  // Negative counts are ignored.
  void update(TripId trip_id, int days_generated);
  void abort(TripId trip_id);

  bool has_job(TripId trip_id) const;
  std::optional<SpeculativeJob> get_job(TripId trip_id) const;

  std::size_t sweep();

  SpeculativeStats stats() const;
  std::string info() const;
  std::size_t size() const;
  int max_speculative_days() const { return cfg_.max_speculative_days; }
  const SpeculativeConfig &config() const { return cfg_; }

private:
  SpeculativeConfig cfg_;
  const IClock &clock_;
  std::unordered_map<TripId, SpeculativeJob> jobs_;
  mutable std::mutex mu_;
};

} // namespace trip_state
