#include "trip_state/speculative.hpp"

#include "trip_state/log.hpp"

#include <sstream>
#include <utility>

namespace trip_state {
namespace {
constexpr const char *kComponent = "speculative";
} // namespace

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Running:
    return "running";
  case JobStatus::Complete:
    return "complete";
  case JobStatus::Aborted:
    return "aborted";
  }
  return "unknown";
}

SpeculativeJobTracker::SpeculativeJobTracker(SpeculativeConfig cfg,
                                             const IClock &clock)
    : cfg_(std::move(cfg)), clock_(clock) {
  if (cfg_.score_threshold < 0 || cfg_.score_threshold > 100)
    throw ConfigurationError("speculative score_threshold must be in [0, 100]");
  if (cfg_.max_speculative_days < 1)
    throw ConfigurationError("max_speculative_days must be at least 1");
  if (cfg_.retention.count() <= 0)
    throw ConfigurationError("speculative retention must be positive");
}

bool SpeculativeJobTracker::should_trigger(const std::string &verdict,
                                           int score) const {
  return verdict == "yes" && score >= cfg_.score_threshold;
}

void SpeculativeJobTracker::start(TripId trip_id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    jobs_[trip_id] =
        SpeculativeJob{trip_id, clock_.now(), JobStatus::Running, 0};
  }
  log_info(kComponent, "started for trip " + std::to_string(trip_id));
}

bool SpeculativeJobTracker::start_if_idle(TripId trip_id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = jobs_.find(trip_id);
    if (it != jobs_.end() && it->second.status == JobStatus::Running)
      return false;
    jobs_[trip_id] =
        SpeculativeJob{trip_id, clock_.now(), JobStatus::Running, 0};
  }
  log_info(kComponent, "started for trip " + std::to_string(trip_id));
  return true;
}

void SpeculativeJobTracker::update(TripId trip_id, int days_generated) {
  if (days_generated < 0)
    return;
  bool completed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = jobs_.find(trip_id);
    if (it == jobs_.end() || it->second.status != JobStatus::Running)
      return;
    it->second.days_generated = days_generated;
    if (days_generated >= cfg_.max_speculative_days) {
      it->second.status = JobStatus::Complete;
      completed = true;
    }
  }
  if (completed)
    log_info(kComponent, "complete for trip " + std::to_string(trip_id) +
                             " (" + std::to_string(days_generated) + " days)");
}

void SpeculativeJobTracker::abort(TripId trip_id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = jobs_.find(trip_id);
    if (it == jobs_.end() || it->second.status != JobStatus::Running)
      return;
    it->second.status = JobStatus::Aborted;
  }
  log_info(kComponent, "aborted for trip " + std::to_string(trip_id));
}

bool SpeculativeJobTracker::has_job(TripId trip_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = jobs_.find(trip_id);
  return it != jobs_.end() && it->second.status == JobStatus::Running;
}

std::optional<SpeculativeJob>
SpeculativeJobTracker::get_job(TripId trip_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = jobs_.find(trip_id);
  if (it == jobs_.end())
    return std::nullopt;
  return it->second;
}

std::size_t SpeculativeJobTracker::sweep() {
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = clock_.now();
    for (auto it = jobs_.begin(); it != jobs_.end();) {
      if (now - it->second.started_at > cfg_.retention) {
        it = jobs_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0)
    log_debug(kComponent, "swept " + std::to_string(removed) + " jobs");
  return removed;
}

SpeculativeStats SpeculativeJobTracker::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  SpeculativeStats s;
  for (const auto &[id, job] : jobs_) {
    if (job.status == JobStatus::Running)
      ++s.active_jobs;
    if (job.status == JobStatus::Complete)
      ++s.completed_jobs;
    s.total_days_generated += job.days_generated;
  }
  return s;
}

std::string SpeculativeJobTracker::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "jobs:" << size() << "\n";
  os << "active_jobs:" << s.active_jobs << "\n";
  os << "completed_jobs:" << s.completed_jobs << "\n";
  os << "total_days_generated:" << s.total_days_generated << "\n";
  os << "score_threshold:" << cfg_.score_threshold << "\n";
  os << "max_speculative_days:" << cfg_.max_speculative_days << "\n";
  os << "retention_ms:" << cfg_.retention.count() << "\n";
  return os.str();
}

std::size_t SpeculativeJobTracker::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return jobs_.size();
}

} // namespace trip_state
