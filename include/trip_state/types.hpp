#pragma once

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>

namespace trip_state {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Thrown only from constructors; runtime operations never fail.
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

// Time only moves when advance() is called.
class ManualClock final : public IClock {
public:
  explicit ManualClock(TimePoint start = TimePoint{} + std::chrono::hours(1))
      : now_(start) {}

  TimePoint now() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return now_;
  }
  void advance(Duration d) {
    std::lock_guard<std::mutex> lock(mu_);
    now_ += d;
  }

private:
  mutable std::mutex mu_;
  TimePoint now_;
};

IClock &system_clock();

} // namespace trip_state
