#pragma once

#include "trip_state/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace trip_state {

// Background thread that runs registered cleanup tasks every `interval`.
// Tasks are plain callables so the same work can be driven directly from
// tests via run_once().
class Sweeper {
public:
  using Task = std::function<void()>;

  explicit Sweeper(Duration interval);
  ~Sweeper();

  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  // Only valid before start().
  void add_task(std::string name, Task task);

  void start();
  void stop();
  bool running() const { return thread_.joinable(); }

  void run_once();
  std::uint64_t runs() const { return runs_.load(); }
  Duration interval() const { return interval_; }

private:
  void loop();

  Duration interval_;
  std::vector<std::pair<std::string, Task>> tasks_;
  std::thread thread_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<std::uint64_t> runs_{0};
};

} // namespace trip_state
