#include "trip_state/sweeper.hpp"

#include "trip_state/log.hpp"

#include <stdexcept>

namespace trip_state {
namespace {
constexpr const char *kComponent = "sweeper";
} // namespace

Sweeper::Sweeper(Duration interval) : interval_(interval) {
  if (interval_.count() <= 0)
    throw ConfigurationError("sweep interval must be positive");
}

Sweeper::~Sweeper() { stop(); }

void Sweeper::add_task(std::string name, Task task) {
  if (running())
    throw std::logic_error("cannot add sweep task while running");
  tasks_.emplace_back(std::move(name), std::move(task));
}

void Sweeper::start() {
  if (running())
    return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { loop(); });
  log_info(kComponent, "started, interval " +
                           std::to_string(interval_.count()) + "ms, " +
                           std::to_string(tasks_.size()) + " tasks");
}

void Sweeper::stop() {
  if (!running())
    return;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  thread_.join();
  log_info(kComponent, "stopped after " + std::to_string(runs()) + " runs");
}

void Sweeper::run_once() {
  for (auto &[name, task] : tasks_) {
    try {
      task();
    } catch (const std::exception &e) {
      log_error(kComponent, "task " + name + " failed: " + e.what());
    }
  }
  ++runs_;
}

void Sweeper::loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
      break;
    lock.unlock();
    run_once();
    lock.lock();
  }
}

} // namespace trip_state
