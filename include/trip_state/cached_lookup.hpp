#pragma once

#include "trip_state/bounded_cache.hpp"
#include "trip_state/log.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace trip_state {

// Handed to a fetch so long-running remote calls can bail out early. A
// canceled fetch may still return a value; it is discarded.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  bool canceled() const { return flag_->load(); }
  void cancel() const { flag_->store(true); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

struct LookupStats {
  std::uint64_t hits{0};
  std::uint64_t remote_calls{0};
  std::uint64_t failures{0};
  std::uint64_t canceled{0};
};

// Memoizes a remote lookup by request fingerprint. Misses run the fetch on
// the caller's thread. Starting a fetch for a key cancels the previous
// in-flight fetch for that key, and only the fetch that is still current
// when it finishes may write to the cache. Concurrent misses on one key are
// not merged.
template <typename V> class CachedLookup {
public:
  using Fetch = std::function<std::optional<V>(const CancellationToken &)>;

  CachedLookup(BoundedCache<std::string, V> &cache, std::string name)
      : cache_(cache), name_(std::move(name)) {}

  CachedLookup(const CachedLookup &) = delete;
  CachedLookup &operator=(const CachedLookup &) = delete;

  std::optional<V> get(const std::string &key, const Fetch &fetch) {
    if (auto hit = cache_.get(key)) {
      std::lock_guard<std::mutex> lock(mu_);
      ++stats_.hits;
      log_debug(name_, "cache hit: " + key);
      return hit;
    }

    const Ticket ticket = begin(key);
    std::optional<V> result;
    try {
      result = fetch(ticket.token);
    } catch (...) {
      release(key, ticket);
      throw;
    }

    std::lock_guard<std::mutex> lock(mu_);
    const bool current = drop_ticket(key, ticket);
    if (!current || ticket.token.canceled()) {
      ++stats_.canceled;
      log_debug(name_, "discarded canceled fetch: " + key);
      return std::nullopt;
    }
    if (!result.has_value()) {
      ++stats_.failures;
      return std::nullopt;
    }
    cache_.set(key, *result);
    return result;
  }

  bool cancel(const std::string &key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = in_flight_.find(key);
    if (it == in_flight_.end())
      return false;
    it->second.token.cancel();
    in_flight_.erase(it);
    return true;
  }

  std::size_t in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_.size();
  }

  LookupStats stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stats_;
  }

  const std::string &name() const { return name_; }

private:
  struct Ticket {
    std::uint64_t id{0};
    CancellationToken token;
  };

  Ticket begin(const std::string &key) {
    std::lock_guard<std::mutex> lock(mu_);
    ++stats_.remote_calls;
    Ticket t{++next_id_, CancellationToken{}};
    auto it = in_flight_.find(key);
    if (it != in_flight_.end()) {
      it->second.token.cancel();
      log_debug(name_, "superseded in-flight fetch: " + key);
      it->second = t;
    } else {
      in_flight_.emplace(key, t);
    }
    return t;
  }

  // Caller holds mu_. Returns true when `t` was still the current ticket.
  bool drop_ticket(const std::string &key, const Ticket &t) {
    auto it = in_flight_.find(key);
    if (it == in_flight_.end() || it->second.id != t.id)
      return false;
    in_flight_.erase(it);
    return true;
  }

  void release(const std::string &key, const Ticket &t) {
    std::lock_guard<std::mutex> lock(mu_);
    drop_ticket(key, t);
  }

  BoundedCache<std::string, V> &cache_;
  std::string name_;
  std::unordered_map<std::string, Ticket> in_flight_;
  std::uint64_t next_id_{0};
  LookupStats stats_;
  mutable std::mutex mu_;
};

} // namespace trip_state
