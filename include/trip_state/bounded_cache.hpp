#pragma once

#include "trip_state/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <list>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trip_state {

struct BoundedCacheConfig {
  std::size_t max_size{1000};
  std::optional<Duration> ttl;
};

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
};

// Fixed-capacity map with LRU eviction and optional expiry measured from the
// last write. Expired entries are never returned; they are dropped lazily by
// whichever accessor meets them first, or in bulk by purge_expired().
//
// Every public member takes the cache mutex, so a single instance may be
// shared between threads.
template <typename K, typename V, typename Hash = std::hash<K>>
class BoundedCache {
public:
  explicit BoundedCache(BoundedCacheConfig cfg,
                        const IClock &clock = system_clock())
      : cfg_(std::move(cfg)), clock_(clock) {
    if (cfg_.max_size < 1)
      throw ConfigurationError("bounded cache max_size must be at least 1");
    if (cfg_.ttl.has_value() && cfg_.ttl->count() <= 0)
      throw ConfigurationError("bounded cache ttl must be positive");
  }

  BoundedCache(const BoundedCache &) = delete;
  BoundedCache &operator=(const BoundedCache &) = delete;

  std::optional<V> get(const K &key) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = clock_.now();
    auto it = find_live(key, now);
    if (it == entries_.end()) {
      ++stats_.misses;
      return std::nullopt;
    }
    touch(it->second, now);
    ++stats_.hits;
    return it->second.value;
  }

  BoundedCache &set(const K &key, V value) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = clock_.now();
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      auto &e = it->second;
      e.value = std::move(value);
      e.created_at = now;
      touch(e, now);
      by_age_.splice(by_age_.end(), by_age_, e.age_it);
      return *this;
    }

    if (entries_.size() >= cfg_.max_size)
      evict_lru();

    // List nodes are linked in only after the map insert succeeds; splice
    // does not throw and keeps the stored iterators valid.
    KeyList rec_node{key};
    KeyList age_node{key};
    entries_.emplace(key, Entry{std::move(value), now, now, rec_node.begin(),
                                age_node.begin()});
    recency_.splice(recency_.begin(), rec_node);
    by_age_.splice(by_age_.end(), age_node);
    return *this;
  }

  // Liveness check without refreshing recency.
  bool has(const K &key) {
    std::lock_guard<std::mutex> lock(mu_);
    return find_live(key, clock_.now()) != entries_.end();
  }

  bool erase(const K &key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end())
      return false;
    erase_internal(it);
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
    recency_.clear();
    by_age_.clear();
  }

  // Raw count; may include expired entries nobody has touched yet.
  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
  }

  std::vector<K> keys() {
    std::vector<K> out;
    visit_live([&](const K &k, const Entry &) { out.push_back(k); });
    return out;
  }

  std::vector<V> values() {
    std::vector<V> out;
    visit_live([&](const K &, const Entry &e) { out.push_back(e.value); });
    return out;
  }

  // Most recently used first.
  std::vector<std::pair<K, V>> entries() {
    std::vector<std::pair<K, V>> out;
    visit_live(
        [&](const K &k, const Entry &e) { out.emplace_back(k, e.value); });
    return out;
  }

  // fn(value, key) runs on a snapshot outside the lock, so it may call back
  // into the cache.
  template <typename Fn> void for_each(Fn &&fn) {
    for (const auto &[k, v] : entries())
      fn(v, k);
  }

  // Drops up to `limit` expired entries, oldest write first.
  std::size_t purge_expired(
      std::size_t limit = std::numeric_limits<std::size_t>::max()) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!cfg_.ttl.has_value())
      return 0;
    const auto now = clock_.now();
    std::size_t purged = 0;
    while (!by_age_.empty() && purged < limit) {
      auto it = entries_.find(by_age_.front());
      if (is_live(it->second, now))
        break;
      erase_internal(it);
      ++stats_.expirations;
      ++purged;
    }
    return purged;
  }

  CacheStats stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stats_;
  }

  std::string info() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::ostringstream os;
    os << "keys:" << entries_.size() << "\n";
    os << "max_size:" << cfg_.max_size << "\n";
    os << "ttl_ms:" << (cfg_.ttl ? cfg_.ttl->count() : -1) << "\n";
    os << "hits:" << stats_.hits << "\n";
    os << "misses:" << stats_.misses << "\n";
    os << "evictions:" << stats_.evictions << "\n";
    os << "expirations:" << stats_.expirations << "\n";
    return os.str();
  }

  std::size_t max_size() const { return cfg_.max_size; }
  std::optional<Duration> ttl() const { return cfg_.ttl; }

private:
  using KeyList = std::list<K>;

  struct Entry {
    V value;
    TimePoint created_at;
    TimePoint accessed_at;
    typename KeyList::iterator lru_it;
    typename KeyList::iterator age_it;
  };

  using Map = std::unordered_map<K, Entry, Hash>;

  bool is_live(const Entry &e, TimePoint now) const {
    return !cfg_.ttl.has_value() || now - e.created_at <= *cfg_.ttl;
  }

  // Lazily erases the entry when it has expired.
  typename Map::iterator find_live(const K &key, TimePoint now) {
    auto it = entries_.find(key);
    if (it == entries_.end())
      return it;
    if (!is_live(it->second, now)) {
      erase_internal(it);
      ++stats_.expirations;
      return entries_.end();
    }
    return it;
  }

  void touch(Entry &e, TimePoint now) {
    e.accessed_at = now;
    recency_.splice(recency_.begin(), recency_, e.lru_it);
  }

  template <typename Fn> void visit_live(Fn &&fn) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = clock_.now();
    for (auto k = recency_.begin(); k != recency_.end();) {
      auto it = entries_.find(*k);
      ++k;
      if (!is_live(it->second, now)) {
        erase_internal(it);
        ++stats_.expirations;
        continue;
      }
      fn(it->first, it->second);
    }
  }

  void erase_internal(typename Map::iterator it) {
    recency_.erase(it->second.lru_it);
    by_age_.erase(it->second.age_it);
    entries_.erase(it);
  }

  void evict_lru() {
    if (recency_.empty())
      return;
    erase_internal(entries_.find(recency_.back()));
    ++stats_.evictions;
  }

  BoundedCacheConfig cfg_;
  const IClock &clock_;
  Map entries_;
  KeyList recency_;
  KeyList by_age_;
  CacheStats stats_;
  mutable std::mutex mu_;
};

} // namespace trip_state
