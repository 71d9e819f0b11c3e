#include "trip_state/config.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace trip_state {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    out = UINT64_MAX;
  }
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}

std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}

constexpr std::uint64_t kMaxEntries = 1'000'000;
constexpr std::uint64_t kMaxTtlMs = 30ULL * 24 * 60 * 60 * 1000;

void read_cache(const std::string &text, const std::string &prefix,
                BoundedCacheConfig &c) {
  std::uint64_t u;
  if (extract_u64(text, prefix + "_cache_size", u))
    c.max_size = static_cast<std::size_t>(clamp_u64(u, 1, kMaxEntries));
  if (extract_u64(text, prefix + "_ttl_ms", u)) {
    if (u == 0)
      c.ttl.reset();
    else
      c.ttl = Duration(clamp_u64(u, 1, kMaxTtlMs));
  }
}
} // namespace

bool parse_config(const std::string &text, StateConfig &cfg,
                  std::string *err) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  StateConfig next = cfg;
  std::string s;
  std::uint64_t u;
  if (extract_string(text, "log_level", s)) {
    auto level = parse_log_level(s);
    if (!level) {
      if (err)
        *err = "unknown log_level: " + s;
      return false;
    }
    next.log_level = *level;
  }

  read_cache(text, "directions", next.directions);
  read_cache(text, "imagery", next.imagery);
  if (extract_u64(text, "feasibility_cache_size", u))
    next.feasibility.max_entries =
        static_cast<std::size_t>(clamp_u64(u, 1, kMaxEntries));
  if (extract_u64(text, "feasibility_ttl_ms", u))
    next.feasibility.ttl = Duration(clamp_u64(u, 1, kMaxTtlMs));

  if (extract_u64(text, "speculative_score_threshold", u))
    next.speculative.score_threshold = static_cast<int>(clamp_u64(u, 0, 100));
  if (extract_u64(text, "max_speculative_days", u))
    next.speculative.max_speculative_days =
        static_cast<int>(clamp_u64(u, 1, 30));
  if (extract_u64(text, "speculative_retention_ms", u))
    next.speculative.retention = Duration(clamp_u64(u, 1000, kMaxTtlMs));
  if (extract_u64(text, "sweep_interval_ms", u))
    next.speculative.sweep_interval = Duration(clamp_u64(u, 100, kMaxTtlMs));
  if (extract_u64(text, "purge_per_tick", u))
    next.purge_per_tick = static_cast<std::size_t>(clamp_u64(u, 1, kMaxEntries));

  cfg = next;
  return true;
}

bool load_config(const std::string &path, StateConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

std::string describe(const StateConfig &cfg) {
  auto ttl_ms = [](const BoundedCacheConfig &c) -> long long {
    return c.ttl ? static_cast<long long>(c.ttl->count()) : -1;
  };
  std::ostringstream os;
  os << "directions_cache_size:" << cfg.directions.max_size << "\n";
  os << "directions_ttl_ms:" << ttl_ms(cfg.directions) << "\n";
  os << "imagery_cache_size:" << cfg.imagery.max_size << "\n";
  os << "imagery_ttl_ms:" << ttl_ms(cfg.imagery) << "\n";
  os << "feasibility_cache_size:" << cfg.feasibility.max_entries << "\n";
  os << "feasibility_ttl_ms:" << cfg.feasibility.ttl.count() << "\n";
  os << "speculative_score_threshold:" << cfg.speculative.score_threshold
     << "\n";
  os << "max_speculative_days:" << cfg.speculative.max_speculative_days
     << "\n";
  os << "speculative_retention_ms:" << cfg.speculative.retention.count()
     << "\n";
  os << "sweep_interval_ms:" << cfg.speculative.sweep_interval.count() << "\n";
  os << "purge_per_tick:" << cfg.purge_per_tick << "\n";
  return os.str();
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  try {
    std::size_t idx = 0;
    const long long v = std::stoll(s, &idx);
    if (idx != s.size())
      return false;
    out = v;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

bool parse_int(const std::string &s, int &out) {
  std::int64_t v = 0;
  if (!parse_i64(s, v) || v < std::numeric_limits<int>::min() ||
      v > std::numeric_limits<int>::max())
    return false;
  out = static_cast<int>(v);
  return true;
}

} // namespace trip_state
