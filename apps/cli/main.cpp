#include "trip_state/config.hpp"
#include "trip_state/log.hpp"
#include "trip_state/request_keys.hpp"
#include "trip_state/state.hpp"
#include "trip_state/sweeper.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace trip_state;

namespace {
bool parse_waypoint(const std::string &s, Waypoint &out) {
  const auto comma = s.find(',');
  if (comma == std::string::npos)
    return false;
  try {
    out.lat = std::stod(s.substr(0, comma));
    out.lng = std::stod(s.substr(comma + 1));
  } catch (const std::logic_error &) {
    return false;
  }
  return std::abs(out.lat) <= 90.0 && std::abs(out.lng) <= 180.0;
}

// Great-circle length of the polyline; stands in for a directions provider.
double great_circle_m(const std::vector<Waypoint> &pts) {
  constexpr double kEarthRadiusM = 6371000.0;
  constexpr double kRad = 3.14159265358979323846 / 180.0;
  double total = 0.0;
  for (std::size_t i = 1; i < pts.size(); ++i) {
    const double dlat = (pts[i].lat - pts[i - 1].lat) * kRad;
    const double dlng = (pts[i].lng - pts[i - 1].lng) * kRad;
    const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(pts[i - 1].lat * kRad) *
                         std::cos(pts[i].lat * kRad) * std::sin(dlng / 2) *
                         std::sin(dlng / 2);
    total += 2 * kEarthRadiusM * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  }
  return total;
}

void usage() {
  std::cout << "commands:\n"
               "  route MODE LAT,LNG LAT,LNG [...]\n"
               "  feas PASSPORT DESTINATION VERDICT SCORE\n"
               "  feasget PASSPORT DESTINATION\n"
               "  trigger VERDICT SCORE\n"
               "  start ID | update ID DAYS | abort ID | job ID | has ID\n"
               "  sweep | tick | info | quit\n";
}
} // namespace

int main(int argc, char **argv) {
  std::string config_path;
  std::string level_override;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--log-level" && i + 1 < argc)
      level_override = argv[++i];
  }

  StateConfig cfg;
  if (!config_path.empty()) {
    std::string err;
    if (!load_config(config_path, cfg, &err)) {
      std::cerr << "config error: " << err << "\n";
      return 1;
    }
  }
  if (!level_override.empty()) {
    auto level = parse_log_level(level_override);
    if (!level) {
      std::cerr << "unknown log level: " << level_override << "\n";
      return 1;
    }
    cfg.log_level = *level;
  }
  set_log_level(cfg.log_level);

  TripState state(cfg);
  Sweeper sweeper(cfg.speculative.sweep_interval);
  state.attach(sweeper);
  sweeper.start();

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd))
      continue;
    if (cmd == "quit")
      break;

    std::vector<std::string> args;
    for (std::string a; in >> a;)
      args.push_back(a);

    std::int64_t id = 0;
    int n = 0;
    if (cmd == "route" && args.size() >= 3) {
      auto mode = parse_travel_mode(args[0]);
      std::vector<Waypoint> pts;
      bool ok = mode.has_value();
      for (std::size_t i = 1; ok && i < args.size(); ++i) {
        Waypoint w;
        ok = parse_waypoint(args[i], w);
        pts.push_back(w);
      }
      if (!ok) {
        std::cout << "ERR bad route\n";
        continue;
      }
      if (pts.size() > kMaxDirectionsWaypoints)
        pts.resize(kMaxDirectionsWaypoints);
      bool computed = false;
      auto route = state.directions().get(
          directions_key(*mode, pts),
          [&](const CancellationToken &) -> std::optional<std::string> {
            computed = true;
            std::ostringstream os;
            os << "distance_m=" << static_cast<long long>(great_circle_m(pts));
            return os.str();
          });
      std::cout << (computed ? "computed " : "cached ")
                << route.value_or("none") << "\n";
    } else if (cmd == "feas" && args.size() == 4 && parse_int(args[3], n)) {
      state.feasibility().put(args[0], args[1],
                              {args[2], n, ""});
      std::cout << "OK " << feasibility_key(args[0], args[1]) << "\n";
    } else if (cmd == "feasget" && args.size() == 2) {
      auto r = state.feasibility().get(args[0], args[1]);
      if (r)
        std::cout << r->verdict << " " << r->score << "\n";
      else
        std::cout << "(nil)\n";
    } else if (cmd == "trigger" && args.size() == 2 && parse_int(args[1], n)) {
      std::cout << (state.speculative().should_trigger(args[0], n) ? "yes" : "no")
                << "\n";
    } else if (cmd == "start" && args.size() == 1 && parse_i64(args[0], id)) {
      state.speculative().start(id);
      std::cout << "OK\n";
    } else if (cmd == "update" && args.size() == 2 && parse_i64(args[0], id) &&
               parse_int(args[1], n)) {
      state.speculative().update(id, n);
      std::cout << "OK\n";
    } else if (cmd == "abort" && args.size() == 1 && parse_i64(args[0], id)) {
      state.speculative().abort(id);
      std::cout << "OK\n";
    } else if (cmd == "has" && args.size() == 1 && parse_i64(args[0], id)) {
      std::cout << (state.speculative().has_job(id) ? 1 : 0) << "\n";
    } else if (cmd == "job" && args.size() == 1 && parse_i64(args[0], id)) {
      auto job = state.speculative().get_job(id);
      if (job)
        std::cout << job->trip_id << " " << to_string(job->status) << " "
                  << job->days_generated << "\n";
      else
        std::cout << "(nil)\n";
    } else if (cmd == "sweep") {
      std::cout << state.speculative().sweep() << "\n";
    } else if (cmd == "tick") {
      const auto t = state.tick();
      std::cout << "purged " << t.directions_purged + t.imagery_purged +
                                    t.feasibility_purged
                << " swept " << t.jobs_swept << "\n";
    } else if (cmd == "info") {
      std::cout << state.info();
    } else {
      usage();
    }
    std::cout.flush();
  }

  sweeper.stop();
  return 0;
}
