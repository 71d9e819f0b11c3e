#include "trip_state/request_keys.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace trip_state {
namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string lng_lat(const Waypoint &w) {
  return format_coord(w.lng) + "," + format_coord(w.lat);
}
} // namespace

const char *to_string(TravelMode mode) {
  switch (mode) {
  case TravelMode::Walking:
    return "walking";
  case TravelMode::Cycling:
    return "cycling";
  case TravelMode::Driving:
    return "driving";
  case TravelMode::DrivingTraffic:
    return "driving-traffic";
  }
  return "walking";
}

std::optional<TravelMode> parse_travel_mode(const std::string &name) {
  const auto n = lower(trim(name));
  if (n == "walking")
    return TravelMode::Walking;
  if (n == "cycling")
    return TravelMode::Cycling;
  if (n == "driving")
    return TravelMode::Driving;
  if (n == "driving-traffic")
    return TravelMode::DrivingTraffic;
  return std::nullopt;
}

std::string format_coord(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4f", v);
  std::string out(buf);
  if (out == "-0.0000")
    out = "0.0000";
  return out;
}

std::string directions_key(TravelMode mode,
                           const std::vector<Waypoint> &waypoints) {
  std::string key = std::string("directions:") + to_string(mode) + ":";
  const auto n = std::min(waypoints.size(), kMaxDirectionsWaypoints);
  for (std::size_t i = 0; i < n; ++i) {
    if (i)
      key += "|";
    key += lng_lat(waypoints[i]);
  }
  return key;
}

std::string imagery_key(const std::string &destination) {
  std::string key = lower(destination);
  for (auto &c : key) {
    const bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    if (!alnum)
      c = '-';
  }
  return key;
}

// "India" + "Tokyo, Japan" -> "india:japan"
std::string feasibility_key(const std::string &passport,
                            const std::string &destination) {
  const auto comma = destination.rfind(',');
  const std::string country = comma == std::string::npos
                                  ? destination
                                  : destination.substr(comma + 1);
  return lower(trim(passport)) + ":" + lower(trim(country));
}

std::string geocode_key(const std::string &query,
                        const GeocodeOptions &options) {
  std::string key = "geocode:" + query + ":types=";
  for (std::size_t i = 0; i < options.types.size(); ++i) {
    if (i)
      key += ",";
    key += options.types[i];
  }
  key += ";limit=" + std::to_string(options.limit);
  if (options.proximity)
    key += ";proximity=" + lng_lat(*options.proximity);
  if (!options.language.empty())
    key += ";language=" + options.language;
  return key;
}

std::string reverse_geocode_key(double lat, double lng) {
  return "reverse:" + format_coord(lat) + "," + format_coord(lng);
}

} // namespace trip_state
