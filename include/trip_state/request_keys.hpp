#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trip_state {

struct Waypoint {
  double lat{0.0};
  double lng{0.0};
};

enum class TravelMode { Walking, Cycling, Driving, DrivingTraffic };

const char *to_string(TravelMode mode);
std::optional<TravelMode> parse_travel_mode(const std::string &name);

// Directions providers reject longer routes; keys only cover what is sent.
constexpr std::size_t kMaxDirectionsWaypoints = 25;

struct GeocodeOptions {
  std::vector<std::string> types;
  int limit{5};
  std::optional<Waypoint> proximity;
  std::string language;
};

// Deterministic fingerprints for memoized remote lookups. Equal requests
// produce equal keys; coordinates are compared at 4 decimal places.
std::string directions_key(TravelMode mode,
                           const std::vector<Waypoint> &waypoints);
std::string imagery_key(const std::string &destination);
std::string feasibility_key(const std::string &passport,
                            const std::string &destination);
std::string geocode_key(const std::string &query,
                        const GeocodeOptions &options);
std::string reverse_geocode_key(double lat, double lng);

std::string format_coord(double v);

} // namespace trip_state
