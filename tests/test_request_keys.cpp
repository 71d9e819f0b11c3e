#include "trip_state/request_keys.hpp"

#include <catch2/catch.hpp>

using namespace trip_state;

TEST_CASE("directions keys are deterministic and rounded", "[keys][directions]") {
  const std::vector<Waypoint> a{{48.858370, 2.294481}, {48.860611, 2.337644}};
  const std::vector<Waypoint> b{{48.858374, 2.294479}, {48.860609, 2.337641}};
  REQUIRE(directions_key(TravelMode::Walking, a) ==
          "directions:walking:2.2945,48.8584|2.3376,48.8606");
  CHECK(directions_key(TravelMode::Walking, a) ==
        directions_key(TravelMode::Walking, b));
  CHECK(directions_key(TravelMode::Driving, a) !=
        directions_key(TravelMode::Walking, a));
}

TEST_CASE("directions keys depend on waypoint order", "[keys][directions]") {
  const std::vector<Waypoint> fwd{{1.0, 2.0}, {3.0, 4.0}};
  const std::vector<Waypoint> rev{{3.0, 4.0}, {1.0, 2.0}};
  CHECK(directions_key(TravelMode::Cycling, fwd) !=
        directions_key(TravelMode::Cycling, rev));
}

TEST_CASE("directions keys cover at most the provider waypoint limit",
          "[keys][directions]") {
  std::vector<Waypoint> pts;
  for (int i = 0; i < 30; ++i)
    pts.push_back({static_cast<double>(i), 0.0});
  std::vector<Waypoint> truncated(pts.begin(),
                                  pts.begin() + kMaxDirectionsWaypoints);
  CHECK(directions_key(TravelMode::DrivingTraffic, pts) ==
        directions_key(TravelMode::DrivingTraffic, truncated));
  CHECK(directions_key(TravelMode::DrivingTraffic, pts)
            .rfind("directions:driving-traffic:", 0) == 0);
}

TEST_CASE("negative zero rounds to the same coordinate", "[keys]") {
  CHECK(format_coord(-0.00001) == "0.0000");
  CHECK(format_coord(-1.23456) == "-1.2346");
  CHECK(reverse_geocode_key(-0.00001, 151.20929) == "reverse:0.0000,151.2093");
}

TEST_CASE("travel modes parse and print", "[keys]") {
  CHECK(parse_travel_mode("walking") == TravelMode::Walking);
  CHECK(parse_travel_mode(" Driving-Traffic ") == TravelMode::DrivingTraffic);
  CHECK_FALSE(parse_travel_mode("teleport").has_value());
  CHECK(std::string(to_string(TravelMode::Cycling)) == "cycling");
}

TEST_CASE("imagery keys normalize destinations", "[keys][imagery]") {
  CHECK(imagery_key("Paris, France") == "paris--france");
  CHECK(imagery_key("PARIS, FRANCE") == imagery_key("paris, france"));
  CHECK(imagery_key("Hyderabad") == "hyderabad");
  CHECK(imagery_key("St. John's 2") == "st--john-s-2");
}

TEST_CASE("feasibility keys use passport and destination country",
          "[keys][feasibility]") {
  CHECK(feasibility_key("India", "Tokyo, Japan") == "india:japan");
  CHECK(feasibility_key("  India ", "Osaka,  JAPAN ") == "india:japan");
  CHECK(feasibility_key("US", "Portugal") == "us:portugal");
  CHECK(feasibility_key("US", "Lisbon, Lisboa, Portugal") == "us:portugal");
}

TEST_CASE("geocode keys include every option", "[keys]") {
  GeocodeOptions opts;
  CHECK(geocode_key("Kyoto", opts) == "geocode:Kyoto:types=;limit=5");
  opts.types = {"place", "locality"};
  opts.limit = 3;
  opts.proximity = Waypoint{35.0, 135.75};
  opts.language = "ja";
  CHECK(geocode_key("Kyoto", opts) ==
        "geocode:Kyoto:types=place,locality;limit=3;"
        "proximity=135.7500,35.0000;language=ja");
}
