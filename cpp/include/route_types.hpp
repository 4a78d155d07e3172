#pragma once

#include <optional>
#include <string>
#include <vector>

// Decimal degrees, WGS84. Callers keep lat in [-90, 90] and lon in [-180, 180];
// nothing here validates or clamps.
struct Location {
  double lat{};
  double lon{};

  double distance_to(const Location& other) const;

  bool operator==(const Location& other) const { return lat == other.lat && lon == other.lon; }
  bool operator!=(const Location& other) const { return !(*this == other); }
};

struct DemandPoint {
  long long id{};
  std::string node_id;
  Location location;
  int urgency{};  // 1..3, 3 = critical
  std::optional<std::string> resource_type;
  int quantity{};
  long long timestamp{};  // unix seconds
};

struct Vehicle {
  Location depot;
  int capacity{100};  // advisory only
};

enum class RouteMode { Distance, Priority, Blended };

struct Stop {
  double lat{};
  double lon{};
  std::string node_id;
  std::optional<std::string> resource_type;
  int quantity{};
  int urgency{};
  double distance_from_prev_km{};
};

struct RouteMetadata {
  std::string algorithm;
  std::optional<double> urgency_weight;
  std::optional<double> distance_weight;
  std::optional<double> return_to_depot_km;
  int vehicle_capacity{};
};

struct RoutePlan {
  RouteMode mode{RouteMode::Distance};
  double depot_lat{};
  double depot_lon{};
  std::vector<Stop> stops;
  double total_distance_km{};
  double estimated_time_minutes{};
  int urgent_requests_served{};
  RouteMetadata metadata;
};

// Raw message as relayed from the mesh, before demand selection.
struct MeshMessage {
  long long id{};
  std::string node_id;
  long long timestamp{};
  std::string message_type;
  int urgency{};
  std::optional<double> lat;
  std::optional<double> lon;
  std::optional<std::string> resource_type;
  std::optional<int> quantity;
  std::string payload;
};

struct RouteRequest {
  double depot_lat{};
  double depot_lon{};
  int vehicle_capacity{100};
  int since_hours{24};
  double urgency_weight{0.6};
  double distance_weight{0.4};
};
