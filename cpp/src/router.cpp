#include "router.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "geo.hpp"
#include "io.hpp"

namespace {
double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

double estimate_minutes(double total_km, size_t stop_count) {
  return total_km / kAverageSpeedKmh * 60.0 + static_cast<double>(stop_count) * kServiceMinutesPerStop;
}

RoutePlan empty_plan(RouteMode mode, const std::string& algorithm, const Vehicle& vehicle) {
  RoutePlan plan;
  plan.mode = mode;
  plan.depot_lat = vehicle.depot.lat;
  plan.depot_lon = vehicle.depot.lon;
  plan.metadata.algorithm = algorithm;
  plan.metadata.vehicle_capacity = vehicle.capacity;
  return plan;
}

// Accumulates stops while a builder walks its visiting order.
class RouteWalk {
 public:
  explicit RouteWalk(RoutePlan& plan, const Location& depot) : plan_(plan), depot_(depot), current_(depot) {}

  const Location& current() const { return current_; }

  void visit(const DemandPoint& demand) {
    const double leg = current_.distance_to(demand.location);
    total_km_ += leg;

    Stop stop;
    stop.lat = demand.location.lat;
    stop.lon = demand.location.lon;
    stop.node_id = demand.node_id;
    stop.resource_type = demand.resource_type;
    stop.quantity = demand.quantity;
    stop.urgency = demand.urgency;
    stop.distance_from_prev_km = round_to(leg, 2);
    plan_.stops.push_back(std::move(stop));

    if (demand.urgency >= 2) ++plan_.urgent_requests_served;
    current_ = demand.location;
  }

  void close() {
    const double return_km = current_.distance_to(depot_);
    total_km_ += return_km;
    plan_.total_distance_km = round_to(total_km_, 2);
    plan_.estimated_time_minutes = round_to(estimate_minutes(total_km_, plan_.stops.size()), 1);
    plan_.metadata.return_to_depot_km = round_to(return_km, 2);
  }

 private:
  RoutePlan& plan_;
  Location depot_;
  Location current_;
  double total_km_{0.0};
};

std::vector<size_t> all_indices(size_t n) {
  std::vector<size_t> idx(n);
  for (size_t i = 0; i < n; ++i) idx[i] = i;
  return idx;
}
}

RoutePlan distance_focused_route(const std::vector<DemandPoint>& demands, const Vehicle& vehicle) {
  RoutePlan plan = empty_plan(RouteMode::Distance, "nearest_neighbor", vehicle);
  if (demands.empty()) return plan;

  RouteWalk walk(plan, vehicle.depot);
  std::vector<size_t> remaining = all_indices(demands.size());

  while (!remaining.empty()) {
    size_t best = 0;
    double best_dist = walk.current().distance_to(demands[remaining[0]].location);
    for (size_t k = 1; k < remaining.size(); ++k) {
      const double d = walk.current().distance_to(demands[remaining[k]].location);
      if (d < best_dist) {
        best_dist = d;
        best = k;
      }
    }
    walk.visit(demands[remaining[best]]);
    // erase keeps the remaining indices in input order for the next tie-break
    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
  }

  walk.close();
  return plan;
}

RoutePlan priority_focused_route(const std::vector<DemandPoint>& demands, const Vehicle& vehicle) {
  RoutePlan plan = empty_plan(RouteMode::Priority, "urgency_first", vehicle);
  if (demands.empty()) return plan;

  std::vector<size_t> order = all_indices(demands.size());
  std::stable_sort(order.begin(), order.end(), [&demands](size_t a, size_t b) {
    const DemandPoint& da = demands[a];
    const DemandPoint& db = demands[b];
    if (da.urgency != db.urgency) return da.urgency > db.urgency;
    return da.timestamp < db.timestamp;
  });

  RouteWalk walk(plan, vehicle.depot);
  for (size_t i : order) {
    walk.visit(demands[i]);
  }
  walk.close();
  return plan;
}

RoutePlan blended_route(const std::vector<DemandPoint>& demands, const Vehicle& vehicle, double urgency_weight,
                        double distance_weight) {
  RoutePlan plan = empty_plan(RouteMode::Blended, "weighted_scoring", vehicle);
  plan.metadata.urgency_weight = urgency_weight;
  plan.metadata.distance_weight = distance_weight;
  if (demands.empty()) return plan;

  RouteWalk walk(plan, vehicle.depot);
  std::vector<size_t> remaining = all_indices(demands.size());
  std::vector<double> dist(demands.size());

  while (!remaining.empty()) {
    double max_dist = 0.0;
    for (size_t i : remaining) {
      dist[i] = walk.current().distance_to(demands[i].location);
      max_dist = std::max(max_dist, dist[i]);
    }
    // everything left sits on the current position
    if (max_dist == 0.0) max_dist = 1.0;

    size_t best = 0;
    double best_score = 0.0;
    for (size_t k = 0; k < remaining.size(); ++k) {
      const DemandPoint& d = demands[remaining[k]];
      const double score = urgency_weight * d.urgency - distance_weight * (dist[remaining[k]] / max_dist);
      if (k == 0 || score > best_score) {
        best_score = score;
        best = k;
      }
    }
    walk.visit(demands[remaining[best]]);
    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
  }

  walk.close();
  return plan;
}

std::array<RoutePlan, 3> generate_all_routes(const std::vector<DemandPoint>& demands, const Vehicle& vehicle,
                                             double urgency_weight, double distance_weight) {
  log_line("router", "generating routes for " + std::to_string(demands.size()) + " demand points");
  std::array<RoutePlan, 3> plans = {
      distance_focused_route(demands, vehicle),
      priority_focused_route(demands, vehicle),
      blended_route(demands, vehicle, urgency_weight, distance_weight),
  };
  log_line("router", "generated " + std::to_string(plans.size()) + " route options");
  return plans;
}

std::string to_string(RouteMode mode) {
  switch (mode) {
    case RouteMode::Distance:
      return "distance";
    case RouteMode::Priority:
      return "priority";
    case RouteMode::Blended:
      return "blended";
  }
  return "distance";
}

RouteMode parse_route_mode(const std::string& name) {
  if (name == "distance") return RouteMode::Distance;
  if (name == "priority") return RouteMode::Priority;
  if (name == "blended") return RouteMode::Blended;
  throw std::runtime_error("Unknown route mode: " + name);
}
