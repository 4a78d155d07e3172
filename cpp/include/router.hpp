#pragma once

#include <array>
#include <string>
#include <vector>
#include "route_types.hpp"

constexpr double kAverageSpeedKmh = 40.0;
constexpr double kServiceMinutesPerStop = 10.0;
constexpr double kDefaultUrgencyWeight = 0.6;
constexpr double kDefaultDistanceWeight = 0.4;

// Greedy nearest neighbour from the depot; ties go to the earliest demand in input order.
RoutePlan distance_focused_route(const std::vector<DemandPoint>& demands, const Vehicle& vehicle);

// Visits demands by urgency (highest first), oldest timestamp first within a tier.
RoutePlan priority_focused_route(const std::vector<DemandPoint>& demands, const Vehicle& vehicle);

// Greedy on score = urgency_weight * urgency - distance_weight * (distance / max remaining distance).
// Weights are taken as given; they need not sum to 1.
RoutePlan blended_route(const std::vector<DemandPoint>& demands, const Vehicle& vehicle, double urgency_weight,
                        double distance_weight);

// Plans in the order distance, priority, blended.
std::array<RoutePlan, 3> generate_all_routes(const std::vector<DemandPoint>& demands, const Vehicle& vehicle,
                                             double urgency_weight = kDefaultUrgencyWeight,
                                             double distance_weight = kDefaultDistanceWeight);

std::string to_string(RouteMode mode);
RouteMode parse_route_mode(const std::string& name);
