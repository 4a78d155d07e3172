#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "io.hpp"
#include "router.hpp"

namespace {
DemandPoint demand(long long id, const std::string& node, double lat, double lon, int urgency, const std::string& res,
                   int qty, long long ts) {
  return DemandPoint{id, node, {lat, lon}, urgency, res, qty, ts};
}

std::vector<DemandPoint> three_demands() {
  return {
      demand(1, "n1", 43.48, -80.55, 1, "water", 10, 1733184000),
      demand(2, "n2", 43.49, -80.56, 2, "food", 20, 1733184001),
      demand(3, "n3", 43.50, -80.57, 3, "medical", 5, 1733184002),
  };
}

std::vector<std::string> node_order(const RoutePlan& plan) {
  std::vector<std::string> ids;
  for (const auto& s : plan.stops) ids.push_back(s.node_id);
  return ids;
}

int count_urgent(const RoutePlan& plan) {
  int n = 0;
  for (const auto& s : plan.stops) {
    if (s.urgency >= 2) ++n;
  }
  return n;
}

class RouterTest : public ::testing::Test {
 protected:
  void SetUp() override { set_log_enabled(false); }
  void TearDown() override { set_log_enabled(true); }

  Vehicle vehicle{{43.47, -80.54}, 100};
};
}

TEST_F(RouterTest, DistanceFocusedEmpty) {
  const RoutePlan plan = distance_focused_route({}, vehicle);
  EXPECT_EQ(plan.mode, RouteMode::Distance);
  EXPECT_TRUE(plan.stops.empty());
  EXPECT_EQ(plan.total_distance_km, 0.0);
  EXPECT_EQ(plan.estimated_time_minutes, 0.0);
  EXPECT_EQ(plan.urgent_requests_served, 0);
  EXPECT_EQ(plan.metadata.algorithm, "nearest_neighbor");
  EXPECT_FALSE(plan.metadata.return_to_depot_km.has_value());
  EXPECT_EQ(plan.depot_lat, 43.47);
  EXPECT_EQ(plan.depot_lon, -80.54);
}

TEST_F(RouterTest, DistanceFocusedSingleDemand) {
  const std::vector<DemandPoint> demands = {demand(1, "node-001", 43.48, -80.55, 2, "water", 10, 1733184000)};
  const RoutePlan plan = distance_focused_route(demands, vehicle);

  ASSERT_EQ(plan.stops.size(), 1u);
  EXPECT_EQ(plan.stops[0].node_id, "node-001");
  EXPECT_GT(plan.stops[0].distance_from_prev_km, 0.0);
  EXPECT_GT(plan.total_distance_km, 0.0);
  EXPECT_GT(plan.estimated_time_minutes, 0.0);
  EXPECT_EQ(plan.urgent_requests_served, 1);
  ASSERT_TRUE(plan.metadata.return_to_depot_km.has_value());
  EXPECT_NEAR(*plan.metadata.return_to_depot_km, plan.stops[0].distance_from_prev_km, 0.011);
}

TEST_F(RouterTest, DistanceFocusedVisitsNearestFirst) {
  const auto base = three_demands();
  const std::vector<DemandPoint> shuffled = {base[2], base[0], base[1]};
  const RoutePlan plan = distance_focused_route(shuffled, vehicle);

  EXPECT_EQ(node_order(plan), (std::vector<std::string>{"n1", "n2", "n3"}));
  EXPECT_EQ(node_order(distance_focused_route(shuffled, vehicle)), node_order(plan));
  // input untouched
  EXPECT_EQ(shuffled[0].node_id, "n3");
  EXPECT_EQ(shuffled.size(), 3u);
}

TEST_F(RouterTest, DistanceFocusedTieGoesToFirstInput) {
  const std::vector<DemandPoint> demands = {
      demand(1, "first", 43.48, -80.55, 1, "water", 1, 10),
      demand(2, "second", 43.48, -80.55, 3, "water", 1, 5),
  };
  const RoutePlan plan = distance_focused_route(demands, vehicle);
  EXPECT_EQ(node_order(plan), (std::vector<std::string>{"first", "second"}));
  EXPECT_EQ(plan.stops[1].distance_from_prev_km, 0.0);
}

TEST_F(RouterTest, TotalsIncludeReturnLegAndServiceTime) {
  const RoutePlan plan = distance_focused_route(three_demands(), vehicle);
  ASSERT_TRUE(plan.metadata.return_to_depot_km.has_value());

  double legs = *plan.metadata.return_to_depot_km;
  for (const auto& s : plan.stops) legs += s.distance_from_prev_km;
  EXPECT_NEAR(plan.total_distance_km, legs, 0.03);

  const double expected_minutes = plan.total_distance_km / 40.0 * 60.0 + 3 * 10.0;
  EXPECT_NEAR(plan.estimated_time_minutes, expected_minutes, 0.1);
}

TEST_F(RouterTest, PriorityFocusedEmpty) {
  const RoutePlan plan = priority_focused_route({}, vehicle);
  EXPECT_EQ(plan.mode, RouteMode::Priority);
  EXPECT_TRUE(plan.stops.empty());
  EXPECT_EQ(plan.metadata.algorithm, "urgency_first");
}

TEST_F(RouterTest, PriorityFocusedOrdersByUrgency) {
  const std::vector<DemandPoint> demands = {
      demand(1, "node-low", 43.48, -80.55, 1, "water", 10, 1733184002),
      demand(2, "node-high", 43.50, -80.57, 3, "medical", 5, 1733184000),
      demand(3, "node-med", 43.49, -80.56, 2, "food", 20, 1733184001),
  };
  const RoutePlan plan = priority_focused_route(demands, vehicle);

  ASSERT_EQ(plan.stops.size(), 3u);
  EXPECT_EQ(plan.stops[0].node_id, "node-high");
  EXPECT_EQ(plan.stops[0].urgency, 3);
  EXPECT_EQ(plan.stops[1].node_id, "node-med");
  EXPECT_EQ(plan.stops[1].urgency, 2);
  EXPECT_EQ(plan.stops[2].node_id, "node-low");
  EXPECT_EQ(plan.stops[2].urgency, 1);
}

TEST_F(RouterTest, PriorityFocusedOldestFirstWithinTier) {
  const std::vector<DemandPoint> demands = {
      demand(1, "newer", 43.48, -80.55, 2, "food", 1, 2000),
      demand(2, "older", 43.60, -80.70, 2, "food", 1, 1000),
  };
  const RoutePlan plan = priority_focused_route(demands, vehicle);
  EXPECT_EQ(node_order(plan), (std::vector<std::string>{"older", "newer"}));
}

TEST_F(RouterTest, PriorityFocusedCountsUrgent) {
  const std::vector<DemandPoint> demands = {
      demand(1, "n1", 43.48, -80.55, 1, "water", 10, 1733184000),
      demand(2, "n2", 43.49, -80.56, 2, "food", 20, 1733184001),
      demand(3, "n3", 43.50, -80.57, 3, "medical", 5, 1733184002),
      demand(4, "n4", 43.51, -80.58, 3, "medical", 5, 1733184003),
  };
  EXPECT_EQ(priority_focused_route(demands, vehicle).urgent_requests_served, 3);
}

TEST_F(RouterTest, BlendedKeepsWeightsExactly) {
  const RoutePlan plan = blended_route(three_demands(), vehicle, 0.7, 0.3);
  EXPECT_EQ(plan.mode, RouteMode::Blended);
  EXPECT_EQ(plan.stops.size(), 3u);
  EXPECT_EQ(plan.metadata.algorithm, "weighted_scoring");
  ASSERT_TRUE(plan.metadata.urgency_weight.has_value());
  ASSERT_TRUE(plan.metadata.distance_weight.has_value());
  EXPECT_EQ(*plan.metadata.urgency_weight, 0.7);
  EXPECT_EQ(*plan.metadata.distance_weight, 0.3);
}

TEST_F(RouterTest, BlendedEmptyCarriesWeights) {
  const RoutePlan plan = blended_route({}, vehicle, 2.5, -1.0);
  EXPECT_TRUE(plan.stops.empty());
  EXPECT_EQ(plan.total_distance_km, 0.0);
  EXPECT_EQ(*plan.metadata.urgency_weight, 2.5);
  EXPECT_EQ(*plan.metadata.distance_weight, -1.0);
  EXPECT_FALSE(plan.metadata.return_to_depot_km.has_value());
}

TEST_F(RouterTest, BlendedDistanceOnlyMatchesNearestNeighbour) {
  const auto base = three_demands();
  const std::vector<DemandPoint> shuffled = {base[1], base[2], base[0]};
  const RoutePlan blended = blended_route(shuffled, vehicle, 0.0, 1.0);
  EXPECT_EQ(node_order(blended), node_order(distance_focused_route(shuffled, vehicle)));
}

TEST_F(RouterTest, BlendedUrgencyOnlyServesCriticalFirst) {
  const std::vector<DemandPoint> demands = {
      demand(1, "near-low", 43.471, -80.541, 1, "water", 1, 1),
      demand(2, "far-high", 43.60, -80.80, 3, "medical", 1, 2),
      demand(3, "mid-high", 43.52, -80.60, 3, "medical", 1, 3),
  };
  const RoutePlan plan = blended_route(demands, vehicle, 1.0, 0.0);
  // equal scores keep input order
  EXPECT_EQ(node_order(plan), (std::vector<std::string>{"far-high", "mid-high", "near-low"}));
}

TEST_F(RouterTest, BlendedTradesUrgencyAgainstDistance) {
  const std::vector<DemandPoint> demands = {
      demand(1, "near-low", 43.471, -80.541, 1, "water", 1, 1),
      demand(2, "far-mid", 43.60, -80.80, 2, "food", 1, 2),
  };
  EXPECT_EQ(blended_route(demands, vehicle, 0.6, 0.4).stops[0].node_id, "far-mid");
  EXPECT_EQ(blended_route(demands, vehicle, 0.1, 0.9).stops[0].node_id, "near-low");
}

TEST_F(RouterTest, BlendedRenormalizesFromEachStop) {
  // A sits ~111 km north of the depot with B and C clustered around it.
  const std::vector<DemandPoint> demands = {
      demand(1, "A", 44.47, -80.54, 3, "medical", 1, 1),
      demand(2, "B", 44.50, -80.54, 2, "food", 1, 2),
      demand(3, "C", 44.47, -80.539, 1, "water", 1, 3),
  };
  // From A the farthest candidate is B (~3.3 km), so B's penalty is the full 1.5 and C wins.
  // Scaling by the ~114 km depot distances instead would have picked B second.
  const RoutePlan plan = blended_route(demands, vehicle, 1.0, 1.5);
  EXPECT_EQ(node_order(plan), (std::vector<std::string>{"A", "C", "B"}));
}

TEST_F(RouterTest, BlendedColocatedDemandsAtDepot) {
  const std::vector<DemandPoint> demands = {
      demand(1, "a", 43.47, -80.54, 1, "water", 1, 1),
      demand(2, "b", 43.47, -80.54, 2, "food", 1, 2),
  };
  const RoutePlan plan = blended_route(demands, vehicle, 0.6, 0.4);
  EXPECT_EQ(node_order(plan), (std::vector<std::string>{"b", "a"}));
  EXPECT_EQ(plan.total_distance_km, 0.0);
  EXPECT_EQ(plan.estimated_time_minutes, 20.0);
}

TEST_F(RouterTest, UrgentCountMatchesStopsForEveryMode) {
  std::vector<DemandPoint> demands = three_demands();
  demands.push_back(demand(4, "n4", 43.45, -80.50, 2, "power", 3, 1733184010));
  demands.push_back(demand(5, "n5", 43.44, -80.60, 1, "food", 8, 1733184011));

  for (const auto& plan : generate_all_routes(demands, vehicle)) {
    EXPECT_EQ(plan.stops.size(), demands.size());
    EXPECT_EQ(plan.urgent_requests_served, count_urgent(plan));
    std::set<std::string> seen;
    for (const auto& s : plan.stops) seen.insert(s.node_id);
    EXPECT_EQ(seen.size(), demands.size());
  }
}

TEST_F(RouterTest, GenerateAllRoutesReturnsThreeModes) {
  const auto demands = three_demands();
  const auto plans = generate_all_routes(demands, vehicle);

  ASSERT_EQ(plans.size(), 3u);
  EXPECT_EQ(plans[0].mode, RouteMode::Distance);
  EXPECT_EQ(plans[1].mode, RouteMode::Priority);
  EXPECT_EQ(plans[2].mode, RouteMode::Blended);
  for (const auto& plan : plans) {
    EXPECT_EQ(plan.stops.size(), 3u);
  }
  EXPECT_EQ(*plans[2].metadata.urgency_weight, 0.6);
  EXPECT_EQ(*plans[2].metadata.distance_weight, 0.4);
}

TEST_F(RouterTest, GenerateAllRoutesEmptyInput) {
  const auto plans = generate_all_routes({}, vehicle, 0.5, 0.5);
  for (const auto& plan : plans) {
    EXPECT_TRUE(plan.stops.empty());
    EXPECT_EQ(plan.urgent_requests_served, 0);
  }
}

TEST_F(RouterTest, CapacityCarriedIntoMetadata) {
  const Vehicle small{{43.47, -80.54}, 7};
  for (const auto& plan : generate_all_routes(three_demands(), small)) {
    EXPECT_EQ(plan.metadata.vehicle_capacity, 7);
  }
}

TEST_F(RouterTest, RepeatedCallsAreIdentical) {
  const auto demands = three_demands();
  const auto first = generate_all_routes(demands, vehicle, 0.7, 0.3);
  const auto second = generate_all_routes(demands, vehicle, 0.7, 0.3);
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(route_plan_to_json(first[i]), route_plan_to_json(second[i]));
  }
}

TEST(RouteModeTest, NamesRoundTrip) {
  for (const RouteMode mode : {RouteMode::Distance, RouteMode::Priority, RouteMode::Blended}) {
    EXPECT_EQ(parse_route_mode(to_string(mode)), mode);
  }
  EXPECT_EQ(to_string(RouteMode::Blended), "blended");
  EXPECT_THROW(parse_route_mode("fastest"), std::runtime_error);
}
