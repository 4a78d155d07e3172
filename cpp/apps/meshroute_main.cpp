#include <iostream>
#include <string>
#include <vector>

#include "io.hpp"
#include "router.hpp"

int main(int argc, char* argv[]) {
  std::string messages_path = argc > 1 ? argv[1] : "data/samples/messages_example.json";
  std::string router_config_path = argc > 2 ? argv[2] : "config/dev/router.json";
  // optional reference time so archived message files can be replayed
  const std::string now_arg = argc > 3 ? argv[3] : "";

  try {
    const RouterConfig cfg = parse_router_config_file(router_config_path);
    const RouteRequest& req = cfg.defaults;
    const auto messages = parse_messages_file(messages_path);
    const long long now_s = now_arg.empty() ? unix_s() : std::stoll(now_arg);
    const auto demands = select_active_demands(messages, now_s, req.since_hours);
    std::cerr << "[meshroute_main] " << demands.size() << " active demands out of " << messages.size()
              << " messages" << std::endl;

    std::vector<RoutePlan> plans;
    if (!demands.empty()) {
      const Vehicle vehicle{{req.depot_lat, req.depot_lon}, req.vehicle_capacity};
      const auto all = generate_all_routes(demands, vehicle, req.urgency_weight, req.distance_weight);
      plans.assign(all.begin(), all.end());
    }
    std::cout << route_plans_to_json(plans);
  } catch (const std::exception& e) {
    std::cerr << "[meshroute_main] error: " << e.what() << std::endl;
    std::cerr << "Usage: meshroute_main [messages.json] [router.json] [now_unix_s]" << std::endl;
    return 1;
  }

  return 0;
}
