#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "io.hpp"

namespace {
struct SimNode {
  std::string id;
  double lat{};
  double lon{};
};

std::string node_name(int index) {
  std::string digits = std::to_string(index);
  while (digits.size() < 3) digits = "0" + digits;
  return "node-" + digits;
}

int quantity_for(const std::string& resource, std::mt19937& rng) {
  auto pick = [&rng](int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng); };
  if (resource == "water") return pick(5, 100);     // liters
  if (resource == "food") return pick(10, 200);     // meals
  if (resource == "medical") return pick(1, 20);    // kits
  return pick(1, 50);
}
}

// Emits disaster-scenario mesh traffic, one JSON message per line.
int main(int argc, char* argv[]) {
  try {
    const int node_count = argc > 1 ? std::stoi(argv[1]) : 5;
    const int message_count = argc > 2 ? std::stoi(argv[2]) : 20;
    const unsigned seed = argc > 3 ? static_cast<unsigned>(std::stoul(argv[3])) : 42u;
    const double base_lat = argc > 4 ? std::stod(argv[4]) : 43.47;
    const double base_lon = argc > 5 ? std::stod(argv[5]) : -80.54;
    if (node_count <= 0) throw std::runtime_error("node count must be positive");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> jitter(-0.1, 0.1);

    std::vector<SimNode> nodes;
    for (int i = 0; i < node_count; ++i) {
      nodes.push_back({node_name(i + 1), base_lat + jitter(rng), base_lon + jitter(rng)});
    }

    // more supply requests than status updates; urgency mostly medium
    const std::vector<std::string> types = {"sos", "supply_request", "supply_request", "supply_request",
                                            "status_update"};
    const std::vector<std::string> resources = {"water", "food", "medical", "shelter", "power", "communications"};
    std::discrete_distribution<int> urgency_dist({2.0, 5.0, 3.0});
    std::uniform_int_distribution<size_t> node_dist(0, nodes.size() - 1);
    std::uniform_int_distribution<size_t> type_dist(0, types.size() - 1);
    std::uniform_int_distribution<size_t> resource_dist(0, resources.size() - 1);

    const long long start_s = unix_s();
    for (int i = 0; i < message_count; ++i) {
      const SimNode& node = nodes[node_dist(rng)];
      MeshMessage msg;
      msg.id = i + 1;
      msg.node_id = node.id;
      msg.timestamp = start_s + i;
      msg.message_type = types[type_dist(rng)];
      msg.urgency = urgency_dist(rng) + 1;
      msg.lat = node.lat;
      msg.lon = node.lon;
      msg.resource_type = resources[resource_dist(rng)];
      msg.quantity = quantity_for(*msg.resource_type, rng);
      msg.payload = "Scenario message from " + node.id;
      std::cout << message_to_json(msg) << "\n";
    }
    std::cerr << "[meshroute_sim] " << message_count << " messages from " << node_count << " nodes (seed " << seed
              << ")" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[meshroute_sim] error: " << e.what() << std::endl;
    std::cerr << "Usage: meshroute_sim_main [nodes] [count] [seed] [lat] [lon]" << std::endl;
    return 1;
  }
  return 0;
}
