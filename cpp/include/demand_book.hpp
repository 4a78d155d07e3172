#pragma once

#include <cstddef>
#include <mutex>
#include <vector>
#include "route_types.hpp"

// Messages received from the mesh, held in memory until they age out.
// add/prune run on the MQTT callback thread while active() may be called elsewhere.
class DemandBook {
 public:
  // Stores a copy of msg under the next id and returns that id.
  long long add(MeshMessage msg);
  std::vector<DemandPoint> active(long long now_s, int since_hours) const;
  // Drops messages with timestamp < before_s; returns how many were removed.
  size_t prune(long long before_s);
  size_t size() const;

 private:
  mutable std::mutex mu_;
  std::vector<MeshMessage> messages_;
  long long next_id_{1};
};
