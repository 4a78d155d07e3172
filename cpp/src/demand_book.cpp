#include "demand_book.hpp"

#include <algorithm>
#include <utility>

#include "io.hpp"

long long DemandBook::add(MeshMessage msg) {
  std::lock_guard<std::mutex> lock(mu_);
  msg.id = next_id_++;
  messages_.push_back(std::move(msg));
  return messages_.back().id;
}

std::vector<DemandPoint> DemandBook::active(long long now_s, int since_hours) const {
  std::vector<MeshMessage> snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot = messages_;
  }
  return select_active_demands(snapshot, now_s, since_hours);
}

size_t DemandBook::prune(long long before_s) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto old_size = messages_.size();
  messages_.erase(std::remove_if(messages_.begin(), messages_.end(),
                                 [before_s](const MeshMessage& m) { return m.timestamp < before_s; }),
                  messages_.end());
  return old_size - messages_.size();
}

size_t DemandBook::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return messages_.size();
}
