#include "hash_counter.hpp"

#include <algorithm>

namespace coolrouter::voting {

std::vector<HashCount> CountHashes(const std::vector<model::Vote>& votes) {
  std::vector<HashCount> counts;
  for (const auto& vote : votes) {
    auto it = std::find_if(counts.begin(), counts.end(), [&](const HashCount& c) { return c.hash == vote.result_hash; });
    if (it == counts.end()) {
      counts.push_back({vote.result_hash, 1});
    } else {
      ++it->count;
    }
  }
  return counts;
}

std::optional<HashCount> Leader(const std::vector<HashCount>& counts) {
  std::optional<HashCount> leader;
  for (const auto& entry : counts) {
    if (!leader || entry.count > leader->count) {
      leader = entry;
    }
  }
  return leader;
}

} // namespace coolrouter::voting
