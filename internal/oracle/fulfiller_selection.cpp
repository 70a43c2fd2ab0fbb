#include "fulfiller_selection.hpp"

#include <algorithm>

namespace coolrouter::oracle {

uint32_t MaxFulfillers(uint32_t total_votes) {
  const uint32_t fifth = total_votes / 5;
  return std::max<uint32_t>(1, std::min(fifth, kMaxConcurrentFulfillers));
}

double FulfillProbability(uint32_t total_votes) {
  if (total_votes == 0) {
    return 1.0;
  }
  return std::min(1.0, static_cast<double>(MaxFulfillers(total_votes)) / static_cast<double>(total_votes));
}

FulfillerSelection::FulfillerSelection(uint64_t seed) : rng_(seed) {
}

bool FulfillerSelection::ShouldFulfill(const model::Hash32& own_hash, const model::Hash32& winning_hash, uint32_t total_votes) {
  double roll = 0.0;
  {
    std::scoped_lock lock(mutex_);
    roll = roll_(rng_);
  }
  return Decide(own_hash, winning_hash, total_votes, roll);
}

bool FulfillerSelection::Decide(const model::Hash32& own_hash, const model::Hash32& winning_hash, uint32_t total_votes, double roll) {
  if (own_hash != winning_hash) {
    return false;
  }
  return roll < FulfillProbability(total_votes);
}

} // namespace coolrouter::oracle
