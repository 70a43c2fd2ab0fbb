#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include "internal/model/types.hpp"

namespace coolrouter::oracle {

inline constexpr uint32_t kMaxConcurrentFulfillers = 4;

// max(1, min(floor(total * 0.2), 4))
uint32_t MaxFulfillers(uint32_t total_votes);

// Chance that one winning oracle volunteers to fulfill.
double FulfillProbability(uint32_t total_votes);

/*
  Decides whether this oracle submits the fulfillment after voting
  completes. Only oracles that voted for the winning hash take part,
  each with FulfillProbability. A losing racer's fulfill fails with
  VotingNotCompleted.
*/
class FulfillerSelection {
 public:
  explicit FulfillerSelection(uint64_t seed = std::random_device{}());

  bool ShouldFulfill(const model::Hash32& own_hash, const model::Hash32& winning_hash, uint32_t total_votes);

  // Deterministic core: roll is uniform in [0, 1).
  static bool Decide(const model::Hash32& own_hash, const model::Hash32& winning_hash, uint32_t total_votes, double roll);

 private:
  std::mutex                             mutex_;
  std::mt19937_64                        rng_;
  std::uniform_real_distribution<double> roll_{0.0, 1.0};
};

} // namespace coolrouter::oracle
