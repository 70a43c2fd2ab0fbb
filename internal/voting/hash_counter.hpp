#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/types.hpp"

namespace coolrouter::voting {

struct HashCount {
  model::Hash32 hash{};
  uint32_t      count = 0;
};

// Distinct result hashes with their counts, in first-seen order.
std::vector<HashCount> CountHashes(const std::vector<model::Vote>& votes);

// Highest count; the earliest first-seen hash wins ties. nullopt when empty.
std::optional<HashCount> Leader(const std::vector<HashCount>& counts);

} // namespace coolrouter::voting
