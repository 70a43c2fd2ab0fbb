#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "internal/model/types.hpp"

namespace coolrouter::crypto {

model::Hash32 Sha256(std::string_view data);

// Hash committed by oracles for a result payload.
inline model::Hash32 HashPayload(std::string_view payload) {
  return Sha256(payload);
}

// First 8 bytes of sha256("global:<name>"), used as a routing tag.
std::array<std::uint8_t, 8> Discriminator(std::string_view name);

// Deterministic program-owned address for the given seeds.
model::Identity DeriveAddress(const std::vector<std::string_view>& seeds, const model::Identity& program_id);

} // namespace coolrouter::crypto
