#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace coolrouter::crypto {

inline constexpr std::size_t kEd25519SeedBytes      = 32;
inline constexpr std::size_t kEd25519SignatureBytes = 64;

using Ed25519Seed = std::array<std::uint8_t, kEd25519SeedBytes>;

/*
  Ed25519 signing key. The public key doubles as the oracle identity.
*/
class Ed25519KeyPair {
 public:
  static Ed25519KeyPair Generate();
  static Ed25519KeyPair FromSeed(const Ed25519Seed& seed);

  const Ed25519Seed& Seed() const {
    return seed_;
  }
  const model::Identity& PublicKey() const {
    return public_key_;
  }

  // Returns the 64-byte signature.
  std::string Sign(std::string_view message) const;

 private:
  Ed25519KeyPair(const Ed25519Seed& seed, const model::Identity& public_key) : seed_(seed), public_key_(public_key) {
  }

  Ed25519Seed     seed_{};
  model::Identity public_key_{};
};

bool VerifyEd25519(const model::Identity& public_key, std::string_view message, std::string_view signature);

} // namespace coolrouter::crypto
