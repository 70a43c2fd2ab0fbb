#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "internal/model/limits.hpp"

namespace coolrouter::model {

// Raw 32-byte public key of a program, account or oracle.
using Identity = std::array<std::uint8_t, kIdentityBytes>;

// SHA-256 digest of a result payload.
using Hash32 = std::array<std::uint8_t, kHashBytes>;

struct Message {
  std::string role;
  std::string content;

  bool operator==(const Message&) const = default;
};

struct AccountMeta {
  Identity pubkey{};
  bool     is_writable = false;
  bool     is_signer   = false;

  bool operator==(const AccountMeta&) const = default;
};

struct Vote {
  Identity oracle{};
  Hash32   result_hash{};

  bool operator==(const Vote&) const = default;
};

} // namespace coolrouter::model
