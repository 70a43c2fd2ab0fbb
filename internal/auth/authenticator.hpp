#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace coolrouter::auth {

/*
  What a caller presents to prove it acts as `identity`.
  The proof format belongs to the Authenticator implementation.
*/
struct Credential {
  model::Identity identity{};
  std::string     proof;
};

class Authenticator {
 public:
  virtual ~Authenticator() = default;

  // True when credential proves its identity over message.
  virtual bool Verify(const Credential& credential, std::string_view message) const = 0;
};

// Oracle identities are Ed25519 public keys; proof is a 64-byte signature.
class Ed25519Authenticator final : public Authenticator {
 public:
  bool Verify(const Credential& credential, std::string_view message) const override;
};

// Canonical bytes an oracle signs when voting.
std::string VoteSigningMessage(std::string_view request_id, const model::Hash32& result_hash);

// Canonical bytes a consumer authority signs to open a request.
std::string ConsumerRequestSigningMessage(std::string_view request_id, std::string_view prompt, std::uint8_t min_votes,
                                          std::uint8_t approval_threshold);

} // namespace coolrouter::auth
