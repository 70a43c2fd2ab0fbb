#include "authenticator.hpp"

#include <cstdint>

#include "internal/crypto/ed25519.hpp"

namespace coolrouter::auth {

namespace {

constexpr std::string_view kVoteDomain    = "coolrouter:submit_vote";
constexpr std::string_view kRequestDomain = "coolrouter:request_llm_response";

void AppendU32Le(std::string& out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

} // namespace

bool Ed25519Authenticator::Verify(const Credential& credential, std::string_view message) const {
  return crypto::VerifyEd25519(credential.identity, message, credential.proof);
}

std::string VoteSigningMessage(std::string_view request_id, const model::Hash32& result_hash) {
  std::string message;
  message.reserve(kVoteDomain.size() + 4 + request_id.size() + result_hash.size());
  message.append(kVoteDomain);
  AppendU32Le(message, static_cast<std::uint32_t>(request_id.size()));
  message.append(request_id);
  message.append(reinterpret_cast<const char*>(result_hash.data()), result_hash.size());
  return message;
}

std::string ConsumerRequestSigningMessage(std::string_view request_id, std::string_view prompt, std::uint8_t min_votes,
                                          std::uint8_t approval_threshold) {
  std::string message;
  message.reserve(kRequestDomain.size() + 8 + request_id.size() + prompt.size() + 2);
  message.append(kRequestDomain);
  AppendU32Le(message, static_cast<std::uint32_t>(request_id.size()));
  message.append(request_id);
  AppendU32Le(message, static_cast<std::uint32_t>(prompt.size()));
  message.append(prompt);
  message.push_back(static_cast<char>(min_votes));
  message.push_back(static_cast<char>(approval_threshold));
  return message;
}

} // namespace coolrouter::auth
