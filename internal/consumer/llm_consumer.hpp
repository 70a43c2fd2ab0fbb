#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "internal/auth/authenticator.hpp"
#include "internal/dispatch/callback.hpp"
#include "internal/model/types.hpp"

namespace coolrouter::core {
class RequestBroker;
}
namespace coolrouter::events {
class EventSink;
}

namespace coolrouter::consumer {

inline constexpr std::size_t kMaxResponseBytes = 2000;
inline constexpr std::size_t kPreviewChars     = 100;

struct ConsumerState {
  std::string     request_id;
  std::string     response;
  bool            has_response = false;
  model::Identity authority{};
};

/*
  Reference requester program.

  Each request gets a state account derived from
  ("consumer_state", authority, request_id); that account is the single
  writable callback target, and the callback stores the winning payload
  in it. Opening a request requires the authority's signature over
  auth::ConsumerRequestSigningMessage.
*/
class LlmConsumer final : public dispatch::CallbackTarget {
 public:
  struct Options {
    model::Identity program_id{};
    std::string     provider = "openai";
    std::string     model_id = "gpt-4";
  };

  LlmConsumer(Options options, std::weak_ptr<core::RequestBroker> broker, std::shared_ptr<auth::Authenticator> authenticator,
              std::shared_ptr<events::EventSink> events);

  const model::Identity& ProgramId() const {
    return options_.program_id;
  }

  model::Identity StateAddress(const model::Identity& authority, const std::string& request_id) const;

  // Returns the state account registered as callback target.
  model::Identity RequestLlmResponse(const auth::Credential& authority, const std::string& request_id, const std::string& prompt,
                                     uint8_t min_votes, uint8_t approval_threshold);

  // Throws InvalidState(NoResponse) until the callback has run.
  ConsumerState GetResponse(const model::Identity& state_account) const;

  void Invoke(const dispatch::CallbackInvocation& invocation) override;

 private:
  Options                              options_;
  std::weak_ptr<core::RequestBroker>   broker_;
  std::shared_ptr<auth::Authenticator> authenticator_;
  std::shared_ptr<events::EventSink>   events_;

  mutable std::mutex                       mutex_;
  std::map<model::Identity, ConsumerState> states_;
};

// Valid UTF-8 without overlongs or surrogates.
bool IsValidUtf8(std::string_view text);

// First max_chars code points of valid UTF-8 text.
std::string Utf8Prefix(std::string_view text, std::size_t max_chars);

} // namespace coolrouter::consumer
