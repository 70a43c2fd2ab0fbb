#include "llm_consumer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "internal/core/request_broker.hpp"
#include "internal/crypto/sha256.hpp"
#include "internal/events/events.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace coolrouter::consumer {

using coolrouter::observability::IdentityField;
using coolrouter::observability::IntField;
using coolrouter::observability::StringField;
using coolrouter::util::ErrorCode;

namespace {

constexpr std::string_view kStateSeed = "consumer_state";

std::size_t Utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0;
}

} // namespace

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    const auto len  = Utf8SequenceLength(lead);
    if (len == 0 || i + len > text.size()) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    if (len >= 3) {
      const auto second = static_cast<unsigned char>(text[i + 1]);
      if (lead == 0xE0 && second < 0xA0) return false; // overlong
      if (lead == 0xED && second > 0x9F) return false; // surrogate
      if (lead == 0xF0 && second < 0x90) return false; // overlong
      if (lead == 0xF4 && second > 0x8F) return false; // > U+10FFFF
    }
    i += len;
  }
  return true;
}

std::string Utf8Prefix(std::string_view text, std::size_t max_chars) {
  std::size_t i     = 0;
  std::size_t chars = 0;
  while (i < text.size() && chars < max_chars) {
    const auto len = Utf8SequenceLength(static_cast<unsigned char>(text[i]));
    i += len == 0 ? 1 : len;
    ++chars;
  }
  return std::string(text.substr(0, std::min(i, text.size())));
}

LlmConsumer::LlmConsumer(Options options, std::weak_ptr<core::RequestBroker> broker,
                         std::shared_ptr<auth::Authenticator> authenticator, std::shared_ptr<events::EventSink> events)
    : options_(std::move(options)),
      broker_(std::move(broker)),
      authenticator_(std::move(authenticator)),
      events_(std::move(events)) {
  if (!authenticator_) {
    throw std::invalid_argument("LlmConsumer requires an authenticator");
  }
}

model::Identity LlmConsumer::StateAddress(const model::Identity& authority, const std::string& request_id) const {
  const std::string_view authority_seed(reinterpret_cast<const char*>(authority.data()), authority.size());
  return crypto::DeriveAddress({kStateSeed, authority_seed, request_id}, options_.program_id);
}

model::Identity LlmConsumer::RequestLlmResponse(const auth::Credential& credential, const std::string& request_id,
                                                const std::string& prompt, uint8_t min_votes, uint8_t approval_threshold) {
  const auto& authority = credential.identity;
  if (!authenticator_->Verify(credential, auth::ConsumerRequestSigningMessage(request_id, prompt, min_votes, approval_threshold))) {
    throw util::PermissionDenied(ErrorCode::kUnauthorizedAuthority, "request signature does not verify for authority " +
                                                                        util::ToHex(authority));
  }

  auto broker = broker_.lock();
  if (!broker) {
    throw std::runtime_error("consumer program is detached from the request broker");
  }

  const auto state_account = StateAddress(authority, request_id);
  {
    std::scoped_lock lock(mutex_);
    if (states_.contains(state_account)) {
      throw util::AlreadyExists(ErrorCode::kConsumerStateExists, "consumer state for " + request_id + " already exists");
    }
    states_.emplace(state_account, ConsumerState{request_id, {}, false, authority});
  }

  core::CreateRequestParams params;
  params.requesting_party   = options_.program_id;
  params.request_id         = request_id;
  params.provider           = options_.provider;
  params.model_id           = options_.model_id;
  params.messages           = {model::Message{"user", prompt}};
  params.callback_targets   = {model::AccountMeta{state_account, true, false}};
  params.min_votes          = min_votes;
  params.approval_threshold = approval_threshold;

  try {
    broker->Create(params);
  } catch (const std::exception&) {
    std::scoped_lock lock(mutex_);
    states_.erase(state_account);
    throw;
  }

  COOLROUTER_LOG_INFO("LLM response requested", {StringField("request_id", request_id),
                                                 IdentityField("consumer_state", state_account),
                                                 IdentityField("authority", authority)});
  return state_account;
}

ConsumerState LlmConsumer::GetResponse(const model::Identity& state_account) const {
  std::scoped_lock lock(mutex_);
  auto             it = states_.find(state_account);
  if (it == states_.end()) {
    throw util::NotFound(ErrorCode::kRequestNotFound, "no consumer state " + util::ToHex(state_account));
  }
  if (!it->second.has_response) {
    throw util::InvalidState(ErrorCode::kNoResponse, "no response yet for " + it->second.request_id);
  }
  return it->second;
}

void LlmConsumer::Invoke(const dispatch::CallbackInvocation& invocation) {
  const auto args = dispatch::DecodeCallbackData(invocation.data);

  if (invocation.accounts.empty()) {
    throw util::InvalidArgument(ErrorCode::kMalformedCallbackData, "callback carries no consumer state account");
  }
  const auto& state_account = invocation.accounts.front();
  if (!state_account.is_writable) {
    throw util::PermissionDenied(ErrorCode::kAccountMismatch, "consumer state account must be writable");
  }
  if (args.payload.size() > kMaxResponseBytes) {
    throw util::InvalidArgument(ErrorCode::kResponseTooLong, std::to_string(args.payload.size()) + " bytes, max " +
                                                                 std::to_string(kMaxResponseBytes));
  }
  if (!IsValidUtf8(args.payload)) {
    throw util::InvalidArgument(ErrorCode::kMalformedCallbackData, "response is not valid UTF-8");
  }

  {
    std::scoped_lock lock(mutex_);
    auto             it = states_.find(state_account.pubkey);
    if (it == states_.end()) {
      throw util::PermissionDenied(ErrorCode::kAccountMismatch, "unknown consumer state " + util::ToHex(state_account.pubkey));
    }
    if (it->second.request_id != args.request_id) {
      throw util::PermissionDenied(ErrorCode::kRequestIdMismatch,
                                   "callback for " + args.request_id + " hit state of " + it->second.request_id);
    }
    it->second.response     = args.payload;
    it->second.has_response = true;
  }

  auto preview = Utf8Prefix(args.payload, kPreviewChars);
  COOLROUTER_LOG_INFO("Response received", {StringField("request_id", args.request_id),
                                            IntField("response_length", static_cast<int64_t>(args.payload.size()))});
  if (events_) {
    events_->Publish(events::ResponseReceived{args.request_id, std::move(preview)});
  }
}

} // namespace coolrouter::consumer
