#include "proto_convert.hpp"

#include <type_traits>
#include <variant>

#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

namespace coolrouter::service {

using namespace coolrouter::v1;

model::Identity IdentityFromProto(const Identity& id, std::string_view what) {
  return util::FixedFromBytes<model::kIdentityBytes>(id.value(), what);
}

model::Hash32 HashFromBytes(const std::string& bytes, std::string_view what) {
  return util::FixedFromBytes<model::kHashBytes>(bytes, what);
}

uint8_t NarrowToByte(uint32_t value, util::ErrorCode code, std::string_view what) {
  if (value > 0xFF) {
    throw util::InvalidArgument(code, std::string(what) + " " + std::to_string(value) + " does not fit in a byte");
  }
  return static_cast<uint8_t>(value);
}

std::optional<model::RequestStatus> StatusFromProto(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_UNSPECIFIED:
      return std::nullopt;
    case REQUEST_STATUS_PENDING:
      return model::RequestStatus::kPending;
    case REQUEST_STATUS_VOTING_COMPLETED:
      return model::RequestStatus::kVotingCompleted;
    case REQUEST_STATUS_FULFILLED:
      return model::RequestStatus::kFulfilled;
    default:
      break;
  }
  throw util::InvalidArgument(util::ErrorCode::kInvalidArgument, "unknown request status " + std::to_string(status));
}

model::AccountMeta AccountFromProto(const AccountMeta& meta) {
  return model::AccountMeta{IdentityFromProto(meta.pubkey(), "account pubkey"), meta.is_writable(), false};
}

model::Message MessageFromProto(const Message& message) {
  return model::Message{message.role(), message.content()};
}

void ToProto(const model::Identity& id, Identity* out) {
  out->set_value(util::ToBytes(id));
}

void ToProto(const model::AccountMeta& meta, AccountMeta* out) {
  ToProto(meta.pubkey, out->mutable_pubkey());
  out->set_is_writable(meta.is_writable);
}

void ToProto(const model::Message& message, Message* out) {
  out->set_role(message.role);
  out->set_content(message.content);
}

RequestStatus ToProto(model::RequestStatus status) {
  switch (status) {
    case model::RequestStatus::kPending:
      return REQUEST_STATUS_PENDING;
    case model::RequestStatus::kVotingCompleted:
      return REQUEST_STATUS_VOTING_COMPLETED;
    case model::RequestStatus::kFulfilled:
      return REQUEST_STATUS_FULFILLED;
  }
  return REQUEST_STATUS_UNSPECIFIED;
}

LlmRequest ToProto(const db::model::RequestRecord& record) {
  LlmRequest out;
  out.set_request_id(record.id);
  ToProto(record.requesting_party, out.mutable_requesting_party());
  out.set_provider(record.provider);
  out.set_model_id(record.model_id);
  for (const auto& target : record.callback_targets) {
    ToProto(target, out.add_callback_targets());
  }
  out.set_status(ToProto(record.status));
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  out.set_min_votes(record.min_votes);
  out.set_approval_threshold(record.approval_threshold);
  for (const auto& vote : record.votes) {
    auto* v = out.add_votes();
    ToProto(vote.oracle, v->mutable_oracle());
    v->set_result_hash(util::ToBytes(vote.result_hash));
  }
  if (record.winning_hash) {
    out.set_winning_hash(util::ToBytes(*record.winning_hash));
  }
  out.set_total_votes_cast(record.total_votes_cast);
  return out;
}

RouterEvent ToProto(const events::EventEnvelope& envelope) {
  RouterEvent out;
  out.set_sequence(envelope.sequence);
  *out.mutable_published_at() = util::MillisToProto(envelope.published_at_ms);
  std::visit(
      [&](const auto& event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, events::RequestCreated>) {
          auto* e = out.mutable_request_created();
          e->set_request_id(event.request_id);
          ToProto(event.requesting_party, e->mutable_requesting_party());
          e->set_provider(event.provider);
          e->set_model_id(event.model_id);
          for (const auto& message : event.messages) {
            ToProto(message, e->add_messages());
          }
          e->set_min_votes(event.min_votes);
          e->set_approval_threshold(event.approval_threshold);
        } else if constexpr (std::is_same_v<T, events::VotingCompleted>) {
          auto* e = out.mutable_voting_completed();
          e->set_request_id(event.request_id);
          e->set_winning_hash(util::ToBytes(event.winning_hash));
          e->set_vote_count(event.vote_count);
          e->set_total_votes(event.total_votes);
        } else if constexpr (std::is_same_v<T, events::RequestFulfilled>) {
          auto* e = out.mutable_request_fulfilled();
          e->set_request_id(event.request_id);
          e->set_payload_length(event.payload_length);
        } else {
          auto* e = out.mutable_response_received();
          e->set_request_id(event.request_id);
          e->set_response_preview(event.response_preview);
        }
      },
      envelope.event);
  return out;
}

} // namespace coolrouter::service
