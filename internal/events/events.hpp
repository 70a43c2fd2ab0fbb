#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/types.hpp"

namespace coolrouter::events {

struct RequestCreated {
  std::string                 request_id;
  model::Identity             requesting_party{};
  std::string                 provider;
  std::string                 model_id;
  std::vector<model::Message> messages;
  uint8_t                     min_votes          = 0;
  uint8_t                     approval_threshold = 0;
};

struct VotingCompleted {
  std::string   request_id;
  model::Hash32 winning_hash{};
  uint32_t      vote_count  = 0;
  uint32_t      total_votes = 0;
};

// Length only; the payload itself is never published.
struct RequestFulfilled {
  std::string request_id;
  uint64_t    payload_length = 0;
};

// Emitted by the consumer program after storing a response.
struct ResponseReceived {
  std::string request_id;
  std::string response_preview;
};

using Event = std::variant<RequestCreated, VotingCompleted, RequestFulfilled, ResponseReceived>;

struct EventEnvelope {
  uint64_t sequence        = 0;
  uint64_t published_at_ms = 0;
  Event    event;
};

/*
  Receives lifecycle notifications. Publishers call Publish only after
  the state change it describes has been committed.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(Event event) = 0;
};

} // namespace coolrouter::events
