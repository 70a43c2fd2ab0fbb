#pragma once

#include <cstdint>
#include <memory>

#include "coolrouter/v1.hpp"
#include "internal/events/event_hub.hpp"
#include "service_context.hpp"

namespace coolrouter::service {

inline constexpr uint32_t kDefaultListLimit = 100;
inline constexpr uint32_t kMaxListLimit     = 1000;

class RouterService {
public:
  explicit RouterService(ServiceContext ctx);

  coolrouter::v1::CreateRequestResponse
  CreateRequest(const coolrouter::v1::CreateRequestRequest& req);

  coolrouter::v1::SubmitVoteResponse
  SubmitVote(const coolrouter::v1::SubmitVoteRequest& req);

  coolrouter::v1::FulfillRequestResponse
  FulfillRequest(const coolrouter::v1::FulfillRequestRequest& req);

  coolrouter::v1::GetRequestResponse
  GetRequest(const coolrouter::v1::GetRequestRequest& req);

  // Oldest first. The limit is clamped to kMaxListLimit.
  coolrouter::v1::ListRequestsResponse
  ListRequests(const coolrouter::v1::ListRequestsRequest& req);

  std::unique_ptr<events::Subscription> SubscribeEvents();

private:
  ServiceContext ctx_;
};

}
