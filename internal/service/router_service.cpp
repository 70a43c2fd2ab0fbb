#include "router_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/core/request_broker.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace coolrouter::service {

using namespace coolrouter::v1;
using coolrouter::util::ErrorCode;

RouterService::RouterService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.broker || !ctx_.events) {
    throw std::invalid_argument("RouterService requires a broker and an event hub");
  }
}

CreateRequestResponse RouterService::CreateRequest(const CreateRequestRequest& req) {
  return ObserveRpc("RouterService.CreateRequest", req.request_id(), [&] {
    core::CreateRequestParams params;
    params.requesting_party = IdentityFromProto(req.requesting_party(), "requesting_party");
    params.request_id       = req.request_id();
    params.provider         = req.provider();
    params.model_id         = req.model_id();
    for (const auto& message : req.messages()) {
      params.messages.push_back(MessageFromProto(message));
    }
    for (const auto& target : req.callback_targets()) {
      params.callback_targets.push_back(AccountFromProto(target));
    }
    params.min_votes          = NarrowToByte(req.min_votes(), ErrorCode::kInvalidMinVotes, "min_votes");
    params.approval_threshold = NarrowToByte(req.approval_threshold(), ErrorCode::kInvalidApprovalThreshold, "approval_threshold");

    CreateRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.broker->Create(params));
    return resp;
  });
}

SubmitVoteResponse RouterService::SubmitVote(const SubmitVoteRequest& req) {
  return ObserveRpc("RouterService.SubmitVote", req.request_id(), [&] {
    auth::Credential credential;
    credential.identity = IdentityFromProto(req.oracle(), "oracle");
    credential.proof    = req.signature();

    const auto result = ctx_.broker->Vote(req.request_id(), credential, HashFromBytes(req.result_hash(), "result_hash"));

    SubmitVoteResponse resp;
    resp.set_status(ToProto(result.record.status));
    resp.set_total_votes_cast(result.record.total_votes_cast);
    resp.set_leading_count(result.outcome.leading_count);
    resp.set_vote_percentage(result.outcome.vote_percentage);
    if (result.record.winning_hash) {
      resp.set_winning_hash(util::ToBytes(*result.record.winning_hash));
    }
    return resp;
  });
}

FulfillRequestResponse RouterService::FulfillRequest(const FulfillRequestRequest& req) {
  return ObserveRpc("RouterService.FulfillRequest", req.request_id(), [&] {
    std::vector<model::AccountMeta> accounts;
    accounts.reserve(req.accounts_size());
    for (const auto& account : req.accounts()) {
      accounts.push_back(AccountFromProto(account));
    }

    const auto record = ctx_.broker->Fulfill(req.request_id(), IdentityFromProto(req.callback_program(), "callback_program"),
                                             accounts, req.payload());

    FulfillRequestResponse resp;
    resp.set_status(ToProto(record.status));
    resp.set_payload_length(req.payload().size());
    return resp;
  });
}

GetRequestResponse RouterService::GetRequest(const GetRequestRequest& req) {
  return ObserveRpc("RouterService.GetRequest", req.request_id(), [&] {
    GetRequestResponse resp;
    *resp.mutable_request() = ToProto(ctx_.broker->Get(req.request_id()));
    return resp;
  });
}

ListRequestsResponse RouterService::ListRequests(const ListRequestsRequest& req) {
  return ObserveRpc("RouterService.ListRequests", "", [&] {
    db::RequestFilter filter;
    filter.status = StatusFromProto(req.status());
    filter.limit  = req.limit() == 0 ? kDefaultListLimit : std::min(req.limit(), kMaxListLimit);

    ListRequestsResponse resp;
    for (const auto& record : ctx_.broker->List(filter)) {
      *resp.add_requests() = ToProto(record);
    }
    return resp;
  });
}

std::unique_ptr<events::Subscription> RouterService::SubscribeEvents() {
  return ObserveRpc("RouterService.SubscribeEvents", "", [&] { return ctx_.events->Subscribe(); });
}

} // namespace coolrouter::service
