#include "consumer_service.hpp"

#include <stdexcept>

#include "internal/auth/authenticator.hpp"
#include "internal/consumer/llm_consumer.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace coolrouter::service {

using namespace coolrouter::v1;
using coolrouter::util::ErrorCode;

ConsumerService::ConsumerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.consumer) {
    throw std::invalid_argument("ConsumerService requires a consumer program");
  }
}

RequestLlmResponseResponse ConsumerService::RequestLlmResponse(const RequestLlmResponseRequest& req) {
  return ObserveRpc("ConsumerService.RequestLlmResponse", req.request_id(), [&] {
    const auth::Credential authority{IdentityFromProto(req.authority(), "authority"), req.authority_signature()};
    const auto min_votes = NarrowToByte(req.min_votes(), ErrorCode::kInvalidMinVotes, "min_votes");
    const auto threshold = NarrowToByte(req.approval_threshold(), ErrorCode::kInvalidApprovalThreshold, "approval_threshold");

    const auto state = ctx_.consumer->RequestLlmResponse(authority, req.request_id(), req.prompt(), min_votes, threshold);

    RequestLlmResponseResponse resp;
    ToProto(state, resp.mutable_consumer_state());
    ToProto(ctx_.consumer->ProgramId(), resp.mutable_program_id());
    return resp;
  });
}

GetResponseResponse ConsumerService::GetResponse(const GetResponseRequest& req) {
  return ObserveRpc("ConsumerService.GetResponse", "", [&] {
    const auto state = ctx_.consumer->GetResponse(IdentityFromProto(req.consumer_state(), "consumer_state"));

    GetResponseResponse resp;
    resp.set_request_id(state.request_id);
    resp.set_response(state.response);
    ToProto(state.authority, resp.mutable_authority());
    return resp;
  });
}

} // namespace coolrouter::service
