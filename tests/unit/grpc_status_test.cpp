#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "coolrouter/v1.hpp"
#include "internal/auth/authenticator.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/consumer_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/router_server.hpp"
#include "internal/service/consumer_service.hpp"
#include "internal/service/router_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace {

using coolrouter::grpc::ToStatus;
using coolrouter::util::ErrorCode;

coolrouter::service::ServiceContext BuildServiceContext() {
  coolrouter::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_consumer()->set_enabled(true);

  auto runtime = coolrouter::factory::BuildRuntime(config);

  coolrouter::service::ServiceContext ctx;
  ctx.broker   = runtime.broker;
  ctx.consumer = runtime.consumer;
  ctx.events   = runtime.events;
  return ctx;
}

void TestCategoryMapping() {
  using namespace coolrouter::util;

  assert(ToStatus(InvalidArgument(ErrorCode::kRequestIdTooLong, "x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(ResourceExhausted(ErrorCode::kTooManyVotes, "x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(NotFound(ErrorCode::kRequestNotFound, "x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(AlreadyExists(ErrorCode::kAlreadyVoted, "x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidState(ErrorCode::kNotPending, "x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(PermissionDenied(ErrorCode::kUnauthorizedOracle, "x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(IntegrityViolation(ErrorCode::kPayloadHashMismatch, "x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(CallbackFailed(ErrorCode::kCallbackRejected, "x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(InvalidState(ErrorCode::kVotingNotCompleted, "request r is Pending"));
  assert(status.error_message().rfind("VotingNotCompleted: ", 0) == 0);

  // Without a server context only the status is produced.
  const auto bare = ToStatus(nullptr, NotFound(ErrorCode::kNoResponse, "x"));
  assert(bare.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(coolrouter::grpc::StatusCodeFor(std::logic_error("bug")) == ::grpc::StatusCode::INTERNAL);
}

void TestGetMissingRequestReturnsNotFound() {
  auto service = std::make_shared<coolrouter::service::RouterService>(BuildServiceContext());
  coolrouter::grpc::RouterServer server(service);

  coolrouter::v1::GetRequestRequest req;
  req.set_request_id("missing-request");
  coolrouter::v1::GetRequestResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.GetRequest(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestUnsignedVoteReturnsPermissionDenied() {
  auto ctx     = BuildServiceContext();
  auto service = std::make_shared<coolrouter::service::RouterService>(ctx);
  coolrouter::grpc::RouterServer server(service);

  coolrouter::v1::CreateRequestRequest create;
  create.mutable_requesting_party()->set_value(std::string(32, '\x01'));
  create.set_request_id("r1");
  create.set_min_votes(1);
  create.set_approval_threshold(51);
  coolrouter::v1::CreateRequestResponse created;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateRequest(&grpc_ctx, &create, &created).ok());
  }

  coolrouter::v1::SubmitVoteRequest vote;
  vote.set_request_id("r1");
  vote.mutable_oracle()->set_value(std::string(32, '\x02'));
  vote.set_result_hash(std::string(32, '\x03'));
  vote.set_signature(std::string(64, '\x00'));
  coolrouter::v1::SubmitVoteResponse voted;
  ::grpc::ServerContext               grpc_ctx;

  assert(server.SubmitVote(&grpc_ctx, &vote, &voted).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestFulfillBeforeVotingReturnsFailedPrecondition() {
  auto service = std::make_shared<coolrouter::service::RouterService>(BuildServiceContext());
  coolrouter::grpc::RouterServer server(service);

  coolrouter::v1::CreateRequestRequest create;
  create.mutable_requesting_party()->set_value(std::string(32, '\x01'));
  create.set_request_id("r2");
  create.set_min_votes(1);
  create.set_approval_threshold(51);
  coolrouter::v1::CreateRequestResponse created;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateRequest(&grpc_ctx, &create, &created).ok());
  }

  coolrouter::v1::FulfillRequestRequest fulfill;
  fulfill.set_request_id("r2");
  fulfill.mutable_callback_program()->set_value(std::string(32, '\x01'));
  fulfill.set_payload("anything");
  coolrouter::v1::FulfillRequestResponse resp;
  ::grpc::ServerContext                  grpc_ctx;

  assert(server.FulfillRequest(&grpc_ctx, &fulfill, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestConsumerGetResponseBeforeFulfillment() {
  auto ctx      = BuildServiceContext();
  auto consumer = std::make_shared<coolrouter::service::ConsumerService>(ctx);
  coolrouter::grpc::ConsumerServer server(consumer);

  const auto user = coolrouter::crypto::Ed25519KeyPair::Generate();

  coolrouter::v1::RequestLlmResponseRequest ask;
  ask.mutable_authority()->set_value(coolrouter::util::ToBytes(user.PublicKey()));
  ask.set_request_id("c1");
  ask.set_prompt("hi");
  ask.set_min_votes(1);
  ask.set_approval_threshold(51);
  coolrouter::v1::RequestLlmResponseResponse asked;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.RequestLlmResponse(&grpc_ctx, &ask, &asked).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  }
  ask.set_authority_signature(user.Sign(coolrouter::auth::ConsumerRequestSigningMessage("c1", "hi", 1, 51)));
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.RequestLlmResponse(&grpc_ctx, &ask, &asked).ok());
  }
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.RequestLlmResponse(&grpc_ctx, &ask, &asked).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  }

  coolrouter::v1::GetResponseRequest read;
  *read.mutable_consumer_state() = asked.consumer_state();
  coolrouter::v1::GetResponseResponse resp;
  ::grpc::ServerContext               grpc_ctx;
  assert(server.GetResponse(&grpc_ctx, &read, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

} // namespace

int main() {
  TestCategoryMapping();
  TestGetMissingRequestReturnsNotFound();
  TestUnsignedVoteReturnsPermissionDenied();
  TestFulfillBeforeVotingReturnsFailedPrecondition();
  TestConsumerGetResponseBeforeFulfillment();

  std::cout << "coolrouter_unit_grpc_status: pass\n";
  return 0;
}
