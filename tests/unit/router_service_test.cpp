#include "internal/service/router_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/auth/authenticator.hpp"
#include "internal/consumer/llm_consumer.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/crypto/sha256.hpp"
#include "internal/factory.hpp"
#include "internal/service/consumer_service.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace {

using namespace coolrouter::v1;
using coolrouter::crypto::Ed25519KeyPair;
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

Identity Wire(const coolrouter::model::Identity& id) {
  Identity out;
  coolrouter::service::ToProto(id, &out);
  return out;
}

template <typename Fn>
ErrorCode CodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const coolrouter::util::RouterError& e) {
    return e.code();
  }
  assert(false && "expected RouterError");
  return ErrorCode::kInvalidArgument;
}

SubmitVoteRequest SignedVote(const Ed25519KeyPair& oracle, const std::string& id, const std::string& answer) {
  const auto hash = coolrouter::crypto::Sha256(answer);

  SubmitVoteRequest req;
  req.set_request_id(id);
  *req.mutable_oracle() = Wire(oracle.PublicKey());
  req.set_result_hash(coolrouter::util::ToBytes(hash));
  req.set_signature(oracle.Sign(coolrouter::auth::VoteSigningMessage(id, hash)));
  return req;
}

CreateRequestRequest Create(const std::string& id) {
  coolrouter::model::Identity requester{};
  requester.fill(0x42);

  CreateRequestRequest req;
  *req.mutable_requesting_party() = Wire(requester);
  req.set_request_id(id);
  req.set_provider("openai");
  req.set_model_id("gpt-4");
  auto* message = req.add_messages();
  message->set_role("user");
  message->set_content("hello");
  auto* target = req.add_callback_targets();
  target->mutable_pubkey()->set_value(std::string(32, '\x07'));
  target->set_is_writable(true);
  req.set_min_votes(1);
  req.set_approval_threshold(51);
  return req;
}

void TestMalformedWireValuesRejected() {
  coolrouter::service::RouterService router(BuildServiceContext());

  auto short_party = Create("wire");
  short_party.mutable_requesting_party()->set_value("short");
  assert(CodeOf([&] { router.CreateRequest(short_party); }) == ErrorCode::kInvalidArgument);

  auto bad_account = Create("wire");
  bad_account.mutable_callback_targets(0)->mutable_pubkey()->set_value(std::string(33, 'x'));
  assert(CodeOf([&] { router.CreateRequest(bad_account); }) == ErrorCode::kInvalidArgument);

  auto big_votes = Create("wire");
  big_votes.set_min_votes(256);
  assert(CodeOf([&] { router.CreateRequest(big_votes); }) == ErrorCode::kInvalidMinVotes);

  auto big_threshold = Create("wire");
  big_threshold.set_approval_threshold(1000);
  assert(CodeOf([&] { router.CreateRequest(big_threshold); }) == ErrorCode::kInvalidApprovalThreshold);

  auto vote = SignedVote(Ed25519KeyPair::Generate(), "wire", "x");
  vote.set_result_hash("abc");
  assert(CodeOf([&] { router.SubmitVote(vote); }) == ErrorCode::kInvalidArgument);

  GetRequestRequest get;
  get.set_request_id("wire");
  assert(CodeOf([&] { router.GetRequest(get); }) == ErrorCode::kRequestNotFound);
}

void TestCreateVoteGet() {
  auto ctx = BuildServiceContext();
  coolrouter::service::RouterService router(ctx);
  auto subscription = router.SubscribeEvents();

  const auto created = router.CreateRequest(Create("svc-1"));
  assert(created.request().status() == REQUEST_STATUS_PENDING);
  assert(created.request().callback_targets_size() == 1);
  assert(created.request().callback_targets(0).is_writable());

  const auto voted = router.SubmitVote(SignedVote(Ed25519KeyPair::Generate(), "svc-1", "answer"));
  assert(voted.status() == REQUEST_STATUS_VOTING_COMPLETED);
  assert(voted.total_votes_cast() == 1);
  assert(voted.leading_count() == 1);
  assert(voted.vote_percentage() == 100);
  assert(voted.winning_hash() == coolrouter::util::ToBytes(coolrouter::crypto::Sha256("answer")));

  GetRequestRequest get;
  get.set_request_id("svc-1");
  const auto fetched = router.GetRequest(get).request();
  assert(fetched.votes_size() == 1);
  assert(fetched.winning_hash() == voted.winning_hash());
  assert(fetched.created_at().seconds() > 0);

  auto first = subscription->Next(std::chrono::milliseconds(0));
  assert(first.has_value());
  const auto wire = coolrouter::service::ToProto(*first);
  assert(wire.has_request_created());
  assert(wire.request_created().messages_size() == 1);

  auto second = subscription->Next(std::chrono::milliseconds(0));
  assert(second.has_value());
  assert(coolrouter::service::ToProto(*second).has_voting_completed());
}

void TestConsumerRoundTrip() {
  auto ctx = BuildServiceContext();
  coolrouter::service::RouterService   router(ctx);
  coolrouter::service::ConsumerService consumer(ctx);

  const auto user      = Ed25519KeyPair::Generate();
  const auto authority = user.PublicKey();

  RequestLlmResponseRequest ask;
  *ask.mutable_authority() = Wire(authority);
  ask.set_request_id("svc-2");
  ask.set_prompt("2+2?");
  ask.set_min_votes(2);
  ask.set_approval_threshold(100);

  // Unsigned, then signed over different parameters.
  assert(CodeOf([&] { consumer.RequestLlmResponse(ask); }) == ErrorCode::kUnauthorizedAuthority);
  ask.set_authority_signature(user.Sign(coolrouter::auth::ConsumerRequestSigningMessage("svc-2", "2+2?", 1, 100)));
  assert(CodeOf([&] { consumer.RequestLlmResponse(ask); }) == ErrorCode::kUnauthorizedAuthority);
  GetRequestRequest lookup;
  lookup.set_request_id("svc-2");
  assert(CodeOf([&] { router.GetRequest(lookup); }) == ErrorCode::kRequestNotFound);

  ask.set_authority_signature(user.Sign(coolrouter::auth::ConsumerRequestSigningMessage("svc-2", "2+2?", 2, 100)));
  const auto asked = consumer.RequestLlmResponse(ask);
  assert(asked.program_id().value() == coolrouter::util::ToBytes(ctx.consumer->ProgramId()));

  router.SubmitVote(SignedVote(Ed25519KeyPair::Generate(), "svc-2", "4"));
  router.SubmitVote(SignedVote(Ed25519KeyPair::Generate(), "svc-2", "4"));

  GetResponseRequest read;
  *read.mutable_consumer_state() = asked.consumer_state();
  assert(CodeOf([&] { consumer.GetResponse(read); }) == ErrorCode::kNoResponse);

  GetRequestRequest get;
  get.set_request_id("svc-2");
  const auto request = router.GetRequest(get).request();

  FulfillRequestRequest fulfill;
  fulfill.set_request_id("svc-2");
  *fulfill.mutable_callback_program() = request.requesting_party();
  *fulfill.mutable_accounts()         = request.callback_targets();
  fulfill.set_payload("5");
  assert(CodeOf([&] { router.FulfillRequest(fulfill); }) == ErrorCode::kPayloadHashMismatch);

  fulfill.set_payload("4");
  const auto done = router.FulfillRequest(fulfill);
  assert(done.status() == REQUEST_STATUS_FULFILLED);
  assert(done.payload_length() == 1);

  const auto response = consumer.GetResponse(read);
  assert(response.request_id() == "svc-2");
  assert(response.response() == "4");
  assert(response.authority().value() == coolrouter::util::ToBytes(authority));
}

void TestConsumerServiceNeedsConsumer() {
  auto ctx     = BuildServiceContext();
  ctx.consumer = nullptr;

  bool threw = false;
  try {
    coolrouter::service::ConsumerService consumer(ctx);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

void TestListRequests() {
  coolrouter::service::RouterService router(BuildServiceContext());

  router.CreateRequest(Create("list-1"));
  router.CreateRequest(Create("list-2"));
  router.CreateRequest(Create("list-3"));
  router.SubmitVote(SignedVote(Ed25519KeyPair::Generate(), "list-2", "answer"));

  ListRequestsRequest req;
  assert(router.ListRequests(req).requests_size() == 3);

  req.set_status(REQUEST_STATUS_PENDING);
  const auto pending = router.ListRequests(req);
  assert(pending.requests_size() == 2);
  for (const auto& request : pending.requests()) {
    assert(request.status() == REQUEST_STATUS_PENDING);
    assert(request.request_id() != "list-2");
  }

  req.set_status(REQUEST_STATUS_VOTING_COMPLETED);
  const auto completed = router.ListRequests(req);
  assert(completed.requests_size() == 1);
  assert(completed.requests(0).request_id() == "list-2");

  req.set_status(REQUEST_STATUS_UNSPECIFIED);
  req.set_limit(1);
  assert(router.ListRequests(req).requests_size() == 1);

  req.set_status(static_cast<RequestStatus>(42));
  assert(CodeOf([&] { router.ListRequests(req); }) == ErrorCode::kInvalidArgument);
}

int main() {
  TestMalformedWireValuesRejected();
  TestCreateVoteGet();
  TestListRequests();
  TestConsumerRoundTrip();
  TestConsumerServiceNeedsConsumer();

  std::cout << "coolrouter_unit_router_service: pass\n";
  return 0;
}
