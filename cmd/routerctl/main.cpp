#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "coolrouter/router/services/v1/consumer_service.grpc.pb.h"
#include "coolrouter/router/services/v1/router_service.grpc.pb.h"
#include "coolrouter/v1.hpp"
#include "internal/auth/authenticator.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/crypto/sha256.hpp"
#include "internal/oracle/fulfiller_selection.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

using namespace coolrouter::v1;

namespace util   = coolrouter::util;
namespace crypto = coolrouter::crypto;

static void Usage() {
  std::cout << "Usage:\n"
            << "  routerctl keygen\n"
            << "  routerctl pubkey <seed_hex>\n"
            << "  routerctl hash <text>\n"
            << "  routerctl <addr> request <authority_seed_hex> <request_id> <prompt> [min_votes] [approval_threshold]\n"
            << "  routerctl <addr> vote <seed_hex> <request_id> <response_text>\n"
            << "  routerctl <addr> fulfill <request_id> <payload>\n"
            << "  routerctl <addr> get <request_id>\n"
            << "  routerctl <addr> list [pending|voting_completed|fulfilled] [limit]\n"
            << "  routerctl <addr> response <consumer_state_hex>\n"
            << "  routerctl <addr> watch\n"
            << "  routerctl <addr> oracle <seed_hex> <response_text>\n";
}

static Identity MakeIdentity(const coolrouter::model::Identity& id) {
  Identity out;
  out.set_value(util::ToBytes(id));
  return out;
}

static Identity ParseIdentity(const std::string& hex) {
  return MakeIdentity(util::FixedFromHex<coolrouter::model::kIdentityBytes>(hex, "identity"));
}

static crypto::Ed25519KeyPair LoadKey(const std::string& seed_hex) {
  return crypto::Ed25519KeyPair::FromSeed(util::FixedFromHex<crypto::kEd25519SeedBytes>(seed_hex, "seed"));
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static const char* StatusName(RequestStatus status) {
  switch (status) {
    case REQUEST_STATUS_PENDING:
      return "pending";
    case REQUEST_STATUS_VOTING_COMPLETED:
      return "voting_completed";
    case REQUEST_STATUS_FULFILLED:
      return "fulfilled";
    default:
      return "unspecified";
  }
}

static bool ParseStatus(const std::string& name, RequestStatus* out) {
  for (const auto status : {REQUEST_STATUS_PENDING, REQUEST_STATUS_VOTING_COMPLETED, REQUEST_STATUS_FULFILLED}) {
    if (name == StatusName(status)) {
      *out = status;
      return true;
    }
  }
  return false;
}

static void PrintRequest(const LlmRequest& request) {
  std::cout << "request_id=" << request.request_id() << "\n"
            << "requesting_party=" << util::ToHex(request.requesting_party().value()) << "\n"
            << "provider=" << request.provider() << " model_id=" << request.model_id() << "\n"
            << "status=" << StatusName(request.status()) << "\n"
            << "created_at=" << util::FormatMillis(util::ProtoToMillis(request.created_at())) << "\n"
            << "min_votes=" << request.min_votes() << " approval_threshold=" << request.approval_threshold() << "\n"
            << "total_votes_cast=" << request.total_votes_cast() << "\n";
  for (const auto& vote : request.votes()) {
    std::cout << "vote oracle=" << util::ToHex(vote.oracle().value()) << " hash=" << util::ToHex(vote.result_hash()) << "\n";
  }
  if (!request.winning_hash().empty()) {
    std::cout << "winning_hash=" << util::ToHex(request.winning_hash()) << "\n";
  }
}

static void PrintEvent(const RouterEvent& event) {
  std::cout << "#" << event.sequence() << " " << util::FormatMillis(util::ProtoToMillis(event.published_at())) << " ";
  switch (event.event_case()) {
    case RouterEvent::kRequestCreated:
      std::cout << "request_created request_id=" << event.request_created().request_id() << "\n";
      break;
    case RouterEvent::kVotingCompleted:
      std::cout << "voting_completed request_id=" << event.voting_completed().request_id()
                << " winning_hash=" << util::ToHex(event.voting_completed().winning_hash())
                << " total_votes=" << event.voting_completed().total_votes() << "\n";
      break;
    case RouterEvent::kRequestFulfilled:
      std::cout << "request_fulfilled request_id=" << event.request_fulfilled().request_id()
                << " payload_length=" << event.request_fulfilled().payload_length() << "\n";
      break;
    case RouterEvent::kResponseReceived:
      std::cout << "response_received request_id=" << event.response_received().request_id()
                << " preview=" << event.response_received().response_preview() << "\n";
      break;
    default:
      std::cout << "unknown\n";
      break;
  }
}

static grpc::Status SubmitVote(RouterService::Stub& stub, const crypto::Ed25519KeyPair& key, const std::string& request_id,
                               const coolrouter::model::Hash32& hash, SubmitVoteResponse* resp) {
  SubmitVoteRequest req;
  req.set_request_id(request_id);
  *req.mutable_oracle() = MakeIdentity(key.PublicKey());
  req.set_result_hash(util::ToBytes(hash));
  req.set_signature(key.Sign(coolrouter::auth::VoteSigningMessage(request_id, hash)));

  grpc::ClientContext ctx;
  return stub.SubmitVote(&ctx, req, resp);
}

// Fulfill needs the recorded callback targets, in order.
static grpc::Status Fulfill(RouterService::Stub& stub, const std::string& request_id, const std::string& payload,
                            FulfillRequestResponse* resp) {
  GetRequestRequest get_req;
  get_req.set_request_id(request_id);
  GetRequestResponse get_resp;
  {
    grpc::ClientContext ctx;
    auto                status = stub.GetRequest(&ctx, get_req, &get_resp);
    if (!status.ok()) {
      return status;
    }
  }

  FulfillRequestRequest req;
  req.set_request_id(request_id);
  *req.mutable_callback_program() = get_resp.request().requesting_party();
  *req.mutable_accounts()         = get_resp.request().callback_targets();
  req.set_payload(payload);

  grpc::ClientContext ctx;
  return stub.FulfillRequest(&ctx, req, resp);
}

/*
  Votes sha256(response) on every new request and, once voting
  completes in its favour, volunteers to fulfill with the selection
  probability.
*/
static int RunOracle(RouterService::Stub& stub, const crypto::Ed25519KeyPair& key, const std::string& response) {
  const auto                           own_hash = crypto::Sha256(response);
  coolrouter::oracle::FulfillerSelection selection;

  std::cout << "oracle=" << util::ToHex(key.PublicKey()) << " hash=" << util::ToHex(own_hash) << "\n";

  grpc::ClientContext     ctx;
  SubscribeEventsRequest  req;
  auto                    reader = stub.SubscribeEvents(&ctx, req);
  RouterEvent             event;

  while (reader->Read(&event)) {
    if (event.has_request_created()) {
      const auto&        request_id = event.request_created().request_id();
      SubmitVoteResponse vote_resp;
      auto               status = SubmitVote(stub, key, request_id, own_hash, &vote_resp);
      if (!status.ok()) {
        std::cerr << "vote " << request_id << ": " << status.error_message() << "\n";
        continue;
      }
      std::cout << "voted request_id=" << request_id << " total_votes_cast=" << vote_resp.total_votes_cast() << "\n";
      continue;
    }

    if (event.has_voting_completed()) {
      const auto& completed = event.voting_completed();
      if (completed.winning_hash().size() != own_hash.size()) {
        continue;
      }
      const auto winning = util::FixedFromBytes<coolrouter::model::kHashBytes>(completed.winning_hash(), "winning_hash");
      if (!selection.ShouldFulfill(own_hash, winning, completed.total_votes())) {
        continue;
      }

      FulfillRequestResponse fulfill_resp;
      auto                   status = Fulfill(stub, completed.request_id(), response, &fulfill_resp);
      if (!status.ok()) {
        // Another selected oracle got there first.
        std::cerr << "fulfill " << completed.request_id() << ": " << status.error_message() << "\n";
        continue;
      }
      std::cout << "fulfilled request_id=" << completed.request_id() << "\n";
    }
  }

  const auto status = reader->Finish();
  return status.ok() ? 0 : Fail(status);
}

static int RunLocal(int argc, char** argv) {
  const std::string cmd = argv[1];

  if (cmd == "keygen") {
    const auto key = crypto::Ed25519KeyPair::Generate();
    std::cout << "seed=" << util::ToHex(key.Seed()) << "\n"
              << "pubkey=" << util::ToHex(key.PublicKey()) << "\n";
    return 0;
  }

  if (cmd == "pubkey") {
    if (argc < 3) return 1;
    std::cout << util::ToHex(LoadKey(argv[2]).PublicKey()) << "\n";
    return 0;
  }

  if (cmd == "hash") {
    if (argc < 3) return 1;
    std::cout << util::ToHex(crypto::Sha256(argv[2])) << "\n";
    return 0;
  }

  return -1;
}

static int Run(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  if (const int rc = RunLocal(argc, argv); rc >= 0) {
    return rc;
  }

  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto router_stub   = RouterService::NewStub(channel);
  auto consumer_stub = ConsumerService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 6) return 1;

    const auto authority = LoadKey(argv[3]);
    const auto min_votes = argc >= 7 ? std::stoul(argv[6]) : 1;
    const auto threshold = argc >= 8 ? std::stoul(argv[7]) : 51;

    RequestLlmResponseRequest req;
    *req.mutable_authority() = MakeIdentity(authority.PublicKey());
    req.set_request_id(argv[4]);
    req.set_prompt(argv[5]);
    req.set_min_votes(min_votes);
    req.set_approval_threshold(threshold);
    req.set_authority_signature(authority.Sign(coolrouter::auth::ConsumerRequestSigningMessage(
        req.request_id(), req.prompt(), static_cast<uint8_t>(min_votes), static_cast<uint8_t>(threshold))));

    RequestLlmResponseResponse resp;
    grpc::ClientContext        ctx;

    auto status = consumer_stub->RequestLlmResponse(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "consumer_state=" << util::ToHex(resp.consumer_state().value()) << "\n"
              << "program_id=" << util::ToHex(resp.program_id().value()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "vote") {
    if (argc < 6) return 1;

    SubmitVoteResponse resp;
    auto               status = SubmitVote(*router_stub, LoadKey(argv[3]), argv[4], crypto::Sha256(argv[5]), &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << StatusName(resp.status()) << " total_votes_cast=" << resp.total_votes_cast()
              << " leading_count=" << resp.leading_count() << " vote_percentage=" << resp.vote_percentage() << "\n";
    if (!resp.winning_hash().empty()) {
      std::cout << "winning_hash=" << util::ToHex(resp.winning_hash()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "fulfill") {
    if (argc < 5) return 1;

    FulfillRequestResponse resp;
    auto                   status = Fulfill(*router_stub, argv[3], argv[4], &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << StatusName(resp.status()) << " payload_length=" << resp.payload_length() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetRequestRequest req;
    req.set_request_id(argv[3]);

    GetRequestResponse  resp;
    grpc::ClientContext ctx;

    auto status = router_stub->GetRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRequest(resp.request());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListRequestsRequest req;
    if (argc >= 4) {
      RequestStatus status = REQUEST_STATUS_UNSPECIFIED;
      if (!ParseStatus(argv[3], &status)) {
        std::cerr << "unknown status " << argv[3] << "\n";
        return 1;
      }
      req.set_status(status);
    }
    if (argc >= 5) req.set_limit(std::stoul(argv[4]));

    ListRequestsResponse resp;
    grpc::ClientContext  ctx;

    auto status = router_stub->ListRequests(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& request : resp.requests()) {
      std::cout << request.request_id() << " " << StatusName(request.status()) << " votes=" << request.total_votes_cast()
                << " created_at=" << util::FormatMillis(util::ProtoToMillis(request.created_at())) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "response") {
    if (argc < 4) return 1;

    GetResponseRequest req;
    *req.mutable_consumer_state() = ParseIdentity(argv[3]);

    GetResponseResponse resp;
    grpc::ClientContext ctx;

    auto status = consumer_stub->GetResponse(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "request_id=" << resp.request_id() << "\n"
              << "authority=" << util::ToHex(resp.authority().value()) << "\n"
              << resp.response() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    grpc::ClientContext    ctx;
    SubscribeEventsRequest req;
    auto                   reader = router_stub->SubscribeEvents(&ctx, req);

    RouterEvent event;
    while (reader->Read(&event)) {
      PrintEvent(event);
    }
    const auto status = reader->Finish();
    return status.ok() ? 0 : Fail(status);
  }

  // ------------------------------------------------------------

  if (cmd == "oracle") {
    if (argc < 5) return 1;
    return RunOracle(*router_stub, LoadKey(argv[3]), argv[4]);
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  try {
    return Run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
}
