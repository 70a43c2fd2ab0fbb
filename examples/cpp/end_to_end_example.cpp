#include <chrono>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "config/config.pb.h"
#include "coolrouter/v1.hpp"
#include "internal/consumer/llm_consumer.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/crypto/sha256.hpp"
#include "internal/events/event_hub.hpp"
#include "internal/factory.hpp"
#include "internal/service/consumer_service.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/service/router_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/auth/authenticator.hpp"
#include "internal/util/hex.hpp"

namespace {

using namespace coolrouter::v1;

Identity ToWire(const coolrouter::model::Identity& id) {
  Identity out;
  coolrouter::service::ToProto(id, &out);
  return out;
}

void PrintEvent(const coolrouter::events::EventEnvelope& envelope) {
  std::cout << "  event #" << envelope.sequence << ": ";
  std::visit(
      [](const auto& event) {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, coolrouter::events::RequestCreated>) {
          std::cout << "RequestCreated " << event.request_id << "\n";
        } else if constexpr (std::is_same_v<T, coolrouter::events::VotingCompleted>) {
          std::cout << "VotingCompleted " << event.request_id << " " << event.vote_count << "/" << event.total_votes << "\n";
        } else if constexpr (std::is_same_v<T, coolrouter::events::RequestFulfilled>) {
          std::cout << "RequestFulfilled " << event.request_id << " (" << event.payload_length << " bytes)\n";
        } else {
          std::cout << "ResponseReceived " << event.request_id << ": " << event.response_preview << "\n";
        }
      },
      envelope.event);
}

} // namespace

int main() {
  // In-process router with the reference consumer program and an
  // in-memory repository.
  coolrouter::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_consumer()->set_enabled(true);

  auto runtime = coolrouter::factory::BuildRuntime(config);

  coolrouter::service::ServiceContext ctx;
  ctx.broker   = runtime.broker;
  ctx.consumer = runtime.consumer;
  ctx.events   = runtime.events;

  coolrouter::service::RouterService   router(ctx);
  coolrouter::service::ConsumerService consumer(ctx);

  auto subscription = router.SubscribeEvents();

  // A user asks the consumer program for an answer; two of three
  // oracles must agree.
  const auto user = coolrouter::crypto::Ed25519KeyPair::Generate();

  RequestLlmResponseRequest ask;
  *ask.mutable_authority() = ToWire(user.PublicKey());
  ask.set_request_id("example-1");
  ask.set_prompt("What is the capital of France?");
  ask.set_min_votes(2);
  ask.set_approval_threshold(60);
  ask.set_authority_signature(user.Sign(coolrouter::auth::ConsumerRequestSigningMessage(ask.request_id(), ask.prompt(), 2, 60)));
  const auto asked = consumer.RequestLlmResponse(ask);

  std::cout << "consumer state " << coolrouter::util::ToHex(asked.consumer_state().value()) << "\n";

  // Oracles answer independently and vote the hash of their answer.
  const std::vector<std::string> answers = {"Paris.", "Paris.", "Lyon."};
  for (const auto& answer : answers) {
    const auto oracle = coolrouter::crypto::Ed25519KeyPair::Generate();
    const auto hash   = coolrouter::crypto::Sha256(answer);

    SubmitVoteRequest vote;
    vote.set_request_id("example-1");
    *vote.mutable_oracle() = ToWire(oracle.PublicKey());
    vote.set_result_hash(coolrouter::util::ToBytes(hash));
    vote.set_signature(oracle.Sign(coolrouter::auth::VoteSigningMessage("example-1", hash)));

    try {
      const auto voted = router.SubmitVote(vote);
      std::cout << "vote for '" << answer << "': " << voted.leading_count() << "/" << voted.total_votes_cast() << " ("
                << voted.vote_percentage() << "%)\n";
    } catch (const std::exception& e) {
      // The third vote arrives after resolution.
      std::cout << "vote for '" << answer << "' rejected: " << e.what() << "\n";
    }
  }

  // Any winning oracle may fulfill with the plaintext answer.
  GetRequestRequest get;
  get.set_request_id("example-1");
  const auto request = router.GetRequest(get).request();

  FulfillRequestRequest fulfill;
  fulfill.set_request_id("example-1");
  *fulfill.mutable_callback_program() = request.requesting_party();
  *fulfill.mutable_accounts()         = request.callback_targets();
  fulfill.set_payload("Paris.");
  router.FulfillRequest(fulfill);

  GetResponseRequest read;
  *read.mutable_consumer_state() = asked.consumer_state();
  const auto response = consumer.GetResponse(read);
  std::cout << "stored response: " << response.response() << "\n";

  std::cout << "events:\n";
  while (auto envelope = subscription->Next(std::chrono::milliseconds(0))) {
    PrintEvent(*envelope);
  }

  runtime.events->Close();
  return 0;
}
