#include "internal/core/request_broker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "internal/crypto/ed25519.hpp"
#include "internal/crypto/sha256.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/callback_dispatcher.hpp"
#include "internal/dispatch/program_registry.hpp"
#include "internal/events/event_hub.hpp"
#include "internal/util/errors.hpp"

namespace {

using coolrouter::auth::Credential;
using coolrouter::core::CreateRequestParams;
using coolrouter::core::RequestBroker;
using coolrouter::crypto::Ed25519KeyPair;
using coolrouter::db::model::RequestRecord;
using coolrouter::dispatch::CallbackInvocation;
using coolrouter::model::AccountMeta;
using coolrouter::model::Hash32;
using coolrouter::model::Identity;
using coolrouter::model::RequestStatus;
using coolrouter::util::ErrorCode;

Identity Id(uint8_t tag) {
  Identity id{};
  id.fill(tag);
  return id;
}

// Records every invocation; rejects while `reject` is set.
class RecordingProgram final : public coolrouter::dispatch::CallbackTarget {
 public:
  void Invoke(const CallbackInvocation& invocation) override {
    if (reject) {
      throw std::runtime_error("program refused");
    }
    std::scoped_lock lock(mutex);
    calls.push_back(invocation);
  }

  std::size_t Calls() {
    std::scoped_lock lock(mutex);
    return calls.size();
  }

  std::atomic<bool>               reject{false};
  std::mutex                      mutex;
  std::vector<CallbackInvocation> calls;
};

// Serves records without their winning hash, as a damaged store would.
class HashDroppingRepository final : public coolrouter::db::Repository {
 public:
  explicit HashDroppingRepository(std::shared_ptr<coolrouter::db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<coolrouter::db::Transaction> Begin() override {
    return inner_->Begin();
  }
  std::unique_ptr<coolrouter::db::Transaction> BeginRead() override {
    return inner_->BeginRead();
  }
  coolrouter::db::Result InsertRequest(coolrouter::db::Transaction& tx, const RequestRecord& record) override {
    return inner_->InsertRequest(tx, record);
  }
  std::optional<RequestRecord> GetRequest(coolrouter::db::Transaction& tx, const std::string& id) override {
    auto record = inner_->GetRequest(tx, id);
    if (record && drop) {
      record->winning_hash.reset();
    }
    return record;
  }
  std::vector<RequestRecord> ListRequests(coolrouter::db::Transaction& tx, const coolrouter::db::RequestFilter& filter) override {
    return inner_->ListRequests(tx, filter);
  }
  coolrouter::db::Result UpdateRequest(coolrouter::db::Transaction& tx, const RequestRecord& record) override {
    return inner_->UpdateRequest(tx, record);
  }

  bool drop = false;

 private:
  std::shared_ptr<coolrouter::db::Repository> inner_;
};

struct Fixture {
  Fixture() {
    repository = std::make_shared<coolrouter::db::memory::MemoryRepository>();
    registry   = std::make_shared<coolrouter::dispatch::ProgramRegistry>();
    events     = std::make_shared<coolrouter::events::EventHub>(64);
    program    = std::make_shared<RecordingProgram>();
    registry->Register(kRequester, program);

    broker = std::make_shared<RequestBroker>(repository, std::make_shared<coolrouter::auth::Ed25519Authenticator>(),
                                             std::make_shared<coolrouter::dispatch::CallbackDispatcher>(registry), events);
    subscription = events->Subscribe();
  }

  CreateRequestParams Params(const std::string& id, uint8_t min_votes = 2, uint8_t threshold = 60) const {
    CreateRequestParams params;
    params.requesting_party   = kRequester;
    params.request_id         = id;
    params.provider           = "openai";
    params.model_id           = "gpt-4";
    params.messages           = {{"system", "be brief"}, {"user", "capital of France?"}};
    params.callback_targets   = {AccountMeta{Id(0x51), true, true}, AccountMeta{Id(0x52), false, false}};
    params.min_votes          = min_votes;
    params.approval_threshold = threshold;
    return params;
  }

  coolrouter::core::VoteResult Vote(const Ed25519KeyPair& oracle, const std::string& id, const std::string& answer) {
    const auto hash = coolrouter::crypto::Sha256(answer);
    Credential credential{oracle.PublicKey(), oracle.Sign(coolrouter::auth::VoteSigningMessage(id, hash))};
    return broker->Vote(id, credential, hash);
  }

  std::vector<AccountMeta> Targets(const std::string& id) {
    return broker->Get(id).callback_targets;
  }

  std::vector<coolrouter::events::EventEnvelope> Drain() {
    std::vector<coolrouter::events::EventEnvelope> out;
    while (auto envelope = subscription->Next(std::chrono::milliseconds(0))) {
      out.push_back(std::move(*envelope));
    }
    return out;
  }

  static inline const Identity kRequester = Id(0xC0);

  std::shared_ptr<coolrouter::db::memory::MemoryRepository> repository;
  std::shared_ptr<coolrouter::dispatch::ProgramRegistry>    registry;
  std::shared_ptr<coolrouter::events::EventHub>             events;
  std::shared_ptr<RecordingProgram>                         program;
  std::shared_ptr<RequestBroker>                            broker;
  std::unique_ptr<coolrouter::events::Subscription>         subscription;
};

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

// Two matching "Paris." votes resolve `id`.
void Resolve(Fixture& f, const std::string& id) {
  f.broker->Create(f.Params(id));
  f.Vote(Ed25519KeyPair::Generate(), id, "Paris.");
  const auto result = f.Vote(Ed25519KeyPair::Generate(), id, "Paris.");
  assert(result.record.status == RequestStatus::kVotingCompleted);
}

void TestCreateStoresPendingRecord() {
  Fixture f;
  const auto created = f.broker->Create(f.Params("req-create"));

  assert(created.status == RequestStatus::kPending);
  assert(created.total_votes_cast == 0);
  assert(created.votes.empty());
  assert(!created.winning_hash.has_value());

  const auto stored = f.broker->Get("req-create");
  assert(stored.status == RequestStatus::kPending);
  assert(stored.provider == "openai" && stored.model_id == "gpt-4");
  assert(stored.callback_targets.size() == 2);
  assert(stored.callback_targets[0].pubkey == Id(0x51) && stored.callback_targets[0].is_writable);
  assert(stored.callback_targets[1].pubkey == Id(0x52) && !stored.callback_targets[1].is_writable);
  assert(!stored.callback_targets[0].is_signer);

  const auto events = f.Drain();
  assert(events.size() == 1);
  const auto* event = std::get_if<coolrouter::events::RequestCreated>(&events[0].event);
  assert(event != nullptr);
  assert(event->request_id == "req-create");
  assert(event->messages.size() == 2 && event->messages[1].content == "capital of France?");
  assert(event->min_votes == 2 && event->approval_threshold == 60);
}

void TestCreateValidation() {
  Fixture f;

  auto params = f.Params(std::string(64, 'x'));
  f.broker->Create(params);

  params = f.Params(std::string(65, 'x'));
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kRequestIdTooLong);

  params          = f.Params("bounds");
  params.provider = std::string(65, 'p');
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kProviderTooLong);

  params          = f.Params("bounds");
  params.model_id = std::string(65, 'm');
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kModelIdTooLong);

  params = f.Params("bounds");
  params.messages.assign(51, {"user", "hi"});
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kTooManyMessages);

  params = f.Params("bounds");
  params.callback_targets.assign(33, AccountMeta{Id(1), true, false});
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kTooManyAccounts);

  params           = f.Params("bounds");
  params.min_votes = 0;
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kInvalidMinVotes);

  params                    = f.Params("bounds");
  params.approval_threshold = 0;
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kInvalidApprovalThreshold);
  params.approval_threshold = 101;
  assert(CodeOf([&] { f.broker->Create(params); }) == ErrorCode::kInvalidApprovalThreshold);

  // Nothing rejected was stored.
  assert(CodeOf([&] { f.broker->Get("bounds"); }) == ErrorCode::kRequestNotFound);
  assert(f.broker->List().size() == 1);
  assert(f.broker->List({RequestStatus::kFulfilled, 0}).empty());
}

void TestDuplicateCreateRejected() {
  Fixture f;
  f.broker->Create(f.Params("dup"));

  auto second     = f.Params("dup");
  second.provider = "other";
  assert(CodeOf([&] { f.broker->Create(second); }) == ErrorCode::kRequestAlreadyExists);
  assert(f.broker->Get("dup").provider == "openai");
}

void TestVoteAuthentication() {
  Fixture f;
  f.broker->Create(f.Params("auth"));

  const auto oracle = Ed25519KeyPair::Generate();
  const auto hash   = coolrouter::crypto::Sha256("Paris.");
  const auto other  = coolrouter::crypto::Sha256("Lyon.");

  // Signature over a different hash.
  Credential forged{oracle.PublicKey(), oracle.Sign(coolrouter::auth::VoteSigningMessage("auth", other))};
  assert(CodeOf([&] { f.broker->Vote("auth", forged, hash); }) == ErrorCode::kUnauthorizedOracle);

  // Someone else's key.
  const auto impostor = Ed25519KeyPair::Generate();
  Credential stolen{oracle.PublicKey(), impostor.Sign(coolrouter::auth::VoteSigningMessage("auth", hash))};
  assert(CodeOf([&] { f.broker->Vote("auth", stolen, hash); }) == ErrorCode::kUnauthorizedOracle);

  Credential truncated{oracle.PublicKey(), "short"};
  assert(CodeOf([&] { f.broker->Vote("auth", truncated, hash); }) == ErrorCode::kUnauthorizedOracle);

  assert(f.broker->Get("auth").total_votes_cast == 0);

  assert(CodeOf([&] { f.Vote(oracle, "missing", "Paris."); }) == ErrorCode::kRequestNotFound);
}

void TestDuplicateVoteLeavesRecordUnchanged() {
  Fixture f;
  f.broker->Create(f.Params("twice", 3, 100));

  const auto oracle = Ed25519KeyPair::Generate();
  f.Vote(oracle, "twice", "Paris.");
  const auto before = f.broker->Get("twice");

  assert(CodeOf([&] { f.Vote(oracle, "twice", "Lyon."); }) == ErrorCode::kAlreadyVoted);

  const auto after = f.broker->Get("twice");
  assert(after.votes == before.votes);
  assert(after.total_votes_cast == 1);
  assert(after.version == before.version);
}

void TestMajorityResolvesAndClosesVoting() {
  Fixture f;
  f.broker->Create(f.Params("majority", 2, 60));
  f.Drain();

  const auto first = f.Vote(Ed25519KeyPair::Generate(), "majority", "Paris.");
  assert(!first.outcome.resolved);

  const auto second = f.Vote(Ed25519KeyPair::Generate(), "majority", "Paris.");
  assert(second.outcome.resolved);
  assert(second.record.status == RequestStatus::kVotingCompleted);
  assert(second.record.winning_hash == coolrouter::crypto::Sha256("Paris."));

  assert(CodeOf([&] { f.Vote(Ed25519KeyPair::Generate(), "majority", "Lyon."); }) == ErrorCode::kNotPending);
  assert(f.broker->Get("majority").total_votes_cast == 2);

  const auto events = f.Drain();
  assert(events.size() == 1);
  const auto* completed = std::get_if<coolrouter::events::VotingCompleted>(&events[0].event);
  assert(completed != nullptr);
  assert(completed->winning_hash == coolrouter::crypto::Sha256("Paris."));
  assert(completed->vote_count == 2 && completed->total_votes == 2);
}

void TestUnanimousThresholdWithDissentStaysPending() {
  Fixture f;
  f.broker->Create(f.Params("split", 3, 100));

  f.Vote(Ed25519KeyPair::Generate(), "split", "A");
  f.Vote(Ed25519KeyPair::Generate(), "split", "A");
  const auto third = f.Vote(Ed25519KeyPair::Generate(), "split", "B");

  assert(!third.outcome.resolved);
  assert(third.record.status == RequestStatus::kPending);
  assert(CodeOf([&] { f.broker->Fulfill("split", Fixture::kRequester, f.Targets("split"), "A"); }) ==
         ErrorCode::kVotingNotCompleted);
}

void TestFulfillChecks() {
  Fixture f;
  f.broker->Create(f.Params("early"));
  assert(CodeOf([&] { f.broker->Fulfill("early", Fixture::kRequester, f.Targets("early"), "Paris."); }) ==
         ErrorCode::kVotingNotCompleted);

  Resolve(f, "checks");
  const auto targets = f.Targets("checks");

  assert(CodeOf([&] { f.broker->Fulfill("checks", Fixture::kRequester, targets, "Lyon."); }) == ErrorCode::kPayloadHashMismatch);
  assert(CodeOf([&] { f.broker->Fulfill("checks", Id(0xEE), targets, "Paris."); }) == ErrorCode::kCallbackProgramMismatch);

  // Payload is checked before the program.
  assert(CodeOf([&] { f.broker->Fulfill("checks", Id(0xEE), targets, "Lyon."); }) == ErrorCode::kPayloadHashMismatch);

  auto extra = targets;
  extra.push_back(AccountMeta{Id(0x53), false, false});
  assert(CodeOf([&] { f.broker->Fulfill("checks", Fixture::kRequester, extra, "Paris."); }) == ErrorCode::kAccountCountMismatch);

  auto missing = targets;
  missing.pop_back();
  assert(CodeOf([&] { f.broker->Fulfill("checks", Fixture::kRequester, missing, "Paris."); }) ==
         ErrorCode::kAccountCountMismatch);

  auto reordered = targets;
  std::swap(reordered[0], reordered[1]);
  assert(CodeOf([&] { f.broker->Fulfill("checks", Fixture::kRequester, reordered, "Paris."); }) == ErrorCode::kAccountMismatch);

  assert(CodeOf([&] { f.broker->Fulfill("unknown", Fixture::kRequester, targets, "Paris."); }) == ErrorCode::kRequestNotFound);

  assert(f.program->Calls() == 0);
  assert(f.broker->Get("checks").status == RequestStatus::kVotingCompleted);
}

void TestFulfillDispatchesExactlyOnce() {
  Fixture f;
  Resolve(f, "once");
  f.Drain();

  // Writable flags come from the record, whatever the caller passes.
  auto provided = f.Targets("once");
  provided[0].is_writable = false;
  provided[1].is_signer   = true;

  const auto fulfilled = f.broker->Fulfill("once", Fixture::kRequester, provided, "Paris.");
  assert(fulfilled.status == RequestStatus::kFulfilled);
  assert(f.broker->Get("once").status == RequestStatus::kFulfilled);

  assert(f.program->Calls() == 1);
  const auto& call = f.program->calls[0];
  assert(call.program_id == Fixture::kRequester);
  assert(call.accounts.size() == 2);
  assert(call.accounts[0].pubkey == Id(0x51) && call.accounts[0].is_writable && !call.accounts[0].is_signer);
  assert(call.accounts[1].pubkey == Id(0x52) && !call.accounts[1].is_writable && !call.accounts[1].is_signer);

  const auto args = coolrouter::dispatch::DecodeCallbackData(call.data);
  assert(args.request_id == "once");
  assert(args.payload == "Paris.");

  assert(CodeOf([&] { f.broker->Fulfill("once", Fixture::kRequester, provided, "Paris."); }) == ErrorCode::kVotingNotCompleted);
  assert(f.program->Calls() == 1);

  const auto events = f.Drain();
  assert(events.size() == 1);
  const auto* done = std::get_if<coolrouter::events::RequestFulfilled>(&events[0].event);
  assert(done != nullptr && done->request_id == "once" && done->payload_length == 6);
}

void TestRejectedCallbackPersistsNothing() {
  Fixture f;
  Resolve(f, "rejected");
  f.Drain();
  f.program->reject = true;

  const auto targets = f.Targets("rejected");
  assert(CodeOf([&] { f.broker->Fulfill("rejected", Fixture::kRequester, targets, "Paris."); }) == ErrorCode::kCallbackRejected);
  assert(f.broker->Get("rejected").status == RequestStatus::kVotingCompleted);
  assert(f.Drain().empty());

  // Unregistered requester is rejected the same way.
  f.registry->Unregister(Fixture::kRequester);
  assert(CodeOf([&] { f.broker->Fulfill("rejected", Fixture::kRequester, targets, "Paris."); }) == ErrorCode::kCallbackRejected);

  f.registry->Register(Fixture::kRequester, f.program);
  f.program->reject = false;
  f.broker->Fulfill("rejected", Fixture::kRequester, targets, "Paris.");
  assert(f.broker->Get("rejected").status == RequestStatus::kFulfilled);
}

void TestConcurrentVotesAreSerialized() {
  Fixture f;
  f.broker->Create(f.Params("parallel", 32, 100));

  std::vector<Ed25519KeyPair> oracles;
  for (int i = 0; i < 16; ++i) {
    oracles.push_back(Ed25519KeyPair::Generate());
  }

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (const auto& oracle : oracles) {
    threads.emplace_back([&, oracle] {
      try {
        f.Vote(oracle, "parallel", "same answer");
      } catch (const std::exception&) {
        ++failures;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  assert(failures.load() == 0);
  const auto record = f.broker->Get("parallel");
  assert(record.total_votes_cast == 16);
  assert(record.votes.size() == 16);
  assert(record.status == RequestStatus::kPending);
}

void TestThirtyThirdVoteRejected() {
  Fixture f;
  f.broker->Create(f.Params("full", 33, 100));

  for (int i = 0; i < 32; ++i) {
    f.Vote(Ed25519KeyPair::Generate(), "full", "same");
  }
  assert(CodeOf([&] { f.Vote(Ed25519KeyPair::Generate(), "full", "same"); }) == ErrorCode::kTooManyVotes);
  assert(f.broker->Get("full").status == RequestStatus::kPending);
}

void TestMissingWinningHashBlocksFulfill() {
  Fixture f;
  auto damaged = std::make_shared<HashDroppingRepository>(f.repository);
  f.broker     = std::make_shared<RequestBroker>(damaged, std::make_shared<coolrouter::auth::Ed25519Authenticator>(),
                                                 std::make_shared<coolrouter::dispatch::CallbackDispatcher>(f.registry), f.events);
  Resolve(f, "hashless");
  f.Drain();

  const auto targets = f.Targets("hashless");
  damaged->drop      = true;
  assert(CodeOf([&] { f.broker->Fulfill("hashless", Fixture::kRequester, targets, "Paris."); }) ==
         ErrorCode::kWinningHashMissing);

  damaged->drop = false;
  assert(f.program->Calls() == 0);
  assert(f.broker->Get("hashless").status == RequestStatus::kVotingCompleted);
  assert(f.Drain().empty());
}

void TestRequestLocksAreReleased() {
  Fixture f;
  for (int i = 0; i < 1000; ++i) {
    const auto id = "no-such-" + std::to_string(i);
    assert(CodeOf([&] { f.broker->Fulfill(id, Fixture::kRequester, {}, "x"); }) == ErrorCode::kRequestNotFound);
    assert(CodeOf([&] { f.Vote(Ed25519KeyPair::Generate(), id, "x"); }) == ErrorCode::kRequestNotFound);
  }
  assert(f.broker->LockedRequestCount() == 0);

  Resolve(f, "held");
  f.broker->Fulfill("held", Fixture::kRequester, f.Targets("held"), "Paris.");
  assert(f.broker->LockedRequestCount() == 0);

  // Contended ids are dropped once the last holder leaves.
  f.broker->Create(f.Params("contended", 32, 100));
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      f.Vote(Ed25519KeyPair::Generate(), "contended", "same");
      CodeOf([&] { f.broker->Fulfill("contended", Fixture::kRequester, {}, "same"); });
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  assert(f.broker->Get("contended").total_votes_cast == 8);
  assert(f.broker->LockedRequestCount() == 0);
}

} // namespace

int main() {
  TestCreateStoresPendingRecord();
  TestCreateValidation();
  TestDuplicateCreateRejected();
  TestVoteAuthentication();
  TestDuplicateVoteLeavesRecordUnchanged();
  TestMajorityResolvesAndClosesVoting();
  TestUnanimousThresholdWithDissentStaysPending();
  TestFulfillChecks();
  TestFulfillDispatchesExactlyOnce();
  TestRejectedCallbackPersistsNothing();
  TestConcurrentVotesAreSerialized();
  TestThirtyThirdVoteRejected();
  TestMissingWinningHashBlocksFulfill();
  TestRequestLocksAreReleased();

  std::cout << "coolrouter_unit_request_broker: pass\n";
  return 0;
}
