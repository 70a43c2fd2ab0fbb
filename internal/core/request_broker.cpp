#include "request_broker.hpp"

#include <stdexcept>

#include "internal/crypto/sha256.hpp"
#include "internal/dispatch/callback_dispatcher.hpp"
#include "internal/events/events.hpp"
#include "internal/model/limits.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/util/time.hpp"

namespace coolrouter::core {

using coolrouter::model::RequestStatus;
using coolrouter::observability::HashField;
using coolrouter::observability::IdentityField;
using coolrouter::observability::IntField;
using coolrouter::observability::StringField;
using coolrouter::util::ErrorCode;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(ErrorCode::kRequestAlreadyExists, message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(ErrorCode::kRequestNotFound, message);
    case db::ErrorCode::BoundsExceeded:
      throw util::ResourceExhausted(ErrorCode::kStorageBoundsExceeded, message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ToString(result.code)) + ")");
  }
}

void CheckLength(const std::string& value, std::size_t max, ErrorCode code, std::string_view what) {
  if (value.size() > max) {
    throw util::InvalidArgument(code, std::string(what) + " is " + std::to_string(value.size()) + " bytes, max " +
                                          std::to_string(max));
  }
}

void ValidateCreate(const CreateRequestParams& params) {
  CheckLength(params.request_id, model::kMaxRequestIdBytes, ErrorCode::kRequestIdTooLong, "request id");
  CheckLength(params.provider, model::kMaxProviderBytes, ErrorCode::kProviderTooLong, "provider");
  CheckLength(params.model_id, model::kMaxModelIdBytes, ErrorCode::kModelIdTooLong, "model id");

  if (params.messages.size() > model::kMaxMessages) {
    throw util::InvalidArgument(ErrorCode::kTooManyMessages, std::to_string(params.messages.size()) + " messages, max " +
                                                                 std::to_string(model::kMaxMessages));
  }
  if (params.callback_targets.size() > model::kMaxCallbackTargets) {
    throw util::InvalidArgument(ErrorCode::kTooManyAccounts, std::to_string(params.callback_targets.size()) +
                                                                 " callback accounts, max " +
                                                                 std::to_string(model::kMaxCallbackTargets));
  }
  if (params.min_votes < 1) {
    throw util::InvalidArgument(ErrorCode::kInvalidMinVotes, "min_votes must be at least 1");
  }
  if (params.approval_threshold < 1 || params.approval_threshold > model::kMaxApprovalThreshold) {
    throw util::InvalidArgument(ErrorCode::kInvalidApprovalThreshold,
                                "approval_threshold must be 1..100, got " + std::to_string(params.approval_threshold));
  }
}

void CheckCallbackAccounts(const db::model::RequestRecord& record, const std::vector<model::AccountMeta>& provided) {
  if (provided.size() != record.callback_targets.size()) {
    throw util::PermissionDenied(ErrorCode::kAccountCountMismatch, "expected " + std::to_string(record.callback_targets.size()) +
                                                                       " callback accounts, got " + std::to_string(provided.size()));
  }
  for (std::size_t i = 0; i < provided.size(); ++i) {
    if (provided[i].pubkey != record.callback_targets[i].pubkey) {
      throw util::PermissionDenied(ErrorCode::kAccountMismatch, "callback account " + std::to_string(i) + " is " +
                                                                    util::ToHex(provided[i].pubkey) + ", expected " +
                                                                    util::ToHex(record.callback_targets[i].pubkey));
    }
  }
}

} // namespace

RequestBroker::RequestBroker(std::shared_ptr<db::Repository> repository, std::shared_ptr<auth::Authenticator> authenticator,
                             std::shared_ptr<dispatch::CallbackDispatcher> dispatcher, std::shared_ptr<events::EventSink> events)
    : repository_(std::move(repository)),
      authenticator_(std::move(authenticator)),
      dispatcher_(std::move(dispatcher)),
      events_(std::move(events)) {
  if (!repository_ || !authenticator_ || !dispatcher_) {
    throw std::invalid_argument("RequestBroker requires repository, authenticator and dispatcher");
  }
}

RequestBroker::RequestLock::RequestLock(RequestBroker& broker, const std::string& request_id)
    : broker_(broker), request_id_(request_id) {
  {
    std::lock_guard<std::mutex> guard(broker_.request_mutexes_guard_);
    auto&                       request_mutex = broker_.request_mutexes_[request_id_];
    if (!request_mutex) {
      request_mutex = std::make_shared<std::mutex>();
    }
    mutex_ = request_mutex;
  }
  lock_ = std::unique_lock<std::mutex>(*mutex_);
}

RequestBroker::RequestLock::~RequestLock() {
  lock_.unlock();

  std::lock_guard<std::mutex> guard(broker_.request_mutexes_guard_);
  mutex_.reset();
  auto it = broker_.request_mutexes_.find(request_id_);
  if (it != broker_.request_mutexes_.end() && it->second.use_count() == 1) {
    broker_.request_mutexes_.erase(it);
  }
}

std::size_t RequestBroker::LockedRequestCount() const {
  std::lock_guard<std::mutex> guard(request_mutexes_guard_);
  return request_mutexes_.size();
}

db::model::RequestRecord RequestBroker::Create(const CreateRequestParams& params) {
  ValidateCreate(params);

  RequestLock lock(*this, params.request_id);

  db::model::RequestRecord record;
  record.id                 = params.request_id;
  record.requesting_party   = params.requesting_party;
  record.provider           = params.provider;
  record.model_id           = params.model_id;
  record.callback_targets   = params.callback_targets;
  record.status             = RequestStatus::kPending;
  record.created_at_ms      = util::NowMillis();
  record.min_votes          = params.min_votes;
  record.approval_threshold = params.approval_threshold;
  for (auto& target : record.callback_targets) {
    target.is_signer = false;
  }

  {
    auto tx = repository_->Begin();
    if (repository_->GetRequest(*tx, record.id)) {
      throw util::AlreadyExists(ErrorCode::kRequestAlreadyExists, "request " + record.id + " already exists");
    }
    ThrowIfDbError(repository_->InsertRequest(*tx, record), "insert request " + record.id);
    tx->Commit();
  }
  record.version = 1;

  COOLROUTER_LOG_INFO("Request created", {StringField("request_id", record.id),
                                          IdentityField("requesting_party", record.requesting_party),
                                          StringField("provider", record.provider), StringField("model_id", record.model_id),
                                          IntField("min_votes", record.min_votes),
                                          IntField("approval_threshold", record.approval_threshold)});

  if (events_) {
    events_->Publish(events::RequestCreated{record.id, record.requesting_party, record.provider, record.model_id,
                                            params.messages, record.min_votes, record.approval_threshold});
  }
  return record;
}

VoteResult RequestBroker::Vote(const std::string& request_id, const auth::Credential& oracle, const model::Hash32& result_hash) {
  if (!authenticator_->Verify(oracle, auth::VoteSigningMessage(request_id, result_hash))) {
    throw util::PermissionDenied(ErrorCode::kUnauthorizedOracle, "vote signature does not verify for oracle " + util::ToHex(oracle.identity));
  }

  RequestLock lock(*this, request_id);

  VoteResult result;
  {
    auto tx     = repository_->Begin();
    auto stored = repository_->GetRequest(*tx, request_id);
    if (!stored) {
      throw util::NotFound(ErrorCode::kRequestNotFound, "request " + request_id + " not found");
    }

    result.record  = std::move(*stored);
    result.outcome = voting::ApplyVote(result.record, oracle.identity, result_hash);

    ThrowIfDbError(repository_->UpdateRequest(*tx, result.record), "update request " + request_id);
    tx->Commit();
  }
  ++result.record.version;

  COOLROUTER_LOG_INFO("Vote recorded", {StringField("request_id", request_id), IdentityField("oracle", oracle.identity),
                                        IntField("leading_count", result.outcome.leading_count),
                                        IntField("total_votes", result.outcome.total_votes),
                                        IntField("vote_percentage", result.outcome.vote_percentage)});

  if (result.outcome.resolved) {
    COOLROUTER_LOG_INFO("Voting completed", {StringField("request_id", request_id),
                                             HashField("winning_hash", *result.record.winning_hash),
                                             IntField("vote_count", result.outcome.leading_count),
                                             IntField("total_votes", result.outcome.total_votes)});
    if (events_) {
      events_->Publish(events::VotingCompleted{request_id, *result.record.winning_hash, result.outcome.leading_count,
                                               result.outcome.total_votes});
    }
  }
  return result;
}

db::model::RequestRecord RequestBroker::Fulfill(const std::string& request_id, const model::Identity& calling_program,
                                                const std::vector<model::AccountMeta>& provided_accounts, std::string_view payload) {
  RequestLock lock(*this, request_id);

  db::model::RequestRecord record;
  {
    auto tx     = repository_->Begin();
    auto stored = repository_->GetRequest(*tx, request_id);
    if (!stored) {
      throw util::NotFound(ErrorCode::kRequestNotFound, "request " + request_id + " not found");
    }
    record = std::move(*stored);

    if (!model::CanTransition(record.status, RequestStatus::kFulfilled)) {
      throw util::InvalidState(ErrorCode::kVotingNotCompleted,
                               "request " + request_id + " is " + std::string(model::ToString(record.status)));
    }
    if (!record.winning_hash) {
      throw util::InvalidState(ErrorCode::kWinningHashMissing, "request " + request_id + " has no winning hash");
    }
    if (crypto::HashPayload(payload) != *record.winning_hash) {
      throw util::IntegrityViolation(ErrorCode::kPayloadHashMismatch, "payload does not hash to the winning hash of " + request_id);
    }
    if (calling_program != record.requesting_party) {
      throw util::PermissionDenied(ErrorCode::kCallbackProgramMismatch, "callback program " + util::ToHex(calling_program) +
                                                                            " is not the requester " +
                                                                            util::ToHex(record.requesting_party));
    }
    CheckCallbackAccounts(record, provided_accounts);

    record.status = RequestStatus::kFulfilled;
    ThrowIfDbError(repository_->UpdateRequest(*tx, record), "update request " + request_id);

    // a rejected callback unwinds through tx and discards the update
    dispatcher_->Dispatch(record, payload);
    tx->Commit();
  }
  ++record.version;

  COOLROUTER_LOG_INFO("Request fulfilled", {StringField("request_id", request_id),
                                            IntField("payload_length", static_cast<int64_t>(payload.size()))});
  if (events_) {
    events_->Publish(events::RequestFulfilled{request_id, payload.size()});
  }
  return record;
}

db::model::RequestRecord RequestBroker::Get(const std::string& request_id) {
  auto tx     = repository_->BeginRead();
  auto stored = repository_->GetRequest(*tx, request_id);
  if (!stored) {
    throw util::NotFound(ErrorCode::kRequestNotFound, "request " + request_id + " not found");
  }
  tx->Commit();
  return std::move(*stored);
}

std::vector<db::model::RequestRecord> RequestBroker::List(const db::RequestFilter& filter) {
  auto tx      = repository_->BeginRead();
  auto records = repository_->ListRequests(*tx, filter);
  tx->Commit();
  return records;
}

} // namespace coolrouter::core
