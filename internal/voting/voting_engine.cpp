#include "voting_engine.hpp"

#include <algorithm>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#include "internal/voting/hash_counter.hpp"

namespace coolrouter::voting {

using coolrouter::model::RequestStatus;
using coolrouter::util::ErrorCode;

VoteOutcome ApplyVote(db::model::RequestRecord& record, const model::Identity& oracle, const model::Hash32& result_hash,
                      std::size_t max_oracles) {
  if (!model::CanTransition(record.status, RequestStatus::kVotingCompleted)) {
    throw util::InvalidState(ErrorCode::kNotPending,
                             "request " + record.id + " is " + std::string(model::ToString(record.status)));
  }

  const bool already_voted =
      std::any_of(record.votes.begin(), record.votes.end(), [&](const model::Vote& v) { return v.oracle == oracle; });
  if (already_voted) {
    throw util::AlreadyExists(ErrorCode::kAlreadyVoted, "oracle " + util::ToHex(oracle) + " already voted on " + record.id);
  }

  if (record.votes.size() >= max_oracles) {
    throw util::ResourceExhausted(ErrorCode::kTooManyVotes,
                                  "request " + record.id + " already holds " + std::to_string(record.votes.size()) + " votes");
  }

  record.votes.push_back(model::Vote{oracle, result_hash});
  record.total_votes_cast = static_cast<uint32_t>(record.votes.size());

  const auto leader = Leader(CountHashes(record.votes));

  VoteOutcome outcome;
  outcome.leading_hash    = leader->hash;
  outcome.leading_count   = leader->count;
  outcome.total_votes     = record.total_votes_cast;
  outcome.vote_percentage = leader->count * 100 / record.total_votes_cast;

  if (outcome.leading_count >= record.min_votes && outcome.vote_percentage >= record.approval_threshold) {
    record.winning_hash = leader->hash;
    record.status       = RequestStatus::kVotingCompleted;
    outcome.resolved    = true;
  }
  return outcome;
}

} // namespace coolrouter::voting
