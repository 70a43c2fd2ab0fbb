#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "internal/db/model/request_record.hpp"
#include "internal/model/limits.hpp"
#include "internal/model/types.hpp"

namespace coolrouter::voting {

struct VoteOutcome {
  model::Hash32 leading_hash{};
  uint32_t      leading_count    = 0;
  uint32_t      total_votes      = 0;
  uint32_t      vote_percentage  = 0;
  bool          resolved         = false;
};

/*
  Applies one oracle vote to a pending record.

  Throws InvalidState(NotPending), AlreadyExists(AlreadyVoted) or
  ResourceExhausted(TooManyVotes) and leaves the record untouched on
  failure. On success the vote is appended and, when the leading hash
  holds at least min_votes and approval_threshold percent of the votes
  cast, the record moves to VotingCompleted with winning_hash set.
*/
VoteOutcome ApplyVote(db::model::RequestRecord& record, const model::Identity& oracle, const model::Hash32& result_hash,
                      std::size_t max_oracles = model::kMaxOracles);

} // namespace coolrouter::voting
