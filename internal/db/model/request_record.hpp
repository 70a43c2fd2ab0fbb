#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/request_status.hpp"
#include "internal/model/types.hpp"

namespace coolrouter::db::model {

/*
  Persistent request row.

  IMPORTANT:
  - callback_targets is write-once; backends never rewrite it on update.
  - votes is append-only; an update carrying fewer votes than stored is a conflict.
  - winning_hash is set exactly when status leaves Pending.
  - version increments on every committed update.
*/

struct RequestRecord {
  std::string id;

  coolrouter::model::Identity requesting_party{};
  std::string                 provider;
  std::string                 model_id;

  std::vector<coolrouter::model::AccountMeta> callback_targets;

  coolrouter::model::RequestStatus status = coolrouter::model::RequestStatus::kPending;

  uint64_t created_at_ms = 0;

  uint8_t min_votes          = 1;
  uint8_t approval_threshold = 1;

  std::vector<coolrouter::model::Vote> votes;

  std::optional<coolrouter::model::Hash32> winning_hash;

  uint32_t total_votes_cast = 0;

  uint64_t version = 0;
};

/*
  Returns an empty string if the record fits the storage layout and,
  once resolved, carries its winning hash. Otherwise describes the
  first violation.
*/
std::string CheckStorageBounds(const RequestRecord& record);

} // namespace coolrouter::db::model
