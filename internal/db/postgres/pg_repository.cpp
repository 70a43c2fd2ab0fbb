#include "pg_repository.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/hex.hpp"

namespace coolrouter::db::postgres {

using coolrouter::model::AccountMeta;
using coolrouter::model::Hash32;
using coolrouter::model::Identity;
using coolrouter::model::RequestStatus;
using coolrouter::model::Vote;

namespace {

template <std::size_t N>
std::array<std::uint8_t, N> FromHexColumn(const pqxx::field& field) {
  return util::FixedFromHex<N>(field.c_str(), "postgres column");
}

std::vector<Vote> LoadVotes(pqxx::transaction_base& work, const std::string& id) {
  std::vector<Vote> votes;
  for (const auto& row : work.exec_prepared("get_votes", id)) {
    votes.push_back(Vote{FromHexColumn<32>(row[0]), FromHexColumn<32>(row[1])});
  }
  return votes;
}

void InsertVotes(pqxx::transaction_base& work, const model::RequestRecord& r, std::size_t from) {
  for (std::size_t i = from; i < r.votes.size(); ++i) {
    work.exec_prepared("insert_vote", r.id, static_cast<int>(i), util::ToHex(r.votes[i].oracle), util::ToHex(r.votes[i].result_hash));
  }
}

std::optional<std::string> WinningHashHex(const model::RequestRecord& r) {
  if (!r.winning_hash) return std::nullopt;
  return util::ToHex(*r.winning_hash);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, TxMode::kReadWrite);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, TxMode::kReadOnly);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::check_violation*>(&e)) {
    return Result::Err(ErrorCode::BoundsExceeded, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, r.id);
  if (auto violation = model::CheckStorageBounds(r); !violation.empty()) {
    return Result::Err(ErrorCode::BoundsExceeded, violation);
  }

  try {
    auto& work = TX(t).Work();
    if (!work.exec_prepared("get_request_version", r.id).empty()) {
      return Result::Err(ErrorCode::AlreadyExists, r.id);
    }

    work.exec_prepared("insert_request", r.id, util::ToHex(r.requesting_party), r.provider, r.model_id,
                       static_cast<int>(r.status), static_cast<int64_t>(r.created_at_ms), static_cast<int>(r.min_votes),
                       static_cast<int>(r.approval_threshold), WinningHashHex(r), static_cast<int64_t>(r.total_votes_cast));

    for (std::size_t i = 0; i < r.callback_targets.size(); ++i) {
      work.exec_prepared("insert_callback_target", r.id, static_cast<int>(i), util::ToHex(r.callback_targets[i].pubkey),
                         r.callback_targets[i].is_writable);
    }
    InsertVotes(work, r, 0);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RequestRecord> PgRepository::GetRequest(Transaction& t, const std::string& id) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_prepared("get_request", id);
  if (res.empty()) return std::nullopt;

  const auto& row = res[0];

  model::RequestRecord r;
  r.id                 = row[0].c_str();
  r.requesting_party   = FromHexColumn<32>(row[1]);
  r.provider           = row[2].c_str();
  r.model_id           = row[3].c_str();
  r.status             = static_cast<RequestStatus>(row[4].as<int>());
  r.created_at_ms      = static_cast<uint64_t>(row[5].as<int64_t>());
  r.min_votes          = static_cast<uint8_t>(row[6].as<int>());
  r.approval_threshold = static_cast<uint8_t>(row[7].as<int>());
  if (!row[8].is_null()) {
    r.winning_hash = FromHexColumn<32>(row[8]);
  }
  r.total_votes_cast = static_cast<uint32_t>(row[9].as<int64_t>());
  r.version          = static_cast<uint64_t>(row[10].as<int64_t>());

  for (const auto& target : work.exec_prepared("get_callback_targets", id)) {
    AccountMeta meta;
    meta.pubkey      = FromHexColumn<32>(target[0]);
    meta.is_writable = target[1].as<bool>();
    r.callback_targets.push_back(meta);
  }
  r.votes = LoadVotes(work, id);
  return r;
}

std::vector<model::RequestRecord> PgRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
  std::optional<int> status;
  if (filter.status) status = static_cast<int>(*filter.status);
  // LIMIT NULL is LIMIT ALL
  std::optional<int64_t> limit;
  if (filter.limit != 0) limit = static_cast<int64_t>(filter.limit);

  std::vector<std::string> ids;
  for (const auto& row : TX(t).Work().exec_prepared("list_request_ids", status, limit)) {
    ids.emplace_back(row[0].c_str());
  }

  std::vector<model::RequestRecord> records;
  records.reserve(ids.size());
  for (const auto& id : ids) {
    if (auto record = GetRequest(t, id)) records.push_back(std::move(*record));
  }
  return records;
}

Result PgRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, r.id);
  if (auto violation = model::CheckStorageBounds(r); !violation.empty()) {
    return Result::Err(ErrorCode::BoundsExceeded, violation);
  }

  try {
    auto& work    = TX(t).Work();
    auto  current = work.exec_prepared("get_request_version", r.id);
    if (current.empty()) return Result::Err(ErrorCode::NotFound, r.id);
    if (static_cast<uint64_t>(current[0][0].as<int64_t>()) != r.version) {
      return Result::Err(ErrorCode::Conflict, "stale version for request " + r.id);
    }

    const auto stored_votes = LoadVotes(work, r.id);
    if (r.votes.size() < stored_votes.size() || !std::equal(stored_votes.begin(), stored_votes.end(), r.votes.begin())) {
      return Result::Err(ErrorCode::Conflict, "votes are append-only for request " + r.id);
    }

    auto updated = work.exec_prepared("update_request", r.id, static_cast<int>(r.status), WinningHashHex(r),
                                      static_cast<int64_t>(r.total_votes_cast), static_cast<int64_t>(r.version));
    if (updated.affected_rows() != 1) {
      return Result::Err(ErrorCode::Conflict, "request " + r.id + " changed concurrently");
    }

    InsertVotes(work, r, stored_votes.size());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace coolrouter::db::postgres
