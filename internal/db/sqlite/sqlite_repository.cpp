#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace coolrouter::db::sqlite {

using coolrouter::db::ErrorCode;
using coolrouter::db::Result;
using coolrouter::model::AccountMeta;
using coolrouter::model::Hash32;
using coolrouter::model::Identity;
using coolrouter::model::RequestStatus;
using coolrouter::model::Vote;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

template <std::size_t N>
void BindBlob(sqlite3_stmt* st, int idx, const std::array<std::uint8_t, N>& v) {
  sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

template <std::size_t N>
std::array<std::uint8_t, N> ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size != static_cast<int>(N)) {
    throw std::runtime_error("sqlite: corrupt fixed-width column " + std::to_string(col));
  }
  std::array<std::uint8_t, N> out{};
  std::copy_n(static_cast<const std::uint8_t*>(data), N, out.begin());
  return out;
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return sqlite3_column_int64(st, col);
}

std::vector<Vote> LoadVotes(sqlite3* db, const std::string& id) {
  auto st = Prepare(db, sql::SELECT_VOTES);
  BindText(st.get(), 1, id);

  std::vector<Vote> votes;
  int               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    votes.push_back(Vote{ColBlob<32>(st.get(), 0), ColBlob<32>(st.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite select votes: ") + sqlite3_errmsg(db));
  }
  return votes;
}

std::vector<AccountMeta> LoadCallbackTargets(sqlite3* db, const std::string& id) {
  auto st = Prepare(db, sql::SELECT_CALLBACK_TARGETS);
  BindText(st.get(), 1, id);

  std::vector<AccountMeta> targets;
  int                      rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    AccountMeta meta;
    meta.pubkey      = ColBlob<32>(st.get(), 0);
    meta.is_writable = ColI64(st.get(), 1) != 0;
    targets.push_back(meta);
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite select callback targets: ") + sqlite3_errmsg(db));
  }
  return targets;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::kReadWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, TxMode::kReadOnly);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
    if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, r.id);
    if (auto violation = model::CheckStorageBounds(r); !violation.empty())
        return Result::Err(ErrorCode::BoundsExceeded, violation);

    auto* db = TX(t).Handle();

    {
        auto st = Prepare(db, sql::SELECT_REQUEST_VERSION);
        BindText(st.get(), 1, r.id);
        if (sqlite3_step(st.get()) == SQLITE_ROW)
            return Result::Err(ErrorCode::AlreadyExists, r.id);
    }

    auto st = Prepare(db, sql::INSERT_REQUEST);
    BindText(st.get(), 1, r.id);
    BindBlob(st.get(), 2, r.requesting_party);
    BindText(st.get(), 3, r.provider);
    BindText(st.get(), 4, r.model_id);
    BindI64(st.get(), 5, static_cast<int64_t>(r.status));
    BindI64(st.get(), 6, static_cast<int64_t>(r.created_at_ms));
    BindI64(st.get(), 7, r.min_votes);
    BindI64(st.get(), 8, r.approval_threshold);
    if (r.winning_hash) {
        BindBlob(st.get(), 9, *r.winning_hash);
    } else {
        sqlite3_bind_null(st.get(), 9);
    }
    BindI64(st.get(), 10, r.total_votes_cast);

    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;

    for (std::size_t i = 0; i < r.callback_targets.size(); ++i) {
        auto target = Prepare(db, sql::INSERT_CALLBACK_TARGET);
        BindText(target.get(), 1, r.id);
        BindI64(target.get(), 2, static_cast<int64_t>(i));
        BindBlob(target.get(), 3, r.callback_targets[i].pubkey);
        BindI64(target.get(), 4, r.callback_targets[i].is_writable ? 1 : 0);
        if (auto res = Translate(db, sqlite3_step(target.get())); !res) return res;
    }

    for (std::size_t i = 0; i < r.votes.size(); ++i) {
        auto vote = Prepare(db, sql::INSERT_VOTE);
        BindText(vote.get(), 1, r.id);
        BindI64(vote.get(), 2, static_cast<int64_t>(i));
        BindBlob(vote.get(), 3, r.votes[i].oracle);
        BindBlob(vote.get(), 4, r.votes[i].result_hash);
        if (auto res = Translate(db, sqlite3_step(vote.get())); !res) return res;
    }

    return Result::Ok();
}

std::optional<model::RequestRecord>
SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SELECT_REQUEST);
    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite select request: ") + sqlite3_errmsg(db));

    model::RequestRecord r;
    r.id                 = ColText(st.get(), 0);
    r.requesting_party   = ColBlob<32>(st.get(), 1);
    r.provider           = ColText(st.get(), 2);
    r.model_id           = ColText(st.get(), 3);
    r.status             = static_cast<RequestStatus>(ColI64(st.get(), 4));
    r.created_at_ms      = static_cast<uint64_t>(ColI64(st.get(), 5));
    r.min_votes          = static_cast<uint8_t>(ColI64(st.get(), 6));
    r.approval_threshold = static_cast<uint8_t>(ColI64(st.get(), 7));
    if (sqlite3_column_type(st.get(), 8) != SQLITE_NULL) {
        r.winning_hash = ColBlob<32>(st.get(), 8);
    }
    r.total_votes_cast = static_cast<uint32_t>(ColI64(st.get(), 9));
    r.version          = static_cast<uint64_t>(ColI64(st.get(), 10));
    st.reset();

    r.callback_targets = LoadCallbackTargets(db, id);
    r.votes            = LoadVotes(db, id);
    return r;
}

std::vector<model::RequestRecord> SqliteRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
    auto* db = TX(t).Handle();

    std::vector<std::string> ids;
    {
        auto st = Prepare(db, sql::SELECT_REQUEST_IDS);
        if (filter.status) {
            BindI64(st.get(), 1, static_cast<int64_t>(*filter.status));
        } else {
            sqlite3_bind_null(st.get(), 1);
        }
        BindI64(st.get(), 2, filter.limit == 0 ? -1 : static_cast<int64_t>(filter.limit));

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
            ids.push_back(ColText(st.get(), 0));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("sqlite list requests: ") + sqlite3_errmsg(db));
        }
    }

    std::vector<model::RequestRecord> records;
    records.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto record = GetRequest(t, id)) records.push_back(std::move(*record));
    }
    return records;
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
    if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, r.id);
    if (auto violation = model::CheckStorageBounds(r); !violation.empty())
        return Result::Err(ErrorCode::BoundsExceeded, violation);

    auto* db = TX(t).Handle();

    {
        auto st = Prepare(db, sql::SELECT_REQUEST_VERSION);
        BindText(st.get(), 1, r.id);
        if (sqlite3_step(st.get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, r.id);
        if (static_cast<uint64_t>(ColI64(st.get(), 0)) != r.version)
            return Result::Err(ErrorCode::Conflict, "stale version for request " + r.id);
    }

    const auto stored_votes = LoadVotes(db, r.id);
    if (r.votes.size() < stored_votes.size() ||
        !std::equal(stored_votes.begin(), stored_votes.end(), r.votes.begin()))
        return Result::Err(ErrorCode::Conflict, "votes are append-only for request " + r.id);

    auto st = Prepare(db, sql::UPDATE_REQUEST);
    BindI64(st.get(), 1, static_cast<int64_t>(r.status));
    if (r.winning_hash) {
        BindBlob(st.get(), 2, *r.winning_hash);
    } else {
        sqlite3_bind_null(st.get(), 2);
    }
    BindI64(st.get(), 3, r.total_votes_cast);
    BindText(st.get(), 4, r.id);
    BindI64(st.get(), 5, static_cast<int64_t>(r.version));

    if (auto res = Translate(db, sqlite3_step(st.get())); !res) return res;
    if (sqlite3_changes(db) != 1) return Result::Err(ErrorCode::Conflict, "request " + r.id + " changed concurrently");

    for (std::size_t i = stored_votes.size(); i < r.votes.size(); ++i) {
        auto vote = Prepare(db, sql::INSERT_VOTE);
        BindText(vote.get(), 1, r.id);
        BindI64(vote.get(), 2, static_cast<int64_t>(i));
        BindBlob(vote.get(), 3, r.votes[i].oracle);
        BindBlob(vote.get(), 4, r.votes[i].result_hash);
        if (auto res = Translate(db, sqlite3_step(vote.get())); !res) return res;
    }

    return Result::Ok();
}

} // namespace coolrouter::db::sqlite
