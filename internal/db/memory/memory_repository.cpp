#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace coolrouter::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, TxMode::kReadWrite);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, TxMode::kReadOnly);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, r.id);
  if (auto violation = model::CheckStorageBounds(r); !violation.empty()) {
    return Result::Err(ErrorCode::BoundsExceeded, violation);
  }

  auto& s = TX(t).MutableFor(r.id);
  if (s.requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);

  auto& stored   = s.requests[r.id];
  stored         = r;
  stored.version = 1;
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RequestRecord> MemoryRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
  const auto&                       s = TX(t).View();
  std::vector<model::RequestRecord> records;
  for (const auto& [_, record] : s.requests) {
    if (filter.status && record.status != *filter.status) continue;
    records.push_back(record);
  }

  std::sort(records.begin(), records.end(), [](const model::RequestRecord& a, const model::RequestRecord& b) {
    return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
  });
  if (filter.limit != 0 && records.size() > filter.limit) {
    records.resize(filter.limit);
  }
  return records;
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  if (t.IsReadOnly()) return Result::Err(ErrorCode::ReadOnly, r.id);
  if (auto violation = model::CheckStorageBounds(r); !violation.empty()) {
    return Result::Err(ErrorCode::BoundsExceeded, violation);
  }

  auto& s  = TX(t).MutableFor(r.id);
  auto  it = s.requests.find(r.id);
  if (it == s.requests.end()) return Result::Err(ErrorCode::NotFound, r.id);

  auto& stored = it->second;
  if (stored.version != r.version) {
    return Result::Err(ErrorCode::Conflict, "stale version for request " + r.id);
  }
  if (r.votes.size() < stored.votes.size() ||
      !std::equal(stored.votes.begin(), stored.votes.end(), r.votes.begin())) {
    return Result::Err(ErrorCode::Conflict, "votes are append-only for request " + r.id);
  }

  auto targets            = std::move(stored.callback_targets);
  const auto next_version = stored.version + 1;
  stored                  = r;
  stored.callback_targets = std::move(targets);
  stored.version          = next_version;
  return Result::Ok();
}

} // namespace coolrouter::db::memory
