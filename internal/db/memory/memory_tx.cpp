#include "memory_tx.hpp"

#include <stdexcept>

namespace coolrouter::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::MutableFor(const std::string& id) {
  if (mode_ == TxMode::kReadOnly) {
    throw std::logic_error("write to request " + id + " in a read-only transaction");
  }
  if (!write_set_.contains(id)) {
    auto it = working_.requests.find(id);
    write_set_.emplace(id, it == working_.requests.end() ? std::nullopt : std::optional<uint64_t>(it->second.version));
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::runtime_error("commit after rollback");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [id, base_version] : write_set_) {
    auto current = repo_.committed_.requests.find(id);
    const bool exists = current != repo_.committed_.requests.end();
    if (exists != base_version.has_value() || (exists && current->second.version != *base_version)) {
      throw std::runtime_error("transaction conflict: request " + id + " was modified by a concurrent transaction");
    }
  }

  for (const auto& [id, _] : write_set_) {
    auto working = working_.requests.find(id);
    if (working != working_.requests.end()) {
      repo_.committed_.requests[id] = working->second;
    }
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace coolrouter::db::memory
