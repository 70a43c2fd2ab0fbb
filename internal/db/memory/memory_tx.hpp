#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace coolrouter::db::memory {

/*
  Transaction = snapshot + write set.

  Commit fails if any record in the write set changed since the
  snapshot was taken; untouched records are never overwritten.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  TxMode Mode() const override {
    return mode_;
  }

  // Call before mutating `id` in the working state.
  MemoryRepository::State& MutableFor(const std::string& id);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  TxMode                  mode_;
  MemoryRepository::State working_;

  // id -> version at snapshot time (nullopt when absent)
  std::unordered_map<std::string, std::optional<uint64_t>> write_set_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace coolrouter::db::memory
