#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace coolrouter::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertRequest(Transaction&, const model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string&) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter&) override;
  Result UpdateRequest(Transaction&, const model::RequestRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RequestRecord> requests;
  };

  std::mutex mutex_;
  State committed_;
};

}
