#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/model/request_status.hpp"

namespace coolrouter::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Records violating the storage bounds are rejected with BoundsExceeded,
    as are resolved records without a winning hash
  - callback targets are written once, votes are only appended

  The DB is the source of truth for request lifecycle state.
*/

// Listing is ordered by (created_at_ms, id). A zero limit means no limit.
struct RequestFilter {
  std::optional<coolrouter::model::RequestStatus> status;
  std::size_t                                     limit = 0;
};

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // For Get/List paths; Insert/Update inside it return ReadOnly.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  virtual Result InsertRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter&) = 0;

  // Persists status, winning hash, vote count, version and any appended votes.
  virtual Result UpdateRequest(Transaction&, const model::RequestRecord&) = 0;
};

} // namespace coolrouter::db
