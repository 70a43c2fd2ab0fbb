#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/auth/authenticator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/model/types.hpp"
#include "internal/voting/voting_engine.hpp"

namespace coolrouter::dispatch {
class CallbackDispatcher;
}
namespace coolrouter::events {
class EventSink;
}

namespace coolrouter::core {

struct CreateRequestParams {
  model::Identity                  requesting_party{};
  std::string                      request_id;
  std::string                      provider;
  std::string                      model_id;
  std::vector<model::Message>      messages;
  std::vector<model::AccountMeta>  callback_targets;
  uint8_t                          min_votes          = 1;
  uint8_t                          approval_threshold = 1;
};

struct VoteResult {
  db::model::RequestRecord record;
  voting::VoteOutcome      outcome;
};

/*
  Request lifecycle: create -> vote* -> fulfill.

  Every operation is all-or-nothing against one record: operations on
  the same id are serialized, each runs in a single repository
  transaction, and events are published only after commit. Errors are
  thrown as util::RouterError subclasses and leave the record unchanged.

  Callback targets run on the fulfilling thread while the request is
  locked; they must not call back into the broker for the same id.
*/
class RequestBroker {
 public:
  RequestBroker(std::shared_ptr<db::Repository> repository, std::shared_ptr<auth::Authenticator> authenticator,
                std::shared_ptr<dispatch::CallbackDispatcher> dispatcher, std::shared_ptr<events::EventSink> events);

  db::model::RequestRecord Create(const CreateRequestParams& params);

  VoteResult Vote(const std::string& request_id, const auth::Credential& oracle, const model::Hash32& result_hash);

  db::model::RequestRecord Fulfill(const std::string& request_id, const model::Identity& calling_program,
                                   const std::vector<model::AccountMeta>& provided_accounts, std::string_view payload);

  db::model::RequestRecord              Get(const std::string& request_id);
  std::vector<db::model::RequestRecord> List(const db::RequestFilter& filter = {});

  // Ids with a live per-request lock; zero when the broker is idle.
  std::size_t LockedRequestCount() const;

 private:
  // Serializes operations on one id. The map entry is erased by the
  // last holder, so unknown ids leave nothing behind.
  class RequestLock {
   public:
    RequestLock(RequestBroker& broker, const std::string& request_id);
    ~RequestLock();

    RequestLock(const RequestLock&)            = delete;
    RequestLock& operator=(const RequestLock&) = delete;

   private:
    RequestBroker&               broker_;
    std::string                  request_id_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<auth::Authenticator>          authenticator_;
  std::shared_ptr<dispatch::CallbackDispatcher> dispatcher_;
  std::shared_ptr<events::EventSink>            events_;

  mutable std::mutex                                           request_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> request_mutexes_;
};

} // namespace coolrouter::core
