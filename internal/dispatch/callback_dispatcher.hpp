#pragma once

#include <memory>
#include <string_view>

#include "internal/db/model/request_record.hpp"
#include "internal/dispatch/callback.hpp"

namespace coolrouter::dispatch {

/*
  Delivers a fulfilled payload to the requesting program.

  The invocation always targets record.requesting_party and carries
  exactly record.callback_targets (order and writable flags as recorded,
  never signers). Any failure surfaces as CallbackFailed(CallbackRejected).
*/
class CallbackDispatcher {
 public:
  explicit CallbackDispatcher(std::shared_ptr<CallbackTransport> transport);

  CallbackInvocation Build(const db::model::RequestRecord& record, std::string_view payload) const;

  void Dispatch(const db::model::RequestRecord& record, std::string_view payload);

 private:
  std::shared_ptr<CallbackTransport> transport_;
};

} // namespace coolrouter::dispatch
