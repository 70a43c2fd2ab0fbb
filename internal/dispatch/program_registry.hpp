#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include "internal/dispatch/callback.hpp"

namespace coolrouter::dispatch {

/*
  In-process transport: programs register under their identity and
  receive invocations synchronously on the caller's thread.
*/
class ProgramRegistry final : public CallbackTransport {
 public:
  void Register(const model::Identity& program_id, std::shared_ptr<CallbackTarget> target);
  void Unregister(const model::Identity& program_id);
  bool Contains(const model::Identity& program_id) const;

  // Unknown programs reject with CallbackFailed(CallbackRejected).
  void Send(const CallbackInvocation& invocation) override;

 private:
  mutable std::shared_mutex                                  mutex_;
  std::map<model::Identity, std::shared_ptr<CallbackTarget>> programs_;
};

} // namespace coolrouter::dispatch
