#include "program_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace coolrouter::dispatch {

void ProgramRegistry::Register(const model::Identity& program_id, std::shared_ptr<CallbackTarget> target) {
  if (!target) {
    throw std::invalid_argument("ProgramRegistry::Register: null target");
  }
  std::unique_lock lock(mutex_);
  if (!programs_.emplace(program_id, std::move(target)).second) {
    throw std::invalid_argument("ProgramRegistry::Register: program " + util::ToHex(program_id) + " already registered");
  }
}

void ProgramRegistry::Unregister(const model::Identity& program_id) {
  std::unique_lock lock(mutex_);
  programs_.erase(program_id);
}

bool ProgramRegistry::Contains(const model::Identity& program_id) const {
  std::shared_lock lock(mutex_);
  return programs_.contains(program_id);
}

void ProgramRegistry::Send(const CallbackInvocation& invocation) {
  std::shared_ptr<CallbackTarget> target;
  {
    std::shared_lock lock(mutex_);
    auto             it = programs_.find(invocation.program_id);
    if (it != programs_.end()) {
      target = it->second;
    }
  }

  if (!target) {
    throw util::CallbackFailed(util::ErrorCode::kCallbackRejected, "no program registered as " + util::ToHex(invocation.program_id));
  }
  target->Invoke(invocation);
}

} // namespace coolrouter::dispatch
