#include "callback_dispatcher.hpp"

#include <cstdint>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace coolrouter::dispatch {

using coolrouter::util::ErrorCode;

CallbackDispatcher::CallbackDispatcher(std::shared_ptr<CallbackTransport> transport) : transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("CallbackDispatcher requires a transport");
  }
}

CallbackInvocation CallbackDispatcher::Build(const db::model::RequestRecord& record, std::string_view payload) const {
  CallbackInvocation invocation;
  invocation.program_id = record.requesting_party;
  invocation.accounts.reserve(record.callback_targets.size());
  for (const auto& target : record.callback_targets) {
    invocation.accounts.push_back(model::AccountMeta{target.pubkey, target.is_writable, false});
  }
  invocation.data = EncodeCallbackData(record.id, payload);
  return invocation;
}

void CallbackDispatcher::Dispatch(const db::model::RequestRecord& record, std::string_view payload) {
  const auto invocation = Build(record, payload);
  COOLROUTER_LOG_DEBUG("Dispatching callback",
                       {observability::StringField("request_id", record.id),
                        observability::IdentityField("program_id", invocation.program_id),
                        observability::IntField("accounts", static_cast<std::int64_t>(invocation.accounts.size())),
                        observability::IntField("data_bytes", static_cast<std::int64_t>(invocation.data.size()))});
  try {
    transport_->Send(invocation);
  } catch (const util::CallbackFailed&) {
    throw;
  } catch (const std::exception& e) {
    throw util::CallbackFailed(ErrorCode::kCallbackRejected,
                               "program " + util::ToHex(invocation.program_id) + " rejected callback for " + record.id + ": " + e.what());
  }
}

} // namespace coolrouter::dispatch
