#include "request_record.hpp"

#include "internal/model/limits.hpp"

namespace coolrouter::db::model {

namespace limits = coolrouter::model;

std::string CheckStorageBounds(const RequestRecord& record) {
  if (record.id.size() > limits::kMaxRequestIdBytes) {
    return "request id exceeds " + std::to_string(limits::kMaxRequestIdBytes) + " bytes";
  }
  if (record.provider.size() > limits::kMaxProviderBytes) {
    return "provider exceeds " + std::to_string(limits::kMaxProviderBytes) + " bytes";
  }
  if (record.model_id.size() > limits::kMaxModelIdBytes) {
    return "model id exceeds " + std::to_string(limits::kMaxModelIdBytes) + " bytes";
  }
  if (record.callback_targets.size() > limits::kMaxCallbackTargets) {
    return "callback target list exceeds " + std::to_string(limits::kMaxCallbackTargets) + " entries";
  }
  if (record.votes.size() > limits::kMaxOracles) {
    return "vote list exceeds " + std::to_string(limits::kMaxOracles) + " entries";
  }
  if (record.total_votes_cast != record.votes.size()) {
    return "total_votes_cast does not match stored votes";
  }
  if (record.status != coolrouter::model::RequestStatus::kPending && !record.winning_hash) {
    return std::string(coolrouter::model::ToString(record.status)) + " request has no winning hash";
  }
  return {};
}

} // namespace coolrouter::db::model
