#pragma once

#include <cstdint>
#include <string_view>

namespace coolrouter::model {

enum class RequestStatus : std::uint8_t {
  kPending         = 0,
  kVotingCompleted = 1,
  kFulfilled       = 2,
};

constexpr bool IsTerminal(RequestStatus status) {
  return status == RequestStatus::kFulfilled;
}

// Forward only, one step at a time.
constexpr bool CanTransition(RequestStatus from, RequestStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:
      return "Pending";
    case RequestStatus::kVotingCompleted:
      return "VotingCompleted";
    case RequestStatus::kFulfilled:
      return "Fulfilled";
  }
  return "Unknown";
}

} // namespace coolrouter::model
