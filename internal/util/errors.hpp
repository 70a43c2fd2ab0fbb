#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace coolrouter::util {

/*
  Every failure the router reports has a specific code. The exception
  class only selects the category; the gRPC layer maps categories to
  status codes and carries the code name in the message.
*/

enum class ErrorCode {
  // input bounds
  kRequestIdTooLong,
  kProviderTooLong,
  kModelIdTooLong,
  kTooManyMessages,
  kTooManyAccounts,
  kInvalidMinVotes,
  kInvalidApprovalThreshold,
  kTooManyVotes,
  kInvalidArgument,

  // state preconditions
  kNotPending,
  kVotingNotCompleted,
  kWinningHashMissing,
  kRequestNotFound,
  kRequestAlreadyExists,

  // identity / authorization
  kUnauthorizedOracle,
  kUnauthorizedAuthority,
  kAlreadyVoted,
  kCallbackProgramMismatch,
  kAccountCountMismatch,
  kAccountMismatch,

  // integrity
  kPayloadHashMismatch,
  kStorageBoundsExceeded,

  // dispatch and consumer program
  kCallbackRejected,
  kMalformedCallbackData,
  kRequestIdMismatch,
  kResponseTooLong,
  kNoResponse,
  kConsumerStateExists,
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kRequestIdTooLong:
      return "RequestIdTooLong";
    case ErrorCode::kProviderTooLong:
      return "ProviderTooLong";
    case ErrorCode::kModelIdTooLong:
      return "ModelIdTooLong";
    case ErrorCode::kTooManyMessages:
      return "TooManyMessages";
    case ErrorCode::kTooManyAccounts:
      return "TooManyAccounts";
    case ErrorCode::kInvalidMinVotes:
      return "InvalidMinVotes";
    case ErrorCode::kInvalidApprovalThreshold:
      return "InvalidApprovalThreshold";
    case ErrorCode::kTooManyVotes:
      return "TooManyVotes";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotPending:
      return "NotPending";
    case ErrorCode::kVotingNotCompleted:
      return "VotingNotCompleted";
    case ErrorCode::kWinningHashMissing:
      return "WinningHashMissing";
    case ErrorCode::kRequestNotFound:
      return "RequestNotFound";
    case ErrorCode::kRequestAlreadyExists:
      return "RequestAlreadyExists";
    case ErrorCode::kUnauthorizedOracle:
      return "UnauthorizedOracle";
    case ErrorCode::kUnauthorizedAuthority:
      return "UnauthorizedAuthority";
    case ErrorCode::kAlreadyVoted:
      return "AlreadyVoted";
    case ErrorCode::kCallbackProgramMismatch:
      return "CallbackProgramMismatch";
    case ErrorCode::kAccountCountMismatch:
      return "AccountCountMismatch";
    case ErrorCode::kAccountMismatch:
      return "AccountMismatch";
    case ErrorCode::kPayloadHashMismatch:
      return "PayloadHashMismatch";
    case ErrorCode::kStorageBoundsExceeded:
      return "StorageBoundsExceeded";
    case ErrorCode::kCallbackRejected:
      return "CallbackRejected";
    case ErrorCode::kMalformedCallbackData:
      return "MalformedCallbackData";
    case ErrorCode::kRequestIdMismatch:
      return "RequestIdMismatch";
    case ErrorCode::kResponseTooLong:
      return "ResponseTooLong";
    case ErrorCode::kNoResponse:
      return "NoResponse";
    case ErrorCode::kConsumerStateExists:
      return "ConsumerStateExists";
  }
  return "Unknown";
}

class RouterError : public std::runtime_error {
 public:
  RouterError(ErrorCode code, const std::string& msg)
      : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

class InvalidArgument : public RouterError {
 public:
  InvalidArgument(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class ResourceExhausted : public RouterError {
 public:
  ResourceExhausted(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class NotFound : public RouterError {
 public:
  NotFound(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class AlreadyExists : public RouterError {
 public:
  AlreadyExists(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class InvalidState : public RouterError {
 public:
  InvalidState(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class PermissionDenied : public RouterError {
 public:
  PermissionDenied(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class IntegrityViolation : public RouterError {
 public:
  IntegrityViolation(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

class CallbackFailed : public RouterError {
 public:
  CallbackFailed(ErrorCode code, const std::string& msg) : RouterError(code, msg) {
  }
};

} // namespace coolrouter::util
