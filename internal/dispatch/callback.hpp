#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/types.hpp"

namespace coolrouter::dispatch {

inline constexpr std::string_view kCallbackInstruction = "llm_callback";

// One cross-program call: target, ordered accounts, opaque data.
struct CallbackInvocation {
  model::Identity                  program_id{};
  std::vector<model::AccountMeta>  accounts;
  std::string                      data;
};

struct CallbackArgs {
  std::string request_id;
  std::string payload;
};

// Routing tag for kCallbackInstruction.
const std::array<std::uint8_t, 8>& CallbackTag();

// tag || borsh(request_id) || borsh(payload)
std::string EncodeCallbackData(std::string_view request_id, std::string_view payload);

// Throws InvalidArgument(MalformedCallbackData) on a wrong tag, truncation or trailing bytes.
CallbackArgs DecodeCallbackData(std::string_view data);

/*
  A program that accepts callbacks. Reject by throwing.
*/
class CallbackTarget {
 public:
  virtual ~CallbackTarget() = default;

  virtual void Invoke(const CallbackInvocation& invocation) = 0;
};

/*
  The send capability the dispatcher uses to reach programs.
*/
class CallbackTransport {
 public:
  virtual ~CallbackTransport() = default;

  virtual void Send(const CallbackInvocation& invocation) = 0;
};

} // namespace coolrouter::dispatch
