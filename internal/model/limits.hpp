#pragma once

#include <cstddef>

namespace coolrouter::model {

/*
  Storage layout bounds. Every backend enforces these before writing,
  so a record that fits one backend fits all of them.
*/

inline constexpr std::size_t kIdentityBytes = 32;
inline constexpr std::size_t kHashBytes     = 32;

inline constexpr std::size_t kMaxRequestIdBytes  = 64;
inline constexpr std::size_t kMaxProviderBytes   = 64;
inline constexpr std::size_t kMaxModelIdBytes    = 64;
inline constexpr std::size_t kMaxMessages        = 50;
inline constexpr std::size_t kMaxCallbackTargets = 32;
inline constexpr std::size_t kMaxOracles         = 32;

inline constexpr unsigned kMaxApprovalThreshold = 100;

} // namespace coolrouter::model
