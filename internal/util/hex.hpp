#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace coolrouter::util {

std::string ToHex(const std::uint8_t* data, std::size_t size);

template <std::size_t N>
std::string ToHex(const std::array<std::uint8_t, N>& bytes) {
  return ToHex(bytes.data(), bytes.size());
}

inline std::string ToHex(std::string_view bytes) {
  return ToHex(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

// Throws InvalidArgument on odd length or non-hex input.
std::string FromHex(std::string_view hex);

// Fixed-width variants used for identities and hashes.
template <std::size_t N>
std::array<std::uint8_t, N> FixedFromBytes(std::string_view bytes, std::string_view what) {
  if (bytes.size() != N) {
    throw InvalidArgument(ErrorCode::kInvalidArgument,
                          std::string(what) + " must be " + std::to_string(N) + " bytes, got " + std::to_string(bytes.size()));
  }
  std::array<std::uint8_t, N> out{};
  for (std::size_t i = 0; i < N; ++i) {
    out[i] = static_cast<std::uint8_t>(bytes[i]);
  }
  return out;
}

template <std::size_t N>
std::array<std::uint8_t, N> FixedFromHex(std::string_view hex, std::string_view what) {
  return FixedFromBytes<N>(FromHex(hex), what);
}

template <std::size_t N>
std::string ToBytes(const std::array<std::uint8_t, N>& value) {
  return std::string(reinterpret_cast<const char*>(value.data()), value.size());
}

} // namespace coolrouter::util
