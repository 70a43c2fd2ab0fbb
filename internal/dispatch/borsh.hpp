#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace coolrouter::dispatch {

/*
  Minimal Borsh subset: little-endian u32 and u32-length-prefixed
  byte strings. Enough for the callback argument tuple.
*/

class BorshWriter {
 public:
  void WriteRaw(const void* data, std::size_t size);
  void WriteU32(std::uint32_t value);
  void WriteBytes(std::string_view bytes);

  const std::string& Buffer() const {
    return buffer_;
  }
  std::string Take() {
    return std::move(buffer_);
  }

 private:
  std::string buffer_;
};

// Throws InvalidArgument(MalformedCallbackData) on truncated input.
class BorshReader {
 public:
  explicit BorshReader(std::string_view data) : data_(data) {
  }

  std::string_view ReadRaw(std::size_t size);
  std::uint32_t    ReadU32();
  std::string      ReadBytes();

  std::size_t Remaining() const {
    return data_.size() - offset_;
  }

 private:
  std::string_view data_;
  std::size_t      offset_ = 0;
};

} // namespace coolrouter::dispatch
