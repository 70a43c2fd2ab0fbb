#include "borsh.hpp"

#include <limits>

#include "internal/util/errors.hpp"

namespace coolrouter::dispatch {

using coolrouter::util::ErrorCode;

void BorshWriter::WriteRaw(const void* data, std::size_t size) {
  buffer_.append(static_cast<const char*>(data), size);
}

void BorshWriter::WriteU32(std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

void BorshWriter::WriteBytes(std::string_view bytes) {
  if (bytes.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw util::InvalidArgument(ErrorCode::kInvalidArgument, "borsh: field longer than u32 length prefix");
  }
  WriteU32(static_cast<std::uint32_t>(bytes.size()));
  buffer_.append(bytes);
}

std::string_view BorshReader::ReadRaw(std::size_t size) {
  if (Remaining() < size) {
    throw util::InvalidArgument(ErrorCode::kMalformedCallbackData,
                                "borsh: need " + std::to_string(size) + " bytes, have " + std::to_string(Remaining()));
  }
  auto out = data_.substr(offset_, size);
  offset_ += size;
  return out;
}

std::uint32_t BorshReader::ReadU32() {
  const auto    raw   = ReadRaw(4);
  std::uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value |= static_cast<std::uint32_t>(static_cast<unsigned char>(raw[i])) << (8 * i);
  }
  return value;
}

std::string BorshReader::ReadBytes() {
  const auto size = ReadU32();
  return std::string(ReadRaw(size));
}

} // namespace coolrouter::dispatch
