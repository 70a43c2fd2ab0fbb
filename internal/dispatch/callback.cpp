#include "callback.hpp"

#include <algorithm>

#include "internal/crypto/sha256.hpp"
#include "internal/dispatch/borsh.hpp"
#include "internal/util/errors.hpp"

namespace coolrouter::dispatch {

using coolrouter::util::ErrorCode;

const std::array<std::uint8_t, 8>& CallbackTag() {
  static const auto kTag = crypto::Discriminator(kCallbackInstruction);
  return kTag;
}

std::string EncodeCallbackData(std::string_view request_id, std::string_view payload) {
  BorshWriter writer;
  writer.WriteRaw(CallbackTag().data(), CallbackTag().size());
  writer.WriteBytes(request_id);
  writer.WriteBytes(payload);
  return writer.Take();
}

CallbackArgs DecodeCallbackData(std::string_view data) {
  BorshReader reader(data);

  const auto tag = reader.ReadRaw(CallbackTag().size());
  if (!std::equal(tag.begin(), tag.end(), CallbackTag().begin(),
                  [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; })) {
    throw util::InvalidArgument(ErrorCode::kMalformedCallbackData, "unknown instruction tag");
  }

  CallbackArgs args;
  args.request_id = reader.ReadBytes();
  args.payload    = reader.ReadBytes();
  if (reader.Remaining() != 0) {
    throw util::InvalidArgument(ErrorCode::kMalformedCallbackData,
                                std::to_string(reader.Remaining()) + " trailing bytes after callback arguments");
  }
  return args;
}

} // namespace coolrouter::dispatch
