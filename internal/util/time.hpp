#pragma once

#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace coolrouter::util {

/*
  Router timestamps are unix milliseconds (wall clock). Records store
  them as integers; the wire carries google.protobuf.Timestamp.
*/

uint64_t NowMillis();

google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
std::string FormatMillis(uint64_t ms);

} // namespace coolrouter::util
