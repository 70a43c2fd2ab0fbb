#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "coolrouter/v1.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/events/events.hpp"
#include "internal/model/request_status.hpp"
#include "internal/model/types.hpp"
#include "internal/util/errors.hpp"

namespace coolrouter::service {

/*
  Wire <-> domain conversions. Malformed wire values throw
  util::InvalidArgument before anything reaches the broker.
*/

model::Identity IdentityFromProto(const coolrouter::v1::Identity& id, std::string_view what);
model::Hash32   HashFromBytes(const std::string& bytes, std::string_view what);

// Values above 255 cannot be stored and are rejected with `code`.
uint8_t NarrowToByte(uint32_t value, util::ErrorCode code, std::string_view what);

// REQUEST_STATUS_UNSPECIFIED maps to nullopt; unknown values throw.
std::optional<model::RequestStatus> StatusFromProto(coolrouter::v1::RequestStatus status);

model::AccountMeta AccountFromProto(const coolrouter::v1::AccountMeta& meta);
model::Message     MessageFromProto(const coolrouter::v1::Message& message);

void ToProto(const model::Identity& id, coolrouter::v1::Identity* out);
void ToProto(const model::AccountMeta& meta, coolrouter::v1::AccountMeta* out);
void ToProto(const model::Message& message, coolrouter::v1::Message* out);

coolrouter::v1::RequestStatus ToProto(model::RequestStatus status);
coolrouter::v1::LlmRequest    ToProto(const db::model::RequestRecord& record);
coolrouter::v1::RouterEvent   ToProto(const events::EventEnvelope& envelope);

} // namespace coolrouter::service
