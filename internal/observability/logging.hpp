#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/types.hpp"

namespace coolrouter::runtime::config {
class RuntimeConfig;
}

namespace coolrouter::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Identities and hashes are rendered as lowercase hex.
LogField IdentityField(std::string_view key, const model::Identity& value);
LogField HashField(std::string_view key, const model::Hash32& value);

// key=value pairs separated by spaces. Values that are empty or contain
// whitespace, '"' or '=' are double quoted with '"' and '\\' escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

// COOLROUTER_LOG_LEVEL / COOLROUTER_LOG_PATTERN override the config. An
// unknown level name falls back to info.
void InitializeLogging(const coolrouter::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace coolrouter::observability

#define COOLROUTER_LOG_DEBUG(message, ...) ::coolrouter::observability::LogDebug((message), ##__VA_ARGS__)
#define COOLROUTER_LOG_INFO(message, ...) ::coolrouter::observability::LogInfo((message), ##__VA_ARGS__)
#define COOLROUTER_LOG_WARN(message, ...) ::coolrouter::observability::LogWarn((message), ##__VA_ARGS__)
#define COOLROUTER_LOG_ERROR(message, ...) ::coolrouter::observability::LogError((message), ##__VA_ARGS__)
