#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.pb.h"

namespace {

using coolrouter::observability::BoolField;
using coolrouter::observability::FormatFields;
using coolrouter::observability::HashField;
using coolrouter::observability::IdentityField;
using coolrouter::observability::IntField;
using coolrouter::observability::StringField;

void TestFormatFields() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("request_id", "q-1"), IntField("votes", 3), BoolField("resolved", true)}) ==
         "request_id=q-1 votes=3 resolved=true");

  assert(FormatFields({StringField("error", "")}) == "error=\"\"");
  assert(FormatFields({StringField("error", "stale version")}) == "error=\"stale version\"");
  assert(FormatFields({StringField("sql", "a=b")}) == "sql=\"a=b\"");
  assert(FormatFields({StringField("msg", "say \"hi\" \\o/")}) == "msg=\"say \\\"hi\\\" \\\\o/\"");
  assert(FormatFields({StringField("path", "C:\\db")}) == "path=C:\\db");
}

void TestHexFields() {
  coolrouter::model::Identity id{};
  id.fill(0xAB);
  const auto field = IdentityField("oracle", id);
  std::string expected;
  for (int i = 0; i < 32; ++i) {
    expected += "ab";
  }
  assert(field.key == "oracle");
  assert(field.value == expected);

  coolrouter::model::Hash32 hash{};
  hash[31] = 0x0F;
  assert(HashField("winning_hash", hash).value == std::string(62, '0') + "0f");
}

void TestLevelSelection() {
  unsetenv("COOLROUTER_LOG_LEVEL");

  coolrouter::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  coolrouter::observability::InitializeLogging(config);
  assert(spdlog::get("coolrouter") != nullptr);
  assert(spdlog::get("coolrouter")->level() == spdlog::level::debug);

  config.mutable_logging()->set_level("loud");
  coolrouter::observability::InitializeLogging(config);
  assert(spdlog::get("coolrouter")->level() == spdlog::level::info);

  setenv("COOLROUTER_LOG_LEVEL", "error", 1);
  coolrouter::observability::InitializeLogging(config);
  assert(spdlog::get("coolrouter")->level() == spdlog::level::err);
  unsetenv("COOLROUTER_LOG_LEVEL");

  COOLROUTER_LOG_DEBUG("not shown", {StringField("k", "v")});
  COOLROUTER_LOG_ERROR("shown", {StringField("k", "v v")});
}

} // namespace

int main() {
  TestFormatFields();
  TestHexFields();
  TestLevelSelection();

  coolrouter::observability::ShutdownLogging();
  std::cout << "coolrouter_unit_logging: pass\n";
  return 0;
}
