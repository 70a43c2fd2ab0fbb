#include "internal/dispatch/callback_dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/crypto/sha256.hpp"
#include "internal/dispatch/borsh.hpp"
#include "internal/dispatch/callback.hpp"
#include "internal/dispatch/program_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using coolrouter::db::model::RequestRecord;
using coolrouter::dispatch::CallbackDispatcher;
using coolrouter::dispatch::CallbackInvocation;
using coolrouter::model::AccountMeta;
using coolrouter::model::Identity;
using coolrouter::util::ErrorCode;

Identity Id(uint8_t tag) {
  Identity id{};
  id.fill(tag);
  return id;
}

class CapturingTransport final : public coolrouter::dispatch::CallbackTransport {
 public:
  void Send(const CallbackInvocation& invocation) override {
    sent.push_back(invocation);
    if (failure == 1) {
      throw std::runtime_error("target panicked");
    }
    if (failure == 2) {
      throw coolrouter::util::InvalidArgument(ErrorCode::kResponseTooLong, "too long");
    }
  }

  int                             failure = 0;
  std::vector<CallbackInvocation> sent;
};

RequestRecord Record() {
  RequestRecord record;
  record.id               = "req-7";
  record.requesting_party = Id(0xAA);
  record.callback_targets = {AccountMeta{Id(1), true, false}, AccountMeta{Id(2), false, true}, AccountMeta{Id(3), true, true}};
  return record;
}

void TestCallbackDataLayout() {
  const auto data = coolrouter::dispatch::EncodeCallbackData("ab", "xyz");

  const auto tag = coolrouter::crypto::Discriminator("llm_callback");
  assert(data.size() == 8 + 4 + 2 + 4 + 3);
  for (std::size_t i = 0; i < 8; ++i) {
    assert(static_cast<uint8_t>(data[i]) == tag[i]);
  }
  assert(data.substr(8, 6) == std::string("\x02\x00\x00\x00" "ab", 6));
  assert(data.substr(14, 7) == std::string("\x03\x00\x00\x00" "xyz", 7));

  const auto args = coolrouter::dispatch::DecodeCallbackData(data);
  assert(args.request_id == "ab");
  assert(args.payload == "xyz");
}

void TestMalformedCallbackDataRejected() {
  auto expect_malformed = [](const std::string& data) {
    try {
      coolrouter::dispatch::DecodeCallbackData(data);
    } catch (const coolrouter::util::InvalidArgument& e) {
      assert(e.code() == ErrorCode::kMalformedCallbackData);
      return;
    }
    assert(false && "expected MalformedCallbackData");
  };

  const auto good = coolrouter::dispatch::EncodeCallbackData("id", "payload");

  auto wrong_tag = good;
  wrong_tag[0]   = static_cast<char>(wrong_tag[0] ^ 0xFF);
  expect_malformed(wrong_tag);
  expect_malformed(good.substr(0, good.size() - 1));
  expect_malformed(good + "x");
  expect_malformed("");

  // Length prefix larger than what follows.
  coolrouter::dispatch::BorshWriter writer;
  writer.WriteRaw(coolrouter::dispatch::CallbackTag().data(), 8);
  writer.WriteU32(1000);
  writer.WriteRaw("abc", 3);
  expect_malformed(writer.Take());
}

void TestBuildUsesRecordedTargets() {
  auto transport = std::make_shared<CapturingTransport>();
  CallbackDispatcher dispatcher(transport);

  const auto invocation = dispatcher.Build(Record(), "answer");
  assert(invocation.program_id == Id(0xAA));
  assert(invocation.accounts.size() == 3);
  assert(invocation.accounts[0].pubkey == Id(1) && invocation.accounts[0].is_writable);
  assert(invocation.accounts[1].pubkey == Id(2) && !invocation.accounts[1].is_writable);
  assert(invocation.accounts[2].pubkey == Id(3) && invocation.accounts[2].is_writable);
  for (const auto& account : invocation.accounts) {
    assert(!account.is_signer);
  }
  assert(invocation.data == coolrouter::dispatch::EncodeCallbackData("req-7", "answer"));

  dispatcher.Dispatch(Record(), "answer");
  assert(transport->sent.size() == 1);
}

void TestTargetFailuresBecomeCallbackRejected() {
  auto transport = std::make_shared<CapturingTransport>();
  CallbackDispatcher dispatcher(transport);

  for (int failure : {1, 2}) {
    transport->failure = failure;
    try {
      dispatcher.Dispatch(Record(), "answer");
      assert(false && "expected CallbackFailed");
    } catch (const coolrouter::util::CallbackFailed& e) {
      assert(e.code() == ErrorCode::kCallbackRejected);
    }
  }
}

class CountingTarget final : public coolrouter::dispatch::CallbackTarget {
 public:
  void Invoke(const CallbackInvocation&) override {
    ++calls;
  }
  int calls = 0;
};

void TestRegistryRoutesByProgramId() {
  auto registry = std::make_shared<coolrouter::dispatch::ProgramRegistry>();
  auto target   = std::make_shared<CountingTarget>();
  registry->Register(Id(0xAA), target);
  assert(registry->Contains(Id(0xAA)));

  // Wiring mistakes are not router errors.
  bool duplicate = false;
  try {
    registry->Register(Id(0xAA), target);
  } catch (const coolrouter::util::RouterError&) {
    assert(false && "duplicate registration is not a RouterError");
  } catch (const std::invalid_argument&) {
    duplicate = true;
  }
  assert(duplicate);

  bool null_target = false;
  try {
    registry->Register(Id(0xAB), nullptr);
  } catch (const std::invalid_argument&) {
    null_target = true;
  }
  assert(null_target && !registry->Contains(Id(0xAB)));

  CallbackDispatcher dispatcher(registry);
  dispatcher.Dispatch(Record(), "answer");
  assert(target->calls == 1);

  auto other             = Record();
  other.requesting_party = Id(0xBB);
  try {
    dispatcher.Dispatch(other, "answer");
    assert(false && "expected CallbackFailed");
  } catch (const coolrouter::util::CallbackFailed& e) {
    assert(e.code() == ErrorCode::kCallbackRejected);
  }
  assert(target->calls == 1);

  registry->Unregister(Id(0xAA));
  assert(!registry->Contains(Id(0xAA)));
}

} // namespace

int main() {
  TestCallbackDataLayout();
  TestMalformedCallbackDataRejected();
  TestBuildUsesRecordedTargets();
  TestTargetFailuresBecomeCallbackRejected();
  TestRegistryRoutesByProgramId();

  std::cout << "coolrouter_unit_callback_dispatcher: pass\n";
  return 0;
}
