#pragma once

#include <memory>

#include "config/config.pb.h"

namespace coolrouter::core { class RequestBroker; }
namespace coolrouter::consumer { class LlmConsumer; }
namespace coolrouter::dispatch { class ProgramRegistry; }
namespace coolrouter::db { class Repository; }
namespace coolrouter::events { class EventHub; }

namespace coolrouter::factory {

/*
  Core object graph, without transport. Tests and the in-process
  example use this directly.
*/
struct Runtime {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<events::EventHub>          events;
  std::shared_ptr<dispatch::ProgramRegistry> registry;
  std::shared_ptr<core::RequestBroker>       broker;
  std::shared_ptr<consumer::LlmConsumer>     consumer;  // null when disabled
};

/*
  Composition root. It is the ONLY place allowed to know concrete DB
  types. runtime/application.hpp adds the gRPC services on top.
*/
std::shared_ptr<db::Repository> BuildRepository(const coolrouter::runtime::config::RuntimeConfig& config);

Runtime BuildRuntime(const coolrouter::runtime::config::RuntimeConfig& config);

} // namespace coolrouter::factory
