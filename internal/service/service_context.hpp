#pragma once

#include <memory>

namespace coolrouter::core { class RequestBroker; }
namespace coolrouter::consumer { class LlmConsumer; }
namespace coolrouter::events { class EventHub; }

namespace coolrouter::service {

/*
  Dependency container shared by all services.
  consumer is null when the reference consumer program is disabled.
*/
struct ServiceContext {
  std::shared_ptr<coolrouter::core::RequestBroker> broker;
  std::shared_ptr<coolrouter::consumer::LlmConsumer> consumer;
  std::shared_ptr<coolrouter::events::EventHub> events;
};

}
