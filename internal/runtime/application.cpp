#include "application.hpp"

#include "internal/grpc/consumer_server.hpp"
#include "internal/grpc/router_server.hpp"
#include "internal/service/consumer_service.hpp"
#include "internal/service/router_service.hpp"
#include "internal/service/service_context.hpp"

namespace coolrouter::runtime {

/*
    Build full application dependency graph
*/
Application Build(const coolrouter::runtime::config::RuntimeConfig& config) {
  Application app;
  app.core = factory::BuildRuntime(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.broker   = app.core.broker;
  ctx.consumer = app.core.consumer;
  ctx.events   = app.core.events;

  auto router_service = std::make_shared<service::RouterService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<coolrouter::grpc::RouterServer>(router_service));

  if (ctx.consumer) {
    auto consumer_service = std::make_shared<service::ConsumerService>(ctx);
    app.grpc_services.push_back(std::make_unique<coolrouter::grpc::ConsumerServer>(consumer_service));
  }

  return app;
}

} // namespace coolrouter::runtime
