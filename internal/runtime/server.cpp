#include "server.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace coolrouter::runtime {

using coolrouter::observability::IntField;
using coolrouter::observability::StringField;

Server::Server(const coolrouter::runtime::config::ServerConfig& config,
               std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(config.bind_address()),
      max_receive_message_bytes_(static_cast<int>(config.max_receive_message_bytes())),
      shutdown_grace_(config.shutdown_grace_ms() == 0 ? kDefaultShutdownGrace
                                                      : std::chrono::milliseconds(config.shutdown_grace_ms())),
      services_(std::move(services)) {
  if (bind_address_.empty()) {
    throw std::invalid_argument("server bind_address is empty");
  }
  if (config.max_receive_message_bytes() > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("server max_receive_message_bytes is out of range");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  if (max_receive_message_bytes_ > 0) {
    builder.SetMaxReceiveMessageSize(max_receive_message_bytes_);
  }

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  COOLROUTER_LOG_INFO("coolrouter listening", {StringField("bind_address", bind_address_), IntField("port", port_),
                                               IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown(std::chrono::system_clock::now() + shutdown_grace_);
    grpc_server_.reset();
    COOLROUTER_LOG_INFO("coolrouter stopped", {StringField("bind_address", bind_address_)});
  }
}

} // namespace coolrouter::runtime
