#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace coolrouter::runtime {

/*
  Owns the gRPC services and the server that hosts them.

  Stop() gives in-flight calls the configured grace period and then
  cancels them; SubscribeEvents streams only end early if the event hub
  was closed first.
*/
class Server {
public:
  static constexpr std::chrono::milliseconds kDefaultShutdownGrace{2000};

  Server(const coolrouter::runtime::config::ServerConfig& config,
         std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; valid after Start().
  int Port() const { return port_; }

private:
  std::string bind_address_;
  int max_receive_message_bytes_;
  std::chrono::milliseconds shutdown_grace_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int port_ = 0;
};

} // namespace coolrouter::runtime
