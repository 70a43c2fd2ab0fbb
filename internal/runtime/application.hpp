#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace coolrouter::runtime {

/*
  Owns everything the server process needs. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  factory::Runtime                               core;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application Build(const coolrouter::runtime::config::RuntimeConfig& config);

} // namespace coolrouter::runtime
