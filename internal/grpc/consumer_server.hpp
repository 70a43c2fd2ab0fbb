#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "coolrouter/router/services/v1/consumer_service.grpc.pb.h"
#include "internal/service/consumer_service.hpp"
#include "coolrouter/v1.hpp"

namespace coolrouter::grpc {

class ConsumerServer final : public coolrouter::v1::ConsumerService::Service {
public:
  explicit ConsumerServer(std::shared_ptr<coolrouter::service::ConsumerService> svc);

  ::grpc::Status RequestLlmResponse(::grpc::ServerContext*,
                                    const coolrouter::v1::RequestLlmResponseRequest*,
                                    coolrouter::v1::RequestLlmResponseResponse*) override;

  ::grpc::Status GetResponse(::grpc::ServerContext*,
                             const coolrouter::v1::GetResponseRequest*,
                             coolrouter::v1::GetResponseResponse*) override;

private:
  std::shared_ptr<coolrouter::service::ConsumerService> service_;
};

}
