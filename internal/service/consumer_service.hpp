#pragma once

#include "coolrouter/v1.hpp"
#include "service_context.hpp"

namespace coolrouter::service {

class ConsumerService {
public:
  explicit ConsumerService(ServiceContext ctx);

  coolrouter::v1::RequestLlmResponseResponse
  RequestLlmResponse(const coolrouter::v1::RequestLlmResponseRequest& req);

  coolrouter::v1::GetResponseResponse
  GetResponse(const coolrouter::v1::GetResponseRequest& req);

private:
  ServiceContext ctx_;
};

}
