#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "coolrouter/router/services/v1/router_service.grpc.pb.h"
#include "internal/service/router_service.hpp"
#include "coolrouter/v1.hpp"

namespace coolrouter::grpc {

class RouterServer final : public coolrouter::v1::RouterService::Service {
public:
  explicit RouterServer(std::shared_ptr<coolrouter::service::RouterService> svc);

  ::grpc::Status CreateRequest(::grpc::ServerContext*,
                               const coolrouter::v1::CreateRequestRequest*,
                               coolrouter::v1::CreateRequestResponse*) override;

  ::grpc::Status SubmitVote(::grpc::ServerContext*,
                            const coolrouter::v1::SubmitVoteRequest*,
                            coolrouter::v1::SubmitVoteResponse*) override;

  ::grpc::Status FulfillRequest(::grpc::ServerContext*,
                                const coolrouter::v1::FulfillRequestRequest*,
                                coolrouter::v1::FulfillRequestResponse*) override;

  ::grpc::Status GetRequest(::grpc::ServerContext*,
                            const coolrouter::v1::GetRequestRequest*,
                            coolrouter::v1::GetRequestResponse*) override;

  ::grpc::Status ListRequests(::grpc::ServerContext*,
                              const coolrouter::v1::ListRequestsRequest*,
                              coolrouter::v1::ListRequestsResponse*) override;

  ::grpc::Status SubscribeEvents(::grpc::ServerContext*,
                                 const coolrouter::v1::SubscribeEventsRequest*,
                                 ::grpc::ServerWriter<coolrouter::v1::RouterEvent>*) override;

private:
  std::shared_ptr<coolrouter::service::RouterService> service_;
};

}
