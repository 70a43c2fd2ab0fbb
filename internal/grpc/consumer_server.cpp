#include "consumer_server.hpp"

#include "grpc_error.hpp"

namespace coolrouter::grpc {

ConsumerServer::ConsumerServer(std::shared_ptr<coolrouter::service::ConsumerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ConsumerServer::RequestLlmResponse(::grpc::ServerContext* ctx,
                                                  const coolrouter::v1::RequestLlmResponseRequest* req,
                                                  coolrouter::v1::RequestLlmResponseResponse* resp) {
  try {
    *resp = service_->RequestLlmResponse(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

::grpc::Status ConsumerServer::GetResponse(::grpc::ServerContext* ctx,
                                           const coolrouter::v1::GetResponseRequest* req,
                                           coolrouter::v1::GetResponseResponse* resp) {
  try {
    *resp = service_->GetResponse(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

} // namespace coolrouter::grpc
