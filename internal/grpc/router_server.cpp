#include "router_server.hpp"

#include <chrono>

#include "grpc_error.hpp"
#include "internal/service/proto_convert.hpp"

namespace coolrouter::grpc {

namespace {

constexpr std::chrono::milliseconds kSubscriberPoll{200};

}

RouterServer::RouterServer(std::shared_ptr<coolrouter::service::RouterService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RouterServer::CreateRequest(::grpc::ServerContext* ctx,
                                           const coolrouter::v1::CreateRequestRequest* req,
                                           coolrouter::v1::CreateRequestResponse* resp) {
  try {
    *resp = service_->CreateRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

::grpc::Status RouterServer::SubmitVote(::grpc::ServerContext* ctx,
                                        const coolrouter::v1::SubmitVoteRequest* req,
                                        coolrouter::v1::SubmitVoteResponse* resp) {
  try {
    *resp = service_->SubmitVote(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

::grpc::Status RouterServer::FulfillRequest(::grpc::ServerContext* ctx,
                                            const coolrouter::v1::FulfillRequestRequest* req,
                                            coolrouter::v1::FulfillRequestResponse* resp) {
  try {
    *resp = service_->FulfillRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

::grpc::Status RouterServer::GetRequest(::grpc::ServerContext* ctx,
                                        const coolrouter::v1::GetRequestRequest* req,
                                        coolrouter::v1::GetRequestResponse* resp) {
  try {
    *resp = service_->GetRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

::grpc::Status RouterServer::ListRequests(::grpc::ServerContext* ctx,
                                          const coolrouter::v1::ListRequestsRequest* req,
                                          coolrouter::v1::ListRequestsResponse* resp) {
  try {
    *resp = service_->ListRequests(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

// Streams until the client goes away or the hub closes.
::grpc::Status RouterServer::SubscribeEvents(::grpc::ServerContext* ctx,
                                             const coolrouter::v1::SubscribeEventsRequest*,
                                             ::grpc::ServerWriter<coolrouter::v1::RouterEvent>* writer) {
  try {
    auto subscription = service_->SubscribeEvents();
    // Clients waiting on initial metadata know no later event is missed.
    writer->SendInitialMetadata();
    while (!ctx->IsCancelled()) {
      auto envelope = subscription->Next(kSubscriberPoll);
      if (!envelope) {
        if (subscription->Closed()) {
          break;
        }
        continue;
      }
      if (!writer->Write(coolrouter::service::ToProto(*envelope))) {
        break;
      }
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(ctx, e);
  }
}

} // namespace coolrouter::grpc
