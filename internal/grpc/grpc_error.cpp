#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace coolrouter::grpc {

::grpc::StatusCode StatusCodeFor(const std::exception& e) {
  using namespace coolrouter::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (dynamic_cast<const ResourceExhausted*>(&e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  if (dynamic_cast<const NotFound*>(&e)) return ::grpc::StatusCode::NOT_FOUND;
  if (dynamic_cast<const AlreadyExists*>(&e)) return ::grpc::StatusCode::ALREADY_EXISTS;
  if (dynamic_cast<const InvalidState*>(&e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (dynamic_cast<const PermissionDenied*>(&e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (dynamic_cast<const IntegrityViolation*>(&e)) return ::grpc::StatusCode::DATA_LOSS;
  if (dynamic_cast<const CallbackFailed*>(&e)) return ::grpc::StatusCode::ABORTED;

  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  return {StatusCodeFor(e), e.what()};
}

::grpc::Status ToStatus(::grpc::ServerContext* ctx, const std::exception& e) {
  if (const auto* router_error = dynamic_cast<const util::RouterError*>(&e); router_error != nullptr && ctx != nullptr) {
    ctx->AddTrailingMetadata(kErrorCodeTrailer, std::string(util::ErrorCodeName(router_error->code())));
  }
  return ToStatus(e);
}

} // namespace coolrouter::grpc
