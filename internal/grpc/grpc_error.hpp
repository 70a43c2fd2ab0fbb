#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace coolrouter::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  RouterError categories pick the status code and the message keeps the
  "<ErrorCode>: " prefix. With a server context the code name is also
  sent as the kErrorCodeTrailer trailing metadata entry.
*/

inline constexpr char kErrorCodeTrailer[] = "coolrouter-error-code";

::grpc::StatusCode StatusCodeFor(const std::exception& e);

::grpc::Status ToStatus(const std::exception& e);

::grpc::Status ToStatus(::grpc::ServerContext* ctx, const std::exception& e);

} // namespace coolrouter::grpc
