#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace mprisrelay::grpc {

/*
  Exception -> status mapping shared by the pairing and relay adapters.

  util errors carry their message to the client. Bus failures that mean
  "no session bus" become UNAVAILABLE. Everything else is INTERNAL with a
  fixed message; the real one only goes to the agent log, since pairing
  and relay clients are remote and untrusted until proven otherwise.
*/

::grpc::StatusCode StatusCodeFor(const std::exception& e);

::grpc::Status ToStatus(const std::exception& e);

} // namespace mprisrelay::grpc
