#include "grpc_error.hpp"

#include <string>

#include "internal/bus/bus.hpp"
#include "internal/crypto/crypto.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mprisrelay::grpc {

namespace {

template <typename T>
bool Is(const std::exception& e) {
  return dynamic_cast<const T*>(&e) != nullptr;
}

bool IsBusGone(const bus::BusError& e) {
  return e.Name() == "org.freedesktop.DBus.Error.NoServer" || e.Name() == "org.freedesktop.DBus.Error.Disconnected" ||
         e.Name() == "org.freedesktop.DBus.Error.ServiceUnknown";
}

} // namespace

::grpc::StatusCode StatusCodeFor(const std::exception& e) {
  using namespace mprisrelay::util;

  if (Is<NotFound>(e)) return ::grpc::StatusCode::NOT_FOUND;
  if (Is<InvalidState>(e)) return ::grpc::StatusCode::FAILED_PRECONDITION;
  if (Is<InvalidArgument>(e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (Is<ResourceExhausted>(e)) return ::grpc::StatusCode::RESOURCE_EXHAUSTED;
  if (Is<Unauthenticated>(e)) return ::grpc::StatusCode::UNAUTHENTICATED;
  if (Is<PermissionDenied>(e)) return ::grpc::StatusCode::PERMISSION_DENIED;
  if (Is<Unavailable>(e)) return ::grpc::StatusCode::UNAVAILABLE;

  if (const auto* bus_error = dynamic_cast<const bus::BusError*>(&e); bus_error && IsBusGone(*bus_error)) {
    return ::grpc::StatusCode::UNAVAILABLE;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  const auto code = StatusCodeFor(e);

  if (Is<bus::BusError>(e)) {
    MPRISRELAY_LOG_WARN("Session bus failure surfaced to client", {observability::StringField("error", e.what())});
    return {code, code == ::grpc::StatusCode::UNAVAILABLE ? "session bus unavailable" : "session bus error"};
  }
  if (code == ::grpc::StatusCode::INTERNAL) {
    MPRISRELAY_LOG_ERROR("Request failed",
                         {observability::StringField("error", e.what()),
                          observability::BoolField("crypto", Is<crypto::CryptoError>(e))});
    return {code, "internal error"};
  }
  return {code, e.what()};
}

} // namespace mprisrelay::grpc
