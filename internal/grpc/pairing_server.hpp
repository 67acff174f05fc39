#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/pairing_service.hpp"
#include "mprisrelay/v1.hpp"

namespace mprisrelay::grpc {

class PairingServer final : public mprisrelay::v1::Pairing::Service {
public:
  explicit PairingServer(std::shared_ptr<mprisrelay::service::PairingService> svc);

  ::grpc::Status Pair(::grpc::ServerContext*,
                      ::grpc::ServerReaderWriter<mprisrelay::v1::PairingResponse, mprisrelay::v1::PairingRequest>*) override;

private:
  std::shared_ptr<mprisrelay::service::PairingService> service_;
};

} // namespace mprisrelay::grpc
