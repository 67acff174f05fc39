#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/relay/relay_authorizer.hpp"
#include "internal/service/relay_service.hpp"
#include "mprisrelay/v1.hpp"

namespace mprisrelay::grpc {

class RelayServer final : public mprisrelay::v1::Relay::Service {
public:
  RelayServer(std::shared_ptr<mprisrelay::service::RelayService> svc,
              std::shared_ptr<mprisrelay::relay::RelayAuthorizer> authorizer);

  ::grpc::Status Connect(::grpc::ServerContext*,
                         ::grpc::ServerReaderWriter<mprisrelay::v1::ServerMessage, mprisrelay::v1::ClientMessage>*) override;

  ::grpc::Status ListPlayers(::grpc::ServerContext*, const mprisrelay::v1::ListPlayersRequest*,
                             mprisrelay::v1::ListPlayersResponse*) override;

private:
  std::string Authenticate(const ::grpc::ServerContext& ctx, const char* method);

  std::shared_ptr<mprisrelay::service::RelayService>  service_;
  std::shared_ptr<mprisrelay::relay::RelayAuthorizer> authorizer_;
};

} // namespace mprisrelay::grpc
