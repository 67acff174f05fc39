#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace mprisrelay::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
               std::shared_ptr<::grpc::ServerCredentials> credentials)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), credentials_(std::move(credentials)) {
  tls_ = credentials_ != nullptr;
  if (!tls_) {
    credentials_ = ::grpc::InsecureServerCredentials();
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, credentials_, &selected_port_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  MPRISRELAY_LOG_INFO("Listening", {observability::StringField("address", bind_address_),
                                    observability::IntField("port", selected_port_),
                                    observability::BoolField("tls", tls_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop(std::chrono::milliseconds grace) {
  if (grpc_server_) {
    grpc_server_->Shutdown(std::chrono::system_clock::now() + grace);
    grpc_server_.reset();
  }
}

std::shared_ptr<::grpc::Channel> Server::InProcessChannel() {
  if (!grpc_server_) {
    throw std::runtime_error("server not started");
  }
  return grpc_server_->InProcessChannel(::grpc::ChannelArguments());
}

} // namespace mprisrelay::runtime
