#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace mprisrelay::runtime {

/*
  One gRPC listener hosting a set of services. The agent runs two: the
  pairing port and the relay port.
*/
class Server {
public:
  // Insecure transport when `credentials` is null.
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services,
         std::shared_ptr<::grpc::ServerCredentials> credentials = nullptr);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  // In-flight calls get `grace` to finish before they are cancelled.
  void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

  // Port actually bound; differs from the address when it asked for 0.
  int Port() const {
    return selected_port_;
  }

  std::shared_ptr<::grpc::Channel> InProcessChannel();

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::shared_ptr<::grpc::ServerCredentials> credentials_;
  bool tls_ = false;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace mprisrelay::runtime
