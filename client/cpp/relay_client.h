#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "mprisrelay/v1.hpp"

namespace mprisrelay::client {

// Shown the code the agent displays; returns whether both codes match.
using SasConfirm = std::function<bool(const std::string& sas, const mprisrelay::v1::ServerHello& hello)>;

struct PairingAttempt {
  mprisrelay::v1::PairingResult     result;
  // Filled only when result.outcome() is ESTABLISHED.
  mprisrelay::v1::ClientCredentials credentials;
};

/*
  Client half of the pairing handshake: ephemeral X25519 exchange, local
  code comparison, sealed enrollment of a fresh Ed25519 identity, and key
  confirmation of the resulting trust key.
*/
class PairingClient {
 public:
  explicit PairingClient(std::shared_ptr<::grpc::Channel> channel);

  // A non-OK status means the handshake failed in transport or the
  // agent's key confirmation did not verify. Rejections and timeouts are
  // reported through `outcome` with an OK status.
  ::grpc::Status Pair(const std::string& client_name, const SasConfirm& confirm, PairingAttempt* outcome) const;

 private:
  std::unique_ptr<mprisrelay::v1::Pairing::Stub> stub_;
};

/*
  Authenticated relay access. Every call carries a fresh proof of
  possession of the trust key.
*/
class RelayClient {
 public:
  RelayClient(std::shared_ptr<::grpc::Channel> channel, mprisrelay::v1::ClientCredentials credentials);

  ::grpc::Status ListPlayers(std::vector<mprisrelay::v1::Player>* players) const;

  // `context` must outlive the stream.
  std::unique_ptr<::grpc::ClientReaderWriter<mprisrelay::v1::ClientMessage, mprisrelay::v1::ServerMessage>> Connect(
      ::grpc::ClientContext* context) const;

  // Adds the proof metadata for `method` to `context`.
  void Authorize(::grpc::ClientContext* context, const char* method) const;

  const mprisrelay::v1::ClientCredentials& Credentials() const {
    return credentials_;
  }

 private:
  std::unique_ptr<mprisrelay::v1::Relay::Stub> stub_;
  mprisrelay::v1::ClientCredentials             credentials_;
};

// Credentials live in a private (0600) binary protobuf file.
std::filesystem::path             DefaultCredentialsFile();
void                              SaveCredentials(const std::filesystem::path& path,
                                                  const mprisrelay::v1::ClientCredentials& credentials);
mprisrelay::v1::ClientCredentials LoadCredentials(const std::filesystem::path& path);

} // namespace mprisrelay::client
