#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/bus/bus.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/monitor/player_monitor.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/pairing/confirmer.hpp"
#include "internal/relay/relay_authorizer.hpp"
#include "internal/service/pairing_service.hpp"
#include "internal/service/relay_service.hpp"

namespace mprisrelay::factory {

/*
  Application

  Owns every long-lived component of the agent. Everything here lives for
  the lifetime of the process; Start() and Stop() order the background
  parts (Stop closes relay sessions before anything below them goes away).
*/
struct Application {
  std::shared_ptr<credentials::CredentialStore> store;

  std::shared_ptr<bus::Bus>           ui_bus;
  std::shared_ptr<pairing::Confirmer> confirmer;
  std::shared_ptr<notify::Notifier>   notifier;

  std::shared_ptr<service::PairingService> pairing_service;
  std::shared_ptr<monitor::PlayerMonitor>  monitor;
  std::shared_ptr<relay::RelayAuthorizer>  authorizer;
  std::shared_ptr<service::RelayService>   relay_service;

  std::vector<std::unique_ptr<::grpc::Service>> pairing_grpc_services;
  std::vector<std::unique_ptr<::grpc::Service>> relay_grpc_services;

  void Start();
  void Stop();

  // Drops every trust record and disconnects every relay client.
  std::size_t ResetPairings();
};

/*
  Build

  Composition root of the agent. The only place that knows concrete
  storage, bus and confirmer types.
*/
Application Build(const mprisrelay::runtime::config::RuntimeConfig& config);

// Used on its own by the agent's offline subcommands.
std::shared_ptr<credentials::CredentialStore> BuildCredentialStore(
    const mprisrelay::runtime::config::RuntimeConfig& config);

// Null when TLS is not configured.
std::shared_ptr<::grpc::ServerCredentials> BuildServerCredentials(
    const mprisrelay::runtime::config::RuntimeConfig& config);

} // namespace mprisrelay::factory
