#include "factory.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/bus/dbus_session_bus.hpp"
#include "internal/config/paths.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/pairing_server.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/notify/desktop_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pairing/console_confirmer.hpp"
#include "internal/pairing/desktop_confirmer.hpp"

namespace mprisrelay::factory {

using mprisrelay::runtime::config::RuntimeConfig;

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::shared_ptr<bus::Bus> ConnectUiBus() {
  try {
    return bus::DbusSessionBus::Connect();
  } catch (const bus::BusError& e) {
    MPRISRELAY_LOG_WARN("Desktop notifications unavailable", {observability::StringField("error", e.what())});
    return nullptr;
  }
}

monitor::MonitorOptions MonitorOptionsFrom(const RuntimeConfig& config) {
  const auto&             m = config.monitor();
  monitor::MonitorOptions options;
  options.probe.attempts       = m.probe_attempts();
  options.probe.backoff        = std::chrono::milliseconds(m.probe_backoff_ms());
  options.probe.call_timeout   = std::chrono::milliseconds(config.relay().command_timeout_ms());
  options.bus_connect_attempts = m.bus_connect_attempts();
  options.bus_retry            = std::chrono::milliseconds(m.bus_retry_ms());
  return options;
}

} // namespace

std::shared_ptr<credentials::CredentialStore> BuildCredentialStore(const RuntimeConfig& config) {
  if (config.credentials().in_memory()) {
    return std::make_shared<credentials::CredentialStore>(std::make_shared<db::memory::MemoryRepository>());
  }

  std::filesystem::path path = config.credentials().path();
  if (path.empty()) path = mprisrelay::config::DefaultCredentialsPath();
  if (path.has_parent_path()) mprisrelay::config::EnsurePrivateDirectory(path.parent_path());

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string());
  db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
  return std::make_shared<credentials::CredentialStore>(std::make_shared<db::sqlite::SqliteRepository>(sqlite_db));
}

std::shared_ptr<::grpc::ServerCredentials> BuildServerCredentials(const RuntimeConfig& config) {
  const auto& tls = config.server().tls();
  if (tls.cert_file().empty()) return nullptr;

  ::grpc::SslServerCredentialsOptions options;
  options.pem_key_cert_pairs.push_back({ReadFile(tls.key_file()), ReadFile(tls.cert_file())});
  return ::grpc::SslServerCredentials(options);
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Credential store
  // ------------------------------------------------------------------
  app.store = BuildCredentialStore(config);

  // ------------------------------------------------------------------
  // Operator surface
  // ------------------------------------------------------------------
  const auto& pairing_cfg = config.pairing();
  if (pairing_cfg.confirmer() == "desktop" || pairing_cfg.notify()) {
    app.ui_bus = ConnectUiBus();
  }

  if (pairing_cfg.confirmer() == "desktop" && app.ui_bus) {
    app.confirmer = std::make_shared<pairing::DesktopConfirmer>(app.ui_bus);
  } else {
    if (pairing_cfg.confirmer() == "desktop") {
      MPRISRELAY_LOG_WARN("Falling back to console pairing confirmation");
    }
    app.confirmer = std::make_shared<pairing::ConsoleConfirmer>(STDIN_FILENO, std::cout);
  }

  if (pairing_cfg.notify() && app.ui_bus) {
    app.notifier = std::make_shared<notify::DesktopNotifier>(app.ui_bus);
  }

  // ------------------------------------------------------------------
  // Pairing
  // ------------------------------------------------------------------
  service::PairingOptions pairing_options;
  pairing_options.confirmation_timeout = std::chrono::seconds(pairing_cfg.confirmation_timeout_sec());
  pairing_options.max_sessions         = pairing_cfg.max_sessions();
  pairing_options.sas_digits           = pairing_cfg.sas_digits();
  app.pairing_service =
      std::make_shared<service::PairingService>(app.store, app.confirmer, app.notifier, pairing_options);

  // ------------------------------------------------------------------
  // Players and relay
  // ------------------------------------------------------------------
  app.monitor = std::make_shared<monitor::PlayerMonitor>(
      []() -> std::shared_ptr<bus::Bus> { return bus::DbusSessionBus::Connect(); }, MonitorOptionsFrom(config));

  app.authorizer =
      std::make_shared<relay::RelayAuthorizer>(app.store, std::chrono::seconds(config.relay().auth_max_skew_sec()));

  service::RelayOptions relay_options;
  relay_options.max_outbound_events = config.relay().max_outbound_events();
  relay_options.command_timeout     = std::chrono::milliseconds(config.relay().command_timeout_ms());
  app.relay_service = std::make_shared<service::RelayService>(app.monitor, app.authorizer, relay_options);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.pairing_grpc_services.push_back(std::make_unique<grpc::PairingServer>(app.pairing_service));
  app.relay_grpc_services.push_back(std::make_unique<grpc::RelayServer>(app.relay_service, app.authorizer));

  return app;
}

void Application::Start() {
  if (auto console = std::dynamic_pointer_cast<pairing::ConsoleConfirmer>(confirmer)) console->Start();
  if (auto desktop = std::dynamic_pointer_cast<pairing::DesktopConfirmer>(confirmer)) desktop->Start();

  pairing_service->Start();
  monitor->Start();
}

void Application::Stop() {
  relay_service->Shutdown();
  pairing_service->Stop();
  monitor->Stop();

  if (auto console = std::dynamic_pointer_cast<pairing::ConsoleConfirmer>(confirmer)) console->Stop();
  if (auto desktop = std::dynamic_pointer_cast<pairing::DesktopConfirmer>(confirmer)) desktop->Stop();
}

std::size_t Application::ResetPairings() {
  const auto removed = store->RevokeAll();
  const auto dropped = relay_service->DisconnectAll(relay::CloseReason::kRevoked);
  MPRISRELAY_LOG_WARN("All pairings reset", {observability::IntField("trust_records", removed),
                                             observability::IntField("sessions", dropped)});
  return removed;
}

} // namespace mprisrelay::factory
