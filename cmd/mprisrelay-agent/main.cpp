#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using mprisrelay::factory::Build;
using mprisrelay::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_reset   = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleReset(int) {
  g_reset = 1;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  mprisrelay-agent [--config <config.yaml>]\n"
            << "  mprisrelay-agent [--config <config.yaml>] list-pairings\n"
            << "  mprisrelay-agent [--config <config.yaml>] revoke <identity>\n"
            << "  mprisrelay-agent [--config <config.yaml>] reset-pairings\n";
}

static std::string FormatMillis(int64_t ms) {
  std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm     tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

// Offline pairing management against the same credential store the
// running agent uses. Revocations take effect on the agent's next
// authorization check.
static int RunPairingCommand(const mprisrelay::runtime::config::RuntimeConfig& config,
                             const std::vector<std::string>&                   args) {
  auto store = mprisrelay::factory::BuildCredentialStore(config);

  if (args[0] == "list-pairings") {
    for (const auto& record : store->List()) {
      std::cout << record.identity << "  " << FormatMillis(record.created_at_ms) << "  " << record.client_name << "\n";
    }
    return 0;
  }

  if (args[0] == "revoke") {
    if (args.size() != 2) {
      Usage();
      return 1;
    }
    try {
      store->Revoke(args[1]);
    } catch (const mprisrelay::util::NotFound& e) {
      std::cerr << e.what() << "\n";
      return 2;
    }
    std::cout << "revoked " << args[1] << "\n";
    return 0;
  }

  if (args[0] == "reset-pairings") {
    std::cout << "revoked " << store->RevokeAll() << " pairing(s)\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      args.push_back(arg);
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = mprisrelay::config::ConfigLoader::Load(config_path);

    mprisrelay::observability::InitializeLogging(config.logging());

    if (!args.empty()) {
      const int rc = RunPairingCommand(config, args);
      mprisrelay::observability::ShutdownLogging();
      return rc;
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app         = Build(config);
    auto credentials = mprisrelay::factory::BuildServerCredentials(config);

    Server pairing_server(config.server().pairing_address(), std::move(app.pairing_grpc_services), credentials);
    Server relay_server(config.server().relay_address(), std::move(app.relay_grpc_services), credentials);

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGUSR2, HandleReset);

    app.Start();
    pairing_server.Start();
    relay_server.Start();
    MPRISRELAY_LOG_INFO("mprisrelay agent started",
                        {mprisrelay::observability::StringField("relay_address", config.server().relay_address()),
                         mprisrelay::observability::StringField("pairing_address", config.server().pairing_address()),
                         mprisrelay::observability::BoolField("tls", credentials != nullptr)});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (g_reset) {
        g_reset = 0;
        app.ResetPairings();
      }
    }

    MPRISRELAY_LOG_INFO("Shutting down mprisrelay agent");

    // Sessions close first so blocked streams let the servers drain.
    app.Stop();
    relay_server.Stop();
    pairing_server.Stop();
    mprisrelay::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    MPRISRELAY_LOG_ERROR("Fatal error", {mprisrelay::observability::StringField("error", e.what())});
    mprisrelay::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
