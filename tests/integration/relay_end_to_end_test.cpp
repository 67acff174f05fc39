#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "client/cpp/relay_client.h"
#include "internal/credentials/credential_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/pairing_server.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/monitor/player_monitor.hpp"
#include "internal/relay/relay_authorizer.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/pairing_service.hpp"
#include "internal/service/relay_service.hpp"
#include "support/fake_bus.hpp"
#include "support/scripted_confirmer.hpp"

namespace {

using namespace std::chrono_literals;
using mprisrelay::pairing::OperatorDecision;
using mprisrelay::testing::FakeBus;
using mprisrelay::testing::RecordingNotifier;
using mprisrelay::testing::ScriptedConfirmer;
using mprisrelay::testing::StandardPlayer;
namespace bus = mprisrelay::bus;
namespace v1  = mprisrelay::v1;

/*
  The agent minus its process shell: both listeners on loopback with an
  in-memory credential store and a scripted bus.
*/
struct Agent {
  std::shared_ptr<mprisrelay::credentials::CredentialStore> store =
      std::make_shared<mprisrelay::credentials::CredentialStore>(
          std::make_shared<mprisrelay::db::memory::MemoryRepository>());
  std::shared_ptr<ScriptedConfirmer>                   confirmer;
  std::shared_ptr<RecordingNotifier>                   notifier = std::make_shared<RecordingNotifier>();
  std::shared_ptr<mprisrelay::service::PairingService> pairing;

  std::shared_ptr<FakeBus>                            fake = std::make_shared<FakeBus>();
  std::shared_ptr<mprisrelay::monitor::PlayerMonitor> monitor;
  std::shared_ptr<mprisrelay::relay::RelayAuthorizer> authorizer;
  std::shared_ptr<mprisrelay::service::RelayService>  relay;

  std::unique_ptr<mprisrelay::runtime::Server> pairing_server;
  std::unique_ptr<mprisrelay::runtime::Server> relay_server;

  explicit Agent(OperatorDecision decision) : confirmer(std::make_shared<ScriptedConfirmer>(decision)) {
    mprisrelay::service::PairingOptions pairing_options;
    pairing_options.confirmation_timeout = 5s;
    pairing_options.sas_digits           = 4;
    pairing = std::make_shared<mprisrelay::service::PairingService>(store, confirmer, notifier, pairing_options);

    fake->Register("org.mpris.MediaPlayer2.vlc", StandardPlayer(":1.5", "VLC"));
    mprisrelay::monitor::MonitorOptions monitor_options;
    monitor_options.probe.backoff = 10ms;
    auto shared                   = fake;
    monitor                       = std::make_shared<mprisrelay::monitor::PlayerMonitor>(
        [shared] { return std::static_pointer_cast<bus::Bus>(shared); }, monitor_options);
    authorizer = std::make_shared<mprisrelay::relay::RelayAuthorizer>(store, 120s);
    relay      = std::make_shared<mprisrelay::service::RelayService>(monitor, authorizer,
                                                                    mprisrelay::service::RelayOptions{});

    std::vector<std::unique_ptr<::grpc::Service>> pairing_services;
    pairing_services.push_back(std::make_unique<mprisrelay::grpc::PairingServer>(pairing));
    pairing_server = std::make_unique<mprisrelay::runtime::Server>("127.0.0.1:0", std::move(pairing_services));

    std::vector<std::unique_ptr<::grpc::Service>> relay_services;
    relay_services.push_back(std::make_unique<mprisrelay::grpc::RelayServer>(relay, authorizer));
    relay_server = std::make_unique<mprisrelay::runtime::Server>("127.0.0.1:0", std::move(relay_services));

    pairing->Start();
    monitor->Start();
    pairing_server->Start();
    relay_server->Start();

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (monitor->Players().empty()) {
      assert(std::chrono::steady_clock::now() < deadline);
      std::this_thread::sleep_for(5ms);
    }
  }

  ~Agent() {
    relay->Shutdown();
    pairing->Stop();
    relay_server->Stop();
    pairing_server->Stop();
    monitor->Stop();
  }
};

mprisrelay::client::PairingAttempt PairOk(Agent& agent, std::string* seen_sas) {
  mprisrelay::client::PairingClient client(agent.pairing_server->InProcessChannel());
  mprisrelay::client::PairingAttempt attempt;

  const auto status = client.Pair(
      "Phone",
      [&](const std::string& sas, const v1::ServerHello&) {
        *seen_sas = sas;
        return true;
      },
      &attempt);
  assert(status.ok());
  return attempt;
}

void TestPairThenRelay() {
  Agent       agent(OperatorDecision::kAccept);
  std::string sas;
  auto        attempt = PairOk(agent, &sas);

  assert(attempt.result.outcome() == v1::PAIRING_OUTCOME_ESTABLISHED);
  assert(sas.size() == 4);
  assert(agent.confirmer->Prompts().front().sas == sas);
  const auto& credentials = attempt.credentials;
  assert(credentials.identity() == attempt.result.identity());
  assert(credentials.trust_key().size() == 32);
  assert(agent.store->Get(credentials.identity()).has_value());

  mprisrelay::client::RelayClient client(agent.relay_server->InProcessChannel(), credentials);

  std::vector<v1::Player> players;
  assert(client.ListPlayers(&players).ok());
  assert(players.size() == 1);
  assert(players[0].player_id() == "VLC");

  ::grpc::ClientContext ctx;
  auto                  stream = client.Connect(&ctx);

  v1::ServerMessage message;
  assert(stream->Read(&message));
  assert(message.has_welcome());
  assert(message.welcome().identity() == credentials.identity());

  v1::ClientMessage subscribe;
  subscribe.mutable_subscribe()->set_all_players(true);
  assert(stream->Write(subscribe));
  assert(stream->Read(&message));
  assert(message.snapshot().players_size() == 1);

  agent.fake->ChangeProperties("org.mpris.MediaPlayer2.vlc", {{"PlaybackStatus", bus::Value("Paused")}});
  assert(stream->Read(&message));
  assert(message.event().state_changed().player().state() == v1::PLAYBACK_STATE_PAUSED);

  agent.fake->AddPlayer("org.mpris.MediaPlayer2.mpv", StandardPlayer(":1.6", "mpv"));
  assert(stream->Read(&message));
  assert(message.event().appeared().player().player_id() == "mpv");
  assert(stream->Read(&message));
  assert(message.event().has_state_changed());

  v1::ClientMessage command;
  command.mutable_command()->set_request_id("seek-1");
  command.mutable_command()->mutable_command()->set_player_id("VLC");
  command.mutable_command()->mutable_command()->mutable_seek()->set_position_us(-5);
  assert(stream->Write(command));
  assert(stream->Read(&message));
  assert(message.command_result().request_id() == "seek-1");
  assert(message.command_result().reason() == v1::REJECT_REASON_INVALID_ARGUMENT);

  command.mutable_command()->set_request_id("play-1");
  command.mutable_command()->mutable_command()->set_play(true);
  assert(stream->Write(command));
  assert(stream->Read(&message));
  assert(message.command_result().request_id() == "play-1");
  assert(message.command_result().accepted());
  assert(agent.fake->PlayerCalls("org.mpris.MediaPlayer2.vlc", "Play").size() == 1);

  stream->WritesDone();
  while (stream->Read(&message)) {
  }
  assert(stream->Finish().ok());
}

void TestRejectedPairingStoresNothing() {
  Agent       agent(OperatorDecision::kReject);
  std::string sas;
  auto        attempt = PairOk(agent, &sas);

  assert(attempt.result.outcome() == v1::PAIRING_OUTCOME_REJECTED_BY_OPERATOR);
  assert(attempt.credentials.identity().empty());
  assert(agent.store->List().empty());
}

void TestClientSideMismatchIsReported() {
  Agent agent(OperatorDecision::kAccept);

  mprisrelay::client::PairingClient  client(agent.pairing_server->InProcessChannel());
  mprisrelay::client::PairingAttempt attempt;
  const auto status = client.Pair("Phone", [](const std::string&, const v1::ServerHello&) { return false; }, &attempt);

  assert(status.ok());
  assert(attempt.result.outcome() == v1::PAIRING_OUTCOME_REJECTED_BY_CLIENT);
  assert(agent.store->List().empty());
}

void TestUnpairedClientIsRefused() {
  Agent agent(OperatorDecision::kAccept);

  v1::ClientCredentials forged;
  forged.set_identity(std::string(32, 'f'));
  forged.set_trust_key(std::string(32, '\x01'));
  mprisrelay::client::RelayClient client(agent.relay_server->InProcessChannel(), forged);

  std::vector<v1::Player> players;
  assert(client.ListPlayers(&players).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(players.empty());

  ::grpc::ClientContext ctx;
  auto                  stream = client.Connect(&ctx);
  v1::ServerMessage     message;
  assert(!stream->Read(&message));
  assert(stream->Finish().error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(agent.relay->ActiveSessions() == 0);
}

void TestRevocationDisconnectsStream() {
  Agent       agent(OperatorDecision::kAccept);
  std::string sas;
  auto        attempt = PairOk(agent, &sas);

  mprisrelay::client::RelayClient client(agent.relay_server->InProcessChannel(), attempt.credentials);
  ::grpc::ClientContext           ctx;
  auto                            stream = client.Connect(&ctx);
  v1::ServerMessage               message;
  assert(stream->Read(&message));
  assert(message.has_welcome());

  agent.store->RevokeAll();
  agent.relay->DisconnectAll(mprisrelay::relay::CloseReason::kRevoked);

  while (stream->Read(&message)) {
  }
  // Server-initiated closes cancel the call.
  assert(stream->Finish().error_code() == ::grpc::StatusCode::CANCELLED);

  std::vector<v1::Player> players;
  assert(client.ListPlayers(&players).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

} // namespace

int main() {
  TestPairThenRelay();
  TestRejectedPairingStoresNothing();
  TestClientSideMismatchIsReported();
  TestUnpairedClientIsRefused();
  TestRevocationDisconnectsStream();

  std::cout << "mprisrelay_integration_relay_end_to_end: pass\n";
  return 0;
}
