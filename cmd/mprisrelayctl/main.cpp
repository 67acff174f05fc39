#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "client/cpp/relay_client.h"
#include "mprisrelay/v1.hpp"

using namespace mprisrelay::v1;
using mprisrelay::client::LoadCredentials;
using mprisrelay::client::PairingClient;
using mprisrelay::client::RelayClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mprisrelayctl [options] pair <client-name>\n"
            << "  mprisrelayctl [options] players\n"
            << "  mprisrelayctl [options] watch [player_id...]\n"
            << "  mprisrelayctl [options] play|pause|stop|next|previous <player_id>\n"
            << "  mprisrelayctl [options] seek <player_id> <position_us>\n"
            << "  mprisrelayctl [options] rate <player_id> <rate>\n"
            << "Options:\n"
            << "  --relay <host:port>      (default localhost:40051)\n"
            << "  --pairing <host:port>    (default localhost:40052)\n"
            << "  --credentials <file>     (default ~/.config/mprisrelay/client-credentials.pb)\n"
            << "  --ca <pem>               use TLS, trusting this root\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot read " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static const char* StateName(PlaybackState state) {
  switch (state) {
    case PLAYBACK_STATE_PLAYING:
      return "playing";
    case PLAYBACK_STATE_PAUSED:
      return "paused";
    case PLAYBACK_STATE_STOPPED:
      return "stopped";
    default:
      return "unknown";
  }
}

static void PrintPlayer(const Player& player) {
  std::cout << player.player_id() << "  " << StateName(player.state());
  if (player.degraded()) std::cout << " (degraded)";
  if (!player.metadata().title().empty()) {
    std::cout << "  " << player.metadata().artist() << (player.metadata().artist().empty() ? "" : " - ")
              << player.metadata().title();
  }
  std::cout << "\n";
}

static void PrintMessage(const ServerMessage& message) {
  switch (message.kind_case()) {
    case ServerMessage::kWelcome:
      std::cout << "welcome protocol=" << message.welcome().protocol_version()
                << " agent=" << message.welcome().agent_version() << "\n";
      break;
    case ServerMessage::kSnapshot:
      std::cout << "snapshot players=" << message.snapshot().players_size() << "\n";
      for (const auto& player : message.snapshot().players()) PrintPlayer(player);
      break;
    case ServerMessage::kEvent: {
      const auto& event = message.event();
      if (event.has_appeared()) {
        std::cout << "+ ";
        PrintPlayer(event.appeared().player());
      } else if (event.has_state_changed()) {
        std::cout << "~ ";
        PrintPlayer(event.state_changed().player());
      } else if (event.has_disappeared()) {
        std::cout << "- " << event.disappeared().player_id() << "\n";
      }
      break;
    }
    case ServerMessage::kCommandResult: {
      const auto& result = message.command_result();
      if (result.accepted()) {
        std::cout << "accepted\n";
      } else {
        std::cout << "rejected " << RejectReason_Name(result.reason()) << ": " << result.detail() << "\n";
      }
      break;
    }
    default:
      break;
  }
}

static std::optional<Command> ParseCommand(const std::vector<std::string>& args) {
  if (args.size() < 2) return std::nullopt;

  Command command;
  command.set_player_id(args[1]);
  const auto& verb = args[0];
  if (verb == "play") {
    command.set_play(true);
  } else if (verb == "pause") {
    command.set_pause(true);
  } else if (verb == "stop") {
    command.set_stop(true);
  } else if (verb == "next") {
    command.set_next(true);
  } else if (verb == "previous") {
    command.set_previous(true);
  } else if (verb == "seek" && args.size() == 3) {
    command.mutable_seek()->set_position_us(std::stoll(args[2]));
  } else if (verb == "rate" && args.size() == 3) {
    command.mutable_set_rate()->set_rate(std::stod(args[2]));
  } else {
    return std::nullopt;
  }
  return command;
}

int main(int argc, char** argv) {
  std::string              relay_addr   = "localhost:40051";
  std::string              pairing_addr = "localhost:40052";
  std::string              credentials_file;
  std::string              ca_file;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--relay" && i + 1 < argc) {
      relay_addr = argv[++i];
    } else if (arg == "--pairing" && i + 1 < argc) {
      pairing_addr = argv[++i];
    } else if (arg == "--credentials" && i + 1 < argc) {
      credentials_file = argv[++i];
    } else if (arg == "--ca" && i + 1 < argc) {
      ca_file = argv[++i];
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    std::filesystem::path creds_path =
        credentials_file.empty() ? mprisrelay::client::DefaultCredentialsFile() : std::filesystem::path(credentials_file);

    std::shared_ptr<grpc::ChannelCredentials> channel_creds = grpc::InsecureChannelCredentials();
    if (!ca_file.empty()) {
      grpc::SslCredentialsOptions options;
      options.pem_root_certs = ReadFile(ca_file);
      channel_creds          = grpc::SslCredentials(options);
    }

    const auto& cmd = args[0];

    // ------------------------------------------------------------

    if (cmd == "pair") {
      if (args.size() != 2) {
        Usage();
        return 1;
      }
      PairingClient client(grpc::CreateChannel(pairing_addr, channel_creds));

      mprisrelay::client::PairingAttempt attempt;
      auto status = client.Pair(
          args[1],
          [](const std::string& sas, const ServerHello& hello) {
            std::cout << "Pairing code: " << sas << "\n"
                      << "Confirm it matches the code shown by the agent (session " << hello.session_id()
                      << ") [y/N]: " << std::flush;
            std::string answer;
            std::getline(std::cin, answer);
            return answer == "y" || answer == "Y" || answer == "yes";
          },
          &attempt);
      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }
      if (attempt.result.outcome() != PAIRING_OUTCOME_ESTABLISHED) {
        std::cerr << "pairing not established: " << PairingOutcome_Name(attempt.result.outcome()) << " "
                  << attempt.result.detail() << "\n";
        return 2;
      }
      mprisrelay::client::SaveCredentials(creds_path, attempt.credentials);
      std::cout << "paired as " << attempt.credentials.identity() << "\n";
      return 0;
    }

    RelayClient client(grpc::CreateChannel(relay_addr, channel_creds), LoadCredentials(creds_path));

    // ------------------------------------------------------------

    if (cmd == "players") {
      std::vector<Player> players;
      auto                status = client.ListPlayers(&players);
      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }
      for (const auto& player : players) PrintPlayer(player);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "watch") {
      grpc::ClientContext ctx;
      auto                stream = client.Connect(&ctx);

      ClientMessage subscribe;
      if (args.size() == 1) {
        subscribe.mutable_subscribe()->set_all_players(true);
      } else {
        for (std::size_t i = 1; i < args.size(); ++i) subscribe.mutable_subscribe()->add_player_ids(args[i]);
      }
      stream->Write(subscribe);

      ServerMessage message;
      while (stream->Read(&message)) PrintMessage(message);

      auto status = stream->Finish();
      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }
      return 0;
    }

    // ------------------------------------------------------------

    auto command = ParseCommand(args);
    if (!command.has_value()) {
      Usage();
      return 1;
    }

    grpc::ClientContext ctx;
    auto                stream = client.Connect(&ctx);

    ClientMessage request;
    request.mutable_command()->set_request_id("ctl-1");
    *request.mutable_command()->mutable_command() = *command;
    stream->Write(request);
    stream->WritesDone();

    int           rc = 2;
    ServerMessage message;
    while (stream->Read(&message)) {
      if (message.has_command_result() && message.command_result().request_id() == "ctl-1") {
        PrintMessage(message);
        rc = message.command_result().accepted() ? 0 : 3;
      }
    }
    auto status = stream->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return rc;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
