#include "internal/observability/logging.hpp"

#include <stdlib.h>

#include <cassert>
#include <chrono>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using namespace std::chrono_literals;
namespace obs = mprisrelay::observability;

void TestPlainFieldsAreUnquoted() {
  const auto line = obs::FormatFields({obs::StringField("player_id", "vlc"), obs::IntField("attempt", 3),
                                       obs::BoolField("replaced", false), obs::DurationField("retry_in", 250ms)});
  assert(line == "player_id=vlc attempt=3 replaced=false retry_in=250ms");
}

void TestPeerSuppliedValuesCannotForgeFields() {
  assert(obs::FormatFields({obs::StringField("client", "Pixel 8")}) == "client=\"Pixel 8\"");
  assert(obs::FormatFields({obs::StringField("client", "x identity=abc")}) == "client=\"x identity=abc\"");
  assert(obs::FormatFields({obs::StringField("title", "say \"hi\"\nbye")}) == "title=\"say \\\"hi\\\"\\nbye\"");
  assert(obs::FormatFields({obs::StringField("client", "")}) == "client=\"\"");
  assert(obs::FormatFields({}).empty());
}

void TestUnknownLevelFallsBackToInfo() {
  ::unsetenv("MPRISRELAY_LOG_LEVEL");
  ::unsetenv("MPRISRELAY_LOG_PATTERN");

  mprisrelay::runtime::config::LoggingConfig config;
  config.set_level("verbose");
  obs::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.set_level("debug");
  obs::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  ::setenv("MPRISRELAY_LOG_LEVEL", "error", 1);
  obs::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::err);
  ::unsetenv("MPRISRELAY_LOG_LEVEL");

  obs::LogInfo("suppressed", {obs::StringField("k", "v")});
  obs::ShutdownLogging();
}

} // namespace

int main() {
  TestPlainFieldsAreUnquoted();
  TestPeerSuppliedValuesCannotForgeFields();
  TestUnknownLevelFallsBackToInfo();

  std::cout << "mprisrelay_unit_logging: pass\n";
  return 0;
}
