#include "paths.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mprisrelay::config {

std::filesystem::path ConfigDirectory() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "mprisrelay";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "mprisrelay";
  }
  throw std::runtime_error("Cannot resolve config directory: neither XDG_CONFIG_HOME nor HOME is set");
}

std::filesystem::path DefaultConfigPath() {
  return ConfigDirectory() / "agent.yaml";
}

std::filesystem::path DefaultCredentialsPath() {
  return ConfigDirectory() / "credentials.db";
}

void EnsurePrivateDirectory(const std::filesystem::path& dir) {
  if (dir.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory " + dir.string() + ": " + ec.message());
  }

  std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw std::runtime_error("Failed to restrict directory " + dir.string() + ": " + ec.message());
  }
}

} // namespace mprisrelay::config
