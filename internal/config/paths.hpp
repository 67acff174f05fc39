#pragma once

#include <filesystem>

namespace mprisrelay::config {

// $XDG_CONFIG_HOME/mprisrelay, falling back to $HOME/.config/mprisrelay.
std::filesystem::path ConfigDirectory();

std::filesystem::path DefaultConfigPath();
std::filesystem::path DefaultCredentialsPath();

// Creates `dir` (and parents) if needed and restricts it to the owner.
void EnsurePrivateDirectory(const std::filesystem::path& dir);

} // namespace mprisrelay::config
