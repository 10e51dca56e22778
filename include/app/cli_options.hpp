// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/protocol.hpp"
#include "network/interface_factory.hpp"

#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace app {

enum class Command {
  NONE,
  DISCOVER,
  LIST_NODES,
};

struct CliOptions {
  Command command{Command::NONE};
  std::string address;  // Empty: first serial device found
  network::InterfaceType interface_type{network::InterfaceType::AUTO};
  int duration_seconds{protocol::DEFAULT_DISCOVERY_DURATION_SEC};
  bool debug{false};
  bool json{false};
  std::string log_file;
  bool show_help{false};
  bool show_version{false};
};

// Parse arguments (without the program name) into `options`.
// Options take "--name=value" or "--name value". Returns an error message on
// bad input, std::nullopt on success.
std::optional<std::string> ParseCommandLine(const std::vector<std::string>& args, CliOptions& options);

}  // namespace app
}  // namespace meshprobe
