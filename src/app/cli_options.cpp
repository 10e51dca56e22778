// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "app/cli_options.hpp"

#include <charconv>

namespace meshprobe {
namespace app {

namespace {

std::optional<int> ParsePositiveInt(const std::string& str) {
  int value = 0;
  const char* begin = str.data();
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || value <= 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<std::string> ParseCommandLine(const std::vector<std::string>& args, CliOptions& options) {
  options = CliOptions{};

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
      continue;
    }
    if (arg == "--version" || arg == "-v") {
      options.show_version = true;
      continue;
    }
    if (arg == "--debug") {
      options.debug = true;
      continue;
    }
    if (arg == "--json") {
      options.json = true;
      continue;
    }

    if (arg.starts_with("--")) {
      std::string name = arg;
      std::string value;
      const size_t eq = arg.find('=');
      if (eq != std::string::npos) {
        name = arg.substr(0, eq);
        value = arg.substr(eq + 1);
      } else {
        if (i + 1 >= args.size()) {
          return name + " requires a value";
        }
        value = args[++i];
      }

      if (name == "--address" || name == "--device") {
        options.address = value;
      } else if (name == "--interface-type") {
        auto type = network::ParseInterfaceType(value);
        if (!type) {
          return "Invalid --interface-type '" + value + "' (expected auto, serial, tcp or ble)";
        }
        options.interface_type = *type;
      } else if (name == "--interface") {
        // Older spelling, only ever took the two wired transports
        auto type = network::ParseInterfaceType(value);
        if (!type || (*type != network::InterfaceType::SERIAL && *type != network::InterfaceType::TCP)) {
          return "Invalid --interface '" + value + "' (expected serial or tcp)";
        }
        options.interface_type = *type;
      } else if (name == "--duration") {
        auto duration = ParsePositiveInt(value);
        if (!duration) {
          return "Invalid --duration '" + value + "' (expected a positive number of seconds)";
        }
        options.duration_seconds = *duration;
      } else if (name == "--log-file") {
        if (value.empty()) {
          return "--log-file requires a non-empty path";
        }
        options.log_file = value;
      } else {
        return "Unknown option " + name;
      }
      continue;
    }

    if (options.command != Command::NONE) {
      return "Unexpected argument '" + arg + "'";
    }
    if (arg == "discover") {
      options.command = Command::DISCOVER;
    } else if (arg == "list-nodes") {
      options.command = Command::LIST_NODES;
    } else {
      return "Unknown command '" + arg + "'";
    }
  }

  return std::nullopt;
}

}  // namespace app
}  // namespace meshprobe
