// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "mesh/protocol.hpp"

#include <cctype>
#include <cstdio>

namespace meshprobe {
namespace protocol {

std::string PortNumAsString(PortNum port) {
  switch (port) {
  case PortNum::UNKNOWN_APP:
    return "UNKNOWN_APP";
  case PortNum::TEXT_MESSAGE_APP:
    return "TEXT_MESSAGE_APP";
  case PortNum::REMOTE_HARDWARE_APP:
    return "REMOTE_HARDWARE_APP";
  case PortNum::POSITION_APP:
    return "POSITION_APP";
  case PortNum::NODEINFO_APP:
    return "NODEINFO_APP";
  case PortNum::ROUTING_APP:
    return "ROUTING_APP";
  case PortNum::ADMIN_APP:
    return "ADMIN_APP";
  case PortNum::TELEMETRY_APP:
    return "TELEMETRY_APP";
  case PortNum::TRACEROUTE_APP:
    return "TRACEROUTE_APP";
  case PortNum::NEIGHBORINFO_APP:
    return "NEIGHBORINFO_APP";
  default:
    return "PORT_" + std::to_string(static_cast<uint32_t>(port));
  }
}

std::string FormatNodeId(NodeNum num) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "!%08x", num);
  return std::string(buf);
}

std::optional<NodeNum> ParseNodeId(const std::string& id) {
  std::string hex = id;
  if (!hex.empty() && hex[0] == '!') {
    hex = hex.substr(1);
  }
  if (hex.size() != 8) {
    return std::nullopt;
  }

  NodeNum value = 0;
  for (char c : hex) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    const int digit = std::isdigit(static_cast<unsigned char>(c))
                          ? c - '0'
                          : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    value = (value << 4) | static_cast<NodeNum>(digit);
  }
  return value;
}

}  // namespace protocol
}  // namespace meshprobe
