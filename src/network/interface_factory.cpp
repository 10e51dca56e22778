// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/interface_factory.hpp"

#include "network/serial_interface.hpp"
#ifdef MESHPROBE_WITH_BLE
#include "network/simpleble_link.hpp"
#endif
#include "network/tcp_interface.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace meshprobe {
namespace network {

std::optional<InterfaceType> ParseInterfaceType(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "auto")
    return InterfaceType::AUTO;
  if (lower == "serial")
    return InterfaceType::SERIAL;
  if (lower == "tcp")
    return InterfaceType::TCP;
  if (lower == "ble")
    return InterfaceType::BLE;
  return std::nullopt;
}

std::string InterfaceTypeAsString(InterfaceType type) {
  switch (type) {
  case InterfaceType::AUTO:
    return "auto";
  case InterfaceType::SERIAL:
    return "serial";
  case InterfaceType::TCP:
    return "tcp";
  case InterfaceType::BLE:
    return "ble";
  }
  return "unknown";
}

bool BleSupported() {
#ifdef MESHPROBE_WITH_BLE
  return true;
#else
  return false;
#endif
}

InterfaceType DetectInterfaceType(const std::string& address) {
  if (address.empty() || address.rfind("/dev/", 0) == 0) {
    return InterfaceType::SERIAL;
  }

  const std::string host = address.substr(0, address.find(':'));
  if (util::IsIPv4Literal(host)) {
    return InterfaceType::TCP;
  }
  if (util::IsMacAddress(address)) {
    return InterfaceType::BLE;
  }
  if (address.find(':') != std::string::npos) {
    return InterfaceType::TCP;
  }
  if (util::IsHostnameLike(address)) {
    return InterfaceType::TCP;
  }
  return InterfaceType::BLE;
}

std::vector<std::string> FindSerialPorts() {
  std::vector<std::string> ports;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/dev", ec)) {
    const std::string name = entry.path().filename().string();
    if (name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0) {
      ports.push_back(entry.path().string());
    }
  }
  if (ec) {
    LOG_NET_DEBUG("Cannot scan /dev for serial ports: {}", ec.message());
  }
  std::sort(ports.begin(), ports.end());
  return ports;
}

MeshInterfacePtr CreateInterface(InterfaceType type, const std::string& address) {
  if (type == InterfaceType::AUTO) {
    type = DetectInterfaceType(address);
    LOG_NET_DEBUG("Detected {} interface for address '{}'", InterfaceTypeAsString(type), address);
  }

  switch (type) {
  case InterfaceType::SERIAL: {
    std::string device = address;
    if (device.empty()) {
      auto ports = FindSerialPorts();
      if (ports.empty()) {
        throw UnsupportedInterfaceError("No serial radio found (looked for /dev/ttyUSB* and /dev/ttyACM*)");
      }
      if (ports.size() > 1) {
        LOG_NET_WARN("Multiple serial devices found, using {}", ports.front());
      }
      device = ports.front();
    }
    return std::make_unique<SerialInterface>(device);
  }
  case InterfaceType::TCP: {
    const std::string target = address.empty() ? std::string(protocol::DEFAULT_TCP_HOST) : address;
    if (!util::ParseHostPort(target, protocol::DEFAULT_TCP_PORT)) {
      throw UnsupportedInterfaceError("Invalid TCP address '" + target + "' (expected host[:port])");
    }
    return std::make_unique<TcpInterface>(target);
  }
  case InterfaceType::BLE:
#ifdef MESHPROBE_WITH_BLE
    return std::make_unique<BleInterface>(std::make_unique<SimpleBleLink>(address));
#else
    throw UnsupportedInterfaceError("Bluetooth LE interfaces are not supported by this build (address '" + address +
                                    "'); use --interface-type=serial or tcp");
#endif
  case InterfaceType::AUTO:
    break;
  }
  throw UnsupportedInterfaceError("Unknown interface type");
}

}  // namespace network
}  // namespace meshprobe
