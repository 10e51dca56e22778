// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/mesh_interface.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshprobe {
namespace network {

enum class InterfaceType {
  AUTO,
  SERIAL,
  TCP,
  BLE,
};

// "auto", "serial", "tcp", "ble" (case-insensitive). std::nullopt otherwise.
std::optional<InterfaceType> ParseInterfaceType(const std::string& name);
std::string InterfaceTypeAsString(InterfaceType type);

// False when built with MESHPROBE_WITH_BLE=OFF; CreateInterface then
// rejects BLE.
bool BleSupported();

/**
 * Guess the transport from the address syntax. Rules, first match wins:
 *   "/dev/..."                 -> SERIAL
 *   dotted IPv4 (with or without :port) -> TCP
 *   six hex pairs "AA:BB:..."  -> BLE (checked before the ':' rule)
 *   anything else with ':'     -> TCP (host:port, IPv6)
 *   letters/digits/'-'/'.'     -> TCP (hostname)
 *   otherwise                  -> BLE (device name)
 * An empty address selects SERIAL (first detected port).
 */
InterfaceType DetectInterfaceType(const std::string& address);

// Candidate serial devices (/dev/ttyUSB*, /dev/ttyACM*), sorted
std::vector<std::string> FindSerialPorts();

// Thrown by CreateInterface for a transport that cannot be built
class UnsupportedInterfaceError : public std::runtime_error {
public:
  explicit UnsupportedInterfaceError(const std::string& what) : std::runtime_error(what) {}
};

// Construct (but do not connect) an interface. AUTO is resolved with
// DetectInterfaceType. Never returns a null pointer.
MeshInterfacePtr CreateInterface(InterfaceType type, const std::string& address);

}  // namespace network
}  // namespace meshprobe
