// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace meshprobe {
namespace protocol {

// Node numbers are 32-bit. Every node also has a textual id "!xxxxxxxx"
// (lowercase, zero padded hex of the node number).
using NodeNum = uint32_t;

// Destination for packets addressed to every node in range
constexpr NodeNum BROADCAST_ADDR = 0xFFFFFFFF;

// Application port numbers carried in Data.portnum
enum class PortNum : uint32_t {
  UNKNOWN_APP = 0,
  TEXT_MESSAGE_APP = 1,
  REMOTE_HARDWARE_APP = 2,
  POSITION_APP = 3,
  NODEINFO_APP = 4,
  ROUTING_APP = 5,
  ADMIN_APP = 6,
  TELEMETRY_APP = 67,
  TRACEROUTE_APP = 70,
  NEIGHBORINFO_APP = 71,
};

std::string PortNumAsString(PortNum port);

// ============================================================================
// STREAM FRAMING (serial and TCP)
// ============================================================================
// Each protobuf message on a byte stream is preceded by a 4 byte header:
// START1, START2, payload length (big endian, 16 bits).

namespace framing {
constexpr uint8_t START1 = 0x94;
constexpr uint8_t START2 = 0xC3;
constexpr size_t HEADER_SIZE = 4;
constexpr size_t MAX_PAYLOAD_SIZE = 512;
}  // namespace framing

// ============================================================================
// TRANSPORT DEFAULTS
// ============================================================================

constexpr uint16_t DEFAULT_TCP_PORT = 4403;
constexpr const char* DEFAULT_TCP_HOST = "meshtastic.local";
constexpr unsigned int SERIAL_BAUD_RATE = 115200;

// Timeouts (in seconds)
constexpr int CONNECT_TIMEOUT_SEC = 10;
constexpr int CONFIG_TIMEOUT_SEC = 10;

// Firmware reboots into serial API mode when it sees a run of START2 bytes
// before the first frame.
constexpr size_t SERIAL_WAKE_BYTES = 32;

// ============================================================================
// BLUETOOTH LE
// ============================================================================
// Radios expose one GATT service. The client writes ToRadio messages, reads
// FromRadio until the characteristic comes back empty, and is notified on
// FromNum whenever the radio queues more. No stream framing is used.

namespace ble {
constexpr const char* SERVICE_UUID = "6ba1b218-15a8-461f-9fa8-5dcae273eafd";
constexpr const char* TORADIO_UUID = "f75c76d2-129e-4dad-a1dd-7866124401e7";
constexpr const char* FROMRADIO_UUID = "2c55e69e-4993-11ed-b878-0242ac120002";
constexpr const char* FROMNUM_UUID = "ed9da18c-a800-4f66-a670-aa7547e34453";
constexpr int SCAN_TIMEOUT_SEC = 10;
constexpr size_t MAX_TORADIO_SIZE = 512;
}  // namespace ble

// ============================================================================
// DISCOVERY PROBE
// ============================================================================

// Hop limit of the nearby-node probe: receivers must not relay it, so only
// nodes in direct radio range answer.
constexpr uint32_t NEARBY_PROBE_HOP_LIMIT = 0;

// RouteDiscovery SNR samples are signed integers in quarter-dB units
constexpr double SNR_SAMPLE_SCALE = 4.0;

constexpr int DEFAULT_DISCOVERY_DURATION_SEC = 15;

// ============================================================================
// NODE IDS
// ============================================================================

// Format a node number as "!xxxxxxxx"
std::string FormatNodeId(NodeNum num);

// Parse "!xxxxxxxx" (or bare 8 hex digits). Returns std::nullopt if malformed.
std::optional<NodeNum> ParseNodeId(const std::string& id);

}  // namespace protocol
}  // namespace meshprobe
