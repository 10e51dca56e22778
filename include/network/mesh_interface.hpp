// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/message.hpp"
#include "mesh/protocol.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace network {

// Application-layer message handed to a MeshInterface for transmission
struct OutboundPacket {
  protocol::NodeNum destination{protocol::BROADCAST_ADDR};
  protocol::PortNum portnum{protocol::PortNum::UNKNOWN_APP};
  std::vector<uint8_t> payload;
  bool want_response{false};
  bool want_ack{false};
  uint32_t hop_limit{3};
};

// Decoded TRACEROUTE_APP payload
struct RouteInfo {
  std::vector<protocol::NodeNum> route;
  std::vector<int32_t> snr_towards;  // Quarter-dB per hop towards the destination
  std::vector<protocol::NodeNum> route_back;
  std::vector<int32_t> snr_back;
};

// Inbound packet, decoded once at the transport boundary. Every field a
// radio may leave out is optional; consumers never probe raw bytes.
struct ReceivedPacket {
  protocol::PortNum portnum{protocol::PortNum::UNKNOWN_APP};
  std::optional<std::string> from_id;       // Textual id ("!xxxxxxxx" or user id) if known
  std::optional<protocol::NodeNum> from;
  std::optional<float> rx_snr;
  std::optional<int32_t> rx_rssi;
  std::optional<uint8_t> relay_node;        // Low byte of last relaying node
  std::optional<RouteInfo> route_discovery;
  uint32_t id{0};
  uint32_t request_id{0};
  uint32_t hop_start{0};
  uint32_t hop_limit{0};
};

// One row of the radio's live node table
struct NodeEntry {
  protocol::NodeNum num{0};
  std::optional<std::string> user_id;
  std::optional<std::string> short_name;
  std::optional<std::string> long_name;
  std::optional<uint32_t> hops_away;
  std::optional<float> snr;
  std::optional<uint32_t> last_heard;  // Unix seconds
};

// Build a ReceivedPacket from a wire MeshPacket. Missing or malformed
// fields are left empty. from_id is filled by the caller (it needs the
// node table).
ReceivedPacket DecodeReceivedPacket(const meshtastic::MeshPacket& packet);

// MeshInterface - connection to a local radio
//
// Implementations own their I/O thread. The packet handler is invoked on
// that thread; it is registered per session and must be cleared before the
// handler's owner goes away. clear_packet_handler() blocks until any
// in-flight delivery has returned.
class MeshInterface {
public:
  using PacketHandler = std::function<void(const ReceivedPacket&)>;

  virtual ~MeshInterface() = default;

  // Open the link and load the radio's node table.
  // Returns std::nullopt on success, error message on failure.
  virtual std::optional<std::string> connect() = 0;

  // Idempotent
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  // Queue a packet for transmission. Returns the assigned packet id, or
  // std::nullopt when the link is not open or the packet cannot be encoded.
  virtual std::optional<uint32_t> send_data(const OutboundPacket& packet) = 0;

  virtual void set_packet_handler(PacketHandler handler) = 0;
  virtual void clear_packet_handler() = 0;
  virtual bool has_packet_handler() const = 0;

  // Snapshot of the live node table, in the order nodes were first seen
  virtual std::vector<NodeEntry> nodes() const = 0;
  virtual std::optional<protocol::NodeNum> local_node_num() const = 0;

  // Human readable link description ("tcp 192.168.1.20:4403")
  virtual std::string description() const = 0;
};

using MeshInterfacePtr = std::unique_ptr<MeshInterface>;

}  // namespace network
}  // namespace meshprobe
