// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/mesh_interface.hpp"

#include "util/logging.hpp"

namespace meshprobe {
namespace network {

ReceivedPacket DecodeReceivedPacket(const meshtastic::MeshPacket& packet) {
  ReceivedPacket rx;
  rx.id = packet.id();
  rx.hop_start = packet.hop_start();
  rx.hop_limit = packet.hop_limit();
  if (packet.has_rx_snr()) {
    rx.rx_snr = packet.rx_snr();
  }
  if (packet.has_rx_rssi()) {
    rx.rx_rssi = packet.rx_rssi();
  }

  // from == 0 means the field was not on the wire
  if (packet.from() != 0) {
    rx.from = packet.from();
  }
  if (packet.has_relay_node()) {
    rx.relay_node = static_cast<uint8_t>(packet.relay_node() & 0xFF);
  }

  if (!packet.has_decoded()) {
    // Encrypted for a channel we cannot read, nothing more to extract
    return rx;
  }

  const meshtastic::Data& data = packet.decoded();
  rx.portnum = message::ToPortNum(data.portnum());
  rx.request_id = data.request_id();

  if (rx.portnum == protocol::PortNum::TRACEROUTE_APP) {
    meshtastic::RouteDiscovery route;
    if (route.ParseFromString(data.payload())) {
      RouteInfo info;
      info.route.assign(route.route().begin(), route.route().end());
      info.snr_towards.assign(route.snr_towards().begin(), route.snr_towards().end());
      info.route_back.assign(route.route_back().begin(), route.route_back().end());
      info.snr_back.assign(route.snr_back().begin(), route.snr_back().end());
      rx.route_discovery = std::move(info);
    } else {
      LOG_NET_DEBUG("Malformed RouteDiscovery payload in packet id={} ({} bytes)", packet.id(), data.payload().size());
    }
  }
  return rx;
}

}  // namespace network
}  // namespace meshprobe
