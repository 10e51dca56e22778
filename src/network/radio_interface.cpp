// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/radio_interface.hpp"

#include "util/logging.hpp"

#include <chrono>

namespace meshprobe {
namespace network {

namespace {

template <typename T>
std::string OptionalToString(const std::optional<T>& value) {
  return value ? fmt::format("{}", *value) : std::string("?");
}

uint32_t DrawNonZero(std::mt19937& rng) {
  std::uniform_int_distribution<uint32_t> dist(1, 0xFFFFFFFF);
  return dist(rng);
}

}  // namespace

RadioInterface::RadioInterface() : rng_(std::random_device{}()) {
  next_packet_id_ = DrawNonZero(rng_);
}

uint32_t RadioInterface::begin_config() {
  node_table_.Clear();
  {
    std::lock_guard<std::mutex> lock(local_mutex_);
    local_node_num_.reset();
  }
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_complete_ = false;
  link_lost_ = false;
  config_nonce_ = DrawNonZero(rng_);
  return config_nonce_;
}

std::optional<std::string> RadioInterface::wait_for_config() {
  std::unique_lock<std::mutex> lock(config_mutex_);
  config_cv_.wait_for(lock, std::chrono::seconds(protocol::CONFIG_TIMEOUT_SEC),
                      [this]() { return config_complete_ || link_lost_; });
  if (config_complete_) {
    return std::nullopt;
  }
  return std::string(link_lost_ ? "Connection lost during radio configuration"
                                : "Timed out waiting for radio configuration");
}

void RadioInterface::signal_link_lost() {
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    link_lost_ = true;
  }
  config_cv_.notify_all();
}

uint32_t RadioInterface::allocate_packet_id() {
  uint32_t id = next_packet_id_.fetch_add(1);
  if (id == 0) {
    id = next_packet_id_.fetch_add(1);
  }
  return id;
}

std::optional<uint32_t> RadioInterface::send_data(const OutboundPacket& packet) {
  if (!is_open()) {
    return std::nullopt;
  }

  const uint32_t id = allocate_packet_id();
  auto msg = message::MakeDataPacket(packet.destination, packet.portnum, packet.payload, packet.want_response,
                                     packet.want_ack, packet.hop_limit, id);
  if (!send_to_radio(msg)) {
    return std::nullopt;
  }

  LOG_NET_DEBUG("Sent {} packet id={} to {} hop_limit={} want_response={}", protocol::PortNumAsString(packet.portnum),
                id, protocol::FormatNodeId(packet.destination), packet.hop_limit, packet.want_response);
  return id;
}

void RadioInterface::set_packet_handler(PacketHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  packet_handler_ = std::move(handler);
}

void RadioInterface::clear_packet_handler() {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  packet_handler_ = nullptr;
}

bool RadioInterface::has_packet_handler() const {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  return static_cast<bool>(packet_handler_);
}

std::optional<protocol::NodeNum> RadioInterface::local_node_num() const {
  std::lock_guard<std::mutex> lock(local_mutex_);
  return local_node_num_;
}

void RadioInterface::handle_from_radio(const uint8_t* data, size_t size) {
  meshtastic::FromRadio msg;
  if (!message::Decode(data, size, msg)) {
    LOG_NET_WARN_RL("Dropping malformed FromRadio frame ({} bytes)", size);
    return;
  }

  switch (msg.payload_variant_case()) {
  case meshtastic::FromRadio::kMyInfo: {
    std::lock_guard<std::mutex> lock(local_mutex_);
    local_node_num_ = msg.my_info().my_node_num();
    break;
  }
  case meshtastic::FromRadio::kNodeInfo:
    LOG_NET_TRACE("Node database entry {}", protocol::FormatNodeId(msg.node_info().num()));
    node_table_.Upsert(msg.node_info());
    break;
  case meshtastic::FromRadio::kRebooted:
    LOG_NET_WARN("Radio {} reported a reboot", description());
    break;
  case meshtastic::FromRadio::kConfigCompleteId: {
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (msg.config_complete_id() == config_nonce_) {
      config_complete_ = true;
      config_cv_.notify_all();
    } else {
      LOG_NET_DEBUG("Ignoring config_complete_id={} (expected {})", msg.config_complete_id(), config_nonce_);
    }
    break;
  }
  case meshtastic::FromRadio::kPacket:
    handle_mesh_packet(msg.packet());
    break;
  case meshtastic::FromRadio::PAYLOAD_VARIANT_NOT_SET:
    break;
  }
}

void RadioInterface::handle_mesh_packet(const meshtastic::MeshPacket& packet) {
  std::optional<float> rx_snr;
  if (packet.has_rx_snr()) {
    rx_snr = packet.rx_snr();
  }
  node_table_.OnPacketHeard(packet.from(), packet.rx_time(), rx_snr);

  ReceivedPacket rx = DecodeReceivedPacket(packet);
  if (rx.from) {
    rx.from_id = node_table_.LookupId(*rx.from).value_or(protocol::FormatNodeId(*rx.from));
  }

  LOG_NET_DEBUG("Received {} from {} id={} snr={} rssi={} hop_start={} hop_limit={} relay={}",
                protocol::PortNumAsString(rx.portnum), rx.from_id.value_or("?"), rx.id, OptionalToString(rx.rx_snr),
                OptionalToString(rx.rx_rssi), rx.hop_start, rx.hop_limit,
                rx.relay_node ? fmt::format("0x{:02x}", *rx.relay_node) : std::string("?"));

  std::lock_guard<std::mutex> lock(handler_mutex_);
  if (!packet_handler_) {
    return;
  }
  try {
    packet_handler_(rx);
  } catch (const std::exception& e) {
    LOG_NET_ERROR_RL("Packet handler failed on packet id={}: {}", rx.id, e.what());
  }
}

}  // namespace network
}  // namespace meshprobe
