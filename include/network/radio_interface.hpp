// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/message.hpp"
#include "network/mesh_interface.hpp"
#include "network/node_table.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace meshprobe {
namespace network {

/**
 * RadioInterface - MeshInterface half shared by every radio transport
 *
 * Transports move opaque FromRadio/ToRadio messages; this class owns what
 * the messages mean: the want_config_id handshake, the node table, local
 * node number, packet id allocation and delivery to the packet handler.
 *
 * A transport calls begin_config() and then wait_for_config() from
 * connect(), feeds every received FromRadio to handle_from_radio() and
 * reports a dead link with signal_link_lost().
 */
class RadioInterface : public MeshInterface {
public:
  RadioInterface(const RadioInterface&) = delete;
  RadioInterface& operator=(const RadioInterface&) = delete;

  std::optional<uint32_t> send_data(const OutboundPacket& packet) override;

  void set_packet_handler(PacketHandler handler) override;
  void clear_packet_handler() override;
  bool has_packet_handler() const override;

  std::vector<NodeEntry> nodes() const override { return node_table_.Snapshot(); }
  std::optional<protocol::NodeNum> local_node_num() const override;

protected:
  RadioInterface();

  // Queue one message for the radio. Returns false if it cannot be sent.
  virtual bool send_to_radio(const meshtastic::ToRadio& msg) = 0;

  // Forget the previous session and return a fresh config nonce
  uint32_t begin_config();

  // Block until the radio has sent config_complete_id for the nonce, the
  // link is lost, or CONFIG_TIMEOUT_SEC passes. Returns an error message
  // on failure.
  std::optional<std::string> wait_for_config();

  // Decode and dispatch one FromRadio message. Malformed input is dropped.
  void handle_from_radio(const uint8_t* data, size_t size);

  // Wake wait_for_config(); the link is gone
  void signal_link_lost();

  NodeTable node_table_;

private:
  void handle_mesh_packet(const meshtastic::MeshPacket& packet);
  uint32_t allocate_packet_id();

  // Guards rng_ and the handshake state
  std::mutex config_mutex_;
  std::condition_variable config_cv_;
  std::mt19937 rng_;
  uint32_t config_nonce_{0};
  bool config_complete_{false};
  bool link_lost_{false};

  mutable std::mutex local_mutex_;
  std::optional<protocol::NodeNum> local_node_num_;

  // Held for the whole delivery so clear_packet_handler() waits for it
  mutable std::mutex handler_mutex_;
  PacketHandler packet_handler_;

  std::atomic<uint32_t> next_packet_id_{0};
};

}  // namespace network
}  // namespace meshprobe
