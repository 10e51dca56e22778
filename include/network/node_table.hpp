// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/message.hpp"
#include "network/mesh_interface.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace network {

// NodeTable - the radio's node database as seen by this client
//
// Filled from NodeInfo records during the config handshake and refreshed by
// received packets. Snapshots preserve first-seen order. Thread-safe.
class NodeTable {
public:
  NodeTable() = default;

  void Upsert(const meshtastic::NodeInfo& info);

  // Record that a packet from `num` was heard
  void OnPacketHeard(protocol::NodeNum num, uint32_t rx_time, std::optional<float> rx_snr);

  std::vector<NodeEntry> Snapshot() const;

  // Textual user id of a node if the radio reported one
  std::optional<std::string> LookupId(protocol::NodeNum num) const;

  size_t Size() const;
  void Clear();

private:
  NodeEntry& GetOrCreate(protocol::NodeNum num);  // requires mutex_

  mutable std::mutex mutex_;
  std::vector<NodeEntry> entries_;
  std::map<protocol::NodeNum, size_t> index_;
};

}  // namespace network
}  // namespace meshprobe
