// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "discovery/peer_registry.hpp"

#include "util/logging.hpp"

namespace meshprobe {
namespace discovery {

PeerRegistry PeerRegistry::BuildSnapshot(const std::vector<network::NodeEntry>& live_table,
                                         std::optional<protocol::NodeNum> local_node) {
  PeerRegistry registry;
  registry.entries_.reserve(live_table.size());

  for (const auto& node : live_table) {
    if (local_node && node.num == *local_node) {
      continue;
    }

    PeerSummary peer;
    peer.identifier = node.user_id.value_or(protocol::FormatNodeId(node.num));
    peer.short_name = node.short_name;
    peer.long_name = node.long_name;
    peer.num = node.num;
    peer.hops_away = node.hops_away;
    peer.snr = node.snr;
    peer.last_heard = node.last_heard;

    // First entry wins if two nodes claim the same user id
    if (!registry.by_identifier_.emplace(peer.identifier, registry.entries_.size()).second) {
      LOG_DISC_DEBUG("Duplicate node identifier {} in node table, keeping first", peer.identifier);
      continue;
    }
    registry.entries_.push_back(std::move(peer));
  }
  return registry;
}

const PeerSummary* PeerRegistry::Find(const std::string& identifier) const {
  auto it = by_identifier_.find(identifier);
  if (it == by_identifier_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

}  // namespace discovery
}  // namespace meshprobe
