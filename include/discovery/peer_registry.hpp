// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/protocol.hpp"
#include "network/mesh_interface.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace discovery {

// Known peer, as cached at the start of a discovery session
struct PeerSummary {
  std::string identifier;  // User id, or "!xxxxxxxx" derived from num
  std::optional<std::string> short_name;
  std::optional<std::string> long_name;
  protocol::NodeNum num{0};
  std::optional<uint32_t> hops_away;  // 0 = direct radio neighbour
  std::optional<float> snr;
  std::optional<uint32_t> last_heard;
};

/**
 * PeerRegistry - immutable snapshot of known peers, keyed by identifier
 *
 * Built once per session from the radio's node table. Iteration follows the
 * node table order. The local node is never present.
 */
class PeerRegistry {
public:
  PeerRegistry() = default;

  static PeerRegistry BuildSnapshot(const std::vector<network::NodeEntry>& live_table,
                                    std::optional<protocol::NodeNum> local_node);

  const PeerSummary* Find(const std::string& identifier) const;

  const std::vector<PeerSummary>& entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

private:
  std::vector<PeerSummary> entries_;
  std::map<std::string, size_t> by_identifier_;
};

}  // namespace discovery
}  // namespace meshprobe
