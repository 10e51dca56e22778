// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "discovery/relay_resolver.hpp"

namespace meshprobe {
namespace discovery {

std::vector<PeerSummary> FindRelayCandidates(uint8_t relay_byte, const PeerRegistry& registry) {
  std::vector<PeerSummary> candidates;
  for (const auto& peer : registry.entries()) {
    if (!peer.hops_away || *peer.hops_away != 0) {
      continue;
    }
    if ((peer.num & 0xFF) == relay_byte) {
      candidates.push_back(peer);
    }
  }
  return candidates;
}

}  // namespace discovery
}  // namespace meshprobe
