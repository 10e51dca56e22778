// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "discovery/peer_registry.hpp"

#include <cstdint>
#include <vector>

namespace meshprobe {
namespace discovery {

// Packets only carry the low byte of the last relaying node. Returns every
// direct neighbour (hops_away == 0) whose node number ends in that byte, in
// registry order. Several matches are all returned; none is preferred. The
// result is a set of candidates, not an identification.
std::vector<PeerSummary> FindRelayCandidates(uint8_t relay_byte, const PeerRegistry& registry);

}  // namespace discovery
}  // namespace meshprobe
