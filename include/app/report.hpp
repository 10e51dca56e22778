// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "discovery/correlator.hpp"
#include "discovery/discovery_session.hpp"
#include "discovery/known_nodes.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace meshprobe {
namespace app {

// === Discovery ===

void PrintDiscoveryBanner(std::ostream& out, int duration_seconds);
void PrintListening(std::ostream& out, uint32_t probe_id, std::chrono::seconds duration);

// Live line printed as each reply arrives
void PrintDiscoveredNode(std::ostream& out, const discovery::DiscoveryRecord& record);

// Final summary. Errors go to `err`.
void PrintDiscoveryResult(std::ostream& out, std::ostream& err, const discovery::DiscoveryResult& result);

// "0x0d, candidates: !1234560d ([AB] Alpha)", or "0x0d (unknown relay)"
std::string FormatRelay(const discovery::DiscoveryRecord& record);

nlohmann::json DiscoveryRecordsToJson(const std::vector<discovery::DiscoveryRecord>& records);

// === Known nodes ===

void PrintKnownNodes(std::ostream& out, std::ostream& err, const discovery::KnownNodesResult& result);

nlohmann::json KnownNodesToJson(const std::vector<discovery::KnownNode>& nodes);

}  // namespace app
}  // namespace meshprobe
