// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

/*
 ResponseCorrelator - turns traceroute replies into discovery records

 Purpose
 - Consume packets delivered by the MeshInterface while a discovery window is open
 - Keep only TRACEROUTE_APP replies and extract signal metrics and route data
 - Enrich each reply with the display name and relay candidates from the PeerRegistry

 Threading
 - OnPacket() runs on the interface's I/O thread; Arm()/Disarm()/Records()
   run on the session thread. Records are guarded by a mutex and the active
   flag is checked under it, so a reply that races Disarm() is either
   recorded before the final read or dropped.
*/

#include "discovery/peer_registry.hpp"
#include "network/mesh_interface.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace discovery {

// One reply heard during a discovery window. Never modified once recorded.
struct DiscoveryRecord {
  std::string sender_id;
  std::optional<protocol::NodeNum> node_num;
  std::optional<float> snr;       // dB, as measured by our radio
  std::optional<int32_t> rssi;    // dBm
  std::optional<double> snr_towards_db;
  std::optional<uint8_t> relay_byte;
  int64_t received_at{0};         // Unix seconds
  std::string display_name;

  // Direct neighbours that could have relayed the reply. Presented as
  // candidates only.
  std::vector<PeerSummary> relay_candidates;
};

// Last quarter-dB sample of a RouteDiscovery snr_towards list, in dB. The
// first sample is a placeholder from the originating hop, so a list of one
// or fewer samples yields std::nullopt.
std::optional<double> DeriveSnrTowardsDb(const std::vector<int32_t>& snr_towards);

// "[short] long" when both names are known, else whichever is known, else
// the raw identifier.
std::string ResolveDisplayName(const std::string& sender_id, const PeerRegistry& registry);

class ResponseCorrelator {
public:
  using RecordObserver = std::function<void(const DiscoveryRecord&)>;

  ResponseCorrelator() = default;

  ResponseCorrelator(const ResponseCorrelator&) = delete;
  ResponseCorrelator& operator=(const ResponseCorrelator&) = delete;

  // Open a window: install the registry, drop previous records, start accepting
  void Arm(PeerRegistry registry);

  // Close the window. Records are kept until the next Arm().
  void Disarm();

  bool IsActive() const { return active_.load(); }

  // MeshInterface packet handler
  void OnPacket(const network::ReceivedPacket& packet);

  // Records in arrival order
  std::vector<DiscoveryRecord> Records() const;
  size_t RecordCount() const;

  // Called on the delivering thread after each record is stored
  void SetRecordObserver(RecordObserver observer);

private:
  DiscoveryRecord BuildRecord(const network::ReceivedPacket& packet) const;  // requires mutex_

  std::atomic<bool> active_{false};

  mutable std::mutex mutex_;
  PeerRegistry registry_;
  std::vector<DiscoveryRecord> records_;
  RecordObserver observer_;
};

}  // namespace discovery
}  // namespace meshprobe
