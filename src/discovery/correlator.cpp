// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "discovery/correlator.hpp"

#include "discovery/relay_resolver.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace meshprobe {
namespace discovery {

std::optional<double> DeriveSnrTowardsDb(const std::vector<int32_t>& snr_towards) {
  if (snr_towards.size() <= 1) {
    return std::nullopt;
  }
  return static_cast<double>(snr_towards.back()) / protocol::SNR_SAMPLE_SCALE;
}

std::string ResolveDisplayName(const std::string& sender_id, const PeerRegistry& registry) {
  const PeerSummary* peer = registry.Find(sender_id);
  if (!peer) {
    return sender_id;
  }

  const bool has_short = peer->short_name && !peer->short_name->empty();
  const bool has_long = peer->long_name && !peer->long_name->empty();
  if (has_short && has_long) {
    return "[" + *peer->short_name + "] " + *peer->long_name;
  }
  if (has_long) {
    return *peer->long_name;
  }
  if (has_short) {
    return *peer->short_name;
  }
  return sender_id;
}

void ResponseCorrelator::Arm(PeerRegistry registry) {
  std::lock_guard<std::mutex> lock(mutex_);
  registry_ = std::move(registry);
  records_.clear();
  active_ = true;
}

void ResponseCorrelator::Disarm() {
  std::lock_guard<std::mutex> lock(mutex_);
  active_ = false;
}

void ResponseCorrelator::OnPacket(const network::ReceivedPacket& packet) {
  if (!active_) {
    return;
  }
  if (packet.portnum != protocol::PortNum::TRACEROUTE_APP) {
    LOG_DISC_TRACE("Ignoring {} packet during discovery", protocol::PortNumAsString(packet.portnum));
    return;
  }

  DiscoveryRecord record;
  RecordObserver observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Disarmed while this packet was in flight
    if (!active_) {
      return;
    }
    record = BuildRecord(packet);
    records_.push_back(record);
    observer = observer_;
  }

  LOG_DISC_DEBUG("Traceroute reply from {} (snr={}, rssi={}, relay candidates={})", record.sender_id,
                 record.snr ? std::to_string(*record.snr) : "?", record.rssi ? std::to_string(*record.rssi) : "?",
                 record.relay_candidates.size());

  if (observer) {
    observer(record);
  }
}

DiscoveryRecord ResponseCorrelator::BuildRecord(const network::ReceivedPacket& packet) const {
  DiscoveryRecord record;
  record.sender_id = packet.from_id ? *packet.from_id : protocol::FormatNodeId(packet.from.value_or(0));
  record.node_num = packet.from;
  record.snr = packet.rx_snr;
  record.rssi = packet.rx_rssi;
  record.relay_byte = packet.relay_node;
  record.received_at = util::GetTime();

  if (packet.route_discovery) {
    record.snr_towards_db = DeriveSnrTowardsDb(packet.route_discovery->snr_towards);
  }

  record.display_name = ResolveDisplayName(record.sender_id, registry_);

  if (record.relay_byte) {
    record.relay_candidates = FindRelayCandidates(*record.relay_byte, registry_);
  }
  return record;
}

std::vector<DiscoveryRecord> ResponseCorrelator::Records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

size_t ResponseCorrelator::RecordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void ResponseCorrelator::SetRecordObserver(RecordObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

}  // namespace discovery
}  // namespace meshprobe
