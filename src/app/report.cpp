// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "app/report.hpp"

#include "util/time.hpp"

#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace meshprobe {
namespace app {

namespace {

std::string FormatSignal(const discovery::DiscoveryRecord& record) {
  return fmt::format("Signal: SNR={}dB, RSSI={}", *record.snr,
                     record.rssi ? fmt::format("{}dBm", *record.rssi) : std::string("Unknown"));
}

std::string CandidateName(const discovery::PeerSummary& peer) {
  if (peer.short_name && peer.long_name) {
    return fmt::format("{} ([{}] {})", peer.identifier, *peer.short_name, *peer.long_name);
  }
  if (peer.long_name) {
    return fmt::format("{} ({})", peer.identifier, *peer.long_name);
  }
  return peer.identifier;
}

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

}  // namespace

void PrintDiscoveryBanner(std::ostream& out, int duration_seconds) {
  out << "Meshtastic Nearby Node Discoverer\n"
      << std::string(40, '=') << "\n"
      << "Using 0-hop traceroute to broadcast address\n\n"
      << "Listening for responses for " << duration_seconds << " seconds..." << std::endl;
}

void PrintListening(std::ostream& out, uint32_t probe_id, std::chrono::seconds duration) {
  out << "   Probe sent, listening for " << duration.count() << " seconds\n"
      << "   Packet ID: " << probe_id << "\n\n"
      << "Listening for nearby node responses..." << std::endl;
}

void PrintDiscoveredNode(std::ostream& out, const discovery::DiscoveryRecord& record) {
  out << "Nearby node discovered: " << record.display_name;
  if (record.display_name != record.sender_id) {
    out << " (" << record.sender_id << ")";
  }
  out << "\n";
  if (record.snr) {
    out << "   " << FormatSignal(record) << "\n";
  }
  out.flush();
}

std::string FormatRelay(const discovery::DiscoveryRecord& record) {
  if (!record.relay_byte) {
    return "";
  }
  std::string text = fmt::format("0x{:02x}", *record.relay_byte);
  if (record.relay_candidates.empty()) {
    return text + " (unknown relay)";
  }
  text += record.relay_candidates.size() == 1 ? ", candidate: " : ", candidates: ";
  for (size_t i = 0; i < record.relay_candidates.size(); ++i) {
    if (i > 0)
      text += ", ";
    text += CandidateName(record.relay_candidates[i]);
  }
  return text;
}

void PrintDiscoveryResult(std::ostream& out, std::ostream& err, const discovery::DiscoveryResult& result) {
  if (result.final_state == discovery::SessionState::FAILED) {
    err << result.error.value_or("Failed to connect") << std::endl;
    out << "No nearby nodes found" << std::endl;
    return;
  }

  if (result.error) {
    err << result.error.value() << std::endl;
  }
  if (result.interrupted) {
    out << "\nDiscovery interrupted by user\n";
  }

  out << "\nDiscovery complete! Found " << result.records.size() << " nearby nodes:\n";
  if (result.records.empty()) {
    out << "  No nearby nodes detected or they didn't respond.\n";
  }

  int index = 1;
  for (const auto& record : result.records) {
    out << "  " << index++ << ". " << record.display_name;
    if (record.display_name != record.sender_id) {
      out << " (" << record.sender_id << ")";
    }
    out << "\n";
    if (record.snr) {
      out << "     " << FormatSignal(record) << "\n";
    }
    if (record.snr_towards_db) {
      out << "     " << fmt::format("SNR towards: {:.2f}dB", *record.snr_towards_db) << "\n";
    }
    if (record.relay_byte) {
      out << "     Relay: " << FormatRelay(record) << "\n";
    }
  }

  out << (result.records.empty() ? "No nearby nodes found" : "Discovery completed successfully") << std::endl;
}

json DiscoveryRecordsToJson(const std::vector<discovery::DiscoveryRecord>& records) {
  json array = json::array();
  for (const auto& record : records) {
    json candidates = json::array();
    for (const auto& peer : record.relay_candidates) {
      candidates.push_back({{"id", peer.identifier},
                            {"num", peer.num},
                            {"short_name", OptionalToJson(peer.short_name)},
                            {"long_name", OptionalToJson(peer.long_name)}});
    }

    array.push_back({{"id", record.sender_id},
                     {"num", OptionalToJson(record.node_num)},
                     {"name", record.display_name},
                     {"snr", OptionalToJson(record.snr)},
                     {"rssi", OptionalToJson(record.rssi)},
                     {"snr_towards_db", OptionalToJson(record.snr_towards_db)},
                     {"relay_byte", OptionalToJson(record.relay_byte)},
                     {"relay_candidates", candidates},
                     {"received_at", record.received_at}});
  }
  return array;
}

void PrintKnownNodes(std::ostream& out, std::ostream& err, const discovery::KnownNodesResult& result) {
  if (result.error) {
    err << *result.error << std::endl;
    return;
  }

  out << "Currently known nodes in database:\n";
  if (result.database_size == 0) {
    out << "  Node database is empty" << std::endl;
    return;
  }
  if (result.nodes.empty()) {
    out << "  No other nodes in database" << std::endl;
    return;
  }

  int index = 1;
  for (const auto& node : result.nodes) {
    const std::string snr = node.snr ? fmt::format("SNR: {}dB", *node.snr) : std::string("SNR: Unknown");
    const std::string heard = node.last_heard && *node.last_heard != 0
                                  ? util::FormatTime(static_cast<int64_t>(*node.last_heard))
                                  : std::string("Unknown");
    out << "  " << index++ << ". " << node.id << " (" << node.name << ")\n"
        << "     " << snr << ", Last heard: " << heard << "\n";
  }
  out.flush();
}

json KnownNodesToJson(const std::vector<discovery::KnownNode>& nodes) {
  json array = json::array();
  for (const auto& node : nodes) {
    array.push_back({{"id", node.id},
                     {"name", node.name},
                     {"num", node.num},
                     {"snr", OptionalToJson(node.snr)},
                     {"last_heard", OptionalToJson(node.last_heard)},
                     {"hops_away", OptionalToJson(node.hops_away)}});
  }
  return array;
}

}  // namespace app
}  // namespace meshprobe
