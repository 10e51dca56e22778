// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "discovery/known_nodes.hpp"

#include "util/logging.hpp"

#include <algorithm>

namespace meshprobe {
namespace discovery {

std::vector<KnownNode> CollectKnownNodes(const std::vector<network::NodeEntry>& live_table,
                                         std::optional<protocol::NodeNum> local_node) {
  std::vector<KnownNode> nodes;
  for (const auto& entry : live_table) {
    if (local_node && entry.num == *local_node) {
      continue;
    }
    KnownNode node;
    node.id = entry.user_id.value_or(protocol::FormatNodeId(entry.num));
    node.name = entry.long_name.value_or("Unknown");
    node.num = entry.num;
    node.snr = entry.snr;
    node.last_heard = entry.last_heard;
    node.hops_away = entry.hops_away;
    nodes.push_back(std::move(node));
  }

  std::stable_sort(nodes.begin(), nodes.end(), [](const KnownNode& a, const KnownNode& b) {
    return a.last_heard.value_or(0) > b.last_heard.value_or(0);
  });
  return nodes;
}

KnownNodesResult FetchKnownNodes(const std::function<network::MeshInterfacePtr()>& factory) {
  KnownNodesResult result;

  network::MeshInterfacePtr iface;
  try {
    iface = factory();
  } catch (const std::exception& e) {
    result.error = std::string("Failed to connect: ") + e.what();
    LOG_ERROR("{}", *result.error);
    return result;
  }
  if (!iface) {
    result.error = "Failed to connect: no interface available";
    return result;
  }
  result.interface_description = iface->description();

  std::optional<std::string> connect_error;
  try {
    connect_error = iface->connect();
    if (!connect_error) {
      const auto table = iface->nodes();
      result.database_size = table.size();
      result.nodes = CollectKnownNodes(table, iface->local_node_num());
    }
  } catch (const std::exception& e) {
    result.error = std::string("Error reading node database: ") + e.what();
    LOG_ERROR("{}", *result.error);
  }
  if (connect_error) {
    result.error = "Failed to connect to " + result.interface_description + ": " + *connect_error;
    LOG_ERROR("{}", *result.error);
  }

  try {
    iface->close();
  } catch (const std::exception& e) {
    LOG_DEBUG("Error closing {}: {}", result.interface_description, e.what());
  }
  return result;
}

}  // namespace discovery
}  // namespace meshprobe
