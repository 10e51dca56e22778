// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/protocol.hpp"
#include "network/mesh_interface.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meshprobe {
namespace discovery {

struct KnownNode {
  std::string id;
  std::string name;  // Long name, "Unknown" if the radio has none
  protocol::NodeNum num{0};
  std::optional<float> snr;
  std::optional<uint32_t> last_heard;
  std::optional<uint32_t> hops_away;
};

// Other nodes in the radio's database, most recently heard first. Nodes
// never heard sort last; ties keep node table order.
std::vector<KnownNode> CollectKnownNodes(const std::vector<network::NodeEntry>& live_table,
                                         std::optional<protocol::NodeNum> local_node);

struct KnownNodesResult {
  std::optional<std::string> error;
  size_t database_size{0};  // Including the local node
  std::vector<KnownNode> nodes;
  std::string interface_description;
};

// Connect, read the node database, close. Errors are reported in the result.
KnownNodesResult FetchKnownNodes(const std::function<network::MeshInterfacePtr()>& factory);

}  // namespace discovery
}  // namespace meshprobe
