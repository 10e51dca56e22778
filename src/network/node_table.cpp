// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/node_table.hpp"

namespace meshprobe {
namespace network {

NodeEntry& NodeTable::GetOrCreate(protocol::NodeNum num) {
  auto it = index_.find(num);
  if (it != index_.end()) {
    return entries_[it->second];
  }
  index_.emplace(num, entries_.size());
  NodeEntry entry;
  entry.num = num;
  entries_.push_back(std::move(entry));
  return entries_.back();
}

void NodeTable::Upsert(const meshtastic::NodeInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  NodeEntry& entry = GetOrCreate(info.num());

  if (info.has_user()) {
    const meshtastic::User& user = info.user();
    if (!user.id().empty())
      entry.user_id = user.id();
    if (!user.short_name().empty())
      entry.short_name = user.short_name();
    if (!user.long_name().empty())
      entry.long_name = user.long_name();
  }
  if (info.has_hops_away())
    entry.hops_away = info.hops_away();
  if (info.has_snr())
    entry.snr = info.snr();
  if (info.last_heard() != 0)
    entry.last_heard = info.last_heard();
}

void NodeTable::OnPacketHeard(protocol::NodeNum num, uint32_t rx_time, std::optional<float> rx_snr) {
  if (num == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  NodeEntry& entry = GetOrCreate(num);
  if (rx_time != 0)
    entry.last_heard = rx_time;
  if (rx_snr)
    entry.snr = rx_snr;
}

std::vector<NodeEntry> NodeTable::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

std::optional<std::string> NodeTable::LookupId(protocol::NodeNum num) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(num);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return entries_[it->second].user_id;
}

size_t NodeTable::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void NodeTable::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  index_.clear();
}

}  // namespace network
}  // namespace meshprobe
