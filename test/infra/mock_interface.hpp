// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license
// Scripted in-memory MeshInterface for discovery tests

#pragma once

#include "network/mesh_interface.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace meshprobe {
namespace test {

// Script and observations shared between a test and the MockMeshInterface it
// hands to a DiscoverySession. Outlives the interface, so cleanup can be
// checked after the session has destroyed it.
struct MockRadio {
  // === Script ===
  std::optional<std::string> connect_error;
  bool throw_on_connect{false};
  bool throw_on_nodes{false};
  bool fail_send{false};
  bool throw_on_send{false};
  // connect() blocks this long unless close() has been called
  std::chrono::milliseconds connect_delay{0};
  std::vector<network::NodeEntry> nodes;
  std::optional<protocol::NodeNum> local_node_num;

  // Delivered on a background thread after the probe is sent
  std::vector<network::ReceivedPacket> replies;
  std::chrono::milliseconds reply_delay{0};

  // === Observations ===
  std::atomic<int> connect_calls{0};
  std::atomic<bool> connecting{false};
  std::atomic<int> close_calls{0};
  std::atomic<int> clear_handler_calls{0};
  std::atomic<bool> open{false};
  std::atomic<bool> handler_armed_at_send{false};
  std::atomic<int> delivered{0};

  std::vector<network::OutboundPacket> Sent() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sent;
  }

  bool HasHandler() const {
    std::lock_guard<std::mutex> lock(handler_mutex);
    return static_cast<bool>(handler);
  }

  // Push a packet through the registered handler, as the I/O thread would.
  // Returns false if no handler is registered.
  bool Deliver(const network::ReceivedPacket& packet) {
    std::lock_guard<std::mutex> lock(handler_mutex);
    if (!handler) {
      return false;
    }
    handler(packet);
    ++delivered;
    return true;
  }

  mutable std::mutex mutex;
  std::vector<network::OutboundPacket> sent;

  std::mutex connect_mutex;
  std::condition_variable connect_cv;
  bool connect_cancelled{false};

  mutable std::mutex handler_mutex;
  network::MeshInterface::PacketHandler handler;
};

class MockMeshInterface : public network::MeshInterface {
public:
  explicit MockMeshInterface(std::shared_ptr<MockRadio> radio) : radio_(std::move(radio)) {}

  ~MockMeshInterface() override { join_replies(); }

  std::optional<std::string> connect() override {
    ++radio_->connect_calls;
    if (radio_->throw_on_connect) {
      throw std::runtime_error("device unplugged");
    }
    if (radio_->connect_delay.count() > 0) {
      std::unique_lock<std::mutex> lock(radio_->connect_mutex);
      radio_->connecting = true;
      const bool cancelled = radio_->connect_cv.wait_for(lock, radio_->connect_delay,
                                                         [this]() { return radio_->connect_cancelled; });
      radio_->connecting = false;
      if (cancelled) {
        return std::string("Connection attempt cancelled");
      }
    }
    if (radio_->connect_error) {
      return radio_->connect_error;
    }
    radio_->open = true;
    return std::nullopt;
  }

  void close() override {
    ++radio_->close_calls;
    {
      std::lock_guard<std::mutex> lock(radio_->connect_mutex);
      radio_->connect_cancelled = true;
    }
    radio_->connect_cv.notify_all();
    join_replies();
    radio_->open = false;
  }

  bool is_open() const override { return radio_->open; }

  std::optional<uint32_t> send_data(const network::OutboundPacket& packet) override {
    if (radio_->throw_on_send) {
      throw std::runtime_error("write failed");
    }
    if (!radio_->open || radio_->fail_send) {
      return std::nullopt;
    }

    size_t count = 0;
    {
      std::lock_guard<std::mutex> lock(radio_->mutex);
      radio_->sent.push_back(packet);
      count = radio_->sent.size();
    }
    radio_->handler_armed_at_send = radio_->HasHandler();

    if (!radio_->replies.empty()) {
      auto radio = radio_;
      reply_thread_ = std::thread([radio]() {
        std::this_thread::sleep_for(radio->reply_delay);
        for (const auto& reply : radio->replies) {
          radio->Deliver(reply);
        }
      });
    }
    return static_cast<uint32_t>(0x1000 + count);
  }

  void set_packet_handler(PacketHandler handler) override {
    std::lock_guard<std::mutex> lock(radio_->handler_mutex);
    radio_->handler = std::move(handler);
  }

  void clear_packet_handler() override {
    ++radio_->clear_handler_calls;
    std::lock_guard<std::mutex> lock(radio_->handler_mutex);
    radio_->handler = nullptr;
  }

  bool has_packet_handler() const override { return radio_->HasHandler(); }

  std::vector<network::NodeEntry> nodes() const override {
    if (radio_->throw_on_nodes) {
      throw std::runtime_error("node table unavailable");
    }
    return radio_->nodes;
  }

  std::optional<protocol::NodeNum> local_node_num() const override { return radio_->local_node_num; }

  std::string description() const override { return "mock radio"; }

private:
  void join_replies() {
    if (reply_thread_.joinable()) {
      reply_thread_.join();
    }
  }

  std::shared_ptr<MockRadio> radio_;
  std::thread reply_thread_;
};

// Factory for DiscoverySession / FetchKnownNodes
inline std::function<network::MeshInterfacePtr()> MockFactory(const std::shared_ptr<MockRadio>& radio) {
  return [radio]() -> network::MeshInterfacePtr { return std::make_unique<MockMeshInterface>(radio); };
}

inline network::NodeEntry MakeNode(protocol::NodeNum num, std::optional<std::string> user_id = std::nullopt,
                                   std::optional<std::string> short_name = std::nullopt,
                                   std::optional<std::string> long_name = std::nullopt,
                                   std::optional<uint32_t> hops_away = std::nullopt) {
  network::NodeEntry entry;
  entry.num = num;
  entry.user_id = std::move(user_id);
  entry.short_name = std::move(short_name);
  entry.long_name = std::move(long_name);
  entry.hops_away = hops_away;
  return entry;
}

inline network::ReceivedPacket MakeTracerouteReply(protocol::NodeNum from, std::optional<float> snr = std::nullopt,
                                                   std::optional<int32_t> rssi = std::nullopt,
                                                   std::optional<uint8_t> relay = std::nullopt,
                                                   std::vector<int32_t> snr_towards = {}) {
  network::ReceivedPacket packet;
  packet.portnum = protocol::PortNum::TRACEROUTE_APP;
  packet.from = from;
  packet.from_id = protocol::FormatNodeId(from);
  packet.rx_snr = snr;
  packet.rx_rssi = rssi;
  packet.relay_node = relay;
  network::RouteInfo route;
  route.snr_towards = std::move(snr_towards);
  packet.route_discovery = std::move(route);
  return packet;
}

}  // namespace test
}  // namespace meshprobe
