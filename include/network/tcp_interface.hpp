// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/stream_interface.hpp"

#include <string>

namespace meshprobe {
namespace network {

// TcpInterface - radio reachable over its TCP API (WiFi/Ethernet nodes)
// Address format: host[:port], [ipv6][:port]. Default port 4403.
class TcpInterface : public StreamInterface {
public:
  explicit TcpInterface(std::string address);
  ~TcpInterface() override;

  std::string description() const override;

protected:
  std::optional<std::string> open_stream() override;
  void async_read_some(asio::mutable_buffer buffer, IoHandler handler) override;
  void async_write(const std::shared_ptr<std::vector<uint8_t>>& data, IoHandler handler) override;
  void close_stream() override;

private:
  std::string address_;
  std::string host_;
  uint16_t port_{0};
  asio::ip::tcp::socket socket_;

  static constexpr std::chrono::milliseconds CONNECT_POLL_INTERVAL{100};
};

}  // namespace network
}  // namespace meshprobe
