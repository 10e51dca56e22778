// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/stream_interface.hpp"

#include <string>

namespace meshprobe {
namespace network {

// SerialInterface - radio attached over USB serial, 115200 8N1
class SerialInterface : public StreamInterface {
public:
  explicit SerialInterface(std::string device_path);
  ~SerialInterface() override;

  std::string description() const override { return "serial " + device_path_; }

protected:
  std::optional<std::string> open_stream() override;
  void async_read_some(asio::mutable_buffer buffer, IoHandler handler) override;
  void async_write(const std::shared_ptr<std::vector<uint8_t>>& data, IoHandler handler) override;
  void close_stream() override;

  // A run of START2 bytes wakes the firmware's protobuf API on a console port
  std::vector<uint8_t> handshake_preamble() const override;

private:
  std::string device_path_;
  asio::serial_port port_;
};

}  // namespace network
}  // namespace meshprobe
