// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/serial_interface.hpp"

#include "util/logging.hpp"

namespace meshprobe {
namespace network {

SerialInterface::SerialInterface(std::string device_path)
    : device_path_(std::move(device_path)), port_(io_context_) {}

SerialInterface::~SerialInterface() {
  close();
}

std::optional<std::string> SerialInterface::open_stream() {
  if (device_path_.empty()) {
    return std::string("No serial device specified");
  }

  asio::error_code ec;
  port_.open(device_path_, ec);
  if (ec) {
    return "Cannot open serial device " + device_path_ + ": " + ec.message();
  }

  using asio::serial_port_base;
  port_.set_option(serial_port_base::baud_rate(protocol::SERIAL_BAUD_RATE), ec);
  if (!ec)
    port_.set_option(serial_port_base::character_size(8), ec);
  if (!ec)
    port_.set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
  if (!ec)
    port_.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
  if (!ec)
    port_.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
  if (ec) {
    asio::error_code ignored;
    port_.close(ignored);
    return "Cannot configure serial device " + device_path_ + ": " + ec.message();
  }

  LOG_NET_DEBUG("Opened {} at {} baud", device_path_, protocol::SERIAL_BAUD_RATE);
  return std::nullopt;
}

void SerialInterface::async_read_some(asio::mutable_buffer buffer, IoHandler handler) {
  port_.async_read_some(buffer, std::move(handler));
}

void SerialInterface::async_write(const std::shared_ptr<std::vector<uint8_t>>& data, IoHandler handler) {
  asio::async_write(port_, asio::buffer(*data), std::move(handler));
}

void SerialInterface::close_stream() {
  if (!port_.is_open()) {
    return;
  }
  asio::error_code ec;
  port_.cancel(ec);
  port_.close(ec);
}

std::vector<uint8_t> SerialInterface::handshake_preamble() const {
  return std::vector<uint8_t>(protocol::SERIAL_WAKE_BYTES, protocol::framing::START2);
}

}  // namespace network
}  // namespace meshprobe
