// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/tcp_interface.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

namespace meshprobe {
namespace network {

namespace {

// Shared between open_stream() and the async handlers, which may outlive
// the call if the connect attempt times out.
struct ConnectState {
  explicit ConnectState(asio::io_context& io) : resolver(io) {}
  asio::ip::tcp::resolver resolver;
  bool done{false};
  asio::error_code result;
};

}  // namespace

TcpInterface::TcpInterface(std::string address) : address_(std::move(address)), socket_(io_context_) {
  if (auto parsed = util::ParseHostPort(address_, protocol::DEFAULT_TCP_PORT)) {
    host_ = parsed->host;
    port_ = parsed->port;
  }
}

TcpInterface::~TcpInterface() {
  close();
}

std::string TcpInterface::description() const {
  if (host_.empty()) {
    return "tcp " + address_;
  }
  if (host_.find(':') != std::string::npos) {
    return "tcp [" + host_ + "]:" + std::to_string(port_);
  }
  return "tcp " + host_ + ":" + std::to_string(port_);
}

std::optional<std::string> TcpInterface::open_stream() {
  if (host_.empty()) {
    return "Invalid TCP address '" + address_ + "' (expected host[:port])";
  }

  auto state = std::make_shared<ConnectState>(io_context_);

  state->resolver.async_resolve(
      host_, std::to_string(port_),
      [this, state](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
        if (state->done)
          return;
        if (ec) {
          state->done = true;
          state->result = ec;
          return;
        }
        asio::async_connect(socket_, results, [state](const asio::error_code& connect_ec, const asio::ip::tcp::endpoint&) {
          if (state->done)
            return;
          state->done = true;
          state->result = connect_ec;
        });
      });

  // Run in short slices so close() from another thread can cut this short
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(protocol::CONNECT_TIMEOUT_SEC);
  io_context_.restart();
  while (!state->done && !connect_cancelled() && std::chrono::steady_clock::now() < deadline) {
    io_context_.run_for(CONNECT_POLL_INTERVAL);
    if (io_context_.stopped()) {
      io_context_.restart();
    }
  }

  if (!state->done) {
    state->done = true;
    state->resolver.cancel();
    asio::error_code ignored;
    socket_.close(ignored);
    // Let the aborted handlers run before the io thread takes over
    io_context_.restart();
    io_context_.poll();
    io_context_.restart();
    if (connect_cancelled()) {
      return std::string("Connection attempt cancelled");
    }
    return "Connection to " + host_ + ":" + std::to_string(port_) + " timed out after " +
           std::to_string(protocol::CONNECT_TIMEOUT_SEC) + " seconds";
  }
  io_context_.restart();

  if (state->result) {
    asio::error_code ignored;
    socket_.close(ignored);
    return "Cannot connect to " + host_ + ":" + std::to_string(port_) + ": " + state->result.message();
  }

  asio::error_code opt_ec;
  socket_.set_option(asio::ip::tcp::no_delay(true), opt_ec);
  if (opt_ec) {
    LOG_NET_TRACE("Failed to set TCP_NODELAY on {}: {}", description(), opt_ec.message());
  }
  return std::nullopt;
}

void TcpInterface::async_read_some(asio::mutable_buffer buffer, IoHandler handler) {
  socket_.async_read_some(buffer, std::move(handler));
}

void TcpInterface::async_write(const std::shared_ptr<std::vector<uint8_t>>& data, IoHandler handler) {
  asio::async_write(socket_, asio::buffer(*data), std::move(handler));
}

void TcpInterface::close_stream() {
  if (!socket_.is_open()) {
    return;
  }
  asio::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

}  // namespace network
}  // namespace meshprobe
