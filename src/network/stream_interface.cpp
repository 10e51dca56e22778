// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/stream_interface.hpp"

#include "util/logging.hpp"

namespace meshprobe {
namespace network {

StreamInterface::StreamInterface() = default;

StreamInterface::~StreamInterface() {
  // Derived destructor already ran close(); this only catches misuse
  if (io_thread_.joinable()) {
    io_context_.stop();
    io_thread_.join();
  }
}

std::optional<std::string> StreamInterface::connect() {
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (open_ || io_thread_.joinable()) {
      return "Interface already connected: " + description();
    }

    cancel_requested_ = false;
    auto error = open_stream();
    if (cancel_requested_) {
      if (!error) {
        close_stream();
      }
      error = "Connection attempt cancelled";
    }
    if (error) {
      LOG_NET_DEBUG("Failed to open {}: {}", description(), *error);
      return error;
    }

    const uint32_t nonce = begin_config();
    frame_reader_.reset();
    write_queue_.clear();
    writing_ = false;
    closing_ = false;
    drain_timer_.reset();

    io_context_.restart();
    work_guard_.emplace(asio::make_work_guard(io_context_));
    open_ = true;

    io_thread_ = std::thread([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        LOG_NET_ERROR("Radio I/O thread terminated: {}", e.what());
        open_ = false;
      }
    });

    asio::post(io_context_, [this]() { start_read(); });

    auto preamble = handshake_preamble();
    if (!preamble.empty()) {
      auto data = std::make_shared<std::vector<uint8_t>>(std::move(preamble));
      asio::post(io_context_, [this, data]() { queue_write(data); });
    }

    send_to_radio(message::MakeWantConfig(nonce));
    LOG_NET_DEBUG("Requested radio configuration from {} (nonce={})", description(), nonce);
  }

  auto failure = wait_for_config();
  if (!failure) {
    LOG_NET_INFO("Connected to {} (local node {}, {} nodes in database)", description(),
                 local_node_num() ? protocol::FormatNodeId(*local_node_num()) : std::string("unknown"),
                 node_table_.Size());
    return std::nullopt;
  }

  close();
  return *failure + " (" + description() + ")";
}

void StreamInterface::close() {
  // A connect() still in open_stream() holds close_mutex_ until it sees this
  cancel_requested_ = true;

  std::lock_guard<std::mutex> lock(close_mutex_);
  const bool was_open = open_.exchange(false);

  if (io_thread_.joinable()) {
    if (was_open) {
      // Tell the radio we are going away; best effort
      send_to_radio(message::MakeDisconnect());
    }
    asio::post(io_context_, [this]() { finish_close(); });
    stop_io_thread();
    LOG_NET_DEBUG("Closed {}", description());
  } else if (was_open) {
    close_stream();
  }

  // Wake a connect() still waiting for the handshake
  signal_link_lost();
}

void StreamInterface::stop_io_thread() {
  work_guard_.reset();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

bool StreamInterface::send_to_radio(const meshtastic::ToRadio& msg) {
  auto frame = message::EncodeFrame(message::Encode(msg));
  if (frame.empty()) {
    LOG_NET_WARN("ToRadio message exceeds {} byte frame limit, not sent", protocol::framing::MAX_PAYLOAD_SIZE);
    return false;
  }
  auto data = std::make_shared<std::vector<uint8_t>>(std::move(frame));
  asio::post(io_context_, [this, data]() { queue_write(data); });
  return true;
}

// ============================================================================
// io thread
// ============================================================================

void StreamInterface::start_read() {
  async_read_some(asio::buffer(read_buffer_), [this](const asio::error_code& ec, size_t bytes_transferred) {
    if (ec) {
      on_link_lost(ec);
      return;
    }

    auto payloads = frame_reader_.feed(read_buffer_.data(), bytes_transferred);
    for (const auto& payload : payloads) {
      handle_from_radio(payload.data(), payload.size());
    }
    start_read();
  });
}

void StreamInterface::on_link_lost(const asio::error_code& ec) {
  if (!closing_ && ec != asio::error::operation_aborted) {
    LOG_NET_WARN("Lost connection to {}: {}", description(), ec.message());
  }
  open_ = false;
  signal_link_lost();
}

void StreamInterface::queue_write(std::shared_ptr<std::vector<uint8_t>> data) {
  write_queue_.push_back(std::move(data));
  if (!writing_) {
    do_write();
  }
}

void StreamInterface::do_write() {
  if (write_queue_.empty()) {
    writing_ = false;
    if (closing_) {
      if (drain_timer_)
        drain_timer_->cancel();
      close_stream();
    }
    return;
  }

  writing_ = true;
  auto data = write_queue_.front();
  async_write(data, [this, data](const asio::error_code& ec, size_t /*bytes_transferred*/) {
    if (ec) {
      write_queue_.clear();
      writing_ = false;
      on_link_lost(ec);
      if (closing_)
        close_stream();
      return;
    }
    write_queue_.pop_front();
    do_write();
  });
}

void StreamInterface::finish_close() {
  closing_ = true;
  if (!writing_) {
    close_stream();
    return;
  }

  // Give pending writes (the disconnect notice) a moment, then force it
  drain_timer_ = std::make_unique<asio::steady_timer>(io_context_, CLOSE_DRAIN_TIMEOUT);
  drain_timer_->async_wait([this](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    LOG_NET_DEBUG("Write drain timed out on {}", description());
    close_stream();
  });
}

}  // namespace network
}  // namespace meshprobe
