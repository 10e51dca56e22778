// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "network/ble_interface.hpp"

#include "util/logging.hpp"

namespace meshprobe {
namespace network {

BleInterface::BleInterface(std::unique_ptr<GattLink> link) : link_(std::move(link)) {}

BleInterface::~BleInterface() {
  close();
}

std::optional<std::string> BleInterface::connect() {
  {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (open_ || reader_thread_.joinable()) {
      return "Interface already connected: " + description();
    }

    cancel_requested_ = false;
    auto error = link_->open([this]() { request_read(); }, [this]() { return cancel_requested_.load(); });
    if (!error && cancel_requested_) {
      link_->close();
      error = "Connection attempt cancelled";
    }
    if (error) {
      LOG_NET_DEBUG("Failed to open {}: {}", description(), *error);
      return error;
    }

    const uint32_t nonce = begin_config();
    {
      std::lock_guard<std::mutex> read_lock(read_mutex_);
      read_requested_ = false;
      stopping_ = false;
    }
    open_ = true;
    reader_thread_ = std::thread([this]() { reader_loop(); });

    if (!send_to_radio(message::MakeWantConfig(nonce))) {
      signal_link_lost();
    } else {
      LOG_NET_DEBUG("Requested radio configuration from {} (nonce={})", description(), nonce);
    }
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

void BleInterface::close() {
  // A connect() still scanning holds close_mutex_ until it sees this
  cancel_requested_ = true;

  std::lock_guard<std::mutex> lock(close_mutex_);
  const bool was_open = open_.exchange(false);

  if (reader_thread_.joinable()) {
    if (was_open) {
      // Tell the radio we are going away; best effort
      send_to_radio(message::MakeDisconnect());
    }
    stop_reader();
  }

  {
    std::lock_guard<std::mutex> link_lock(link_mutex_);
    link_->close();
  }
  if (was_open) {
    LOG_NET_DEBUG("Closed {}", description());
  }

  // Wake a connect() still waiting for the handshake
  signal_link_lost();
}

void BleInterface::stop_reader() {
  {
    std::lock_guard<std::mutex> lock(read_mutex_);
    stopping_ = true;
  }
  read_cv_.notify_all();
  reader_thread_.join();
}

bool BleInterface::send_to_radio(const meshtastic::ToRadio& msg) {
  auto data = message::Encode(msg);
  if (data.empty() || data.size() > protocol::ble::MAX_TORADIO_SIZE) {
    LOG_NET_WARN("ToRadio message of {} bytes cannot be written to {}", data.size(), description());
    return false;
  }

  bool written = false;
  {
    std::lock_guard<std::mutex> lock(link_mutex_);
    written = link_->write_to_radio(data);
  }
  if (!written) {
    LOG_NET_WARN("Write to {} failed", description());
    return false;
  }

  // The radio usually has an answer queued right away
  request_read();
  return true;
}

void BleInterface::request_read() {
  {
    std::lock_guard<std::mutex> lock(read_mutex_);
    read_requested_ = true;
  }
  read_cv_.notify_all();
}

void BleInterface::reader_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(read_mutex_);
      read_cv_.wait_for(lock, READ_POLL_INTERVAL, [this]() { return read_requested_ || stopping_; });
      if (stopping_) {
        return;
      }
      read_requested_ = false;
    }

    // Drain everything the radio has queued
    while (true) {
      std::optional<std::vector<uint8_t>> data;
      {
        std::lock_guard<std::mutex> lock(link_mutex_);
        data = link_->read_from_radio();
      }
      if (!data) {
        if (open_.exchange(false)) {
          LOG_NET_WARN("Lost connection to {}", description());
        }
        signal_link_lost();
        return;
      }
      if (data->empty()) {
        break;
      }
      handle_from_radio(data->data(), data->size());

      std::lock_guard<std::mutex> lock(read_mutex_);
      if (stopping_) {
        return;
      }
    }
  }
}

}  // namespace network
}  // namespace meshprobe
