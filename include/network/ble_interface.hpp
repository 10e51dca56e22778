// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/radio_interface.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meshprobe {
namespace network {

// GattLink - the radio's GATT service as seen by BleInterface
//
// Implementations are not required to be thread-safe against close(); the
// interface serialises calls into the link.
class GattLink {
public:
  using NotifyCallback = std::function<void()>;
  using CancelCheck = std::function<bool()>;

  virtual ~GattLink() = default;

  // Find the peripheral, connect and subscribe to FromNum. on_from_num may
  // run on any thread. A slow scan gives up once cancelled() returns true.
  // Returns std::nullopt on success, error message on failure.
  virtual std::optional<std::string> open(NotifyCallback on_from_num, CancelCheck cancelled) = 0;

  // Idempotent
  virtual void close() = 0;

  // Write one encoded ToRadio. Returns false on a GATT error.
  virtual bool write_to_radio(const std::vector<uint8_t>& data) = 0;

  // Read one encoded FromRadio. An empty vector means nothing is queued;
  // std::nullopt means the read failed.
  virtual std::optional<std::vector<uint8_t>> read_from_radio() = 0;

  virtual std::string description() const = 0;
};

/**
 * BleInterface - MeshInterface over Bluetooth LE
 *
 * Messages are whole protobufs, one per characteristic access. A reader
 * thread drains FromRadio whenever FromNum notifies, after every write, and
 * every READ_POLL_INTERVAL in case a notification was missed. Packet handler
 * calls happen on that thread; a handler must not call close() or
 * clear_packet_handler() on the interface delivering to it.
 */
class BleInterface : public RadioInterface {
public:
  explicit BleInterface(std::unique_ptr<GattLink> link);
  ~BleInterface() override;

  std::optional<std::string> connect() override;
  void close() override;
  bool is_open() const override { return open_; }

  std::string description() const override { return link_->description(); }

protected:
  bool send_to_radio(const meshtastic::ToRadio& msg) override;

private:
  void reader_loop();
  void request_read();
  void stop_reader();

  std::unique_ptr<GattLink> link_;

  std::mutex close_mutex_;
  std::atomic<bool> open_{false};
  std::atomic<bool> cancel_requested_{false};

  // Serialises every call into link_ made after open()
  std::mutex link_mutex_;

  std::thread reader_thread_;
  std::mutex read_mutex_;
  std::condition_variable read_cv_;
  bool read_requested_{false};
  bool stopping_{false};

  static constexpr std::chrono::milliseconds READ_POLL_INTERVAL{500};
};

}  // namespace network
}  // namespace meshprobe
