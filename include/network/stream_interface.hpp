// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "mesh/stream_framer.hpp"
#include "network/radio_interface.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <asio.hpp>

namespace meshprobe {

namespace network {

/**
 * StreamInterface - MeshInterface over a framed byte stream (serial or TCP)
 *
 * Owns an io_context and the thread that runs it. After the derived class has
 * opened the stream, connect() starts the read loop and performs the config
 * handshake: a ToRadio{want_config_id=nonce} is sent and the radio replies
 * with my_info, one node_info per known node and config_complete_id=nonce.
 * Every message on the stream is wrapped in a 0x94 0xC3 length frame.
 *
 * All reads, writes and packet handler calls happen on the io thread. A
 * handler must not call close() or clear_packet_handler() on the interface
 * that is delivering to it.
 *
 * Derived classes must call close() from their own destructor, since the
 * stream hooks are virtual.
 */
class StreamInterface : public RadioInterface {
public:
  ~StreamInterface() override;

  StreamInterface(const StreamInterface&) = delete;
  StreamInterface& operator=(const StreamInterface&) = delete;

  std::optional<std::string> connect() override;
  void close() override;
  bool is_open() const override { return open_; }

protected:
  using IoHandler = std::function<void(const asio::error_code&, size_t)>;

  StreamInterface();

  // Open the underlying stream. Runs on the caller's thread before the io
  // thread exists, so it may drive io_context_ itself (run_for/restart).
  // A slow open should poll connect_cancelled() and give up once it is set.
  // Returns std::nullopt on success, error message on failure.
  virtual std::optional<std::string> open_stream() = 0;

  // close() was called while connect() is opening the stream
  bool connect_cancelled() const { return cancel_requested_; }

  virtual void async_read_some(asio::mutable_buffer buffer, IoHandler handler) = 0;
  virtual void async_write(const std::shared_ptr<std::vector<uint8_t>>& data, IoHandler handler) = 0;

  // Must be idempotent
  virtual void close_stream() = 0;

  // Raw bytes sent before the first frame
  virtual std::vector<uint8_t> handshake_preamble() const { return {}; }

  bool send_to_radio(const meshtastic::ToRadio& msg) override;

  asio::io_context io_context_;

private:
  // io thread only
  void start_read();
  void queue_write(std::shared_ptr<std::vector<uint8_t>> data);
  void do_write();
  void finish_close();
  void on_link_lost(const asio::error_code& ec);

  void stop_io_thread();

  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread io_thread_;
  std::mutex close_mutex_;

  std::atomic<bool> open_{false};
  std::atomic<bool> cancel_requested_{false};

  // Read side (io thread)
  std::array<uint8_t, 1024> read_buffer_{};
  message::FrameReader frame_reader_;

  // Write side (io thread)
  std::deque<std::shared_ptr<std::vector<uint8_t>>> write_queue_;
  bool writing_{false};
  bool closing_{false};
  std::unique_ptr<asio::steady_timer> drain_timer_;

  // Outstanding writes get this long to drain on close
  static constexpr std::chrono::milliseconds CLOSE_DRAIN_TIMEOUT{1000};
};

}  // namespace network
}  // namespace meshprobe
