// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace meshprobe {
namespace message {

// Wrap a protobuf payload in the 4-byte stream header.
// Payloads larger than framing::MAX_PAYLOAD_SIZE are rejected (empty result).
std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t>& payload);

/**
 * FrameReader - incremental decoder for the radio's byte-stream framing
 *
 * Bytes may arrive split at any point. Anything that is not a valid frame
 * (firmware debug console text on a shared serial line, a header announcing
 * an oversized payload) is dropped one byte at a time until the next START1
 * START2 pair, so a single corrupt frame never desynchronises the stream.
 *
 * Not thread-safe; owned by the reading side of one connection.
 */
class FrameReader {
public:
  FrameReader() = default;

  // Append bytes and return every payload completed by them, in order.
  std::vector<std::vector<uint8_t>> feed(const uint8_t* data, size_t size);
  std::vector<std::vector<uint8_t>> feed(const std::vector<uint8_t>& data) { return feed(data.data(), data.size()); }

  // Bytes buffered towards an incomplete frame
  size_t buffered() const { return buffer_.size(); }

  // Bytes discarded while searching for frame starts (diagnostics)
  uint64_t dropped_bytes() const { return dropped_bytes_; }

  void reset();

private:
  std::vector<uint8_t> buffer_;
  uint64_t dropped_bytes_{0};
};

}  // namespace message
}  // namespace meshprobe
