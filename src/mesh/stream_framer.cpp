// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "mesh/stream_framer.hpp"

#include "mesh/protocol.hpp"

namespace meshprobe {
namespace message {

using namespace protocol::framing;

std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t>& payload) {
  if (payload.size() > MAX_PAYLOAD_SIZE) {
    return {};
  }
  std::vector<uint8_t> frame;
  frame.reserve(HEADER_SIZE + payload.size());
  frame.push_back(START1);
  frame.push_back(START2);
  frame.push_back(static_cast<uint8_t>((payload.size() >> 8) & 0xff));
  frame.push_back(static_cast<uint8_t>(payload.size() & 0xff));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::vector<std::vector<uint8_t>> FrameReader::feed(const uint8_t* data, size_t size) {
  std::vector<std::vector<uint8_t>> frames;
  buffer_.insert(buffer_.end(), data, data + size);

  size_t pos = 0;
  while (pos < buffer_.size()) {
    const size_t avail = buffer_.size() - pos;

    if (buffer_[pos] != START1) {
      ++pos;
      ++dropped_bytes_;
      continue;
    }
    if (avail < 2) {
      break;
    }
    if (buffer_[pos + 1] != START2) {
      ++pos;
      ++dropped_bytes_;
      continue;
    }
    if (avail < HEADER_SIZE) {
      break;
    }

    const size_t len = (static_cast<size_t>(buffer_[pos + 2]) << 8) | buffer_[pos + 3];
    if (len > MAX_PAYLOAD_SIZE) {
      // Not a real header; resync from the next byte
      ++pos;
      ++dropped_bytes_;
      continue;
    }
    if (avail < HEADER_SIZE + len) {
      break;
    }

    const auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(pos + HEADER_SIZE);
    frames.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(len));
    pos += HEADER_SIZE + len;
  }

  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos));
  return frames;
}

void FrameReader::reset() {
  buffer_.clear();
}

}  // namespace message
}  // namespace meshprobe
