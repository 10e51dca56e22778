// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace meshprobe {
namespace util {

/**
 * RateLimiter - per-callsite token buckets for the *_RL logging macros
 *
 * A radio shares its serial line with the firmware's debug console, so a
 * client reading the API stream sees runs of bytes that fail frame sync for
 * as long as the device keeps printing. Each callsite may burst up to
 * `burst` messages, then logs at burst/period_seconds per second. Messages
 * dropped in between are counted and handed back with the next one that
 * gets through, so the log still says how much was hidden.
 */
class RateLimiter {
public:
  // std::nullopt: drop this message. Otherwise the number of messages
  // dropped at this callsite since the previous one that was let through.
  // Non-positive limits disable limiting.
  std::optional<uint64_t> acquire(const std::string& callsite_key, int burst, int period_seconds);

  // Forget all callsites (tests)
  void reset();

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens;
    std::chrono::steady_clock::time_point refilled_at;
    uint64_t suppressed{0};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace meshprobe
