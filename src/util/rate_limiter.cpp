// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>
#include <utility>

namespace meshprobe {
namespace util {

std::optional<uint64_t> RateLimiter::acquire(const std::string& callsite_key, int burst, int period_seconds) {
  if (burst <= 0 || period_seconds <= 0) {
    return 0;
  }

  const auto now = GetSteadyTime();
  const double capacity = burst;

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(callsite_key, Bucket{capacity, now, 0});
  Bucket& bucket = it->second;

  if (!inserted) {
    // Whole seconds only, so mock time steps refill predictably
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.refilled_at);
    if (elapsed.count() > 0) {
      bucket.tokens = std::min(capacity, bucket.tokens + elapsed.count() * capacity / period_seconds);
      bucket.refilled_at += elapsed;
    }
  }

  if (bucket.tokens < 1.0) {
    ++bucket.suppressed;
    return std::nullopt;
  }
  bucket.tokens -= 1.0;
  return std::exchange(bucket.suppressed, 0);
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace meshprobe
