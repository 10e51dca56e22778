// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace meshprobe {
namespace util {

// Current unix time in seconds (mock time if set).
int64_t GetTime();

// Monotonic time point. Advances with mock time while mock time is active.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time (0 disables mocking).
void SetMockTime(int64_t time);

int64_t GetMockTime();

// Format a unix timestamp as "YYYY-MM-DD HH:MM:SS UTC".
std::string FormatTime(int64_t unix_time);

// RAII helper for tests: sets mock time and restores the previous value on scope exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace meshprobe
