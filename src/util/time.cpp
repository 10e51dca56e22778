// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace meshprobe {
namespace util {

namespace {

// 0 means mock time is disabled
std::atomic<int64_t> g_mock_time{0};

// While mock time is active, steady time is anchored at the real steady clock
// reading taken when mocking began, offset by how far mock time has moved.
std::mutex g_steady_mutex;
std::chrono::steady_clock::time_point g_steady_anchor;
int64_t g_mock_anchor{0};
bool g_anchor_set{false};

}  // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_anchor_set) {
    g_steady_anchor = std::chrono::steady_clock::now();
    g_mock_anchor = mock;
    g_anchor_set = true;
  }
  return g_steady_anchor + std::chrono::seconds(mock - g_mock_anchor);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_anchor_set = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2) << static_cast<unsigned>(ymd.day()) << ' '
      << std::setw(2) << hms.hours().count() << ':' << std::setw(2) << hms.minutes().count() << ':'
      << std::setw(2) << hms.seconds().count() << " UTC";
  return oss.str();
}

}  // namespace util
}  // namespace meshprobe
