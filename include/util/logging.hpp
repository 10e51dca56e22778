// Copyright (c) 2025 The meshprobe developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace meshprobe {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "discovery"), all sharing
 * the same console sink on stderr, plus a file sink with --log-file. The CLI
 * logs warnings and errors only unless --debug is given; user-facing output
 * is written directly to stdout.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex, since transports log from their io threads.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "meshprobe.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component (e.g., "network", "discovery").
  // Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace meshprobe

// Convenience macros for logging
#define LOG_TRACE(...) meshprobe::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) meshprobe::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) meshprobe::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) meshprobe::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) meshprobe::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) meshprobe::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) meshprobe::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) meshprobe::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) meshprobe::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) meshprobe::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...) meshprobe::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...) meshprobe::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...) meshprobe::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...) meshprobe::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...) meshprobe::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// 200 messages per hour per callsite. For paths driven by bytes off the radio
// link. The first message let through after a quiet spell is followed by a
// count of what was dropped.

#include "util/rate_limiter.hpp"

#define MESHPROBE_CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define MESHPROBE_LOG_RL_(component, level, ...)                                                                       \
  do {                                                                                                                 \
    if (auto suppressed_ = meshprobe::util::RateLimiter::instance().acquire(MESHPROBE_CALLSITE_KEY_, 200, 3600)) {     \
      auto logger_ = meshprobe::util::LogManager::GetLogger(component);                                                \
      logger_->level(__VA_ARGS__);                                                                                     \
      if (*suppressed_ > 0) {                                                                                          \
        logger_->level("({} similar messages suppressed)", *suppressed_);                                              \
      }                                                                                                                \
    }                                                                                                                  \
  } while (0)

#define LOG_NET_WARN_RL(...) MESHPROBE_LOG_RL_("network", warn, __VA_ARGS__)
#define LOG_NET_ERROR_RL(...) MESHPROBE_LOG_RL_("network", error, __VA_ARGS__)
