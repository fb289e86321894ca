/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for quicgate.
 * Provides QUICGATE_LOG_DEBUG, QUICGATE_LOG_INFO, QUICGATE_LOG_WARN,
 * QUICGATE_LOG_ERROR macros taking a logger name and a message.
 */

#ifndef QUICGATE_LOG_HPP_
#define QUICGATE_LOG_HPP_

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace quicgate {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_level(Level level) { min_level().store(level, std::memory_order_relaxed); }

  static Level level() { return min_level().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(min_level().load(std::memory_order_relaxed));
  }

  // Format: "<asctime> <LEVEL> <name> <message>"
  static void log(Level level, std::string_view name, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    static const char* const kNames[] = {"DEBUG", "INFO", "WARNING", "ERROR"};

    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    char stamp[32];
    size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);
    std::snprintf(stamp + n, sizeof(stamp) - n, ",%03d", static_cast<int>(millis));

    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << stamp << " " << kNames[static_cast<int>(level)] << " " << name << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& min_level() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

#define QUICGATE_LOG_DEBUG(name, msg)                                  \
  do {                                                                 \
    if (::quicgate::Logger::enabled(::quicgate::Logger::Level::kDebug)) \
      ::quicgate::Logger::log(::quicgate::Logger::Level::kDebug, name, msg); \
  } while (0)
#define QUICGATE_LOG_INFO(name, msg) ::quicgate::Logger::log(::quicgate::Logger::Level::kInfo, name, msg)
#define QUICGATE_LOG_WARN(name, msg) ::quicgate::Logger::log(::quicgate::Logger::Level::kWarn, name, msg)
#define QUICGATE_LOG_ERROR(name, msg) ::quicgate::Logger::log(::quicgate::Logger::Level::kError, name, msg)

}  // namespace quicgate

#endif  // QUICGATE_LOG_HPP_
