/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for EWSB.
 * Provides EWSB_LOG_DEBUG, EWSB_LOG_INFO, EWSB_LOG_WARN, EWSB_LOG_ERROR macros.
 */

#ifndef EWSB_LOG_HPP_
#define EWSB_LOG_HPP_

#include <atomic>
#include <iostream>
#include <string>

namespace ewsb {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3, kOff = 4 };

  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }

  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(threshold().load(std::memory_order_relaxed));
  }

  static void log(Level level, const std::string& msg) {
    if (level == Level::kOff || !enabled(level))
      return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::cerr << prefix[static_cast<int>(level)] << " [EWSB] " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }
};

// Message expressions are only evaluated when the level is enabled.
#define EWSB_LOG_AT(lvl, msg)                 \
  do {                                        \
    if (::ewsb::Logger::enabled(lvl)) {       \
      ::ewsb::Logger::log(lvl, msg);          \
    }                                         \
  } while (0)

#define EWSB_LOG_DEBUG(msg) EWSB_LOG_AT(::ewsb::Logger::Level::kDebug, msg)
#define EWSB_LOG_INFO(msg) EWSB_LOG_AT(::ewsb::Logger::Level::kInfo, msg)
#define EWSB_LOG_WARN(msg) EWSB_LOG_AT(::ewsb::Logger::Level::kWarn, msg)
#define EWSB_LOG_ERROR(msg) EWSB_LOG_AT(::ewsb::Logger::Level::kError, msg)

}  // namespace ewsb

#endif  // EWSB_LOG_HPP_
