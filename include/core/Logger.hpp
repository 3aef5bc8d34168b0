/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - quiet mode flag
#include <cstdint> // IWYU pragma: keep - uint8_t
#include <cstdio> // IWYU pragma: keep - printf()/fflush()
#include <mutex> // IWYU pragma: keep - serialized output
#include <string> // IWYU pragma: keep - std::string messages in macros

namespace GridRoute {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  // Benchmark mode silences every level. The CLI maps --quiet onto it and
  // the test modules enable it through a global fixture.
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    // stderr keeps stdout clean for the CLI's JSON response
    std::lock_guard<std::mutex> lock(s_logMutex);
    fprintf(stderr, "GridRoute - [%s] %s: %s\n", system, getLevelString(level),
            message);
    fflush(stderr);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

#define GRIDROUTE_CRITICAL(system, msg)                                        \
  GridRoute::Logger::Log(GridRoute::LogLevel::CRITICAL, system, msg)
#define GRIDROUTE_ERROR(system, msg)                                           \
  GridRoute::Logger::Log(GridRoute::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
// Debug builds - full functionality
#define GRIDROUTE_WARN(system, msg)                                            \
  GridRoute::Logger::Log(GridRoute::LogLevel::WARNING, system, msg)
#define GRIDROUTE_INFO(system, msg)                                            \
  GridRoute::Logger::Log(GridRoute::LogLevel::INFO, system, msg)
#define GRIDROUTE_DEBUG(system, msg)                                           \
  GridRoute::Logger::Log(GridRoute::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define GRIDROUTE_WARN(system, msg) ((void)0)  // Zero overhead
#define GRIDROUTE_INFO(system, msg) ((void)0)  // Zero overhead
#define GRIDROUTE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each subsystem

#define PATHFIND_CRITICAL(msg) GRIDROUTE_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) GRIDROUTE_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) GRIDROUTE_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) GRIDROUTE_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) GRIDROUTE_DEBUG("Pathfinding", msg)

#define CACHE_CRITICAL(msg) GRIDROUTE_CRITICAL("PathCache", msg)
#define CACHE_ERROR(msg) GRIDROUTE_ERROR("PathCache", msg)
#define CACHE_WARN(msg) GRIDROUTE_WARN("PathCache", msg)
#define CACHE_INFO(msg) GRIDROUTE_INFO("PathCache", msg)
#define CACHE_DEBUG(msg) GRIDROUTE_DEBUG("PathCache", msg)

#define PLANNER_CRITICAL(msg) GRIDROUTE_CRITICAL("RoutePlanner", msg)
#define PLANNER_ERROR(msg) GRIDROUTE_ERROR("RoutePlanner", msg)
#define PLANNER_WARN(msg) GRIDROUTE_WARN("RoutePlanner", msg)
#define PLANNER_INFO(msg) GRIDROUTE_INFO("RoutePlanner", msg)
#define PLANNER_DEBUG(msg) GRIDROUTE_DEBUG("RoutePlanner", msg)

#define ENGINE_CRITICAL(msg) GRIDROUTE_CRITICAL("RouteEngine", msg)
#define ENGINE_ERROR(msg) GRIDROUTE_ERROR("RouteEngine", msg)
#define ENGINE_WARN(msg) GRIDROUTE_WARN("RouteEngine", msg)
#define ENGINE_INFO(msg) GRIDROUTE_INFO("RouteEngine", msg)
#define ENGINE_DEBUG(msg) GRIDROUTE_DEBUG("RouteEngine", msg)

#define SETTINGS_CRITICAL(msg) GRIDROUTE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) GRIDROUTE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) GRIDROUTE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) GRIDROUTE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) GRIDROUTE_DEBUG("SettingsManager", msg)

#define CODEC_CRITICAL(msg) GRIDROUTE_CRITICAL("RequestCodec", msg)
#define CODEC_ERROR(msg) GRIDROUTE_ERROR("RequestCodec", msg)
#define CODEC_WARN(msg) GRIDROUTE_WARN("RequestCodec", msg)
#define CODEC_INFO(msg) GRIDROUTE_INFO("RequestCodec", msg)
#define CODEC_DEBUG(msg) GRIDROUTE_DEBUG("RequestCodec", msg)

// Benchmark mode convenience macros
#define GRIDROUTE_ENABLE_BENCHMARK_MODE()                                      \
  GridRoute::Logger::SetBenchmarkMode(true)
#define GRIDROUTE_DISABLE_BENCHMARK_MODE()                                     \
  GridRoute::Logger::SetBenchmarkMode(false)

} // namespace GridRoute

#endif // LOGGER_HPP
