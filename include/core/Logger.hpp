/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Tessera {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (world startup failures, lost heartbeats)
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
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

    // Heartbeat and worker threads log concurrently
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Tessera World - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
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

#define TESSERA_CRITICAL(system, msg)                                          \
  Tessera::Logger::Log(Tessera::LogLevel::CRITICAL, system, msg)
#define TESSERA_ERROR(system, msg)                                             \
  Tessera::Logger::Log(Tessera::LogLevel::ERROR_LEVEL, system, msg)
#define TESSERA_WARN(system, msg)                                              \
  Tessera::Logger::Log(Tessera::LogLevel::WARNING, system, msg)
#define TESSERA_INFO(system, msg)                                              \
  Tessera::Logger::Log(Tessera::LogLevel::INFO, system, msg)
#define TESSERA_DEBUG(system, msg)                                             \
  Tessera::Logger::Log(Tessera::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TESSERA_CRITICAL(system, msg)                                          \
  Tessera::Logger::Log("CRITICAL", system, msg)

#define TESSERA_ERROR(system, msg) Tessera::Logger::Log("ERROR", system, msg)

#define TESSERA_WARN(system, msg) ((void)0)  // Zero overhead
#define TESSERA_INFO(system, msg) ((void)0)  // Zero overhead
#define TESSERA_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// World systems
#define WORLD_MANAGER_CRITICAL(msg) TESSERA_CRITICAL("WorldManager", msg)
#define WORLD_MANAGER_ERROR(msg) TESSERA_ERROR("WorldManager", msg)
#define WORLD_MANAGER_WARN(msg) TESSERA_WARN("WorldManager", msg)
#define WORLD_MANAGER_INFO(msg) TESSERA_INFO("WorldManager", msg)
#define WORLD_MANAGER_DEBUG(msg) TESSERA_DEBUG("WorldManager", msg)

#define REGISTRY_CRITICAL(msg) TESSERA_CRITICAL("PartitionRegistry", msg)
#define REGISTRY_ERROR(msg) TESSERA_ERROR("PartitionRegistry", msg)
#define REGISTRY_WARN(msg) TESSERA_WARN("PartitionRegistry", msg)
#define REGISTRY_INFO(msg) TESSERA_INFO("PartitionRegistry", msg)
#define REGISTRY_DEBUG(msg) TESSERA_DEBUG("PartitionRegistry", msg)

#define MAP_CRITICAL(msg) TESSERA_CRITICAL("Map", msg)
#define MAP_ERROR(msg) TESSERA_ERROR("Map", msg)
#define MAP_WARN(msg) TESSERA_WARN("Map", msg)
#define MAP_INFO(msg) TESSERA_INFO("Map", msg)
#define MAP_DEBUG(msg) TESSERA_DEBUG("Map", msg)

// Core systems
#define HEARTBEAT_CRITICAL(msg) TESSERA_CRITICAL("Heartbeat", msg)
#define HEARTBEAT_ERROR(msg) TESSERA_ERROR("Heartbeat", msg)
#define HEARTBEAT_WARN(msg) TESSERA_WARN("Heartbeat", msg)
#define HEARTBEAT_INFO(msg) TESSERA_INFO("Heartbeat", msg)
#define HEARTBEAT_DEBUG(msg) TESSERA_DEBUG("Heartbeat", msg)

#define SETTINGS_CRITICAL(msg) TESSERA_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) TESSERA_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) TESSERA_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) TESSERA_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) TESSERA_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define TESSERA_ENABLE_BENCHMARK_MODE() Tessera::Logger::SetBenchmarkMode(true)
#define TESSERA_DISABLE_BENCHMARK_MODE()                                       \
  Tessera::Logger::SetBenchmarkMode(false)

} // namespace Tessera

#endif // LOGGER_HPP
