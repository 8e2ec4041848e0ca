/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// - string: Used in macro expansions for std::string() conversions
// - cstdio: printf() and fflush()
// - atomic: std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Wayfinder {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  // Quiet mode silences all output; tests driving thousands of frames use it
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Wayfinder - [%s] %s: %s\n", system, getLevelString(level),
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

inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

} // namespace Wayfinder

#define WAYFINDER_CRITICAL(system, msg)                                        \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::CRITICAL, system, msg)
#define WAYFINDER_ERROR(system, msg)                                           \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define WAYFINDER_WARN(system, msg)                                            \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::WARNING, system, msg)
#define WAYFINDER_INFO(system, msg)                                            \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::INFO, system, msg)
#define WAYFINDER_DEBUG(system, msg)                                           \
  Wayfinder::Logger::Log(Wayfinder::LogLevel::DEBUG_LEVEL, system, msg)
#else
// Release builds - zero overhead for the chatty levels
#define WAYFINDER_WARN(system, msg) ((void)0)
#define WAYFINDER_INFO(system, msg) ((void)0)
#define WAYFINDER_DEBUG(system, msg) ((void)0)
#endif

// Per-subsystem convenience macros

#define ANIMATOR_CRITICAL(msg) WAYFINDER_CRITICAL("PathAnimator", msg)
#define ANIMATOR_ERROR(msg) WAYFINDER_ERROR("PathAnimator", msg)
#define ANIMATOR_WARN(msg) WAYFINDER_WARN("PathAnimator", msg)
#define ANIMATOR_INFO(msg) WAYFINDER_INFO("PathAnimator", msg)
#define ANIMATOR_DEBUG(msg) WAYFINDER_DEBUG("PathAnimator", msg)

#define GAIT_ERROR(msg) WAYFINDER_ERROR("GaitSynthesizer", msg)
#define GAIT_WARN(msg) WAYFINDER_WARN("GaitSynthesizer", msg)
#define GAIT_INFO(msg) WAYFINDER_INFO("GaitSynthesizer", msg)

#define FOLLOWCAM_ERROR(msg) WAYFINDER_ERROR("CameraFollow", msg)
#define FOLLOWCAM_WARN(msg) WAYFINDER_WARN("CameraFollow", msg)
#define FOLLOWCAM_INFO(msg) WAYFINDER_INFO("CameraFollow", msg)
#define FOLLOWCAM_DEBUG(msg) WAYFINDER_DEBUG("CameraFollow", msg)

#define FLOORS_WARN(msg) WAYFINDER_WARN("FloorClusterer", msg)
#define FLOORS_INFO(msg) WAYFINDER_INFO("FloorClusterer", msg)
#define FLOORS_DEBUG(msg) WAYFINDER_DEBUG("FloorClusterer", msg)

#define WALKER_ERROR(msg) WAYFINDER_ERROR("WalkerController", msg)
#define WALKER_WARN(msg) WAYFINDER_WARN("WalkerController", msg)
#define WALKER_INFO(msg) WAYFINDER_INFO("WalkerController", msg)
#define WALKER_DEBUG(msg) WAYFINDER_DEBUG("WalkerController", msg)

#define SETTINGS_CRITICAL(msg) WAYFINDER_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) WAYFINDER_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) WAYFINDER_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) WAYFINDER_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) WAYFINDER_DEBUG("SettingsManager", msg)

#define JSON_ERROR(msg) WAYFINDER_ERROR("JsonReader", msg)
#define JSON_DEBUG(msg) WAYFINDER_DEBUG("JsonReader", msg)

#define TIMESTEP_WARN(msg) WAYFINDER_WARN("TimestepManager", msg)
#define TIMESTEP_DEBUG(msg) WAYFINDER_DEBUG("TimestepManager", msg)

#define DEMO_CRITICAL(msg) WAYFINDER_CRITICAL("Walkthrough", msg)
#define DEMO_ERROR(msg) WAYFINDER_ERROR("Walkthrough", msg)
#define DEMO_INFO(msg) WAYFINDER_INFO("Walkthrough", msg)

// Quiet mode convenience macros
#define WAYFINDER_ENABLE_QUIET_MODE()                                          \
  Wayfinder::Logger::SetQuietMode(true)
#define WAYFINDER_DISABLE_QUIET_MODE()                                         \
  Wayfinder::Logger::SetQuietMode(false)

#endif // LOGGER_HPP
