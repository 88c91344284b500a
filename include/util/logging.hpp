// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace dhtnode {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per component ("default", "network", "dht", "app"),
 * all sharing the same sinks. Components are addressed by name so that
 * per-component levels can be changed at runtime (e.g. --debug=dht).
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "discovery.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (see Components())
   *
   * Auto-initializes if not initialized. Unknown names return the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown or logging is not initialized
   */
  static bool SetComponentLevel(const std::string &component, const std::string &level);

  // Names of all component loggers
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace dhtnode

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  dhtnode::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  dhtnode::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  dhtnode::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  dhtnode::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  dhtnode::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  dhtnode::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  dhtnode::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  dhtnode::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  dhtnode::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  dhtnode::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DHT_TRACE(...)                                                     \
  dhtnode::util::LogManager::GetLogger("dht")->trace(__VA_ARGS__)
#define LOG_DHT_DEBUG(...)                                                     \
  dhtnode::util::LogManager::GetLogger("dht")->debug(__VA_ARGS__)
#define LOG_DHT_INFO(...)                                                      \
  dhtnode::util::LogManager::GetLogger("dht")->info(__VA_ARGS__)
#define LOG_DHT_WARN(...)                                                      \
  dhtnode::util::LogManager::GetLogger("dht")->warn(__VA_ARGS__)
#define LOG_DHT_ERROR(...)                                                     \
  dhtnode::util::LogManager::GetLogger("dht")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  dhtnode::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  dhtnode::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  dhtnode::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
