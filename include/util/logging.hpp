// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace gossipnet {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "gossip", "analysis",
 * "app"), all sharing the same sinks.
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
                         const std::string &log_file_path = "gossipsim.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a silent console
   * logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "gossip", "analysis")
   *
   * Auto-initializes if not initialized. Unknown components map to the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, gossip, analysis, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace gossipnet

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  gossipnet::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  gossipnet::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  gossipnet::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  gossipnet::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  gossipnet::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  gossipnet::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  gossipnet::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  gossipnet::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  gossipnet::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  gossipnet::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_GOSSIP_TRACE(...)                                                  \
  gossipnet::util::LogManager::GetLogger("gossip")->trace(__VA_ARGS__)
#define LOG_GOSSIP_DEBUG(...)                                                  \
  gossipnet::util::LogManager::GetLogger("gossip")->debug(__VA_ARGS__)
#define LOG_GOSSIP_INFO(...)                                                   \
  gossipnet::util::LogManager::GetLogger("gossip")->info(__VA_ARGS__)
#define LOG_GOSSIP_WARN(...)                                                   \
  gossipnet::util::LogManager::GetLogger("gossip")->warn(__VA_ARGS__)
#define LOG_GOSSIP_ERROR(...)                                                  \
  gossipnet::util::LogManager::GetLogger("gossip")->error(__VA_ARGS__)

#define LOG_ANALYSIS_DEBUG(...)                                                \
  gossipnet::util::LogManager::GetLogger("analysis")->debug(__VA_ARGS__)
#define LOG_ANALYSIS_INFO(...)                                                 \
  gossipnet::util::LogManager::GetLogger("analysis")->info(__VA_ARGS__)
#define LOG_ANALYSIS_ERROR(...)                                                \
  gossipnet::util::LogManager::GetLogger("analysis")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  gossipnet::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  gossipnet::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  gossipnet::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
