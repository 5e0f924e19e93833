// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace headerchain {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "chain", "crypto", "app"), all sharing
 * the same sinks. Console output is written to stderr so that the tool's
 * stdout can carry JSON documents.
 *
 * Thread-safety: Initialization runs exactly once (std::call_once); the
 * logger map is guarded by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call has any effect.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "headerchain.log");

  // Flushes and drops all loggers
  static void Shutdown();

  /**
   * Get logger for a component. Auto-initializes with defaults.
   * Unknown components fall back to the "default" logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set level on every component
  static void SetLogLevel(const std::string &level);

  // Set level on one component; returns false for unknown components
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace headerchain

#define LOG_TRACE(...)                                                         \
  headerchain::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  headerchain::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  headerchain::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  headerchain::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  headerchain::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  headerchain::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  headerchain::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  headerchain::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  headerchain::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  headerchain::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_CRYPTO_ERROR(...)                                                  \
  headerchain::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  headerchain::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  headerchain::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  headerchain::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  headerchain::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
