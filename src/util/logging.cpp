// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace headerchain {
namespace util {

static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

static std::once_flag s_init_flag;

// Guards every access to s_loggers
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

static spdlog::sink_ptr MakeConsoleSink() {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern(kPattern);
  return console_sink;
}

static void InitializeInternal(const std::string &log_level, bool log_to_file,
                               const std::string &log_file_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      namespace fs = std::filesystem;
      try {
        fs::path p = log_file_path.empty() ? fs::path("headerchain.log")
                                           : fs::path(log_file_path);
        if (p.has_parent_path()) {
          std::error_code ec;
          fs::create_directories(p.parent_path(), ec);
        }
        // 10MB per file, 3 files kept
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            p.string(), 10 * 1024 * 1024, 3);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), falling back to console logging\n";
        sinks.push_back(MakeConsoleSink());
      }
    } else {
      sinks.push_back(MakeConsoleSink());
    }

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const auto &component : LogManager::Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::warn);

      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct access: LOG_* would re-enter GetLogger() and the mutex
    if (log_level != "off") {
      s_loggers["default"]->debug("Logging system initialized (level: {})",
                                  log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    // s_loggers stays empty; GetLogger() installs a silent fallback
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

const std::vector<std::string> &LogManager::Components() {
  static const std::vector<std::string> components = {"default", "chain",
                                                      "crypto", "app"};
  return components;
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file,
                 log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Initialization failed or Shutdown() ran: install a muted console logger
  if (s_loggers.empty()) {
    auto logger = std::make_shared<spdlog::logger>("default", MakeConsoleSink());
    logger->set_level(spdlog::level::off);
    spdlog::drop("default");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  if (level != "off") {
    s_loggers["default"]->debug("Log level changed to: {}", level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    return false;
  }

  it->second->set_level(spdlog::level::from_str(level));
  if (level != "off") {
    s_loggers["default"]->debug("Component '{}' log level set to: {}",
                                component, level);
  }
  return true;
}

} // namespace util
} // namespace headerchain
