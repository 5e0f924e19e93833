// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <iostream> // CLI output and errors reported before the logger exists
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
  try {
    headerchain::app::AppConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string error;

    if (!headerchain::app::ParseArguments(args, config, error)) {
      std::cerr << "Error: " << error << "\n\n";
      headerchain::app::PrintUsage(std::cerr, argv[0]);
      return headerchain::app::EXIT_USAGE_ERROR;
    }

    if (config.command == headerchain::app::Command::HELP) {
      headerchain::app::PrintUsage(std::cout, argv[0]);
      return headerchain::app::EXIT_OK;
    }
    if (config.command == headerchain::app::Command::VERSION) {
      std::cout << headerchain::GetFullVersionString() << std::endl;
      std::cout << headerchain::GetCopyrightString() << std::endl;
      return headerchain::app::EXIT_OK;
    }

    headerchain::util::LogManager::Initialize(config.log_level, false, "");

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        headerchain::util::LogManager::SetLogLevel("trace");
      } else if (!headerchain::util::LogManager::SetComponentLevel(component,
                                                                   "trace")) {
        LOG_WARN("Unknown log component: {}", component);
      }
    }

    int rc = headerchain::app::EXIT_OK;
    {
      headerchain::app::Application app(config);
      rc = app.run(std::cout, std::cin);
    }

    headerchain::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    // Logger state is unknown here
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    headerchain::util::LogManager::Shutdown();
    return headerchain::app::EXIT_USAGE_ERROR;
  }
}
