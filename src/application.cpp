// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/header_json.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

namespace headerchain {
namespace app {

bool IsValidLogLevel(const std::string &level) {
  static const std::vector<std::string> levels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  for (const auto &name : levels) {
    if (name == level) {
      return true;
    }
  }
  return false;
}

static std::vector<std::string> SplitComponents(const std::string &components) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= components.length()) {
    size_t comma = components.find(',', pos);
    if (comma == std::string::npos) {
      out.push_back(components.substr(pos));
      break;
    }
    out.push_back(components.substr(pos, comma - pos));
    pos = comma + 1;
  }
  return out;
}

bool ParseArguments(const std::vector<std::string> &args, AppConfig &config,
                    std::string &error) {
  std::vector<std::string> positional;

  for (const auto &arg : args) {
    if (arg == "--help" || arg == "-h") {
      config.command = Command::HELP;
      return true;
    } else if (arg == "--version") {
      config.command = Command::VERSION;
      return true;
    } else if (arg == "--verbose") {
      config.log_level = "debug";
    } else if (arg.find("--loglevel=") == 0) {
      config.log_level = arg.substr(11);
      if (!IsValidLogLevel(config.log_level)) {
        error = "Invalid log level: " + config.log_level;
        return false;
      }
    } else if (arg.find("--debug=") == 0) {
      for (auto &component : SplitComponents(arg.substr(8))) {
        if (component.empty()) {
          error = "Empty component in " + arg;
          return false;
        }
        config.debug_components.push_back(component);
      }
    } else if (arg.find("--blocks=") == 0) {
      auto blocks = util::SafeParseInt(arg.substr(9), 1, MAX_BUILD_BLOCKS);
      if (!blocks) {
        error = "Invalid block count: " + arg.substr(9) +
                " (must be between 1 and " + std::to_string(MAX_BUILD_BLOCKS) + ")";
        return false;
      }
      config.blocks = static_cast<size_t>(*blocks);
    } else if (arg.find("--corrupt=") == 0) {
      auto height = util::SafeParseUInt64(arg.substr(10), MAX_BUILD_BLOCKS);
      if (!height) {
        error = "Invalid corrupt height: " + arg.substr(10);
        return false;
      }
      config.corrupt_height = *height;
    } else if (arg.find("--corrupt-field=") == 0) {
      auto corruption = chain::CorruptionFromString(arg.substr(16));
      if (!corruption) {
        error = "Invalid corrupt field: " + arg.substr(16) +
                " (expected parent or height)";
        return false;
      }
      config.corruption = *corruption;
    } else if (arg.size() > 1 && arg[0] == '-') {
      error = "Unknown option: " + arg;
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    error = "Missing command";
    return false;
  }

  const std::string &command = positional[0];
  size_t expected_positional = 1;
  if (command == "genesis") {
    config.command = Command::GENESIS;
  } else if (command == "build") {
    config.command = Command::BUILD;
  } else if (command == "verify") {
    config.command = Command::VERIFY;
    expected_positional = 2;
    if (positional.size() < 2) {
      error = "verify requires a chain document path (or - for stdin)";
      return false;
    }
    config.input_path = positional[1];
  } else {
    error = "Unknown command: " + command;
    return false;
  }

  if (positional.size() > expected_positional) {
    error = "Unexpected argument: " + positional[expected_positional];
    return false;
  }

  if (config.corrupt_height) {
    if (config.command != Command::BUILD) {
      error = "--corrupt is only valid with build";
      return false;
    }
    if (*config.corrupt_height == 0 || *config.corrupt_height >= config.blocks) {
      error = "--corrupt must name a height between 1 and " +
              std::to_string(config.blocks - 1);
      return false;
    }
  }

  return true;
}

void PrintUsage(std::ostream &out, const std::string &program_name) {
  out << "Usage: " << program_name << " [options] <command> [params]\n"
      << "\n"
      << "Commands:\n"
      << "  genesis                  Print the genesis header\n"
      << "  build                    Print a chain document built from genesis\n"
      << "  verify <file|->          Verify a chain document from genesis\n"
      << "                           Exit code 0 = valid, 2 = invalid\n"
      << "\n"
      << "Build options:\n"
      << "  --blocks=<n>             Headers to build, genesis included (default: 5)\n"
      << "  --corrupt=<height>       Break the link into this height\n"
      << "  --corrupt-field=<field>  parent or height (default: parent)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>       trace,debug,info,warn,error,critical,off\n"
      << "                           Default: info (written to stderr)\n"
      << "  --debug=<component>      Trace logging for component(s)\n"
      << "                           Components: chain, crypto, app, all\n"
      << "  --verbose                Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version                Show version information\n"
      << "  --help                   Show this help message\n";
}

Application::Application(const AppConfig &config) : config_(config) {}

int Application::run(std::ostream &out, std::istream &in) {
  switch (config_.command) {
  case Command::GENESIS:
    return run_genesis(out);
  case Command::BUILD:
    return run_build(out);
  case Command::VERIFY:
    return run_verify(out, in);
  case Command::NONE:
  case Command::HELP:
  case Command::VERSION:
    break;
  }
  LOG_APP_ERROR("Application::run called without a runnable command");
  return EXIT_USAGE_ERROR;
}

int Application::run_genesis(std::ostream &out) {
  out << chain::HeaderToJson(chain::Genesis()).dump(2) << "\n";
  return EXIT_OK;
}

int Application::run_build(std::ostream &out) {
  std::vector<chain::BlockHeader> headers;

  if (config_.corrupt_height) {
    auto damaged = chain::BuildInvalidChain(
        config_.blocks, static_cast<size_t>(*config_.corrupt_height),
        config_.corruption);
    if (!damaged) {
      LOG_APP_ERROR("Cannot corrupt height {} of a {}-header chain",
                    *config_.corrupt_height, config_.blocks);
      return EXIT_USAGE_ERROR;
    }
    headers = std::move(*damaged);
  } else {
    headers = chain::BuildValidChain(config_.blocks);
  }

  LOG_APP_INFO("Built {} headers{}", headers.size(),
               config_.corrupt_height
                   ? " (" + chain::CorruptionToString(config_.corruption) +
                         " corrupted at height " +
                         std::to_string(*config_.corrupt_height) + ")"
                   : std::string());

  out << chain::ChainToJson(headers).dump(2) << "\n";
  return EXIT_OK;
}

int Application::run_verify(std::ostream &out, std::istream &in) {
  std::string text;

  if (config_.input_path == "-") {
    text.assign(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
  } else {
    std::ifstream file(config_.input_path, std::ios::binary);
    if (!file.is_open()) {
      LOG_APP_ERROR("Cannot open chain document {}", config_.input_path);
      return EXIT_USAGE_ERROR;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    text = buffer.str();
  }

  auto headers = chain::ParseChainDocument(text);
  if (!headers) {
    LOG_APP_ERROR("Malformed chain document {}", config_.input_path);
    return EXIT_USAGE_ERROR;
  }

  validation::ValidationState state;
  if (!validation::VerifyChain(*headers, state)) {
    LOG_APP_WARN("Chain rejected: {}", state.ToString());
    out << "invalid: " << state.ToString() << "\n";
    return EXIT_CHAIN_INVALID;
  }

  LOG_APP_INFO("Chain of {} headers verified", headers->size());
  out << "valid (" << headers->size() << " headers, tip height "
      << headers->back().nHeight << ")\n";
  return EXIT_OK;
}

} // namespace app
} // namespace headerchain
