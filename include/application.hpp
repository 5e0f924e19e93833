// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header_chain.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace headerchain {
namespace app {

enum class Command {
  NONE,
  HELP,
  VERSION,
  GENESIS, // print the genesis header
  BUILD,   // print a freshly built (optionally corrupted) chain document
  VERIFY   // read a chain document and verify it from genesis
};

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE_ERROR = 1;
constexpr int EXIT_CHAIN_INVALID = 2;

// Upper bound for --blocks
constexpr int MAX_BUILD_BLOCKS = 1000000;

// Application configuration, populated from the command line
struct AppConfig {
  Command command = Command::NONE;

  // build
  size_t blocks = 5;
  std::optional<uint64_t> corrupt_height;
  chain::Corruption corruption = chain::Corruption::PARENT;

  // verify: path to chain document, "-" for stdin
  std::string input_path;

  // Logging
  std::string log_level = "info";
  std::vector<std::string> debug_components;
};

// True for the level names spdlog understands
bool IsValidLogLevel(const std::string &level);

// ParseArguments - fill config from argv[1..]
// Returns false and sets error on unknown options, malformed values or an
// inconsistent combination (e.g. --corrupt outside the built chain).
bool ParseArguments(const std::vector<std::string> &args, AppConfig &config,
                    std::string &error);

void PrintUsage(std::ostream &out, const std::string &program_name);

// Application - runs one command against the configured streams
class Application {
public:
  explicit Application(const AppConfig &config);

  // Returns one of the EXIT_* codes. Documents are written to out; verify
  // reads from in when input_path is "-".
  int run(std::ostream &out, std::istream &in);

private:
  int run_genesis(std::ostream &out);
  int run_build(std::ostream &out);
  int run_verify(std::ostream &out, std::istream &in);

  AppConfig config_;
};

} // namespace app
} // namespace headerchain
