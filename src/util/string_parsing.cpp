// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace headerchain {
namespace util {

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  // Reject empty or whitespace-leading strings (stol would skip whitespace)
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<uint64_t> SafeParseUInt64(const std::string &str, uint64_t max) {
  // stoull accepts "-1" and wraps; only plain digits are allowed here
  if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }
    if (value > max) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(value);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

bool IsValidHex(const std::string &str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(const std::string &str) {
  if (str.size() != 64) {
    return std::nullopt;
  }
  if (!IsValidHex(str)) {
    return std::nullopt;
  }

  uint256 hash;
  hash.SetHex(str);
  return hash;
}

} // namespace util
} // namespace headerchain
