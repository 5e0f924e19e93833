// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of untrusted text (command-line flags, chain documents) into
 numeric and digest types. Every function requires the entire input to be
 consumed and returns std::nullopt on any error; none of them throw.
*/

#include <cstdint>
#include <optional>
#include <string>

#include "util/uint.hpp"

namespace headerchain {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse unsigned 64-bit string with an inclusive upper bound
 *
 * Rejects leading signs, so "-1" never wraps around to UINT64_MAX.
 */
std::optional<uint64_t> SafeParseUInt64(const std::string &str, uint64_t max);

// True if str is non-empty and every character is [0-9a-fA-F]
bool IsValidHex(const std::string &str);

/**
 * Parse 64-character hexadecimal hash string (no "0x" prefix)
 *
 * The string is read most-significant byte first, matching uint256::GetHex().
 */
std::optional<uint256> SafeParseHash(const std::string &str);

} // namespace util
} // namespace headerchain
