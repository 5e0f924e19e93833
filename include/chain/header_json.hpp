// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace headerchain {
namespace chain {

// Chain document layout:
//   {"version": 1, "count": n,
//    "headers": [{"parent": "<64 hex>", "height": n, "hash": "<64 hex>"}, ...]}
// "hash" is written for readers and ignored when parsing.
inline constexpr int CHAIN_DOCUMENT_VERSION = 1;

nlohmann::json HeaderToJson(const BlockHeader &header);

// std::nullopt if parent is not 64 hex digits or height is not an unsigned
// integer
std::optional<BlockHeader> HeaderFromJson(const nlohmann::json &j);

nlohmann::json ChainToJson(std::span<const BlockHeader> chain);

// Parses a chain document. Malformed input (bad JSON, wrong version,
// missing or ill-typed fields) yields std::nullopt and a log entry.
std::optional<std::vector<BlockHeader>> ParseChainDocument(const std::string &text);

} // namespace chain
} // namespace headerchain
