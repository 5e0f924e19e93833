// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/hasher.hpp"
#include "chain/header.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace headerchain {
namespace chain {

// Genesis header: height 0, parent NULL_PARENT_HASH
BlockHeader Genesis();

// IsGenesis - true iff header has the genesis height and sentinel parent
bool IsGenesis(const BlockHeader &header);

// ChildOf - derive the header that extends parent by one block
//
// The parent is read, never modified, and is not re-verified. Placeholder
// commitments are reset to their defaults rather than copied from parent.
// The height follows unsigned arithmetic; a child of the maximum height
// wraps and will be rejected by verification.
BlockHeader ChildOf(const BlockHeader &parent,
                    const HeaderHasher &hasher = DefaultHeaderHasher());

// Kinds of single-link damage used to manufacture invalid chains
enum class Corruption {
  PARENT, // parent digest replaced with the header's own hash
  HEIGHT  // height moved off parent height + 1
};

std::string CorruptionToString(Corruption corruption);
std::optional<Corruption> CorruptionFromString(const std::string &name);

// Genesis followed by length - 1 successive children. Empty for length 0.
std::vector<BlockHeader> BuildValidChain(size_t length,
                                         const HeaderHasher &hasher = DefaultHeaderHasher());

// BuildInvalidChain - valid chain with exactly one broken link
//
// The header at corrupt_height is damaged, then every later header is
// re-derived from its (damaged) predecessor so only that one link fails.
// Returns std::nullopt unless 1 <= corrupt_height < length.
std::optional<std::vector<BlockHeader>>
BuildInvalidChain(size_t length, size_t corrupt_height, Corruption corruption,
                  const HeaderHasher &hasher = DefaultHeaderHasher());

} // namespace chain
} // namespace headerchain
