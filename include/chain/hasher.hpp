// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/header.hpp"
#include "util/uint.hpp"

namespace headerchain {
namespace chain {

/**
 * HeaderHasher - hashing capability consumed by the chain operations
 *
 * Implementations must be deterministic, must depend on both hashParent and
 * nHeight, and must be safe to call concurrently (Hash() is const and should
 * not touch shared mutable state).
 *
 * Chain operations take the hasher as a parameter so a stronger hash, or a
 * mock in tests, can be substituted without touching the chain logic.
 */
class HeaderHasher {
public:
  virtual ~HeaderHasher() = default;

  [[nodiscard]] virtual uint256 Hash(const BlockHeader &header) const = 0;
};

// SHA256(SHA256(header.SerializeFixed()))
class Sha256dHeaderHasher : public HeaderHasher {
public:
  [[nodiscard]] uint256 Hash(const BlockHeader &header) const override;
};

// Process-wide stateless default (a Sha256dHeaderHasher)
const HeaderHasher &DefaultHeaderHasher();

} // namespace chain
} // namespace headerchain
