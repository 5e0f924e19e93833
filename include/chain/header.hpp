// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace headerchain {
namespace chain {

// Parent digest carried by the genesis header ("no parent").
// A real header hashing to all-zero is not expected to occur.
inline constexpr uint256 NULL_PARENT_HASH{};

// Commitment placeholders. Each is a distinct empty type so that later layers
// (inclusion proofs, state commitments, consensus metadata) can replace one
// without changing the others. They carry no data and are not serialized.
struct ExtrinsicsRoot {
  bool operator==(const ExtrinsicsRoot &) const = default;
};
struct StateRoot {
  bool operator==(const StateRoot &) const = default;
};
struct ConsensusDigest {
  bool operator==(const ConsensusDigest &) const = default;
};

// BlockHeader - minimal hash-linked header
// Linkage is (hashParent, nHeight); everything else is an opaque placeholder.
class BlockHeader
{
public:
  uint256 hashParent{};            // Digest of the preceding header (NULL_PARENT_HASH for genesis)
  uint64_t nHeight{0};             // Parent height + 1; genesis is 0
  ExtrinsicsRoot extrinsicsRoot{};
  StateRoot stateRoot{};
  ConsensusDigest consensusDigest{};

  static constexpr size_t UINT256_BYTES = 32;

  // Serialized header: 32-byte parent digest + 8-byte little-endian height
  static constexpr size_t HEADER_SIZE = UINT256_BYTES + 8;

  static constexpr size_t OFF_PARENT = 0;
  static constexpr size_t OFF_HEIGHT = OFF_PARENT + UINT256_BYTES;

  static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
  static_assert(OFF_HEIGHT + 8 == HEADER_SIZE, "offset math must be correct");

  using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

  bool operator==(const BlockHeader &) const = default;

  // Digest under the default hasher (double SHA-256)
  [[nodiscard]] uint256 GetHash() const;

  // Serialize to the fixed-size form that hashers consume.
  // hashParent is copied byte-for-byte; nHeight is little-endian.
  [[nodiscard]] HeaderBytes SerializeFixed() const noexcept;

  [[nodiscard]] std::vector<uint8_t> Serialize() const;

  // Rejects any size other than HEADER_SIZE; placeholders are reset
  [[nodiscard]] bool Deserialize(const uint8_t *data, size_t size) noexcept;

  [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) noexcept {
    return Deserialize(bytes.data(), bytes.size());
  }

  [[nodiscard]] std::string ToString() const;
};

} // namespace chain
} // namespace headerchain
