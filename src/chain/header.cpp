// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/header.hpp"
#include "chain/endian.hpp"
#include "chain/hasher.hpp"
#include <algorithm>
#include <sstream>

namespace headerchain {
namespace chain {

uint256 BlockHeader::GetHash() const {
  return DefaultHeaderHasher().Hash(*this);
}

BlockHeader::HeaderBytes BlockHeader::SerializeFixed() const noexcept {
  HeaderBytes data{};

  // hashParent (32 bytes, offset 0)
  std::copy(hashParent.begin(), hashParent.end(), data.begin() + OFF_PARENT);

  // nHeight (8 bytes, offset 32)
  WriteLE64(data.data() + OFF_HEIGHT, nHeight);

  return data;
}

std::vector<uint8_t> BlockHeader::Serialize() const {
  auto arr = SerializeFixed();
  return std::vector<uint8_t>(arr.begin(), arr.end());
}

bool BlockHeader::Deserialize(const uint8_t *data, size_t size) noexcept {
  if (data == nullptr || size != HEADER_SIZE) {
    return false;
  }

  std::copy(data + OFF_PARENT, data + OFF_PARENT + UINT256_BYTES,
            hashParent.begin());
  nHeight = ReadLE64(data + OFF_HEIGHT);

  extrinsicsRoot = ExtrinsicsRoot{};
  stateRoot = StateRoot{};
  consensusDigest = ConsensusDigest{};
  return true;
}

std::string BlockHeader::ToString() const {
  std::stringstream s;
  s << "BlockHeader(\n";
  s << "  hashParent=" << hashParent.GetHex() << "\n";
  s << "  nHeight=" << nHeight << "\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

} // namespace chain
} // namespace headerchain
