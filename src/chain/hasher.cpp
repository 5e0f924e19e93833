// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/hasher.hpp"
#include "util/sha256.hpp"

namespace headerchain {
namespace chain {

uint256 Sha256dHeaderHasher::Hash(const BlockHeader &header) const {
  const auto s = header.SerializeFixed();

  uint8_t tmp[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(s.data(), s.size()).Finalize(tmp);

  uint256 out;
  CSHA256().Write(tmp, sizeof(tmp)).Finalize(out.begin());
  return out;
}

const HeaderHasher &DefaultHeaderHasher() {
  static const Sha256dHeaderHasher hasher;
  return hasher;
}

} // namespace chain
} // namespace headerchain
