// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/header_chain.hpp"
#include "util/logging.hpp"

namespace headerchain {
namespace chain {

namespace {
// Distance a HEIGHT corruption moves the damaged header
constexpr uint64_t kHeightCorruptionOffset = 9;
} // namespace

BlockHeader Genesis() {
  BlockHeader genesis;
  genesis.hashParent = NULL_PARENT_HASH;
  genesis.nHeight = 0;
  return genesis;
}

bool IsGenesis(const BlockHeader &header) {
  return header.nHeight == 0 && header.hashParent == NULL_PARENT_HASH;
}

BlockHeader ChildOf(const BlockHeader &parent, const HeaderHasher &hasher) {
  BlockHeader child;
  child.hashParent = hasher.Hash(parent);
  child.nHeight = parent.nHeight + 1;
  return child;
}

std::string CorruptionToString(Corruption corruption) {
  switch (corruption) {
  case Corruption::PARENT:
    return "parent";
  case Corruption::HEIGHT:
    return "height";
  }
  return "unknown";
}

std::optional<Corruption> CorruptionFromString(const std::string &name) {
  if (name == "parent") {
    return Corruption::PARENT;
  }
  if (name == "height") {
    return Corruption::HEIGHT;
  }
  return std::nullopt;
}

std::vector<BlockHeader> BuildValidChain(size_t length,
                                         const HeaderHasher &hasher) {
  std::vector<BlockHeader> chain;
  if (length == 0) {
    return chain;
  }

  chain.reserve(length);
  chain.push_back(Genesis());
  while (chain.size() < length) {
    chain.push_back(ChildOf(chain.back(), hasher));
  }

  LOG_CHAIN_TRACE("BuildValidChain: built {} headers (tip height {})",
                  chain.size(), chain.back().nHeight);
  return chain;
}

std::optional<std::vector<BlockHeader>>
BuildInvalidChain(size_t length, size_t corrupt_height, Corruption corruption,
                  const HeaderHasher &hasher) {
  if (corrupt_height == 0 || corrupt_height >= length) {
    LOG_CHAIN_WARN("BuildInvalidChain: corrupt height {} outside [1, {})",
                   corrupt_height, length);
    return std::nullopt;
  }

  std::vector<BlockHeader> chain = BuildValidChain(corrupt_height + 1, hasher);
  BlockHeader &damaged = chain.back();

  switch (corruption) {
  case Corruption::PARENT:
    damaged.hashParent = hasher.Hash(damaged);
    break;
  case Corruption::HEIGHT:
    damaged.nHeight += kHeightCorruptionOffset;
    break;
  }

  // Descendants link correctly to the damaged header
  chain.reserve(length);
  while (chain.size() < length) {
    chain.push_back(ChildOf(chain.back(), hasher));
  }

  LOG_CHAIN_DEBUG("BuildInvalidChain: {} headers, {} corrupted at height {}",
                  chain.size(), CorruptionToString(corruption), corrupt_height);
  return chain;
}

} // namespace chain
} // namespace headerchain
