// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/header_chain.hpp"
#include "util/logging.hpp"
#include <limits>

namespace headerchain {
namespace validation {

using chain::BlockHeader;
using chain::HeaderHasher;

std::string ValidationState::ToString() const {
  if (IsValid()) {
    return "valid";
  }
  if (debug_message_.empty()) {
    return reject_reason_;
  }
  return reject_reason_ + " (" + debug_message_ + ")";
}

namespace {

// One link: next must commit to prev_hash and sit exactly one above prev.
// A predecessor at the maximum height has no representable successor.
bool CheckLink(const BlockHeader &prev, const uint256 &prev_hash,
               const BlockHeader &next, size_t index, ValidationState &state) {
  if (next.hashParent != prev_hash) {
    return state.Invalid("bad-prevblk",
                         "header " + std::to_string(index) +
                             " parent " + next.hashParent.GetHex() +
                             " != " + prev_hash.GetHex());
  }

  if (prev.nHeight == std::numeric_limits<uint64_t>::max() ||
      next.nHeight != prev.nHeight + 1) {
    return state.Invalid("bad-height",
                         "header " + std::to_string(index) + " height " +
                             std::to_string(next.nHeight) +
                             " does not follow " +
                             std::to_string(prev.nHeight));
  }

  return true;
}

} // namespace

bool VerifySubChain(const BlockHeader &trusted,
                    std::span<const BlockHeader> candidates,
                    ValidationState &state, const HeaderHasher &hasher) {
  if (candidates.empty()) {
    return true;
  }

  const BlockHeader *prev = &trusted;
  uint256 prev_hash = hasher.Hash(trusted);

  for (size_t i = 0; i < candidates.size(); ++i) {
    const BlockHeader &next = candidates[i];

    // First failure is final; later links are never consulted
    if (!CheckLink(*prev, prev_hash, next, i, state)) {
      LOG_CHAIN_DEBUG("VerifySubChain: rejected at index {} of {} from height {}: {}",
                      i, candidates.size(), trusted.nHeight, state.ToString());
      return false;
    }

    prev = &next;
    if (i + 1 < candidates.size()) {
      prev_hash = hasher.Hash(next);
    }
  }

  LOG_CHAIN_TRACE("VerifySubChain: {} headers valid from height {} to {}",
                  candidates.size(), trusted.nHeight, prev->nHeight);
  return true;
}

bool VerifySubChain(const BlockHeader &trusted,
                    std::span<const BlockHeader> candidates,
                    const HeaderHasher &hasher) {
  ValidationState state;
  return VerifySubChain(trusted, candidates, state, hasher);
}

bool VerifyChain(std::span<const BlockHeader> chain, ValidationState &state,
                 const HeaderHasher &hasher) {
  if (chain.empty()) {
    return state.Invalid("empty-chain", "no headers to verify");
  }

  if (!chain::IsGenesis(chain.front())) {
    return state.Invalid("bad-genesis",
                         "first header has height " +
                             std::to_string(chain.front().nHeight) +
                             " and parent " +
                             chain.front().hashParent.GetHex());
  }

  return VerifySubChain(chain.front(), chain.subspan(1), state, hasher);
}

bool VerifyChain(std::span<const BlockHeader> chain,
                 const HeaderHasher &hasher) {
  ValidationState state;
  return VerifyChain(chain, state, hasher);
}

} // namespace validation
} // namespace headerchain
