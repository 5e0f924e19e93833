// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/hasher.hpp"
#include "chain/header.hpp"
#include <span>
#include <string>

namespace headerchain {
namespace validation {

/**
 * ============================================================================
 * HEADER CHAIN VERIFICATION
 * ============================================================================
 *
 * VerifySubChain(trusted, candidates)
 * - trusted is assumed valid (genesis, or the tip of an earlier successful
 *   call: the "trust frontier")
 * - candidates[0] must link to trusted; every following header must link to
 *   the one before it
 * - a link is valid iff parent digest matches AND height is exactly +1
 *
 * VerifyChain(chain)
 * - chain[0] must be genesis; the rest is checked with VerifySubChain
 *
 * Results are strictly boolean. A broken chain is an ordinary outcome, never
 * an exception. The ValidationState overloads only add a reject reason:
 *   "bad-prevblk"  parent digest mismatch
 *   "bad-height"   height is not predecessor height + 1
 *   "empty-chain"  VerifyChain() given no headers
 *   "bad-genesis"  VerifyChain() first header is not genesis
 * ============================================================================
 */

/**
 * Validation state - records why verification failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// True iff candidates is a gap-free, correctly linked extension of trusted
bool VerifySubChain(const chain::BlockHeader &trusted,
                    std::span<const chain::BlockHeader> candidates,
                    const chain::HeaderHasher &hasher = chain::DefaultHeaderHasher());

// Same result; on failure state carries the reject reason and the index of
// the offending candidate
bool VerifySubChain(const chain::BlockHeader &trusted,
                    std::span<const chain::BlockHeader> candidates,
                    ValidationState &state,
                    const chain::HeaderHasher &hasher = chain::DefaultHeaderHasher());

// Whole chain rooted at genesis
bool VerifyChain(std::span<const chain::BlockHeader> chain,
                 const chain::HeaderHasher &hasher = chain::DefaultHeaderHasher());

bool VerifyChain(std::span<const chain::BlockHeader> chain,
                 ValidationState &state,
                 const chain::HeaderHasher &hasher = chain::DefaultHeaderHasher());

} // namespace validation
} // namespace headerchain
