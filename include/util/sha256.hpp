// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

// OpenSSL types are kept out of the public header
struct evp_md_ctx_st;

/**
 * CSHA256 - incremental SHA-256 hasher backed by OpenSSL's EVP interface
 *
 * Usage mirrors the chained style used throughout the codebase:
 *   CSHA256().Write(data, len).Finalize(out);
 *
 * Each instance owns its own digest context, so independent instances can be
 * used concurrently from different threads. Instances are move-only.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  // Throws std::runtime_error if OpenSSL cannot allocate/initialize a context
  CSHA256();
  ~CSHA256();

  CSHA256(CSHA256 &&) noexcept;
  CSHA256 &operator=(CSHA256 &&) noexcept;
  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const unsigned char *data, size_t len);

  // Writes OUTPUT_SIZE bytes to hash. The context is reset afterwards and
  // may be reused.
  void Finalize(unsigned char hash[OUTPUT_SIZE]);

  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const noexcept;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};
