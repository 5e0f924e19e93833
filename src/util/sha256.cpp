// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/sha256.hpp"
#include "util/logging.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>

[[noreturn]] static void ThrowEvpFailure(const char *what) {
  LOG_CRYPTO_ERROR("CSHA256: {} failed (openssl error {})", what,
                   ERR_get_error());
  throw std::runtime_error(std::string("CSHA256: ") + what + " failed");
}

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    ThrowEvpFailure("EVP_MD_CTX_new");
  }
  Reset();
}

CSHA256::~CSHA256() = default;
CSHA256::CSHA256(CSHA256 &&) noexcept = default;
CSHA256 &CSHA256::operator=(CSHA256 &&) noexcept = default;

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    ThrowEvpFailure("EVP_DigestInit_ex");
  }
  return *this;
}

CSHA256 &CSHA256::Write(const unsigned char *data, size_t len) {
  if (len == 0) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    ThrowEvpFailure("EVP_DigestUpdate");
  }
  return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE]) {
  unsigned int written = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &written) != 1 ||
      written != OUTPUT_SIZE) {
    ThrowEvpFailure("EVP_DigestFinal_ex");
  }
  Reset();
}
