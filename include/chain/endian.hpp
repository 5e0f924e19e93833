// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>

namespace headerchain {
namespace chain {

// Little-endian codec for the header height. Byte-at-a-time, so the wire
// form does not depend on host byte order.
inline uint64_t ReadLE64(const uint8_t *ptr) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(ptr[i]) << (8 * i);
  }
  return value;
}

inline void WriteLE64(uint8_t *ptr, uint64_t value) {
  for (size_t i = 0; i < 8; ++i) {
    ptr[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

} // namespace chain
} // namespace headerchain
