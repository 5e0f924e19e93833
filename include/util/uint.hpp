// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

/** Fixed-width opaque byte blob used for header digests. */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob only supports whole bytes");
  std::array<uint8_t, WIDTH> m_data;

public:
  /* zero value by default */
  constexpr base_blob() : m_data() {}

  /* first byte set, remainder zero (test constants) */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  constexpr int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend constexpr bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend constexpr bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend constexpr bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  // Hex is rendered most-significant byte first, i.e. the byte array is
  // printed in reverse. SetHex() is the exact inverse of GetHex().
  std::string GetHex() const;
  std::string ToString() const;

  /** Set from hex string. Accepts an optional "0x" prefix. */
  void SetHex(std::string_view str);

  constexpr const unsigned char *data() const { return m_data.data(); }
  constexpr unsigned char *data() { return m_data.data(); }

  constexpr unsigned char *begin() { return m_data.data(); }
  constexpr unsigned char *end() { return m_data.data() + WIDTH; }

  constexpr const unsigned char *begin() const { return m_data.data(); }
  constexpr const unsigned char *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }
};

/** 256-bit opaque blob. Holds header digests; has no integer operations. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}

  static uint256 FromHex(std::string_view str) {
    uint256 rv;
    rv.SetHex(str);
    return rv;
  }
};
