// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

#include <iomanip>
#include <sstream>

static inline int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (int i = WIDTH - 1; i >= 0; --i) {
    ss << std::setw(2) << static_cast<unsigned int>(m_data[i]);
  }
  return ss.str();
}

template <unsigned int BITS>
void base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }

  // Only the leading run of hex digits is consumed
  size_t digits = 0;
  while (digits < str.size() && HexDigit(str[digits]) != -1) {
    ++digits;
  }

  // Walk from the least significant (rightmost) digit into byte 0 upward
  size_t byte = 0;
  size_t pos = digits;
  while (pos > 0 && byte < static_cast<size_t>(WIDTH)) {
    uint8_t value = static_cast<uint8_t>(HexDigit(str[--pos]));
    if (pos > 0) {
      value |= static_cast<uint8_t>(HexDigit(str[--pos]) << 4);
    }
    m_data[byte++] = value;
  }
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template std::string base_blob<256>::GetHex() const;
template void base_blob<256>::SetHex(std::string_view);
template std::string base_blob<256>::ToString() const;
