#pragma once

#include <zkguest/core/buf.h>

namespace zkguest::sol {

// Fixed-width 256-bit unsigned integer, four 64-bit limbs, least significant first.
struct uint256_t {
  enum { size = 32, limbs = 4 };

  uint64_t w[limbs];

  static uint256_t zero() { return make(0); }
  static uint256_t make(uint64_t lo);
  static uint256_t make(uint64_t w0, uint64_t w1, uint64_t w2, uint64_t w3);

  // 32 bytes, big-endian
  static uint256_t load(const_byte_ptr src);
  static error_t load(mem_t src, uint256_t& dst);
  void save(byte_ptr dst) const;
  buf_t to_bin() const;

  static error_t from_string(const std::string& str, uint256_t& dst);
  std::string to_string() const;
  std::string to_hex() const;

  bool is_zero() const;
  bool get_bit(int index) const;
  int get_bits_count() const;

  bool operator==(const uint256_t& src) const;
  bool operator!=(const uint256_t& src) const { return !(*this == src); }
  bool operator<(const uint256_t& src) const;
  bool operator>(const uint256_t& src) const { return src < *this; }
};

std::ostream& operator<<(std::ostream& os, const uint256_t& v);

}  // namespace zkguest::sol
