#include "uint256.h"

namespace zkguest::sol {

namespace {

typedef std::unique_ptr<BIGNUM, decltype(&BN_free)> bn_ptr_t;

// 2^256-1 has 78 decimal digits.
constexpr size_t max_decimal_digits = 78;

}  // namespace

uint256_t uint256_t::make(uint64_t lo) { return make(lo, 0, 0, 0); }

uint256_t uint256_t::make(uint64_t w0, uint64_t w1, uint64_t w2, uint64_t w3) {
  uint256_t r;
  r.w[0] = w0;
  r.w[1] = w1;
  r.w[2] = w2;
  r.w[3] = w3;
  return r;
}

uint256_t uint256_t::load(const_byte_ptr src) {
  uint256_t r;
  for (int i = 0; i < limbs; i++) r.w[limbs - 1 - i] = be_get_8(src + i * 8);
  return r;
}

error_t uint256_t::load(mem_t src, uint256_t& dst) {
  if (src.size != size) return error(E_FORMAT, "uint256 must be 32 bytes");
  dst = load(src.data);
  return SUCCESS;
}

void uint256_t::save(byte_ptr dst) const {
  for (int i = 0; i < limbs; i++) be_set_8(dst + i * 8, w[limbs - 1 - i]);
}

buf_t uint256_t::to_bin() const {
  buf_t out(size);
  save(out.data());
  return out;
}

error_t uint256_t::from_string(const std::string& str, uint256_t& dst) {
  if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos)
    return error(E_FORMAT, "invalid decimal uint256: " + str);

  size_t first = str.find_first_not_of('0');
  std::string digits = first == std::string::npos ? "0" : str.substr(first);
  if (digits.length() > max_decimal_digits) return error(E_RANGE, "value exceeds 256 bits");

  BIGNUM* parsed = nullptr;
  if (!BN_dec2bn(&parsed, digits.c_str())) return openssl_error("BN_dec2bn failed");
  bn_ptr_t bn(parsed, BN_free);
  if (BN_num_bits(bn.get()) > size * 8) return error(E_RANGE, "value exceeds 256 bits");

  byte_t bin[size];
  if (BN_bn2binpad(bn.get(), bin, size) != size) return openssl_error("BN_bn2binpad failed");
  dst = load(bin);
  return SUCCESS;
}

std::string uint256_t::to_string() const {
  byte_t bin[size];
  save(bin);

  bn_ptr_t bn(BN_bin2bn(bin, size, nullptr), BN_free);
  if (!bn) throw std::bad_alloc();
  char* text = BN_bn2dec(bn.get());
  if (!text) throw std::bad_alloc();
  std::string result = text;
  OPENSSL_free(text);
  return result;
}

std::string uint256_t::to_hex() const {
  byte_t bin[size];
  save(bin);
  return zkguest::to_hex(mem_t(bin, size));
}

bool uint256_t::is_zero() const { return (w[0] | w[1] | w[2] | w[3]) == 0; }

bool uint256_t::get_bit(int index) const {
  zkguest_assert(index >= 0 && index < size * 8);
  return ((w[index / 64] >> (index % 64)) & 1) != 0;
}

int uint256_t::get_bits_count() const {
  for (int i = limbs - 1; i >= 0; i--) {
    if (w[i]) return i * 64 + 64 - __builtin_clzll(w[i]);
  }
  return 0;
}

bool uint256_t::operator==(const uint256_t& src) const {
  uint64_t diff = 0;
  for (int i = 0; i < limbs; i++) diff |= w[i] ^ src.w[i];
  return diff == 0;
}

bool uint256_t::operator<(const uint256_t& src) const {
  for (int i = limbs - 1; i >= 0; i--) {
    if (w[i] != src.w[i]) return w[i] < src.w[i];
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, const uint256_t& v) {
  os << v.to_string();
  return os;
}

}  // namespace zkguest::sol
