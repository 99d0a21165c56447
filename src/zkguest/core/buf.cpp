#include "buf.h"

namespace zkguest {

void secure_bzero(byte_ptr ptr, int size) {
  volatile byte_t* p = ptr;
  while (size-- > 0) *p++ = 0;
}

uint64_t be_get_8(const_byte_ptr src) {
  uint64_t value = 0;
  for (int i = 0; i < 8; i++) value = (value << 8) | src[i];
  return value;
}

void be_set_8(byte_ptr dst, uint64_t value) {
  for (int i = 7; i >= 0; i--, value >>= 8) dst[i] = byte_t(value);
}

bool operator==(mem_t a, mem_t b) { return a.size == b.size && (a.size == 0 || memcmp(a.data, b.data, a.size) == 0); }

bool operator!=(mem_t a, mem_t b) { return !(a == b); }

std::string to_hex(mem_t mem) {
  static const char digits[] = "0123456789abcdef";
  std::string out(mem.size * 2, '0');
  for (int i = 0; i < mem.size; i++) {
    out[2 * i] = digits[mem[i] >> 4];
    out[2 * i + 1] = digits[mem[i] & 0x0f];
  }
  return out;
}

std::ostream& operator<<(std::ostream& os, mem_t mem) { return os << to_hex(mem); }

buf_t::buf_t(int size) { resize(size); }

buf_t::buf_t(mem_t src) { assign(src); }

buf_t::buf_t(const buf_t& src) { assign(src); }

buf_t::buf_t(buf_t&& src) noexcept(true) { steal(src); }

buf_t::~buf_t() { clear(); }

buf_t& buf_t::operator=(const buf_t& src) {
  if (this != &src) {
    clear();
    assign(src);
  }
  return *this;
}

buf_t& buf_t::operator=(buf_t&& src) noexcept(true) {
  if (this != &src) {
    clear();
    steal(src);
  }
  return *this;
}

buf_t& buf_t::operator+=(mem_t src) {
  int old_size = s;
  resize(old_size + src.size);
  if (src.size) memmove(data() + old_size, src.data, src.size);
  return *this;
}

void buf_t::clear() {
  secure_bzero(data(), s);
  delete[] heap;
  heap = nullptr;
  s = 0;
}

void buf_t::resize(int size) {
  zkguest_assert(size >= 0);
  if (size <= s) {
    secure_bzero(data() + size, s - size);
    s = size;
    return;
  }
  if (!heap && size <= inline_size) {
    s = size;
    return;  // the tail of local is already zero
  }

  byte_ptr grown = new byte_t[size]();
  if (s) memmove(grown, data(), s);
  clear();
  heap = grown;
  s = size;
}

void buf_t::assign(mem_t src) {
  resize(src.size);
  if (src.size) memmove(data(), src.data, src.size);
}

void buf_t::steal(buf_t& src) {
  if (src.heap) {
    heap = src.heap;
    s = src.s;
    src.heap = nullptr;
    src.s = 0;
    return;
  }
  assign(src);
  src.clear();
}

}  // namespace zkguest
