#pragma once
#include <zkguest/core/error.h>

typedef uint8_t byte_t;
typedef byte_t* byte_ptr;
typedef const byte_t* const_byte_ptr;

namespace zkguest {

void secure_bzero(byte_ptr ptr, int size);

// Big-endian 64-bit load/store, the byte order of ABI words.
uint64_t be_get_8(const_byte_ptr src);
void be_set_8(byte_ptr dst, uint64_t value);

// Borrowed byte range; the owner must outlive it.
struct mem_t {
  byte_ptr data = nullptr;
  int size = 0;

  mem_t() = default;
  mem_t(const_byte_ptr _data, int _size) : data(byte_ptr(_data)), size(_size) {}
  mem_t(const std::string& s) : data(byte_ptr(s.data())), size(int(s.size())) {}

  // String literals drop their terminating zero.
  template <size_t N>
  mem_t(const char (&s)[N]) : data(byte_ptr(s)), size(int(N) - (s[N - 1] == 0 ? 1 : 0)) {}

  uint8_t operator[](int index) const { return data[index]; }
  mem_t take(int n) const { return mem_t(data, n); }
  std::string to_string() const { return std::string(reinterpret_cast<const char*>(data), size); }
};

// Not constant-time.
bool operator==(mem_t a, mem_t b);
bool operator!=(mem_t a, mem_t b);

std::string to_hex(mem_t mem);
std::ostream& operator<<(std::ostream& os, mem_t mem);

/**
 * Owning byte buffer. One ABI word fits in the inline storage; anything longer goes to the heap.
 *
 * @notes:
 * - New bytes are zero. Released bytes are wiped.
 */
class buf_t {
 public:
  buf_t() noexcept(true) {}
  explicit buf_t(int size);
  buf_t(mem_t src);
  buf_t(const buf_t& src);
  buf_t(buf_t&& src) noexcept(true);
  ~buf_t();

  buf_t& operator=(const buf_t& src);
  buf_t& operator=(buf_t&& src) noexcept(true);
  buf_t& operator+=(mem_t src);

  byte_ptr data() const { return heap ? heap : byte_ptr(local); }
  int size() const { return s; }
  bool empty() const { return s == 0; }

  void resize(int size);
  void bzero() { memset(data(), 0, s); }
  void clear();

  operator mem_t() const { return mem_t(data(), s); }
  uint8_t operator[](int index) const { return data()[index]; }
  uint8_t& operator[](int index) { return data()[index]; }
  mem_t take(int n) const { return mem_t(data(), n); }
  std::string to_string() const { return mem_t(*this).to_string(); }

 private:
  enum { inline_size = 32 };

  byte_ptr heap = nullptr;
  int s = 0;
  byte_t local[inline_size] = {};

  void assign(mem_t src);
  void steal(buf_t& src);
};

buf_t operator+(mem_t a, mem_t b);

}  // namespace zkguest
