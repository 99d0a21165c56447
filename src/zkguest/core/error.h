#pragma once
#include <zkguest/core/precompiled.h>

typedef int error_t;

// 0xff in the top byte marks an error, the category sits in bits 16..23.
#define ERRCODE(category, code) (0xff000000 | (uint32_t(category) << 16) | uint32_t(code))
#define ECATEGORY(code) (((code) >> 16) & 0x00ff)

// clang-format off
enum {
  ECATEGORY_GENERIC = 0x01,
  ECATEGORY_CHANNEL = 0x03,
  ECATEGORY_OPENSSL = 0x06,
  ECATEGORY_GUEST   = 0x08,
};

enum {
  SUCCESS             = 0,
  UNINITIALIZED_ERROR = ERRCODE(ECATEGORY_GENERIC, 0x0000),  // initial value of rv, never returned
  E_FORMAT            = ERRCODE(ECATEGORY_GENERIC, 0x0003),
  E_RANGE             = ERRCODE(ECATEGORY_GENERIC, 0x0012),

  E_CHANNEL_READ      = ERRCODE(ECATEGORY_CHANNEL, 0x0001),
  E_CHANNEL_WRITE     = ERRCODE(ECATEGORY_CHANNEL, 0x0002),
  E_CHANNEL_CLOSED    = ERRCODE(ECATEGORY_CHANNEL, 0x0003),

  E_OPENSSL           = ERRCODE(ECATEGORY_OPENSSL, 0x0001),

  E_GUEST_DECODE      = ERRCODE(ECATEGORY_GUEST, 0x0001),
  E_GUEST_PREDICATE   = ERRCODE(ECATEGORY_GUEST, 0x0002),
};
// clang-format on

namespace zkguest {

/**
 * Writes "Error <code>: <text>" to the error sink and returns rv unchanged, so a failing step
 * reads `return error(E_FORMAT, "...");`.
 *
 * @notes:
 * - Nothing is written while a dylog_disable_scope_t is active on the calling thread.
 */
error_t error(error_t rv, const std::string& text);
error_t error(error_t rv);

// Reports the oldest queued OpenSSL error as E_OPENSSL.
error_t openssl_error(const std::string& text);

// Receives each error line. stderr when not set.
typedef void (*error_sink_f)(const char* line);
extern error_sink_f error_sink;

// Test hook: while set, error texts are also appended to g_test_log_str.
extern bool test_error_storing_mode;
extern std::string g_test_log_str;

inline void set_test_error_storing_mode(bool enabled) {
  test_error_storing_mode = enabled;
  g_test_log_str = "test error log";
}

// Silences error() on this thread for the scope's lifetime unless constructed with enabled=true.
class dylog_disable_scope_t {
 public:
  explicit dylog_disable_scope_t(bool enabled = false);
  ~dylog_disable_scope_t();

 private:
  int saved_depth;
};

bool is_log_disabled();

class assertion_failed_t : public std::logic_error {
 public:
  explicit assertion_failed_t(const std::string& msg) : std::logic_error(msg) {}
};

[[noreturn]] void assert_failed(const char* expr, const char* file, int line);

}  // namespace zkguest

#define zkguest_assert(expr)                                                             \
  do {                                                                                   \
    if (__builtin_expect(!(expr), 0)) zkguest::assert_failed(#expr, __FILE__, __LINE__); \
  } while (0)
