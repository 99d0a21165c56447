#include "error.h"

static thread_local int log_disabled_depth = 0;

namespace zkguest {

error_sink_f error_sink = nullptr;
bool test_error_storing_mode = false;
std::string g_test_log_str;

static void emit(const std::string& line) {
  if (error_sink) {
    error_sink(line.c_str());
    return;
  }
  std::cerr << line << '\n';
}

error_t error(error_t rv, const std::string& text) {
  if (log_disabled_depth) return rv;
  if (test_error_storing_mode) g_test_log_str += "; " + text;

  char code[16];
  snprintf(code, sizeof(code), "0x%08x", uint32_t(rv));
  std::string line = std::string("Error ") + code;
  if (!text.empty()) line += ": " + text;
  emit(line);
  return rv;
}

error_t error(error_t rv) { return error(rv, ""); }

error_t openssl_error(const std::string& text) {
  unsigned long err = ERR_get_error();
  char reason[256] = "";
  ERR_error_string_n(err, reason, sizeof(reason));
  return error(E_OPENSSL, text + " (" + reason + ")");
}

dylog_disable_scope_t::dylog_disable_scope_t(bool enabled) : saved_depth(log_disabled_depth) {
  if (!enabled) log_disabled_depth++;
}

dylog_disable_scope_t::~dylog_disable_scope_t() { log_disabled_depth = saved_depth; }

bool is_log_disabled() { return log_disabled_depth != 0; }

void assert_failed(const char* expr, const char* file, int line) {
  if (!log_disabled_depth) {
    // report the path from "src/" on
    const char* relative = strstr(file, "src/");
    emit(std::string("[ASSERTION FAILED] ") + expr + " (" + (relative ? relative : file) + ":" +
         std::to_string(line) + ")");
  }
  throw assertion_failed_t(expr);
}

}  // namespace zkguest
