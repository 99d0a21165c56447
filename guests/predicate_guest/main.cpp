#include <zkguest/guest/predicate_guest.h>

// Input on stdin, journal on stdout. Any failure aborts the process.
int main() {
  zkguest::guest::guest_config_t config = zkguest::guest::default_config();
  return zkguest::guest::guest_main(config, STDIN_FILENO, STDOUT_FILENO);
}
