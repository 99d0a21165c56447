#include "config.h"

#ifndef ZKGUEST_PREDEFINED_VALUE
#define ZKGUEST_PREDEFINED_VALUE "12345"
#endif

namespace zkguest::guest {

const char* predefined_value_string() { return ZKGUEST_PREDEFINED_VALUE; }

guest_config_t default_config() {
  guest_config_t config;
  error_t rv = sol::uint256_t::from_string(predefined_value_string(), config.expected);
  zkguest_assert(rv == SUCCESS && "ZKGUEST_PREDEFINED_VALUE must be a decimal uint256");
  return config;
}

}  // namespace zkguest::guest
