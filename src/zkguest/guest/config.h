#pragma once

#include <zkguest/sol/codec.h>

namespace zkguest::guest {

struct guest_config_t {
  sol::uint256_t expected = sol::uint256_t::zero();
  sol::decode_mode_e decode_mode = sol::decode_mode_e::strict;
  bool log_faults = false;  // faults are silent unless set; see predicate_guest_t
};

// Decimal value compiled in through ZKGUEST_PREDEFINED_VALUE.
const char* predefined_value_string();

// Expected value taken from the build, strict decoding, silent faults.
guest_config_t default_config();

}  // namespace zkguest::guest
