#include "predicate.h"

namespace zkguest::guest {

bool equals_predicate_t::eval(const sol::uint256_t& value) const { return value == expected; }

}  // namespace zkguest::guest
