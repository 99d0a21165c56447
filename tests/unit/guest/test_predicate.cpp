#include <gtest/gtest.h>

#include <cxxabi.h>  // declares a global namespace abi next to zkguest::sol

#include <zkguest/guest/config.h>
#include <zkguest/guest/predicate.h>

namespace {

using namespace zkguest;
using namespace zkguest::guest;
using zkguest::sol::uint256_t;

TEST(GuestPredicate, EqualsMatchesOnlyExpected) {
  equals_predicate_t predicate(uint256_t::make(12345));
  EXPECT_TRUE(predicate.eval(uint256_t::make(12345)));
  EXPECT_FALSE(predicate.eval(uint256_t::make(12344)));
  EXPECT_FALSE(predicate.eval(uint256_t::zero()));
  EXPECT_FALSE(predicate.eval(uint256_t::make(12345, 0, 0, 1)));
}

TEST(GuestPredicate, EqualsWithArbitraryExpected) {
  uint256_t big = uint256_t::make(~0ull, 7, 0, 0x8000000000000000ull);
  equals_predicate_t predicate(big);
  EXPECT_TRUE(predicate.eval(big));
  EXPECT_EQ(predicate.get_expected(), big);
}

TEST(GuestConfig, DefaultConfig) {
  guest_config_t config = default_config();

  uint256_t expected;
  ASSERT_EQ(uint256_t::from_string(predefined_value_string(), expected), 0);
  EXPECT_EQ(config.expected, expected);
  EXPECT_EQ(config.decode_mode, sol::decode_mode_e::strict);
  EXPECT_FALSE(config.log_faults);
}

}  // namespace
