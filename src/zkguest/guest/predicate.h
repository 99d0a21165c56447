#pragma once

#include <zkguest/sol/uint256.h>

namespace zkguest::guest {

// Pure boolean check over the decoded input. Implementations must not have side effects.
class predicate_t {
 public:
  virtual ~predicate_t() {}
  virtual bool eval(const sol::uint256_t& value) const = 0;
};

class equals_predicate_t : public predicate_t {
 public:
  explicit equals_predicate_t(const sol::uint256_t& _expected) : expected(_expected) {}

  bool eval(const sol::uint256_t& value) const override;
  const sol::uint256_t& get_expected() const { return expected; }

 private:
  sol::uint256_t expected;
};

}  // namespace zkguest::guest
