#ifndef KEYREG_UTIL_SYMBOLIC_ENUM_HPP
#define KEYREG_UTIL_SYMBOLIC_ENUM_HPP

#include "error.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cassert>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <tuple>
#include <vector>

namespace keyreg {

// E provides a values enum and a constexpr mapping array of
// (name, enumerator) tuples.
template <typename E>
class symbolic_enum {
  using values = typename E::values;

public:
  explicit
  symbolic_enum(values v) : value_{v} { }

  static std::optional<symbolic_enum>
  find(std::string_view name) {
    for (auto [n, value] : E::mapping)
      if (name == n)
        return symbolic_enum{value};

    return std::nullopt;
  }

  // what names the kind of value in the error message.
  template <typename Error = parse_error>
  static symbolic_enum
  from_name(std::string_view name, std::string_view what = "value") {
    if (auto result = find(name))
      return *result;

    throw make_error<Error>("Unknown {} '{}', expected one of {}",
                            what, name, fmt::join(names(), ", "));
  }

  static std::vector<char const*>
  names() {
    std::vector<char const*> result;
    for (auto [n, value] : E::mapping)
      result.push_back(n);
    return result;
  }

  values
  value() const { return value_; }

  char const*
  name() const {
    for (auto [n, v] : E::mapping)
      if (value_ == v)
        return n;

    assert(false);
    throw std::logic_error{"Invalid enumerator"};
  }

private:
  values value_;
};

} // namespace keyreg

#endif
