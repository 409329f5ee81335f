#ifndef KEYREG_KEY_TYPE_HPP
#define KEYREG_KEY_TYPE_HPP

#include "util/symbolic_enum.hpp"

#include <fmt/format.h>

#include <string_view>
#include <tuple>

namespace keyreg {

// Kinds of values a key declaration can match. Identifier keys may be
// declared more than once and are never checked for uniqueness.
enum class key_type {
  string, integer, real, boolean, identifier
};

struct key_type_symbolic_def {
  using values = key_type;
  static constexpr std::tuple<char const*, key_type> mapping[]{
    {"string", key_type::string},
    {"integer", key_type::integer},
    {"real", key_type::real},
    {"boolean", key_type::boolean},
    {"identifier", key_type::identifier}
  };
};

using key_type_enum = symbolic_enum<key_type_symbolic_def>;

char const*
key_type_name(key_type);

// Throws schema_error for an unknown name.
key_type
key_type_from_name(std::string_view name);

} // namespace keyreg

template <>
struct fmt::formatter<keyreg::key_type> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(keyreg::key_type t, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(keyreg::key_type_name(t),
                                                    ctx);
  }
};

#endif
