#ifndef KEYREG_VALUE_HPP
#define KEYREG_VALUE_HPP

#include "error.hpp"
#include "identifier.hpp"
#include "key_type.hpp"
#include "util/sum_type.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace keyreg {

// Positional key. Never matched against integer attribute values.
struct position {
  std::int64_t index;

  bool
  operator == (position const&) const = default;
};

template <>
struct type_name_of<position> {
  static constexpr char const* value = "position";
};

template <>
struct type_name_of<std::string> {
  static constexpr char const* value = "string";
};

template <>
struct type_name_of<std::int64_t> {
  static constexpr char const* value = "integer";
};

template <>
struct type_name_of<double> {
  static constexpr char const* value = "real";
};

template <>
struct type_name_of<bool> {
  static constexpr char const* value = "boolean";
};

template <>
struct type_name_of<identifier> {
  static constexpr char const* value = "identifier";
};

// Value of one record attribute.
using attribute_value
  = sum_type<std::string, std::int64_t, double, bool, identifier>;

// Anything a record can be looked up by.
using key
  = sum_type<position, std::string, std::int64_t, double, bool, identifier>;

key_type
type_of(attribute_value const&);

// Empty for positions.
std::optional<key_type>
key_type_of(key const&);

std::optional<attribute_value>
key_value(key const&);

std::string
to_string(attribute_value const&);

std::string
to_string(key const&);

template <typename U>
constexpr key_type
attribute_type_of() {
  if constexpr (std::is_same_v<U, bool>)
    return key_type::boolean;
  else if constexpr (std::is_integral_v<U>)
    return key_type::integer;
  else if constexpr (std::is_floating_point_v<U>)
    return key_type::real;
  else if constexpr (std::is_same_v<U, identifier>)
    return key_type::identifier;
  else {
    static_assert(std::is_constructible_v<std::string, U const&>,
                  "Unsupported attribute type");
    return key_type::string;
  }
}

template <typename U>
attribute_value
make_attribute_value(U const& x) {
  if constexpr (std::is_same_v<U, bool>)
    return x;
  else if constexpr (std::is_integral_v<U>) {
    if constexpr (std::is_unsigned_v<U> && sizeof(U) >= sizeof(std::int64_t))
      if (x > static_cast<U>(std::numeric_limits<std::int64_t>::max()))
        throw make_error<type_error>("Value {} does not fit an integer attribute",
                                     x);
    return static_cast<std::int64_t>(x);
  } else if constexpr (std::is_floating_point_v<U>)
    return static_cast<double>(x);
  else if constexpr (std::is_same_v<U, identifier>)
    return x;
  else
    return std::string(x);
}

class duplicate_key_error : public error {
public:
  duplicate_key_error(std::string projection_name, attribute_value value);

  std::string const&
  projection_name() const { return projection_name_; }

  attribute_value const&
  value() const { return value_; }

private:
  std::string     projection_name_;
  attribute_value value_;
};

class ambiguous_key_error : public error {
public:
  ambiguous_key_error(key value, std::string const& projection_name);

  key const&
  value() const { return value_; }

private:
  key value_;
};

class key_not_found : public error {
public:
  explicit
  key_not_found(key value);

  key const&
  value() const { return value_; }

private:
  key value_;
};

} // namespace keyreg

template <>
struct fmt::formatter<keyreg::attribute_value>
  : fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto
  format(keyreg::attribute_value const& v, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(keyreg::to_string(v), ctx);
  }
};

template <>
struct fmt::formatter<keyreg::key> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(keyreg::key const& k, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(keyreg::to_string(k), ctx);
  }
};

#endif
