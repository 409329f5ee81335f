#ifndef KEYREG_KEY_SCHEMA_HPP
#define KEYREG_KEY_SCHEMA_HPP

#include "key_type.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace keyreg {

// Binds a projection name to a record attribute and the type of key values
// that are resolved through it.
struct key_declaration {
  std::string projection_name;
  std::string source_attribute;
  key_type    match_type;

  bool
  operator == (key_declaration const&) const = default;
};

// ASCII letters, digits and underscores, not starting with a digit. Non-ASCII
// letters are not accepted.
bool
is_valid_identifier(std::string_view);

// Ordered, validated list of key declarations. At most one declaration may
// exist per key type, except for key_type::identifier.
class key_schema {
public:
  using const_iterator = std::vector<key_declaration>::const_iterator;

  key_schema() = default;

  explicit
  key_schema(std::vector<key_declaration>);

  key_schema(std::initializer_list<key_declaration> declarations)
    : key_schema(std::vector<key_declaration>(declarations))
  { }

  std::vector<key_declaration> const&
  declarations() const { return declarations_; }

  std::size_t
  size() const { return declarations_.size(); }

  bool
  empty() const { return declarations_.empty(); }

  const_iterator
  begin() const { return declarations_.begin(); }

  const_iterator
  end() const { return declarations_.end(); }

  // First declaration in schema order matching the given type, or null.
  key_declaration const*
  find_for(key_type) const;

  std::vector<std::string>
  projection_names() const;

private:
  std::vector<key_declaration> declarations_;
};

// Parses "projection:attribute:type", e.g. "names:name:string".
key_declaration
parse_key_declaration(std::string_view);

// Parses a comma-separated list of declarations. Blank text gives an empty
// schema.
key_schema
parse_key_schema(std::string_view);

} // namespace keyreg

template <>
struct fmt::formatter<keyreg::key_schema> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(keyreg::key_schema const& schema, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
      fmt::format("[{}]", fmt::join(schema.projection_names(), ", ")),
      ctx
    );
  }
};

#endif
