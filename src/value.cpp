#include "value.hpp"

namespace keyreg {

namespace {
  struct type_visitor {
    key_type
    operator () (std::string const&) const { return key_type::string; }

    key_type
    operator () (std::int64_t) const { return key_type::integer; }

    key_type
    operator () (double) const { return key_type::real; }

    key_type
    operator () (bool) const { return key_type::boolean; }

    key_type
    operator () (identifier const&) const { return key_type::identifier; }
  };

  struct string_visitor {
    std::string
    operator () (position p) const { return fmt::format("#{}", p.index); }

    std::string
    operator () (std::string const& s) const { return s; }

    std::string
    operator () (std::int64_t i) const { return fmt::format("{}", i); }

    std::string
    operator () (double d) const { return fmt::format("{}", d); }

    std::string
    operator () (bool b) const { return b ? "true" : "false"; }

    std::string
    operator () (identifier const& id) const { return id.to_string(); }
  };
}

key_type
type_of(attribute_value const& v) {
  return keyreg::visit(type_visitor{}, v);
}

std::optional<key_type>
key_type_of(key const& k) {
  return keyreg::visit(
    [] <typename T> (T const& x) -> std::optional<key_type> {
      if constexpr (std::is_same_v<T, position>)
        return std::nullopt;
      else
        return type_visitor{}(x);
    },
    k
  );
}

std::optional<attribute_value>
key_value(key const& k) {
  return keyreg::visit(
    [] <typename T> (T const& x) -> std::optional<attribute_value> {
      if constexpr (std::is_same_v<T, position>)
        return std::nullopt;
      else
        return attribute_value{x};
    },
    k
  );
}

std::string
to_string(attribute_value const& v) {
  return keyreg::visit(string_visitor{}, v);
}

std::string
to_string(key const& k) {
  return keyreg::visit(string_visitor{}, k);
}

duplicate_key_error::duplicate_key_error(std::string projection_name,
                                         attribute_value value)
  : error{fmt::format("Duplicate value for key '{}': {}",
                      projection_name, to_string(value))}
  , projection_name_{std::move(projection_name)}
  , value_{std::move(value)}
{ }

ambiguous_key_error::ambiguous_key_error(key value,
                                         std::string const& projection_name)
  : error{fmt::format("Ambiguous key value {} for key '{}'; multiple records "
                      "found",
                      to_string(value), projection_name)}
  , value_{std::move(value)}
{ }

key_not_found::key_not_found(key value)
  : error{fmt::format("Key {} not found", to_string(value))}
  , value_{std::move(value)}
{ }

} // namespace keyreg
