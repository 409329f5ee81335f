#include "key_type.hpp"

namespace keyreg {

char const*
key_type_name(key_type t) {
  return key_type_enum{t}.name();
}

key_type
key_type_from_name(std::string_view name) {
  return key_type_enum::from_name<schema_error>(name, "key type").value();
}

} // namespace keyreg
