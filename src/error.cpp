#include "error.hpp"

namespace keyreg {

index_out_of_range::index_out_of_range(std::int64_t index, std::size_t size)
  : error{fmt::format("Index {} out of range for {} records", index, size)}
  , index_{index}
  , size_{size}
{ }

count_mismatch_error::count_mismatch_error(std::size_t keys,
                                           std::size_t values)
  : error{fmt::format("Number of keys and values must match: got {} keys "
                      "and {} values",
                      keys, values)}
  , keys_{keys}
  , values_{values}
{ }

attribute_not_found::attribute_not_found(std::string name,
                                         std::string const& type_name)
  : error{fmt::format("Registry<{}> has no attribute '{}'", type_name, name)}
  , name_{std::move(name)}
{ }

} // namespace keyreg
