#ifndef KEYREG_ERROR_HPP
#define KEYREG_ERROR_HPP

#include "util/named_runtime_error.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace keyreg {

template <typename Error = error, typename... Args>
Error
make_error(std::string_view fmt, Args&&... args) {
  return Error{fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...)};
}

// Invalid key declaration, record layout or textual configuration.
using schema_error = named_runtime_error<class schema_error_tag>;

// A tagged union was asked for an alternative it does not hold, or a value
// does not fit the attribute type it is stored as.
using type_error = named_runtime_error<class type_error_tag>;

// Malformed text given to one of the parse functions.
using parse_error = named_runtime_error<class parse_error_tag>;

class index_out_of_range : public error {
public:
  index_out_of_range(std::int64_t index, std::size_t size);

  std::int64_t
  index() const { return index_; }

  std::size_t
  size() const { return size_; }

private:
  std::int64_t index_;
  std::size_t  size_;
};

class count_mismatch_error : public error {
public:
  count_mismatch_error(std::size_t keys, std::size_t values);

  std::size_t
  key_count() const { return keys_; }

  std::size_t
  value_count() const { return values_; }

private:
  std::size_t keys_;
  std::size_t values_;
};

class attribute_not_found : public error {
public:
  attribute_not_found(std::string name, std::string const& type_name);

  std::string const&
  name() const { return name_; }

private:
  std::string name_;
};

} // namespace keyreg

#endif
