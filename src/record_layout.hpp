#ifndef KEYREG_RECORD_LAYOUT_HPP
#define KEYREG_RECORD_LAYOUT_HPP

#include "error.hpp"
#include "key_schema.hpp"
#include "pluralize.hpp"
#include "value.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace keyreg {

template <typename T>
struct attribute {
  std::string                              name;
  key_type                                 type;
  std::function<attribute_value(T const&)> get;
};

// Named attributes of record type T, in declaration order, together with
// the projections (column names) derived from them.
template <typename T>
class record_layout {
public:
  explicit
  record_layout(std::string type_name)
    : type_name_{std::move(type_name)}
  { }

  std::string const&
  type_name() const { return type_name_; }

  std::vector<attribute<T>> const&
  attributes() const { return attributes_; }

  std::optional<std::size_t>
  find_attribute(std::string_view name) const {
    for (std::size_t i = 0; i < attributes_.size(); ++i)
      if (attributes_[i].name == name)
        return i;
    return std::nullopt;
  }

  attribute<T> const*
  find_projection(std::string_view name) const {
    for (auto const& [projection, index] : projections_)
      if (projection == name)
        return &attributes_[index];
    return nullptr;
  }

  std::vector<std::string>
  projection_names() const {
    std::vector<std::string> result;
    result.reserve(projections_.size());
    for (auto const& [projection, index] : projections_)
      result.push_back(projection);
    return result;
  }

  void
  add_attribute(std::string name, key_type type,
                std::function<attribute_value(T const&)> get) {
    if (!is_valid_identifier(name))
      throw make_error<schema_error>("Invalid attribute name '{}' for {}",
                                     name, type_name_);
    if (find_attribute(name))
      throw make_error<schema_error>("Attribute '{}' declared twice for {}",
                                     name, type_name_);

    attributes_.push_back({std::move(name), type, std::move(get)});
    add_projection(pluralize(attributes_.back().name), attributes_.size() - 1);
  }

  std::string
  describe(T const& record) const {
    std::vector<std::string> fields;
    fields.reserve(attributes_.size());
    for (attribute<T> const& attr : attributes_)
      fields.push_back(fmt::format("{}: {}", attr.name, attr.get(record)));
    return fmt::format("{}{{{}}}", type_name_, fmt::join(fields, ", "));
  }

private:
  std::string                                         type_name_;
  std::vector<attribute<T>>                           attributes_;
  std::vector<std::tuple<std::string, std::size_t>>   projections_;

  // Distinct attribute names can share a plural, e.g. "bu" and "bus".
  void
  add_projection(std::string projection, std::size_t index) {
    for (auto const& [existing, existing_index] : projections_)
      if (existing == projection)
        throw make_error<schema_error>(
          "Projection '{}' of {} refers to both '{}' and '{}'",
          projection, type_name_,
          attributes_[existing_index].name, attributes_[index].name
        );

    projections_.emplace_back(std::move(projection), index);
  }
};

// Builds a record_layout by listing the attributes of T:
//
//   record_layout<person> layout = define_record<person>("person")
//     .field<&person::name>("name")
//     .field<&person::age>("age")
//     ;
template <typename T>
class record_definer {
public:
  explicit
  record_definer(std::string type_name)
    : layout_{std::move(type_name)}
  { }

  template <auto Member>
  requires std::is_member_object_pointer_v<decltype(Member)>
  record_definer&
  field(std::string name) {
    using value_type = std::remove_cv_t<member_type_t<decltype(Member)>>;
    layout_.add_attribute(std::move(name), attribute_type_of<value_type>(),
                          &object_getter<Member>);
    return *this;
  }

  template <auto Getter>
  requires std::is_member_function_pointer_v<decltype(Getter)>
  record_definer&
  field(std::string name) {
    using value_type
      = std::remove_cvref_t<std::invoke_result_t<decltype(Getter), T const&>>;
    layout_.add_attribute(std::move(name), attribute_type_of<value_type>(),
                          &function_getter<Getter>);
    return *this;
  }

  record_layout<T> const&
  layout() const { return layout_; }

  operator record_layout<T> () const { return layout_; }

private:
  template <typename>
  struct member_type;

  template <typename U>
  struct member_type<U T::*> {
    using type = U;
  };

  template <typename U>
  using member_type_t = typename member_type<U>::type;

  record_layout<T> layout_;

  template <auto Member>
  static attribute_value
  object_getter(T const& x) {
    return make_attribute_value(x.*Member);
  }

  template <auto Getter>
  static attribute_value
  function_getter(T const& x) {
    return make_attribute_value(std::invoke(Getter, x));
  }
};

template <typename T>
record_definer<T>
define_record(std::string type_name) {
  return record_definer<T>{std::move(type_name)};
}

} // namespace keyreg

#endif
