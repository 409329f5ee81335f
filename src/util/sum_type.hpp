#ifndef KEYREG_UTIL_SUM_TYPE_HPP
#define KEYREG_UTIL_SUM_TYPE_HPP

#include "error.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace keyreg {

// Specialised for every type that may appear in a sum_type; value is the name
// used in error messages.
template <typename>
struct type_name_of;

template <typename... Ts>
class sum_type {
public:
  template <typename U>
  requires (!std::is_same_v<std::remove_cvref_t<U>, sum_type<Ts...>>)
           && std::is_constructible_v<std::variant<Ts...>, U&&>
  sum_type(U&& x)
    : value_{std::forward<U>(x)}
  { }

  std::variant<Ts...> const&
  get() const { return value_; }

  bool
  operator == (sum_type<Ts...> const&) const = default;

private:
  std::variant<Ts...> value_;
};

template <typename... Ts>
char const*
held_type_name(sum_type<Ts...> const& s) {
  return std::visit(
    [] <typename U> (U const&) { return type_name_of<U>::value; },
    s.get()
  );
}

template <typename T, typename... Ts>
bool
is(sum_type<Ts...> const& s) {
  return std::holds_alternative<T>(s.get());
}

template <typename T, typename... Ts>
T const&
expect(sum_type<Ts...> const& s) {
  if (auto x = std::get_if<T>(&s.get()))
    return *x;
  else
    throw make_error<type_error>("Invalid type: expected {}, got {}",
                                 type_name_of<T>::value,
                                 held_type_name(s));
}

template <typename T, typename... Ts>
T const*
match(sum_type<Ts...> const& s) {
  return std::get_if<T>(&s.get());
}

template <typename Visitor, typename... Ts>
decltype(auto)
visit(Visitor&& v, sum_type<Ts...> const& s) {
  return std::visit(std::forward<Visitor>(v), s.get());
}

} // namespace keyreg

#endif
