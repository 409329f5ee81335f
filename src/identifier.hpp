#ifndef KEYREG_IDENTIFIER_HPP
#define KEYREG_IDENTIFIER_HPP

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace keyreg {

// 128-bit globally unique value, printed in the canonical 8-4-4-4-12 form.
class identifier {
public:
  constexpr
  identifier() = default;

  constexpr
  identifier(std::uint64_t high, std::uint64_t low)
    : high_{high}
    , low_{low}
  { }

  // Random version 4 identifier.
  static identifier
  generate();

  static identifier
  parse(std::string_view text);

  std::uint64_t
  high() const { return high_; }

  std::uint64_t
  low() const { return low_; }

  bool
  is_nil() const { return high_ == 0 && low_ == 0; }

  std::string
  to_string() const;

  auto
  operator <=> (identifier const&) const = default;

private:
  std::uint64_t high_ = 0;
  std::uint64_t low_  = 0;
};

} // namespace keyreg

template <>
struct fmt::formatter<keyreg::identifier> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(keyreg::identifier const& id, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(id.to_string(), ctx);
  }
};

#endif
