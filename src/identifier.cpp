#include "identifier.hpp"

#include "error.hpp"

#include <array>
#include <random>

namespace keyreg {

static std::mt19937_64&
random_engine() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

identifier
identifier::generate() {
  std::uint64_t high = random_engine()();
  std::uint64_t low = random_engine()();

  high = (high & ~std::uint64_t{0xF000}) | std::uint64_t{0x4000};
  low = (low & ~(std::uint64_t{0xC} << 60)) | (std::uint64_t{0x8} << 60);
  return {high, low};
}

static int
hex_digit_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  else if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  else if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  else
    return -1;
}

identifier
identifier::parse(std::string_view text) {
  constexpr std::array<std::size_t, 4> dashes{8, 13, 18, 23};

  if (text.size() != 36)
    throw make_error<parse_error>("Invalid identifier '{}': expected 36 "
                                  "characters, got {}",
                                  text, text.size());

  std::uint64_t high = 0;
  std::uint64_t low = 0;
  unsigned digits = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == dashes[0] || i == dashes[1] || i == dashes[2] || i == dashes[3]) {
      if (text[i] != '-')
        throw make_error<parse_error>("Invalid identifier '{}': expected '-' "
                                      "at position {}",
                                      text, i);
      continue;
    }

    int value = hex_digit_value(text[i]);
    if (value < 0)
      throw make_error<parse_error>("Invalid identifier '{}': '{}' is not a "
                                    "hexadecimal digit",
                                    text, text[i]);

    std::uint64_t& half = digits < 16 ? high : low;
    half = (half << 4) | static_cast<std::uint64_t>(value);
    ++digits;
  }

  return {high, low};
}

std::string
identifier::to_string() const {
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     high_ >> 32,
                     (high_ >> 16) & 0xFFFF,
                     high_ & 0xFFFF,
                     low_ >> 48,
                     low_ & 0xFFFF'FFFF'FFFF);
}

} // namespace keyreg
