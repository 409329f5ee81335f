#include "pluralize.hpp"

#include <cctype>

namespace keyreg {

static bool
is_vowel(char c) {
  switch (std::tolower(static_cast<unsigned char>(c))) {
  case 'a':
  case 'e':
  case 'i':
  case 'o':
  case 'u':
    return true;
  default:
    return false;
  }
}

std::string
pluralize(std::string_view word) {
  std::string result{word};

  if (word.ends_with('s'))
    return result;
  else if (word.ends_with('y') && word.size() > 1
           && !is_vowel(word[word.size() - 2])) {
    result.pop_back();
    result += "ies";
  } else if (word.ends_with("sh") || word.ends_with("ch")
             || word.ends_with('x') || word.ends_with('z'))
    result += "es";
  else
    result += 's';

  return result;
}

} // namespace keyreg
