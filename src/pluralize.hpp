#ifndef KEYREG_PLURALIZE_HPP
#define KEYREG_PLURALIZE_HPP

#include <string>
#include <string_view>

namespace keyreg {

// English plural of an attribute name, by the following rules, in order:
//
//   - a word already ending in "s" is returned unchanged,
//   - consonant + "y" becomes consonant + "ies",
//   - a word ending in "sh", "ch", "x" or "z" gets "es" appended,
//   - anything else gets "s" appended.
std::string
pluralize(std::string_view word);

} // namespace keyreg

#endif
