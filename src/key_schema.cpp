#include "key_schema.hpp"

#include "error.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace keyreg {

static bool
is_identifier_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool
is_identifier_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool
is_valid_identifier(std::string_view name) {
  return !name.empty()
         && is_identifier_start(name.front())
         && std::ranges::all_of(name, is_identifier_char);
}

key_schema::key_schema(std::vector<key_declaration> declarations)
  : declarations_{std::move(declarations)}
{
  std::map<key_type, std::string> seen;
  for (key_declaration const& decl : declarations_) {
    if (!is_valid_identifier(decl.projection_name))
      throw make_error<schema_error>(
        "Invalid projection name '{}'; must be a valid non-numeric identifier",
        decl.projection_name
      );

    if (decl.match_type == key_type::identifier)
      continue;

    if (auto it = seen.find(decl.match_type); it != seen.end())
      throw make_error<schema_error>(
        "Duplicate key type {} used for '{}' and '{}'",
        decl.match_type, it->second, decl.projection_name
      );

    seen.emplace(decl.match_type, decl.projection_name);
  }
}

key_declaration const*
key_schema::find_for(key_type t) const {
  auto it = std::ranges::find(declarations_, t, &key_declaration::match_type);
  return it != declarations_.end() ? &*it : nullptr;
}

std::vector<std::string>
key_schema::projection_names() const {
  std::vector<std::string> result;
  result.reserve(declarations_.size());
  for (key_declaration const& decl : declarations_)
    result.push_back(decl.projection_name);
  return result;
}

static std::string_view
trim(std::string_view s) {
  auto is_space = [] (char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };

  while (!s.empty() && is_space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))
    s.remove_suffix(1);
  return s;
}

static std::vector<std::string_view>
split(std::string_view s, char sep) {
  std::vector<std::string_view> result;
  std::size_t start = 0;
  while (true) {
    std::size_t end = s.find(sep, start);
    if (end == std::string_view::npos) {
      result.push_back(trim(s.substr(start)));
      return result;
    }

    result.push_back(trim(s.substr(start, end - start)));
    start = end + 1;
  }
}

key_declaration
parse_key_declaration(std::string_view text) {
  std::vector<std::string_view> parts = split(text, ':');
  auto is_empty = [] (std::string_view part) { return part.empty(); };
  if (parts.size() != 3 || std::ranges::any_of(parts, is_empty))
    throw make_error<schema_error>(
      "Invalid key declaration '{}'; expected projection:attribute:type",
      trim(text)
    );

  return key_declaration{std::string{parts[0]},
                         std::string{parts[1]},
                         key_type_from_name(parts[2])};
}

key_schema
parse_key_schema(std::string_view text) {
  if (trim(text).empty())
    return {};

  std::vector<key_declaration> declarations;
  for (std::string_view item : split(text, ','))
    declarations.push_back(parse_key_declaration(item));
  return key_schema(std::move(declarations));
}

} // namespace keyreg
