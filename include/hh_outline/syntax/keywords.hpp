// hh_outline/syntax/keywords.hpp - Reserved words the parser dispatches on
//
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace hh_outline::syntax
{

/// Words that begin a top-level declaration. Used as recovery points.
inline constexpr std::array<std::string_view, 13> k_declaration_keywords = {
  "function", "class",   "interface", "trait",     "enum", "abstract", "final",
  "type",     "newtype", "namespace", "use",       "async", "const",
};

/// Modifiers accepted in front of class members.
inline constexpr std::array<std::string_view, 6> k_member_modifiers = {
  "public", "private", "protected", "static", "abstract", "final",
};

[[nodiscard]] inline bool is_declaration_keyword(std::string_view word) noexcept
{
  return std::find(k_declaration_keywords.begin(), k_declaration_keywords.end(), word) !=
         k_declaration_keywords.end();
}

[[nodiscard]] inline bool is_member_modifier(std::string_view word) noexcept
{
  return std::find(k_member_modifiers.begin(), k_member_modifiers.end(), word) !=
         k_member_modifiers.end();
}

}  // namespace hh_outline::syntax
