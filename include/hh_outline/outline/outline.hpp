// hh_outline/outline/outline.hpp - Outline entries (Def) and their labels
//
// A Def summarizes one declaration: its kind, name, anchor position, full
// span and modifiers. Container kinds (class, interface, trait, enum) carry
// their members as children; every other kind is a leaf.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "hh_outline/basic/pos.hpp"

namespace hh_outline
{

enum class DefKind : uint8_t {
  Function,
  Class,
  Method,
  Property,
  Const,
  Enum,
  Interface,
  Trait,
  Typeconst,
};

enum class Modifier : uint8_t {
  Final,
  Static,
  Abstract,
  Private,
  Public,
  Protected,
  Async,
};

[[nodiscard]] constexpr std::string_view to_string(DefKind kind) noexcept
{
  switch (kind) {
    case DefKind::Function:
      return "function";
    case DefKind::Class:
      return "class";
    case DefKind::Method:
      return "method";
    case DefKind::Property:
      return "property";
    case DefKind::Const:
      return "const";
    case DefKind::Enum:
      return "enum";
    case DefKind::Interface:
      return "interface";
    case DefKind::Trait:
      return "trait";
    case DefKind::Typeconst:
      return "typeconst";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Modifier modifier) noexcept
{
  switch (modifier) {
    case Modifier::Final:
      return "final";
    case Modifier::Static:
      return "static";
    case Modifier::Abstract:
      return "abstract";
    case Modifier::Private:
      return "private";
    case Modifier::Public:
      return "public";
    case Modifier::Protected:
      return "protected";
    case Modifier::Async:
      return "async";
  }
  return "";
}

/// Kinds whose Def may have children.
[[nodiscard]] constexpr bool is_container(DefKind kind) noexcept
{
  return kind == DefKind::Class || kind == DefKind::Interface || kind == DefKind::Trait ||
         kind == DefKind::Enum;
}

/**
 * One outline entry.
 *
 * `pos` is the declared name; `span` covers the whole declaration and always
 * contains `pos`. `modifiers` keep source order and may repeat.
 */
struct Def
{
  DefKind kind = DefKind::Function;
  std::string name;
  AbsolutePos pos;
  AbsolutePos span;
  std::vector<Modifier> modifiers;
  std::vector<Def> children;

  [[nodiscard]] bool has_modifier(Modifier m) const noexcept
  {
    for (const Modifier x : modifiers) {
      if (x == m) return true;
    }
    return false;
  }
};

/// Top-level Defs of one file, in declaration order.
using Outline = std::vector<Def>;

}  // namespace hh_outline
