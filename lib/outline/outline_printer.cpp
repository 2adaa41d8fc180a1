#include "hh_outline/outline/outline_printer.hpp"

#include <fmt/ostream.h>
#include <string>

namespace hh_outline
{
namespace
{

void print_def(std::ostream & os, const Def & def, const std::string & indent)
{
  fmt::print(os, "{}{}\n", indent, def.name);
  fmt::print(os, "{}  kind: {}\n", indent, to_string(def.kind));
  fmt::print(os, "{}  position: {}\n", indent, pos_to_string(def.pos));
  fmt::print(os, "{}  span: {}\n", indent, pos_to_multiline_string(def.span));
  fmt::print(os, "{}  modifiers: ", indent);
  for (const Modifier m : def.modifiers) {
    fmt::print(os, "{} ", to_string(m));
  }
  fmt::print(os, "\n\n");

  const std::string child_indent = indent + "  ";
  for (const Def & child : def.children) {
    print_def(os, child, child_indent);
  }
}

}  // namespace

void print(std::ostream & os, const Outline & outline)
{
  for (const Def & def : outline) {
    print_def(os, def, "");
  }
}

}  // namespace hh_outline
