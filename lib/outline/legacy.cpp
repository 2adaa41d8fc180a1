#include "hh_outline/outline/legacy.hpp"

#include <utility>

#include "hh_outline/outline/outline_builder.hpp"

namespace hh_outline
{
namespace
{

void flatten(const Def & def, const std::string & prefix, std::vector<LegacyEntry> & out)
{
  switch (def.kind) {
    case DefKind::Function:
      out.push_back({def.pos, def.name, LegacyKind::Function});
      return;

    case DefKind::Class:
    case DefKind::Enum:
    case DefKind::Interface:
    case DefKind::Trait: {
      out.push_back({def.pos, def.name, LegacyKind::Class});
      const std::string child_prefix = prefix + def.name + "::";
      for (const Def & child : def.children) {
        flatten(child, child_prefix, out);
      }
      return;
    }

    case DefKind::Method:
      out.push_back(
        {def.pos, prefix + def.name,
         def.has_modifier(Modifier::Static) ? LegacyKind::StaticMethod : LegacyKind::Method});
      return;

    case DefKind::Property:
    case DefKind::Const:
    case DefKind::Typeconst:
      return;
  }
}

}  // namespace

std::vector<LegacyEntry> to_legacy(const Outline & outline)
{
  std::vector<LegacyEntry> out;
  for (const Def & def : outline) {
    flatten(def, "", out);
  }
  return out;
}

std::vector<LegacyEntry> outline_legacy(std::string content, std::filesystem::path path)
{
  return to_legacy(outline(std::move(content), std::move(path)));
}

}  // namespace hh_outline
