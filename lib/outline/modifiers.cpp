#include "hh_outline/outline/modifiers.hpp"

#include <stdexcept>
#include <string>

namespace hh_outline
{

Modifier to_modifier(ModifierKeyword kw)
{
  switch (kw) {
    case ModifierKeyword::Final:
      return Modifier::Final;
    case ModifierKeyword::Static:
      return Modifier::Static;
    case ModifierKeyword::Abstract:
      return Modifier::Abstract;
    case ModifierKeyword::Private:
      return Modifier::Private;
    case ModifierKeyword::Public:
      return Modifier::Public;
    case ModifierKeyword::Protected:
      return Modifier::Protected;
  }
  throw std::invalid_argument(
    "invalid modifier keyword: " + std::to_string(static_cast<int>(kw)));
}

std::vector<Modifier> normalize_modifiers(gsl::span<const ModifierKeyword> keywords)
{
  std::vector<Modifier> out;
  out.reserve(keywords.size());
  for (const ModifierKeyword kw : keywords) {
    out.push_back(to_modifier(kw));
  }
  return out;
}

std::vector<Modifier> fun_kind_modifiers(FunKind kind)
{
  if (is_async(kind)) {
    return {Modifier::Async};
  }
  return {};
}

}  // namespace hh_outline
