#include "hh_outline/outline/outline_json.hpp"

#include <string>

namespace hh_outline
{

using nlohmann::json;

json to_json(const Def & def)
{
  json modifiers = json::array();
  for (const Modifier m : def.modifiers) {
    modifiers.push_back(std::string(to_string(m)));
  }

  return json{
    {"kind", std::string(to_string(def.kind))},
    {"name", def.name},
    {"position", pos_to_json(def.pos)},
    {"span", pos_to_multiline_json(def.span)},
    {"modifiers", std::move(modifiers)},
    {"children", to_json(def.children)},
  };
}

json to_json(const Outline & outline)
{
  json out = json::array();
  for (const Def & def : outline) {
    out.push_back(to_json(def));
  }
  return out;
}

json to_json_legacy(const std::vector<LegacyEntry> & entries)
{
  json out = json::array();
  for (const LegacyEntry & entry : entries) {
    const PosInfo info = info_pos(entry.pos);
    out.push_back(json{
      {"name", entry.name},
      {"type", std::string(to_string(entry.type))},
      {"line", info.line},
      {"char_start", info.char_start},
      {"char_end", info.char_end},
    });
  }
  return out;
}

}  // namespace hh_outline
