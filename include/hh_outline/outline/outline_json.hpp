// hh_outline/outline/outline_json.hpp - JSON encodings of an outline
#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "hh_outline/outline/legacy.hpp"
#include "hh_outline/outline/outline.hpp"

namespace hh_outline
{

/**
 * Structured encoding of one Def:
 * {"kind", "name", "position", "span", "modifiers", "children"}.
 */
[[nodiscard]] nlohmann::json to_json(const Def & def);

/// JSON array of structured Defs.
[[nodiscard]] nlohmann::json to_json(const Outline & outline);

/// JSON array of {"name", "type", "line", "char_start", "char_end"}.
[[nodiscard]] nlohmann::json to_json_legacy(const std::vector<LegacyEntry> & entries);

}  // namespace hh_outline
