// hh_outline/outline/legacy.hpp - Flat outline for the legacy `--outline` format
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "hh_outline/basic/pos.hpp"
#include "hh_outline/outline/outline.hpp"

namespace hh_outline
{

enum class LegacyKind : uint8_t {
  Function,
  Class,
  Method,
  StaticMethod,
};

[[nodiscard]] constexpr std::string_view to_string(LegacyKind kind) noexcept
{
  switch (kind) {
    case LegacyKind::Function:
      return "function";
    case LegacyKind::Class:
      return "class";
    case LegacyKind::Method:
      return "method";
    case LegacyKind::StaticMethod:
      return "static method";
  }
  return "";
}

struct LegacyEntry
{
  AbsolutePos pos;
  std::string name;  ///< methods are qualified: `Outer::method`
  LegacyKind type = LegacyKind::Function;
};

/**
 * Flatten an outline in pre-order.
 *
 * Functions, containers and methods produce one entry each; properties,
 * constants and type constants produce none. A container precedes its
 * children and siblings keep declaration order.
 */
[[nodiscard]] std::vector<LegacyEntry> to_legacy(const Outline & outline);

/// outline() followed by to_legacy().
[[nodiscard]] std::vector<LegacyEntry> outline_legacy(
  std::string content, std::filesystem::path path = {});

}  // namespace hh_outline
