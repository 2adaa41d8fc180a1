// hh_outline/outline/modifiers.hpp - Modifier keyword normalization
#pragma once

#include <gsl/span>
#include <vector>

#include "hh_outline/ast/ast_enums.hpp"
#include "hh_outline/outline/outline.hpp"

namespace hh_outline
{

/**
 * Map one modifier keyword to its outline modifier.
 *
 * @throws std::invalid_argument if `kw` is not a ModifierKeyword enumerator
 */
[[nodiscard]] Modifier to_modifier(ModifierKeyword kw);

/// Map keywords one to one, keeping their order.
[[nodiscard]] std::vector<Modifier> normalize_modifiers(gsl::span<const ModifierKeyword> keywords);

/// [Async] for async functions (generators included), [] otherwise.
[[nodiscard]] std::vector<Modifier> fun_kind_modifiers(FunKind kind);

}  // namespace hh_outline
