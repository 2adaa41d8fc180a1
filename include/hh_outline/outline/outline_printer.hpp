// hh_outline/outline/outline_printer.hpp - Indented text dump of an outline
#pragma once

#include <ostream>

#include "hh_outline/outline/outline.hpp"

namespace hh_outline
{

/**
 * Write a human-readable dump of `outline`, one block per Def:
 *
 * @code
 *   C
 *     kind: class
 *     position: File "a.php", line 3, characters 7-7:
 *     span: File "a.php", line 3, character 1 - line 5, character 1:
 *     modifiers:
 * @endcode
 *
 * followed by a blank line; children are indented two more spaces.
 */
void print(std::ostream & os, const Outline & outline);

}  // namespace hh_outline
