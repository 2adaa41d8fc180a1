// hh_outline/outline/outline_builder.hpp - Syntax tree to outline conversion
//
// Turns the declarations of a parsed file into a forest of Defs. Top-level
// functions and class-like declarations become roots; methods, properties,
// constants and type constants become children of their class. Everything
// else (statements, type aliases, module constants, namespace and use
// declarations, trait uses, require clauses, XHP categories and children)
// does not appear in the outline.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/basic/source_manager.hpp"
#include "hh_outline/outline/outline.hpp"

namespace hh_outline
{

/// Drop the namespace qualification: `\NS\Sub\foo` -> `foo`.
[[nodiscard]] std::string_view strip_ns(std::string_view name) noexcept;

[[nodiscard]] Def summarize_function(const SourceFile & file, const FunDecl & fn);

[[nodiscard]] Def summarize_class(const SourceFile & file, const ClassDecl & cls);

/// Append the Defs of one class member (zero, one or several) to `out`.
void summarize_member(const SourceFile & file, const ClassMember & member, std::vector<Def> & out);

[[nodiscard]] Outline outline_program(const SourceFile & file, const Program & program);

/**
 * Parse `content` and build its outline.
 *
 * Syntax errors are ignored: the outline covers whatever the parser
 * recovered. `path` only labels the positions.
 */
[[nodiscard]] Outline outline(std::string content, std::filesystem::path path = {});

}  // namespace hh_outline
