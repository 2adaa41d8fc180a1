// hh_outline/syntax/frontend.hpp - High-level parse pipeline entry points
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/ast/ast_context.hpp"
#include "hh_outline/basic/diagnostic.hpp"
#include "hh_outline/basic/source_manager.hpp"

namespace hh_outline
{

/// A parsed file together with everything its AST points into.
struct ParsedFile
{
  SourceFile source;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> comment filter -> recursive-descent parser (AST)
//
// Never fails: syntax errors go into `diags` and a (possibly partial) Program
// is always returned.
[[nodiscard]] Program * parse_source(
  const SourceFile & file, AstContext & ast, DiagnosticBag & diags);

/// Parse `content` and keep the diagnostics.
[[nodiscard]] std::unique_ptr<ParsedFile> parse_file(
  std::string content, std::filesystem::path path = {});

/// Parse `content` and drop every diagnostic. Used where partial results over
/// broken files are preferable to errors.
[[nodiscard]] std::unique_ptr<ParsedFile> parse_best_effort(
  std::string content, std::filesystem::path path = {});

}  // namespace hh_outline
