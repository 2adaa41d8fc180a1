// hh_outline/syntax/frontend.cpp - High-level parse pipeline
#include "hh_outline/syntax/frontend.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "hh_outline/syntax/lexer.hpp"
#include "hh_outline/syntax/parser.hpp"

namespace hh_outline
{

Program * parse_source(const SourceFile & file, AstContext & ast, DiagnosticBag & diags)
{
  std::vector<syntax::Token> tokens = syntax::Lexer(file.content()).lex_all();
  tokens.erase(
    std::remove_if(
      tokens.begin(), tokens.end(), [](const syntax::Token & t) { return syntax::is_comment(t.kind); }),
    tokens.end());

  syntax::Parser parser(ast, file, diags, std::move(tokens));
  return parser.parse_program();
}

std::unique_ptr<ParsedFile> parse_file(std::string content, std::filesystem::path path)
{
  auto unit = std::make_unique<ParsedFile>();
  unit->source = SourceFile(std::move(path), std::move(content));
  unit->ast = std::make_unique<AstContext>();
  unit->program = parse_source(unit->source, *unit->ast, unit->diags);
  return unit;
}

std::unique_ptr<ParsedFile> parse_best_effort(std::string content, std::filesystem::path path)
{
  auto unit = parse_file(std::move(content), std::move(path));
  unit->diags = DiagnosticBag{};
  return unit;
}

}  // namespace hh_outline
