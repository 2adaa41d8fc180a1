// hh_outline/syntax/token.hpp - Token kinds for the Hack lexer
//
#pragma once

#include <cstdint>
#include <string_view>

#include "hh_outline/basic/source_manager.hpp"

namespace hh_outline::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  OpenTag,  // <?hh, <?php, <?

  // Comments are emitted so tools can see them; the parser drops them.
  LineComment,   // // ... or # ...
  BlockComment,  // /* ... */

  Identifier,  // may be namespace-qualified: \Foo\Bar
  Variable,    // $name (text includes the dollar sign)
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // token.text is the string *contents* (without quotes)

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  ColonColon,
  Semicolon,
  Dot,
  Ellipsis,
  Backslash,  // group use prefix: Foo\{A, B}

  At,
  Bang,
  Question,
  QuestionArrow,     // ?->
  QuestionQuestion,  // ??

  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Tilde,

  Amp,
  Pipe,
  Caret,
  PipeGt,  // |>

  AndAnd,
  OrOr,

  Eq,
  EqEq,
  EqEqEq,
  Ne,
  NeEq,  // !==
  Lt,
  Le,
  Gt,
  Ge,
  LtLt,  // << (also opens attributes)
  GtGt,  // >> (also closes attributes)

  Arrow,     // ->
  FatArrow,  // =>

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  PercentEq,
  DotEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (for StringLiteral: interior)

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr bool is_comment(TokenKind k) noexcept
{
  return k == TokenKind::LineComment || k == TokenKind::BlockComment;
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::OpenTag:
      return "<?hh";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Variable:
      return "variable";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::Backslash:
      return "\\";
    case TokenKind::At:
      return "@";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Question:
      return "?";
    case TokenKind::QuestionArrow:
      return "?->";
    case TokenKind::QuestionQuestion:
      return "??";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::PipeGt:
      return "|>";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::EqEqEq:
      return "===";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::NeEq:
      return "!==";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::LtLt:
      return "<<";
    case TokenKind::GtGt:
      return ">>";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::FatArrow:
      return "=>";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PercentEq:
      return "%=";
    case TokenKind::DotEq:
      return ".=";
  }
  return "";
}

}  // namespace hh_outline::syntax
