// hh_outline/syntax/lexer.hpp - Hand-written lexer for Hack source
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "hh_outline/syntax/token.hpp"

namespace hh_outline::syntax
{

/**
 * Splits Hack source into tokens.
 *
 * Lexing never fails: malformed input (unterminated strings, stray bytes)
 * comes out as Unknown tokens and the parser reports them. An unterminated
 * quote is a one-character Unknown token and lexing continues after it. The returned
 * vector always ends with an Eof token.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();
  bool lex_comment(Token & out);

  [[nodiscard]] Token lex_open_tag();
  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_variable();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(char quote);
  /// Advance to the closing quote, leaving pos_ on it. False at end of input.
  bool scan_string_body(char quote);
  /// Skip a `{$...}` interpolation, leaving pos_ past its closing brace.
  bool scan_interpolation();
  [[nodiscard]] Token lex_heredoc();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

/// Convenience wrapper around Lexer::lex_all().
[[nodiscard]] std::vector<Token> lex(std::string_view src);

}  // namespace hh_outline::syntax
