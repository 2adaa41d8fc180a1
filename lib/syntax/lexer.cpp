#include "hh_outline/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace hh_outline::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_' || c >= 0x80; }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Longest spelling first so that a prefix never shadows a longer operator.
constexpr std::array<std::pair<std::string_view, TokenKind>, 23> k_operators = {{
  {"===", TokenKind::EqEqEq},
  {"!==", TokenKind::NeEq},
  {"...", TokenKind::Ellipsis},
  {"?->", TokenKind::QuestionArrow},
  {"::", TokenKind::ColonColon},
  {"->", TokenKind::Arrow},
  {"=>", TokenKind::FatArrow},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"<<", TokenKind::LtLt},
  {">>", TokenKind::GtGt},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"??", TokenKind::QuestionQuestion},
  {"|>", TokenKind::PipeGt},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},
  {".=", TokenKind::DotEq},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  return {kind, SourceRange(start, end), src_.substr(start, end - start)};
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

bool Lexer::lex_comment(Token & out)
{
  const auto start = static_cast<uint32_t>(pos_);

  if (starts_with("//") || peek() == '#') {
    while (!eof() && peek() != '\n') {
      advance(1);
    }
    out = make_token(TokenKind::LineComment, start);
    return true;
  }

  if (starts_with("/*")) {
    advance(2);
    while (!eof() && !starts_with("*/")) {
      advance(1);
    }
    if (starts_with("*/")) {
      advance(2);
      out = make_token(TokenKind::BlockComment, start);
    } else {
      // Unterminated block comment swallows the rest of the file.
      out = make_token(TokenKind::Unknown, start);
    }
    return true;
  }

  return false;
}

Token Lexer::lex_open_tag()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);  // <?
  while (!eof() && std::isalpha(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }
  return make_token(TokenKind::OpenTag, start);
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  if (peek() == '\\') {
    advance(1);
  }
  advance(1);
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (is_ident_continue(c)) {
      advance(1);
      continue;
    }
    // Namespace separator inside a qualified name
    if (c == '\\' && is_ident_start(static_cast<unsigned char>(peek(1)))) {
      advance(1);
      continue;
    }
    break;
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_variable()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // $
  if (peek() == '$') {
    advance(1);
    return make_token(TokenKind::Variable, start);
  }
  if (!is_ident_start(static_cast<unsigned char>(peek()))) {
    return make_token(TokenKind::Unknown, start);
  }
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Variable, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  // Base-prefixed integers: 0x.. 0b.. 0o..
  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O') {
      const bool hex = (p1 == 'x' || p1 == 'X');
      advance(2);
      bool any = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        if ((hex && is_hex_digit(c)) || (!hex && std::isdigit(c) != 0) || c == '_') {
          any = true;
          advance(1);
          continue;
        }
        break;
      }
      return make_token(any ? TokenKind::IntLiteral : TokenKind::Unknown, start);
    }
  }

  auto skip_digits = [this]() {
    while (!eof() && (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
      advance(1);
    }
  };

  skip_digits();
  bool is_float = false;

  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    is_float = true;
    advance(1);
    skip_digits();
  }

  if (peek() == 'e' || peek() == 'E') {
    const char sign = peek(1);
    const size_t digit_at = (sign == '+' || sign == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(digit_at))) != 0) {
      is_float = true;
      advance(digit_at);
      skip_digits();
    }
  }

  return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

bool Lexer::scan_string_body(char quote)
{
  // Hack strings may span lines; only the closing quote ends them.
  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      return true;
    }
    if (c == '\\') {
      advance(1);
      if (eof()) return false;
    } else if (quote == '"' && c == '{' && peek(1) == '$') {
      if (!scan_interpolation()) return false;
      continue;
    }
    advance(1);
  }
  return false;
}

bool Lexer::scan_interpolation()
{
  advance(1);  // {
  int depth = 1;

  while (!eof()) {
    const char c = peek();
    if (c == '\'' || c == '"') {
      advance(1);
      if (!scan_string_body(c)) return false;
      advance(1);
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}' && --depth == 0) {
      advance(1);
      return true;
    }
    advance(1);
  }
  return false;
}

Token Lexer::lex_string(char quote)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  if (!scan_string_body(quote)) {
    // Only the opening quote is invalid; lexing resumes right after it.
    pos_ = start + 1;
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_heredoc()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(3);  // <<<

  const char quote = peek();
  const bool quoted = (quote == '\'' || quote == '"');
  if (quoted) advance(1);

  const size_t label_start = pos_;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  const std::string_view label = src_.substr(label_start, pos_ - label_start);
  if (quoted && peek() == quote) advance(1);

  if (label.empty()) {
    return make_token(TokenKind::Unknown, start);
  }

  // Skip to end of the opening line
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  const auto payload_start = static_cast<uint32_t>(pos_);

  // The body ends at a line that starts with the label.
  while (!eof()) {
    advance(1);  // past '\n'
    size_t p = pos_;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) ++p;
    if (src_.substr(p, label.size()) == label) {
      const size_t after = p + label.size();
      if (after >= src_.size() || !is_ident_continue(static_cast<unsigned char>(src_[after]))) {
        const auto payload_end = static_cast<uint32_t>(pos_);
        pos_ = after;
        Token t = make_token(TokenKind::StringLiteral, start);
        t.text = src_.substr(payload_start, payload_end - payload_start);
        return t;
      }
    }
    while (!eof() && peek() != '\n') {
      advance(1);
    }
  }

  return make_token(TokenKind::Unknown, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    return {TokenKind::Eof, SourceRange(at, at), {}};
  }

  Token comment;
  if (lex_comment(comment)) {
    return comment;
  }

  const auto c = static_cast<unsigned char>(peek());
  const auto start = static_cast<uint32_t>(pos_);

  if (starts_with("<?")) {
    return lex_open_tag();
  }
  if (starts_with("<<<") && (is_ident_start(static_cast<unsigned char>(peek(3))) ||
                             peek(3) == '\'' || peek(3) == '"')) {
    return lex_heredoc();
  }
  if (is_ident_start(c) || (c == '\\' && is_ident_start(static_cast<unsigned char>(peek(1))))) {
    return lex_identifier();
  }
  if (c == '$') {
    return lex_variable();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_string(static_cast<char>(c));
  }

  for (const auto & [spelling, kind] : k_operators) {
    if (starts_with(spelling)) {
      advance(spelling.size());
      return make_token(kind, start);
    }
  }

  advance(1);
  switch (c) {
    case '(':
      return make_token(TokenKind::LParen, start);
    case ')':
      return make_token(TokenKind::RParen, start);
    case '{':
      return make_token(TokenKind::LBrace, start);
    case '}':
      return make_token(TokenKind::RBrace, start);
    case '[':
      return make_token(TokenKind::LBracket, start);
    case ']':
      return make_token(TokenKind::RBracket, start);
    case ',':
      return make_token(TokenKind::Comma, start);
    case ':':
      return make_token(TokenKind::Colon, start);
    case ';':
      return make_token(TokenKind::Semicolon, start);
    case '.':
      return make_token(TokenKind::Dot, start);
    case '\\':
      return make_token(TokenKind::Backslash, start);
    case '@':
      return make_token(TokenKind::At, start);
    case '!':
      return make_token(TokenKind::Bang, start);
    case '?':
      return make_token(TokenKind::Question, start);
    case '+':
      return make_token(TokenKind::Plus, start);
    case '-':
      return make_token(TokenKind::Minus, start);
    case '*':
      return make_token(TokenKind::Star, start);
    case '/':
      return make_token(TokenKind::Slash, start);
    case '%':
      return make_token(TokenKind::Percent, start);
    case '~':
      return make_token(TokenKind::Tilde, start);
    case '&':
      return make_token(TokenKind::Amp, start);
    case '|':
      return make_token(TokenKind::Pipe, start);
    case '^':
      return make_token(TokenKind::Caret, start);
    case '=':
      return make_token(TokenKind::Eq, start);
    case '<':
      return make_token(TokenKind::Lt, start);
    case '>':
      return make_token(TokenKind::Gt, start);
    default:
      break;
  }

  return make_token(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

std::vector<Token> lex(std::string_view src) { return Lexer(src).lex_all(); }

}  // namespace hh_outline::syntax
