#include "hh_outline/syntax/parser.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include "hh_outline/syntax/keywords.hpp"

namespace hh_outline::syntax
{
namespace
{

[[nodiscard]] std::optional<ModifierKeyword> modifier_from_word(std::string_view w) noexcept
{
  if (w == "final") return ModifierKeyword::Final;
  if (w == "static") return ModifierKeyword::Static;
  if (w == "abstract") return ModifierKeyword::Abstract;
  if (w == "private") return ModifierKeyword::Private;
  if (w == "public") return ModifierKeyword::Public;
  if (w == "protected") return ModifierKeyword::Protected;
  return std::nullopt;
}

[[nodiscard]] FunKind fun_kind(bool is_async, bool has_yield) noexcept
{
  if (is_async) {
    return has_yield ? FunKind::AsyncGenerator : FunKind::Async;
  }
  return has_yield ? FunKind::Generator : FunKind::Sync;
}

[[nodiscard]] bool is_opening(TokenKind k) noexcept
{
  return k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace;
}

[[nodiscard]] bool is_closing(TokenKind k) noexcept
{
  return k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace;
}

// Angle-bracket depth change for type-position skipping. `>>` closes two.
[[nodiscard]] int angle_delta(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Lt:
      return 1;
    case TokenKind::LtLt:
      return 2;
    case TokenKind::Gt:
      return -1;
    case TokenKind::GtGt:
      return -2;
    default:
      return 0;
  }
}

// Words after a closing `}` that keep a statement going (`if {} else {}`).
[[nodiscard]] bool continues_statement(const Token & t) noexcept
{
  if (t.kind != TokenKind::Identifier) return false;
  return t.text == "else" || t.text == "elseif" || t.text == "catch" || t.text == "finally" ||
         t.text == "while";
}

[[nodiscard]] std::string invalid_token_message(const Token & t)
{
  const std::string_view text = t.text;
  if (text.substr(0, 3) == "<<<") {
    return "unterminated heredoc string";
  }
  if (!text.empty() && (text.front() == '"' || text.front() == '\'')) {
    return "unterminated string literal";
  }
  if (text.substr(0, 2) == "/*") {
    return "unterminated block comment";
  }
  return std::string("unexpected character `") + std::string(text) + "`";
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const { return is_kw(kw, cur(lookahead)); }

bool Parser::at_line_start() const
{
  if (idx_ == 0) return true;
  return source_.get_line_column(cur().begin()).line >
         source_.get_line_column(prev().end()).line;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    if (t.kind == TokenKind::Unknown) {
      error_at(t, invalid_token_message(t));
    }
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }

  const std::string message = std::string("expected ") + std::string(what);

  // A missing `;` is reported at the end of the previous line, not at the
  // first token of the next declaration.
  if (k == TokenKind::Semicolon && idx_ > 0 && at_line_start()) {
    const Token & p = prev();
    diags_.report_error(p.range, message, "expected `;` after this")
      .with_fixit(SourceRange(p.end(), p.end()), ";");
    return false;
  }

  diags_.report_error(cur().range, message);
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg));
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

SourceRange Parser::range_from(const Token & first) const
{
  return {first.begin(), std::max(first.begin(), prev().end())};
}

Parser::DeclStart Parser::classify_decl_start() const
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) return DeclStart::None;

  if (t.text == "namespace") return DeclStart::Namespace;
  if (t.text == "use") return DeclStart::Use;
  if (t.text == "const") return DeclStart::Const;
  if (t.text == "function") {
    return cur(1).kind == TokenKind::Identifier ? DeclStart::Function : DeclStart::None;
  }
  if (t.text == "async") {
    return (at_kw("function", 1) && cur(2).kind == TokenKind::Identifier) ? DeclStart::Function
                                                                           : DeclStart::None;
  }
  if (t.text == "enum") {
    return (cur(1).kind == TokenKind::Identifier && !at_kw("class", 1)) ? DeclStart::Enum
                                                                       : DeclStart::None;
  }
  if (t.text == "type" || t.text == "newtype") {
    return cur(1).kind == TokenKind::Identifier ? DeclStart::Typedef : DeclStart::None;
  }

  size_t i = 0;
  while (at_kw("abstract", i) || at_kw("final", i) || at_kw("xhp", i)) {
    ++i;
  }
  if (at_kw("class", i) || at_kw("interface", i) || at_kw("trait", i)) {
    const TokenKind next = cur(i + 1).kind;
    if (next == TokenKind::Identifier || next == TokenKind::Colon) {
      return DeclStart::Class;
    }
  }
  return DeclStart::None;
}

std::string_view Parser::qualify(std::string_view name)
{
  if (namespace_.empty()) {
    return name;
  }
  std::string qualified;
  qualified.reserve(namespace_.size() + name.size() + 2);
  qualified += '\\';
  qualified += namespace_;
  qualified += '\\';
  qualified += name;
  return ast_.intern(qualified);
}

// ============================================================================
// Skipping
// ============================================================================

void Parser::skip_attributes()
{
  const Token & open = advance();  // <<
  int depth = 0;
  while (!at_eof()) {
    if (depth == 0 && at(TokenKind::GtGt)) {
      advance();
      return;
    }
    if (is_opening(cur().kind)) {
      ++depth;
    } else if (is_closing(cur().kind) && depth > 0) {
      --depth;
    }
    advance();
  }
  diags_.report_error(cur().range, "expected `>>` to close the attribute list")
    .with_secondary_label(open.range, "attribute list starts here");
}

void Parser::skip_type_params()
{
  if (!at(TokenKind::Lt)) return;
  int depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBrace) || at(TokenKind::Semicolon)) {
      error_at(cur(), "expected `>` to close the type parameter list");
      return;
    }
    depth += angle_delta(cur().kind);
    advance();
    if (depth <= 0) return;
  }
}

void Parser::skip_balanced(TokenKind open, TokenKind close, bool * saw_yield)
{
  const Token & first = advance();
  int depth = 1;
  while (!at_eof()) {
    const Token & t = cur();
    if (t.kind == open) {
      ++depth;
    } else if (t.kind == close) {
      --depth;
      if (depth == 0) {
        advance();
        return;
      }
    } else if (saw_yield != nullptr && is_kw("yield", t)) {
      *saw_yield = true;
    }
    advance();
  }
  diags_
    .report_error(
      cur().range, std::string("expected `") + std::string(to_string(close)) + "`")
    .with_secondary_label(
      first.range, std::string("unclosed `") + std::string(to_string(open)) + "` starts here");
}

void Parser::skip_type_until_body()
{
  int depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0 && (k == TokenKind::LBrace || k == TokenKind::Semicolon)) return;
    if (k == TokenKind::LParen || k == TokenKind::LBracket) {
      ++depth;
    } else if (k == TokenKind::RParen || k == TokenKind::RBracket) {
      if (depth == 0) return;
      --depth;
    } else if (k == TokenKind::RBrace) {
      return;
    }
    advance();
  }
}

void Parser::skip_to_semicolon()
{
  int depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0 && k == TokenKind::Semicolon) {
      advance();
      return;
    }
    if (depth == 0 && k == TokenKind::RBrace) {
      break;
    }
    if (is_opening(k)) {
      ++depth;
    } else if (is_closing(k) && depth > 0) {
      --depth;
    }
    advance();
  }
  expect(TokenKind::Semicolon, "`;`");
}

void Parser::synchronize_to_decl()
{
  int depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0) {
      if (k == TokenKind::Semicolon) {
        advance();
        return;
      }
      if (k == TokenKind::RBrace) return;
      if (at_line_start() && classify_decl_start() != DeclStart::None) return;
    }
    if (is_opening(k)) {
      ++depth;
    } else if (is_closing(k) && depth > 0) {
      --depth;
      if (depth == 0 && k == TokenKind::RBrace) {
        advance();
        return;
      }
    }
    advance();
  }
}

void Parser::synchronize_member()
{
  int depth = 0;
  while (!at_eof()) {
    const Token & t = cur();
    if (depth == 0) {
      if (t.kind == TokenKind::Semicolon) {
        advance();
        return;
      }
      if (t.kind == TokenKind::RBrace) return;
      if (
        at_line_start() && t.kind == TokenKind::Identifier &&
        (is_member_modifier(t.text) || t.text == "function" || t.text == "const")) {
        return;
      }
    }
    if (is_opening(t.kind)) {
      ++depth;
    } else if (is_closing(t.kind) && depth > 0) {
      --depth;
      if (depth == 0 && t.kind == TokenKind::RBrace) {
        advance();
        return;
      }
    }
    advance();
  }
}

// ============================================================================
// Top level
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<Decl *> decls;
  while (!at_eof()) {
    const size_t before = idx_;
    parse_toplevel_item(decls);
    if (idx_ == before) {
      error_at(cur(), std::string("unexpected `") + std::string(cur().text) + "`");
      advance();
    }
  }

  auto * program = ast_.create<Program>(SourceRange(0, static_cast<uint32_t>(source_.size())));
  program->decls = ast_.copy_to_arena(decls);
  return program;
}

void Parser::parse_toplevel_item(std::vector<Decl *> & out)
{
  if (match(TokenKind::OpenTag) || match(TokenKind::Semicolon)) {
    return;
  }
  if (at(TokenKind::LtLt)) {
    skip_attributes();
    return;
  }
  if (at(TokenKind::RBrace)) {
    error_at(cur(), "unexpected `}`");
    advance();
    return;
  }

  switch (classify_decl_start()) {
    case DeclStart::Namespace:
      parse_namespace(out);
      return;
    case DeclStart::Use:
      out.push_back(parse_use_decl());
      return;
    case DeclStart::Function:
      if (auto * fn = parse_fun_decl()) out.push_back(fn);
      return;
    case DeclStart::Class:
      if (auto * cls = parse_class_decl()) out.push_back(cls);
      return;
    case DeclStart::Enum:
      out.push_back(parse_enum_decl());
      return;
    case DeclStart::Typedef:
      out.push_back(parse_typedef_decl());
      return;
    case DeclStart::Const:
      parse_constant_decls(out);
      return;
    case DeclStart::None:
      break;
  }

  out.push_back(parse_statement());
}

void Parser::parse_namespace(std::vector<Decl *> & out)
{
  const Token & start = advance();  // namespace

  std::string_view name;
  if (at(TokenKind::Identifier)) {
    name = advance().text;
    if (!name.empty() && name.front() == '\\') {
      name.remove_prefix(1);
    }
    name = ast_.intern(name);
  }

  auto * ns = ast_.create<NamespaceDecl>(name);
  out.push_back(ns);

  if (match(TokenKind::Semicolon)) {
    ns->range_ = range_from(start);
    namespace_ = name;
    return;
  }

  if (!at(TokenKind::LBrace)) {
    error_at(cur(), "expected `;` or `{` after namespace name");
    ns->range_ = range_from(start);
    synchronize_to_decl();
    return;
  }

  const Token & open = advance();
  const std::string_view saved = namespace_;
  namespace_ = name;

  while (!at_eof() && !at(TokenKind::RBrace)) {
    const size_t before = idx_;
    parse_toplevel_item(out);
    if (idx_ == before) {
      error_at(cur(), std::string("unexpected `") + std::string(cur().text) + "`");
      advance();
    }
  }
  if (!match(TokenKind::RBrace)) {
    diags_.report_error(cur().range, "expected `}` to close the namespace")
      .with_secondary_label(open.range, "namespace block starts here");
  }

  namespace_ = saved;
  ns->range_ = range_from(start);
}

NamespaceUseDecl * Parser::parse_use_decl()
{
  const Token & start = advance();  // use
  skip_to_semicolon();
  return ast_.create<NamespaceUseDecl>(range_from(start));
}

bool Parser::parse_function_rest(std::string_view & name, SourceRange & name_range, bool & has_yield)
{
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected function name");
    return false;
  }
  const Token & n = advance();
  name = ast_.intern(n.text);
  name_range = n.range;

  skip_type_params();

  if (!at(TokenKind::LParen)) {
    error_at(cur(), "expected `(` to start the parameter list");
    return false;
  }
  skip_balanced(TokenKind::LParen, TokenKind::RParen);

  if (match(TokenKind::Colon)) {
    skip_type_until_body();
  }

  if (at(TokenKind::LBrace)) {
    skip_balanced(TokenKind::LBrace, TokenKind::RBrace, &has_yield);
    return true;
  }
  if (match(TokenKind::Semicolon)) {
    return true;
  }

  // The header is complete enough to keep the declaration.
  error_at(cur(), "expected function body or `;`");
  return true;
}

FunDecl * Parser::parse_fun_decl()
{
  const Token & start = cur();
  const bool is_async = at_kw("async");
  if (is_async) {
    advance();
  }
  advance();  // function

  std::string_view name;
  SourceRange name_range;
  bool has_yield = false;
  if (!parse_function_rest(name, name_range, has_yield)) {
    synchronize_to_decl();
    return nullptr;
  }

  auto * fn = ast_.create<FunDecl>(qualify(name), name_range, range_from(start));
  fn->funKind = fun_kind(is_async, has_yield);
  return fn;
}

std::string_view Parser::parse_class_name(SourceRange & name_range)
{
  if (at(TokenKind::Identifier)) {
    const Token & n = advance();
    name_range = n.range;
    return ast_.intern(n.text);
  }

  // XHP element name: `:ui:button-group`, written without spaces.
  if (at(TokenKind::Colon) && cur(1).kind == TokenKind::Identifier && cur(1).begin() == cur().end()) {
    const uint32_t begin = cur().begin();
    advance();
    while (!at_eof() && cur().begin() == prev().end() &&
           (at(TokenKind::Identifier) || at(TokenKind::Colon) || at(TokenKind::Minus))) {
      advance();
    }
    name_range = SourceRange(begin, prev().end());
    return ast_.intern(source_.get_slice(name_range));
  }

  return {};
}

ClassDecl * Parser::parse_class_decl()
{
  const Token & start = cur();

  bool is_abstract = false;
  bool is_final = false;
  while (true) {
    if (at_kw("abstract")) {
      is_abstract = true;
    } else if (at_kw("final")) {
      is_final = true;
    } else if (!at_kw("xhp")) {
      break;
    }
    advance();
  }

  ClassKind kind = is_abstract ? ClassKind::Abstract : ClassKind::Normal;
  if (at_kw("interface")) {
    kind = ClassKind::Interface;
  } else if (at_kw("trait")) {
    kind = ClassKind::Trait;
  }
  advance();  // class / interface / trait

  SourceRange name_range;
  const std::string_view name = parse_class_name(name_range);
  if (name.empty()) {
    error_at(cur(), "expected class name");
    synchronize_to_decl();
    return nullptr;
  }

  skip_type_params();

  // extends / implements clauses
  while (!at_eof() && !at(TokenKind::LBrace) && !at(TokenKind::Semicolon) &&
         !at(TokenKind::RBrace)) {
    if (at_line_start() && classify_decl_start() != DeclStart::None) break;
    advance();
  }

  auto * cls = ast_.create<ClassDecl>(qualify(name), name_range, kind);
  cls->isFinal = is_final;

  if (!at(TokenKind::LBrace)) {
    error_at(cur(), "expected `{` to start the class body");
    match(TokenKind::Semicolon);
    cls->range_ = range_from(start);
    return cls;
  }

  const std::vector<ClassMember *> members = parse_class_body();
  cls->members = ast_.copy_to_arena(members);
  cls->range_ = range_from(start);
  return cls;
}

ClassDecl * Parser::parse_enum_decl()
{
  const Token & start = advance();  // enum
  const Token & n = advance();

  // `: int as int` base and constraint types
  while (!at_eof() && !at(TokenKind::LBrace) && !at(TokenKind::Semicolon) &&
         !at(TokenKind::RBrace)) {
    if (at_line_start() && classify_decl_start() != DeclStart::None) break;
    advance();
  }

  auto * cls = ast_.create<ClassDecl>(qualify(ast_.intern(n.text)), n.range, ClassKind::Enum);

  if (!at(TokenKind::LBrace)) {
    error_at(cur(), "expected `{` to start the enum body");
    match(TokenKind::Semicolon);
    cls->range_ = range_from(start);
    return cls;
  }

  const std::vector<ClassMember *> members = parse_enum_body();
  cls->members = ast_.copy_to_arena(members);
  cls->range_ = range_from(start);
  return cls;
}

TypedefDecl * Parser::parse_typedef_decl()
{
  const Token & start = advance();  // type / newtype
  const bool is_newtype = start.text == "newtype";
  const Token & n = advance();
  const std::string_view name = qualify(ast_.intern(n.text));
  skip_to_semicolon();
  return ast_.create<TypedefDecl>(name, is_newtype, range_from(start));
}

void Parser::parse_constant_decls(std::vector<Decl *> & out)
{
  const Token & start = advance();  // const
  if (!skip_type_to_declarator_name()) {
    synchronize_to_decl();
    return;
  }

  // The first constant of the statement owns the `const` keyword.
  bool first = true;
  while (true) {
    const Token & entry_start = first ? start : cur();
    first = false;
    ConstEntry * entry = parse_const_entry();
    if (entry == nullptr) break;
    out.push_back(
      ast_.create<ConstantDecl>(qualify(entry->name), entry->value, range_from(entry_start)));
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::Semicolon, "`;` after constant declaration");
}

StmtDecl * Parser::parse_statement()
{
  const Token & start = cur();
  const size_t start_idx = idx_;
  int depth = 0;

  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0) {
      if (k == TokenKind::Semicolon) {
        advance();
        break;
      }
      if (is_closing(k)) {
        if (idx_ == start_idx) {
          error_at(cur(), std::string("unexpected `") + std::string(cur().text) + "`");
          advance();
        }
        break;
      }
      if (idx_ != start_idx && at_line_start() && classify_decl_start() != DeclStart::None) {
        break;
      }
    }

    if (is_opening(k)) {
      ++depth;
    } else if (is_closing(k)) {
      --depth;
      advance();
      if (depth == 0 && k == TokenKind::RBrace && !continues_statement(cur())) break;
      continue;
    }
    advance();
  }

  return ast_.create<StmtDecl>(range_from(start));
}

// ============================================================================
// Class body
// ============================================================================

std::vector<ClassMember *> Parser::parse_class_body()
{
  const Token & open = advance();  // {
  std::vector<ClassMember *> members;

  while (!at_eof() && !at(TokenKind::RBrace)) {
    // A declaration that can only appear at top level means the body was
    // never closed.
    const DeclStart ds = classify_decl_start();
    if (
      at_line_start() && (ds == DeclStart::Class || ds == DeclStart::Enum ||
                          ds == DeclStart::Namespace || ds == DeclStart::Typedef)) {
      break;
    }

    const size_t before = idx_;
    parse_class_member(members);
    if (idx_ == before) {
      error_at(cur(), "expected a class member declaration");
      advance();
    }
  }

  if (!match(TokenKind::RBrace)) {
    diags_.report_error(cur().range, "expected `}` to close the class body")
      .with_secondary_label(open.range, "class body starts here");
  }
  return members;
}

std::vector<ClassMember *> Parser::parse_enum_body()
{
  const Token & open = advance();  // {
  std::vector<ClassMember *> members;

  while (!at_eof() && !at(TokenKind::RBrace)) {
    if (match(TokenKind::Semicolon)) continue;

    const Token & start = cur();
    const size_t before = idx_;

    if (at_kw("use")) {
      members.push_back(parse_trait_use(start));
    } else if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::Eq) {
      ConstEntry * entry = parse_const_entry();
      auto * group = ast_.create<ClassConstDecl>();
      group->entries = ast_.copy_to_arena(std::vector<ConstEntry *>{entry});
      expect(TokenKind::Semicolon, "`;` after enum member");
      group->range_ = range_from(start);
      members.push_back(group);
    } else {
      error_at(cur(), "expected enum member");
      synchronize_member();
    }

    if (idx_ == before) {
      advance();
    }
  }

  if (!match(TokenKind::RBrace)) {
    diags_.report_error(cur().range, "expected `}` to close the enum body")
      .with_secondary_label(open.range, "enum body starts here");
  }
  return members;
}

void Parser::parse_class_member(std::vector<ClassMember *> & out)
{
  if (match(TokenKind::Semicolon)) return;
  if (at(TokenKind::LtLt)) {
    skip_attributes();
    return;
  }

  const Token & start = cur();

  if (at_kw("use")) {
    out.push_back(parse_trait_use(start));
    return;
  }
  if (at_kw("require") && (at_kw("extends", 1) || at_kw("implements", 1))) {
    out.push_back(parse_require(start));
    return;
  }
  if (at_kw("attribute")) {
    parse_xhp_attributes(start, out);
    return;
  }
  if (at_kw("category") && cur(1).kind == TokenKind::Percent) {
    out.push_back(parse_xhp_category(start));
    return;
  }
  if (at_kw("children") && cur(1).kind != TokenKind::Variable) {
    out.push_back(parse_xhp_children(start));
    return;
  }

  std::vector<ModifierKeyword> mods;
  bool is_async = false;
  bool is_var = false;
  while (at(TokenKind::Identifier)) {
    if (auto m = modifier_from_word(cur().text)) {
      mods.push_back(*m);
    } else if (at_kw("async")) {
      is_async = true;
    } else if (at_kw("var")) {
      is_var = true;
    } else {
      break;
    }
    advance();
  }

  if (at_kw("const")) {
    if (auto * c = parse_class_const(start, mods)) out.push_back(c);
    return;
  }
  if (at_kw("function")) {
    if (auto * m = parse_method(start, mods, is_async)) out.push_back(m);
    return;
  }
  if (!mods.empty() || is_var) {
    if (auto * v = parse_class_vars(start, mods, is_var)) out.push_back(v);
    return;
  }

  error_at(cur(), "expected a class member declaration");
  synchronize_member();
}

TraitUseDecl * Parser::parse_trait_use(const Token & start)
{
  advance();  // use
  std::vector<std::string_view> traits;
  while (at(TokenKind::Identifier)) {
    traits.push_back(ast_.intern(advance().text));
    skip_type_params();
    if (!match(TokenKind::Comma)) break;
  }
  if (traits.empty()) {
    error_at(cur(), "expected trait name");
  }

  if (at(TokenKind::LBrace)) {
    // Conflict resolution block: `use T { foo as bar; }`
    skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
    match(TokenKind::Semicolon);
  } else {
    expect(TokenKind::Semicolon, "`;` after trait use");
  }

  auto * use = ast_.create<TraitUseDecl>(range_from(start));
  use->traits = ast_.copy_to_arena(traits);
  return use;
}

ClassRequireDecl * Parser::parse_require(const Token & start)
{
  advance();  // require
  const RequireKind kind = at_kw("extends") ? RequireKind::Extends : RequireKind::Implements;
  advance();

  std::string_view name;
  if (at(TokenKind::Identifier)) {
    name = ast_.intern(advance().text);
    skip_type_params();
  } else {
    error_at(cur(), "expected class or interface name");
  }
  expect(TokenKind::Semicolon, "`;` after require clause");
  return ast_.create<ClassRequireDecl>(kind, name, range_from(start));
}

void Parser::parse_xhp_attributes(const Token & start, std::vector<ClassMember *> & out)
{
  advance();  // attribute

  bool first = true;
  while (!at_eof()) {
    const Token & entry_start = first ? start : cur();
    first = false;

    if (at(TokenKind::Colon)) {
      // `attribute :other:element;` copies another element's attributes
      while (!at_eof() && !at(TokenKind::Comma) && !at(TokenKind::Semicolon) &&
             !at(TokenKind::RBrace)) {
        advance();
      }
    } else {
      // The attribute name is the last (possibly hyphenated) identifier of
      // the entry before `=`, `@`, `,` or `;`.
      int depth = 0;
      bool have_name = false;
      uint32_t name_begin = 0;
      uint32_t name_end = 0;
      while (!at_eof()) {
        const Token & t = cur();
        if (
          depth == 0 && (t.kind == TokenKind::Eq || t.kind == TokenKind::At ||
                         t.kind == TokenKind::Comma || t.kind == TokenKind::Semicolon ||
                         t.kind == TokenKind::RBrace)) {
          break;
        }
        if (is_opening(t.kind)) {
          ++depth;
        } else if (is_closing(t.kind)) {
          --depth;
        } else {
          depth += angle_delta(t.kind);
        }

        if (depth == 0 && t.kind == TokenKind::Identifier) {
          const bool continues_name = have_name && idx_ >= 1 &&
                                      prev().kind == TokenKind::Minus && prev().end() == t.begin() &&
                                      prev().begin() == name_end;
          if (!continues_name) {
            name_begin = t.begin();
          }
          name_end = t.end();
          have_name = true;
        }
        advance();
      }

      if (!have_name) {
        error_at(cur(), "expected XHP attribute name");
        synchronize_member();
        return;
      }

      const SourceRange name_range(name_begin, name_end);
      auto * var = ast_.create<ClassVar>(ast_.intern(source_.get_slice(name_range)), name_range);
      if (match(TokenKind::Eq)) {
        var->init = parse_opaque_expr(TokenKind::At);
      }

      bool required = false;
      if (match(TokenKind::At)) {
        required = at_kw("required");
        if (at(TokenKind::Identifier)) {
          advance();  // required / lateinit
        } else {
          error_at(cur(), "expected `required` or `lateinit` after `@`");
        }
      }

      auto * attr = ast_.create<XhpAttrDecl>(var, range_from(entry_start));
      attr->required = required;
      var->range_ = attr->get_range();
      out.push_back(attr);
    }

    if (match(TokenKind::Comma)) continue;
    expect(TokenKind::Semicolon, "`;` after XHP attribute declaration");
    return;
  }
}

XhpCategoryDecl * Parser::parse_xhp_category(const Token & start)
{
  advance();  // category
  std::vector<std::string_view> categories;
  while (match(TokenKind::Percent)) {
    const uint32_t begin = cur().begin();
    while (!at_eof() && cur().begin() == prev().end() &&
           (at(TokenKind::Identifier) || at(TokenKind::Colon) || at(TokenKind::Minus))) {
      advance();
    }
    if (prev().end() > begin) {
      categories.push_back(ast_.intern(source_.get_slice(SourceRange(begin, prev().end()))));
    } else {
      error_at(cur(), "expected category name after `%`");
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::Semicolon, "`;` after category declaration");

  auto * decl = ast_.create<XhpCategoryDecl>(range_from(start));
  decl->categories = ast_.copy_to_arena(categories);
  return decl;
}

XhpChildrenDecl * Parser::parse_xhp_children(const Token & start)
{
  advance();  // children
  skip_to_semicolon();
  return ast_.create<XhpChildrenDecl>(range_from(start));
}

MethodDecl * Parser::parse_method(
  const Token & start, const std::vector<ModifierKeyword> & mods, bool is_async)
{
  advance();  // function

  std::string_view name;
  SourceRange name_range;
  bool has_yield = false;
  if (!parse_function_rest(name, name_range, has_yield)) {
    synchronize_member();
    return nullptr;
  }

  auto * method = ast_.create<MethodDecl>(name, name_range, range_from(start));
  method->modifiers = ast_.copy_to_arena(mods);
  method->funKind = fun_kind(is_async, has_yield);
  return method;
}

ClassVarsDecl * Parser::parse_class_vars(
  const Token & start, const std::vector<ModifierKeyword> & mods, bool is_var)
{
  // Property type: everything up to the first variable
  int depth = 0;
  while (!at_eof() && !at(TokenKind::Variable)) {
    const TokenKind k = cur().kind;
    if (depth <= 0 && (k == TokenKind::Semicolon || k == TokenKind::LBrace || k == TokenKind::RBrace)) {
      break;
    }
    if (is_opening(k)) {
      ++depth;
    } else if (is_closing(k)) {
      --depth;
    }
    advance();
  }

  if (!at(TokenKind::Variable)) {
    error_at(cur(), "expected property name");
    synchronize_member();
    return nullptr;
  }

  std::vector<ClassVar *> vars;
  while (at(TokenKind::Variable)) {
    const Token & v = advance();
    auto * var = ast_.create<ClassVar>(ast_.intern(v.text.substr(1)), v.range, v.range);
    if (match(TokenKind::Eq)) {
      var->init = parse_opaque_expr();
      var->range_ = span_between(v.range, var->init->get_range());
    }
    vars.push_back(var);
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::Semicolon, "`;` after property declaration");

  auto * decl = ast_.create<ClassVarsDecl>(range_from(start));
  decl->modifiers = ast_.copy_to_arena(mods);
  decl->vars = ast_.copy_to_arena(vars);
  decl->isVar = is_var;
  return decl;
}

ClassMember * Parser::parse_class_const(
  const Token & start, const std::vector<ModifierKeyword> & mods)
{
  advance();  // const

  const bool is_abstract =
    std::find(mods.begin(), mods.end(), ModifierKeyword::Abstract) != mods.end();

  if (at_kw("type") && cur(1).kind == TokenKind::Identifier) {
    return parse_type_const(start, is_abstract);
  }

  if (!skip_type_to_declarator_name()) {
    synchronize_member();
    return nullptr;
  }

  if (is_abstract) {
    const Token & n = advance();
    auto * decl = ast_.create<AbsConstDecl>(ast_.intern(n.text), n.range);
    skip_to_semicolon();
    decl->range_ = range_from(start);
    return decl;
  }

  std::vector<ConstEntry *> entries;
  while (true) {
    ConstEntry * entry = parse_const_entry();
    if (entry == nullptr) break;
    entries.push_back(entry);
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::Semicolon, "`;` after class constant");

  auto * decl = ast_.create<ClassConstDecl>(range_from(start));
  decl->entries = ast_.copy_to_arena(entries);
  return decl;
}

TypeConstDecl * Parser::parse_type_const(const Token & start, bool is_abstract)
{
  advance();  // type
  const Token & n = advance();
  const std::string_view name = ast_.intern(n.text);
  skip_to_semicolon();
  return ast_.create<TypeConstDecl>(name, n.range, is_abstract, range_from(start));
}

// ============================================================================
// Declarators
// ============================================================================

bool Parser::skip_type_to_declarator_name()
{
  int depth = 0;
  while (!at_eof()) {
    const TokenKind k = cur().kind;
    if (depth == 0 && k == TokenKind::Identifier) {
      const TokenKind next = cur(1).kind;
      if (next == TokenKind::Eq || next == TokenKind::Comma || next == TokenKind::Semicolon) {
        return true;
      }
    }
    if (depth <= 0 && (k == TokenKind::Semicolon || k == TokenKind::LBrace || k == TokenKind::RBrace)) {
      break;
    }
    if (k == TokenKind::LParen || k == TokenKind::LBracket) {
      ++depth;
    } else if (k == TokenKind::RParen || k == TokenKind::RBracket) {
      --depth;
    } else {
      depth += angle_delta(k);
    }
    advance();
  }
  error_at(cur(), "expected constant name");
  return false;
}

ConstEntry * Parser::parse_const_entry()
{
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected constant name");
    return nullptr;
  }
  const Token & n = advance();

  // A constant without initializer has no value range; its span is the name.
  Expr * value = match(TokenKind::Eq) ? parse_opaque_expr() : ast_.create<MissingExpr>();

  return ast_.create<ConstEntry>(
    ast_.intern(n.text), n.range, value, span_between(n.range, value->get_range()));
}

Expr * Parser::parse_opaque_expr(TokenKind extra_stop)
{
  const Token & first = cur();
  const size_t begin_idx = idx_;
  int depth = 0;

  while (!at_eof()) {
    const Token & t = cur();
    if (depth == 0) {
      if (t.kind == TokenKind::Comma || t.kind == TokenKind::Semicolon || t.kind == extra_stop ||
          is_closing(t.kind)) {
        break;
      }
      // A missing `;` must not swallow the next declaration.
      if (
        idx_ != begin_idx && at_line_start() && t.kind == TokenKind::Identifier &&
        (is_member_modifier(t.text) || is_declaration_keyword(t.text))) {
        break;
      }
    }
    if (is_opening(t.kind)) {
      ++depth;
    } else if (is_closing(t.kind)) {
      --depth;
    }
    advance();
  }

  if (idx_ == begin_idx) {
    error_at(cur(), "expected expression");
    return make_missing_expr_at(cur());
  }
  return ast_.create<OpaqueExpr>(range_from(first));
}

Expr * Parser::make_missing_expr_at(const Token & t)
{
  return ast_.create<MissingExpr>(SourceRange(t.begin(), t.begin()));
}

}  // namespace hh_outline::syntax
