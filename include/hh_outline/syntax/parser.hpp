// hh_outline/syntax/parser.hpp - Declaration-level recursive-descent parser
//
#pragma once

#include <string_view>
#include <utility>
#include <vector>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/ast/ast_context.hpp"
#include "hh_outline/basic/diagnostic.hpp"
#include "hh_outline/basic/source_manager.hpp"
#include "hh_outline/syntax/token.hpp"

namespace hh_outline::syntax
{

/**
 * Parses a Hack token stream into a declaration-level Program.
 *
 * Only the shape of declarations is recovered. Function bodies, parameter
 * lists, types and initializers are skipped as balanced token runs;
 * initializers survive as OpaqueExpr ranges.
 *
 * The parser never gives up: errors are reported into the DiagnosticBag and
 * parsing resumes at the next `;`, `}` or declaration keyword. The token
 * stream must not contain comment tokens and must end with Eof.
 */
class Parser
{
public:
  Parser(AstContext & ast, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;
  [[nodiscard]] bool at_line_start() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg);

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] SourceRange range_from(const Token & first) const;

  // Skipping
  void skip_attributes();
  void skip_type_params();
  void skip_balanced(TokenKind open, TokenKind close, bool * saw_yield = nullptr);
  void skip_type_until_body();
  void skip_to_semicolon();
  void synchronize_to_decl();
  void synchronize_member();

  // Top level
  void parse_toplevel_item(std::vector<Decl *> & out);
  void parse_namespace(std::vector<Decl *> & out);
  [[nodiscard]] NamespaceUseDecl * parse_use_decl();
  [[nodiscard]] FunDecl * parse_fun_decl();
  [[nodiscard]] ClassDecl * parse_class_decl();
  [[nodiscard]] ClassDecl * parse_enum_decl();
  [[nodiscard]] TypedefDecl * parse_typedef_decl();
  void parse_constant_decls(std::vector<Decl *> & out);
  [[nodiscard]] StmtDecl * parse_statement();

  enum class DeclStart : uint8_t { None, Namespace, Use, Function, Class, Enum, Typedef, Const };

  /// What kind of top-level declaration begins at the current token.
  [[nodiscard]] DeclStart classify_decl_start() const;
  [[nodiscard]] std::string_view parse_class_name(SourceRange & name_range);
  [[nodiscard]] std::string_view qualify(std::string_view name);

  // Function shape shared by functions and methods: name through body.
  // Returns false when no name could be read.
  bool parse_function_rest(std::string_view & name, SourceRange & name_range, bool & has_yield);

  // Class body
  [[nodiscard]] std::vector<ClassMember *> parse_class_body();
  [[nodiscard]] std::vector<ClassMember *> parse_enum_body();
  void parse_class_member(std::vector<ClassMember *> & out);
  [[nodiscard]] TraitUseDecl * parse_trait_use(const Token & start);
  [[nodiscard]] ClassRequireDecl * parse_require(const Token & start);
  void parse_xhp_attributes(const Token & start, std::vector<ClassMember *> & out);
  [[nodiscard]] XhpCategoryDecl * parse_xhp_category(const Token & start);
  [[nodiscard]] XhpChildrenDecl * parse_xhp_children(const Token & start);
  [[nodiscard]] MethodDecl * parse_method(
    const Token & start, const std::vector<ModifierKeyword> & mods, bool is_async);
  [[nodiscard]] ClassVarsDecl * parse_class_vars(
    const Token & start, const std::vector<ModifierKeyword> & mods, bool is_var);
  [[nodiscard]] ClassMember * parse_class_const(
    const Token & start, const std::vector<ModifierKeyword> & mods);
  [[nodiscard]] TypeConstDecl * parse_type_const(const Token & start, bool is_abstract);

  // Declarators
  [[nodiscard]] bool skip_type_to_declarator_name();
  [[nodiscard]] ConstEntry * parse_const_entry();
  [[nodiscard]] Expr * parse_opaque_expr(TokenKind extra_stop = TokenKind::Eof);
  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;

  std::string_view namespace_;  ///< current namespace, without leading backslash
};

}  // namespace hh_outline::syntax
