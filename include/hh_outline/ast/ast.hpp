// hh_outline/ast/ast.hpp - AST node class definitions for the Hack subset
//
// Declaration-level syntax tree. Function bodies, types and parameter lists
// are not represented; initializers are kept as opaque source ranges.
// Nodes follow the LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "hh_outline/ast/ast_enums.hpp"
#include "hh_outline/basic/casting.hpp"
#include "hh_outline/basic/source_manager.hpp"

namespace hh_outline
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/// Base class for expressions.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for class body members.
class ClassMember : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_member_kind(node->kind); }

protected:
  explicit ClassMember(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for top-level declarations.
class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Expression whose structure is not modelled; only its extent is kept.
class OpaqueExpr : public NodeBase<OpaqueExpr, Expr, NodeKind::OpaqueExpr>
{
public:
  explicit OpaqueExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Placeholder for an expression the parser expected but did not find.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// One variable of a property declaration. `name` has no leading `$`.
class ClassVar : public NodeBase<ClassVar, AstNode, NodeKind::ClassVar>
{
public:
  std::string_view name;
  SourceRange nameRange;
  Expr * init = nullptr;

  ClassVar(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr)
  {
  }
};

/// `NAME = value` inside a constant group or an enum body.
class ConstEntry : public NodeBase<ConstEntry, AstNode, NodeKind::ConstEntry>
{
public:
  std::string_view name;
  SourceRange nameRange;
  Expr * value;

  ConstEntry(std::string_view n, SourceRange nr, Expr * v, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr), value(v)
  {
  }
};

// ============================================================================
// Class Member Nodes
// ============================================================================

class MethodDecl : public NodeBase<MethodDecl, ClassMember, NodeKind::MethodDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  gsl::span<ModifierKeyword> modifiers;
  FunKind funKind = FunKind::Sync;

  MethodDecl(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr)
  {
  }
};

/// Property group: `public static int $a = 1, $b;`
class ClassVarsDecl : public NodeBase<ClassVarsDecl, ClassMember, NodeKind::ClassVarsDecl>
{
public:
  gsl::span<ModifierKeyword> modifiers;
  gsl::span<ClassVar *> vars;
  bool isVar = false;  ///< declared with `var`

  explicit ClassVarsDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// One XHP attribute, e.g. `attribute string title @required;`
class XhpAttrDecl : public NodeBase<XhpAttrDecl, ClassMember, NodeKind::XhpAttrDecl>
{
public:
  ClassVar * var;
  bool required = false;

  explicit XhpAttrDecl(ClassVar * v, SourceRange r = {}) : NodeBase(r), var(v) {}
};

/// Constant group: `const int A = 1, B = 2;`
class ClassConstDecl : public NodeBase<ClassConstDecl, ClassMember, NodeKind::ClassConstDecl>
{
public:
  gsl::span<ConstEntry *> entries;

  explicit ClassConstDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// `abstract const int A;`
class AbsConstDecl : public NodeBase<AbsConstDecl, ClassMember, NodeKind::AbsConstDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;

  AbsConstDecl(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr)
  {
  }
};

/// `[abstract] const type T [as U] [= V];`
class TypeConstDecl : public NodeBase<TypeConstDecl, ClassMember, NodeKind::TypeConstDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  bool isAbstract = false;

  TypeConstDecl(std::string_view n, SourceRange nr, bool abstract, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr), isAbstract(abstract)
  {
  }
};

class TraitUseDecl : public NodeBase<TraitUseDecl, ClassMember, NodeKind::TraitUseDecl>
{
public:
  gsl::span<std::string_view> traits;

  explicit TraitUseDecl(SourceRange r = {}) : NodeBase(r) {}
};

class ClassRequireDecl
: public NodeBase<ClassRequireDecl, ClassMember, NodeKind::ClassRequireDecl>
{
public:
  RequireKind requireKind;
  std::string_view name;

  ClassRequireDecl(RequireKind k, std::string_view n, SourceRange r = {})
  : NodeBase(r), requireKind(k), name(n)
  {
  }
};

class XhpCategoryDecl : public NodeBase<XhpCategoryDecl, ClassMember, NodeKind::XhpCategoryDecl>
{
public:
  gsl::span<std::string_view> categories;

  explicit XhpCategoryDecl(SourceRange r = {}) : NodeBase(r) {}
};

class XhpChildrenDecl : public NodeBase<XhpChildrenDecl, ClassMember, NodeKind::XhpChildrenDecl>
{
public:
  explicit XhpChildrenDecl(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// Top-level function. `name` is namespace-qualified (`\NS\f`) when declared
/// inside a namespace.
class FunDecl : public NodeBase<FunDecl, Decl, NodeKind::FunDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  FunKind funKind = FunKind::Sync;

  FunDecl(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr)
  {
  }
};

/// class / interface / trait / enum
class ClassDecl : public NodeBase<ClassDecl, Decl, NodeKind::ClassDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  ClassKind classKind = ClassKind::Normal;
  bool isFinal = false;
  gsl::span<ClassMember *> members;

  ClassDecl(std::string_view n, SourceRange nr, ClassKind k, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr), classKind(k)
  {
  }
};

/// `type` or `newtype` alias.
class TypedefDecl : public NodeBase<TypedefDecl, Decl, NodeKind::TypedefDecl>
{
public:
  std::string_view name;
  bool isNewtype = false;

  TypedefDecl(std::string_view n, bool newtype, SourceRange r = {})
  : NodeBase(r), name(n), isNewtype(newtype)
  {
  }
};

/// Module-level `const`.
class ConstantDecl : public NodeBase<ConstantDecl, Decl, NodeKind::ConstantDecl>
{
public:
  std::string_view name;
  Expr * value;

  ConstantDecl(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// Marks the start of a namespace. Empty name is the global namespace.
class NamespaceDecl : public NodeBase<NamespaceDecl, Decl, NodeKind::NamespaceDecl>
{
public:
  std::string_view name;

  explicit NamespaceDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class NamespaceUseDecl : public NodeBase<NamespaceUseDecl, Decl, NodeKind::NamespaceUseDecl>
{
public:
  explicit NamespaceUseDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// Any top-level statement; kept only for its extent.
class StmtDecl : public NodeBase<StmtDecl, Decl, NodeKind::StmtDecl>
{
public:
  explicit StmtDecl(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/// Program (root AST node). Declarations appear in source order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Decl *> decls;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

/**
 * Get the SourceRange from any AST node.
 */
[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace hh_outline
