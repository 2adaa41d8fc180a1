// hh_outline/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds and the declaration attributes (modifier keywords, function
// kinds, class kinds) recorded by the parser.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace hh_outline
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "hh_outline/ast/ast_nodes.def"

// === Class members ===
#define AST_NODE_MEMBER(Class, Kind, Snake) Kind,
#include "hh_outline/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "hh_outline/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "hh_outline/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "hh_outline/ast/ast_nodes.def"
};

// ============================================================================
// Declaration attributes
// ============================================================================

/// Modifier keyword as written in the source.
enum class ModifierKeyword : uint8_t {
  Final,
  Static,
  Abstract,
  Private,
  Public,
  Protected,
};

/**
 * Function kind.
 * `async` marks Async; a body containing `yield` marks Generator.
 */
enum class FunKind : uint8_t {
  Sync,
  Async,
  Generator,
  AsyncGenerator,
};

/// Class-like declaration kind. `final` is tracked separately.
enum class ClassKind : uint8_t {
  Normal,     ///< class
  Abstract,   ///< abstract class
  Interface,  ///< interface
  Trait,      ///< trait
  Enum,       ///< enum
};

/// `require extends` / `require implements`
enum class RequireKind : uint8_t { Extends, Implements };

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Kind, Snake) \
  case NodeKind::Kind:               \
    return #Snake;
#define AST_NODE_EXPR AST_NODE
#define AST_NODE_MEMBER AST_NODE
#define AST_NODE_DECL AST_NODE
#define AST_NODE_SUPPORT AST_NODE
#define AST_NODE_TOP AST_NODE
#include "hh_outline/ast/ast_nodes.def"
#undef AST_NODE
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ModifierKeyword kw) noexcept
{
  switch (kw) {
    case ModifierKeyword::Final:
      return "final";
    case ModifierKeyword::Static:
      return "static";
    case ModifierKeyword::Abstract:
      return "abstract";
    case ModifierKeyword::Private:
      return "private";
    case ModifierKeyword::Public:
      return "public";
    case ModifierKeyword::Protected:
      return "protected";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FunKind kind) noexcept
{
  switch (kind) {
    case FunKind::Sync:
      return "sync";
    case FunKind::Async:
      return "async";
    case FunKind::Generator:
      return "generator";
    case FunKind::AsyncGenerator:
      return "async_generator";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ClassKind kind) noexcept
{
  switch (kind) {
    case ClassKind::Normal:
      return "class";
    case ClassKind::Abstract:
      return "abstract class";
    case ClassKind::Interface:
      return "interface";
    case ClassKind::Trait:
      return "trait";
    case ClassKind::Enum:
      return "enum";
  }
  return "";
}

[[nodiscard]] constexpr bool is_async(FunKind kind) noexcept
{
  return kind == FunKind::Async || kind == FunKind::AsyncGenerator;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::OpaqueExpr;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_member_kind = NodeKind::MethodDecl;
inline constexpr NodeKind k_last_member_kind = NodeKind::XhpChildrenDecl;

inline constexpr NodeKind k_first_decl_kind = NodeKind::FunDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::StmtDecl;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a class body member
[[nodiscard]] constexpr bool is_member_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_member_kind && kind <= detail::k_last_member_kind;
}

/// Check if a NodeKind is a top-level declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace hh_outline
