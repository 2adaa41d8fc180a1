#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/ast/ast_context.hpp"

using namespace hh_outline;

TEST(AstContext, InterningSharesStorage)
{
  AstContext ctx;
  const std::string a = "MyClass";
  const std::string b = "MyClass";

  const std::string_view ia = ctx.intern(a);
  const std::string_view ib = ctx.intern(b);
  EXPECT_EQ(ia, "MyClass");
  EXPECT_EQ(ia.data(), ib.data());
  EXPECT_NE(ia.data(), a.data());
  EXPECT_TRUE(ctx.is_interned("MyClass"));
  EXPECT_FALSE(ctx.is_interned("Other"));
  EXPECT_EQ(ctx.get_string_count(), 1U);

  EXPECT_TRUE(ctx.intern("").empty());
  EXPECT_EQ(ctx.get_string_count(), 1U);
}

TEST(AstContext, ArraysAndNodes)
{
  AstContext ctx;
  auto * fn = ctx.create<FunDecl>(ctx.intern("f"), SourceRange(9, 10), SourceRange(0, 15));
  auto * stmt = ctx.create<StmtDecl>(SourceRange(16, 20));

  const std::vector<Decl *> decls = {fn, stmt};
  const gsl::span<Decl *> arena_decls = ctx.copy_to_arena(decls);
  ASSERT_EQ(arena_decls.size(), 2U);
  EXPECT_EQ(arena_decls[0], fn);
  EXPECT_EQ(arena_decls[1], stmt);

  EXPECT_TRUE(ctx.allocate_array<int>(0).empty());
  const gsl::span<int> zeros = ctx.allocate_array<int>(4);
  ASSERT_EQ(zeros.size(), 4U);
  EXPECT_EQ(zeros[3], 0);
}

TEST(AstCasting, CategoryChecks)
{
  AstContext ctx;
  const AstNode * fn = ctx.create<FunDecl>("f", SourceRange(0, 1));
  const AstNode * method = ctx.create<MethodDecl>("m", SourceRange(0, 1));
  const AstNode * expr = ctx.create<OpaqueExpr>(SourceRange(0, 1));
  const AstNode * var = ctx.create<ClassVar>("x", SourceRange(0, 2));

  EXPECT_TRUE(isa<Decl>(fn));
  EXPECT_TRUE(isa<FunDecl>(fn));
  EXPECT_FALSE(isa<ClassDecl>(fn));
  EXPECT_FALSE(isa<ClassMember>(fn));

  EXPECT_TRUE(isa<ClassMember>(method));
  EXPECT_FALSE(isa<Decl>(method));
  EXPECT_EQ(dyn_cast<MethodDecl>(method)->name, "m");
  EXPECT_EQ(dyn_cast<ClassVarsDecl>(method), nullptr);

  EXPECT_TRUE(isa<Expr>(expr));
  EXPECT_FALSE(isa<Expr>(var));
  EXPECT_FALSE(isa<ClassMember>(var));
  EXPECT_FALSE(isa<Decl>(static_cast<const AstNode *>(nullptr)));
}

TEST(AstEnums, Labels)
{
  EXPECT_EQ(to_string(NodeKind::MethodDecl), "method_decl");
  EXPECT_EQ(to_string(NodeKind::Program), "program");
  EXPECT_EQ(to_string(ModifierKeyword::Protected), "protected");
  EXPECT_EQ(to_string(FunKind::AsyncGenerator), "async_generator");
  EXPECT_EQ(to_string(ClassKind::Abstract), "abstract class");
  EXPECT_TRUE(is_async(FunKind::AsyncGenerator));
  EXPECT_FALSE(is_async(FunKind::Generator));
}

TEST(AstNodes, GetRangeOfNullIsInvalid)
{
  EXPECT_TRUE(get_range(nullptr).is_invalid());
  AstContext ctx;
  const auto * missing = ctx.create<MissingExpr>();
  EXPECT_TRUE(get_range(missing).is_invalid());
}
