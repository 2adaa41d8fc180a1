#include <gtest/gtest.h>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/test_support/parse_helpers.hpp"

using namespace hh_outline;
using hh_outline::test_support::parse;

TEST(SyntaxParserDecls, TopLevelFunctionsAndKinds)
{
  auto unit = parse(
    "<?hh\n"
    "function f(): void {}\n"
    "async function g(): Awaitable<void> {}\n"
    "function gen(): Generator<int, int, void> { yield 1; }\n"
    "async function agen(): AsyncGenerator<int, int, void> { yield 1; }\n");
  ASSERT_TRUE(unit.diags().empty());
  ASSERT_EQ(unit.program().decls.size(), 4U);

  const auto * f = unit.decl_as<FunDecl>(0);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->name, "f");
  EXPECT_EQ(unit.slice(f->nameRange), "f");
  EXPECT_EQ(unit.slice(f), "function f(): void {}");
  EXPECT_EQ(f->funKind, FunKind::Sync);

  const auto * g = unit.decl_as<FunDecl>(1);
  ASSERT_NE(g, nullptr);
  EXPECT_EQ(g->funKind, FunKind::Async);
  EXPECT_EQ(unit.slice(g), "async function g(): Awaitable<void> {}");

  ASSERT_NE(unit.decl_as<FunDecl>(2), nullptr);
  EXPECT_EQ(unit.decl_as<FunDecl>(2)->funKind, FunKind::Generator);
  ASSERT_NE(unit.decl_as<FunDecl>(3), nullptr);
  EXPECT_EQ(unit.decl_as<FunDecl>(3)->funKind, FunKind::AsyncGenerator);
}

TEST(SyntaxParserDecls, FunctionWithTypeParamsAndNoBody)
{
  auto unit = parse("function id<T>(T $x): T;\n");
  ASSERT_TRUE(unit.diags().empty());
  const auto * f = unit.decl_as<FunDecl>(0);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->name, "id");
  EXPECT_EQ(unit.slice(f), "function id<T>(T $x): T;");
}

TEST(SyntaxParserDecls, ClassKindsAndFlags)
{
  auto unit = parse(
    "abstract class A extends B implements I {}\n"
    "final class F {}\n"
    "abstract final class AF {}\n"
    "interface I extends J {}\n"
    "trait T {}\n"
    "enum E: int as int {}\n");
  ASSERT_TRUE(unit.diags().empty());
  ASSERT_EQ(unit.program().decls.size(), 6U);

  const auto * a = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->name, "A");
  EXPECT_EQ(a->classKind, ClassKind::Abstract);
  EXPECT_FALSE(a->isFinal);
  EXPECT_EQ(unit.slice(a), "abstract class A extends B implements I {}");

  const auto * f = unit.decl_as<ClassDecl>(1);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->classKind, ClassKind::Normal);
  EXPECT_TRUE(f->isFinal);

  const auto * af = unit.decl_as<ClassDecl>(2);
  ASSERT_NE(af, nullptr);
  EXPECT_EQ(af->classKind, ClassKind::Abstract);
  EXPECT_TRUE(af->isFinal);

  EXPECT_EQ(unit.decl_as<ClassDecl>(3)->classKind, ClassKind::Interface);
  EXPECT_EQ(unit.decl_as<ClassDecl>(4)->classKind, ClassKind::Trait);

  const auto * e = unit.decl_as<ClassDecl>(5);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->classKind, ClassKind::Enum);
  EXPECT_EQ(unit.slice(e->nameRange), "E");
}

TEST(SyntaxParserDecls, OtherTopLevelDeclarations)
{
  auto unit = parse(
    "<?hh\n"
    "use namespace HH\\Lib\\{C, Vec};\n"
    "type Point = shape('x' => int, 'y' => int);\n"
    "newtype Id = int;\n"
    "const int LIMIT = 10, OTHER = 20;\n"
    "echo 'hi';\n"
    "if ($x) { f(); } else { g(); }\n");
  ASSERT_TRUE(unit.diags().empty());

  const auto decls = unit.program().decls;
  ASSERT_EQ(decls.size(), 7U);
  EXPECT_TRUE(isa<NamespaceUseDecl>(decls[0]));

  const auto * point = unit.decl_as<TypedefDecl>(1);
  ASSERT_NE(point, nullptr);
  EXPECT_EQ(point->name, "Point");
  EXPECT_FALSE(point->isNewtype);
  ASSERT_NE(unit.decl_as<TypedefDecl>(2), nullptr);
  EXPECT_TRUE(unit.decl_as<TypedefDecl>(2)->isNewtype);

  const auto * limit = unit.decl_as<ConstantDecl>(3);
  ASSERT_NE(limit, nullptr);
  EXPECT_EQ(limit->name, "LIMIT");
  EXPECT_EQ(unit.slice(limit->value), "10");
  ASSERT_NE(unit.decl_as<ConstantDecl>(4), nullptr);
  EXPECT_EQ(unit.decl_as<ConstantDecl>(4)->name, "OTHER");

  EXPECT_TRUE(isa<StmtDecl>(decls[5]));
  EXPECT_EQ(unit.slice(decls[5]), "echo 'hi';");
  EXPECT_TRUE(isa<StmtDecl>(decls[6]));
  EXPECT_EQ(unit.slice(decls[6]), "if ($x) { f(); } else { g(); }");
}

TEST(SyntaxParserDecls, AttributesAreSkipped)
{
  auto unit = parse(
    "<<__EntryPoint>>\n"
    "function main(): void {}\n");
  ASSERT_TRUE(unit.diags().empty());
  ASSERT_EQ(unit.program().decls.size(), 1U);
  const auto * f = unit.decl_as<FunDecl>(0);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(unit.slice(f), "function main(): void {}");
}

TEST(SyntaxParserDecls, FileScopedNamespaceQualifiesNames)
{
  auto unit = parse(
    "<?hh\n"
    "namespace NS\\Sub;\n"
    "function f(): void {}\n"
    "class C {}\n");
  ASSERT_TRUE(unit.diags().empty());

  const auto * ns = unit.nth<NamespaceDecl>(0);
  ASSERT_NE(ns, nullptr);
  EXPECT_EQ(ns->name, "NS\\Sub");

  ASSERT_NE(unit.nth<FunDecl>(0), nullptr);
  EXPECT_EQ(unit.nth<FunDecl>(0)->name, "\\NS\\Sub\\f");
  ASSERT_NE(unit.nth<ClassDecl>(0), nullptr);
  EXPECT_EQ(unit.nth<ClassDecl>(0)->name, "\\NS\\Sub\\C");
}

TEST(SyntaxParserDecls, NamespaceBlocksAreSplicedInOrder)
{
  auto unit = parse(
    "namespace A {\n"
    "  function f(): void {}\n"
    "}\n"
    "namespace {\n"
    "  function g(): void {}\n"
    "}\n");
  ASSERT_TRUE(unit.diags().empty());

  const auto decls = unit.program().decls;
  ASSERT_EQ(decls.size(), 4U);
  EXPECT_TRUE(isa<NamespaceDecl>(decls[0]));
  ASSERT_NE(unit.decl_as<FunDecl>(1), nullptr);
  EXPECT_EQ(unit.decl_as<FunDecl>(1)->name, "\\A\\f");
  EXPECT_TRUE(isa<NamespaceDecl>(decls[2]));
  ASSERT_NE(unit.decl_as<FunDecl>(3), nullptr);
  EXPECT_EQ(unit.decl_as<FunDecl>(3)->name, "g");
}

TEST(SyntaxParserDecls, CommentsDoNotReachTheParser)
{
  auto unit = parse(
    "// function hidden() {}\n"
    "/* class Hidden {} */\n"
    "# const X = 1;\n"
    "function shown(): void {}\n");
  ASSERT_TRUE(unit.diags().empty());
  ASSERT_EQ(unit.program().decls.size(), 1U);
  ASSERT_NE(unit.decl_as<FunDecl>(0), nullptr);
  EXPECT_EQ(unit.decl_as<FunDecl>(0)->name, "shown");
}
