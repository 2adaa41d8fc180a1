#include <gtest/gtest.h>

#include <string>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/test_support/parse_helpers.hpp"

using namespace hh_outline;
using hh_outline::test_support::parse;

namespace
{

bool has_message(const DiagnosticBag & diags, const std::string & needle)
{
  for (const auto & d : diags) {
    if (d.message.find(needle) != std::string::npos) return true;
  }
  return false;
}

}  // namespace

TEST(SyntaxParserRecovery, MissingSemicolonIsReportedAfterPreviousToken)
{
  auto unit = parse(
    "class C {\n"
    "  public int $x\n"
    "  public function f(): void {}\n"
    "}\n");
  ASSERT_EQ(unit.diags().size(), 1U);
  const Diagnostic & d = unit.diags().all()[0];
  EXPECT_EQ(d.message, "expected `;` after property declaration");
  EXPECT_EQ(unit.slice(d.primary_range()), "$x");
  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits[0].replacement_text, ";");

  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 2U);
  EXPECT_TRUE(isa<ClassVarsDecl>(cls->members[0]));
  EXPECT_TRUE(isa<MethodDecl>(cls->members[1]));
}

TEST(SyntaxParserRecovery, UnclosedClassBodyStopsAtNextClass)
{
  auto unit = parse(
    "class A {\n"
    "  public function f(): void {}\n"
    "\n"
    "class B {}\n");
  EXPECT_TRUE(has_message(unit.diags(), "expected `}` to close the class body"));

  ASSERT_EQ(unit.program().decls.size(), 2U);
  const auto * a = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->members.size(), 1U);
  const auto * b = unit.decl_as<ClassDecl>(1);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->name, "B");
}

TEST(SyntaxParserRecovery, UnterminatedStringInsideMethodBody)
{
  auto unit = parse(
    "class C {\n"
    "  public function f(): void { $x = 'oops; }\n"
    "}\n");
  EXPECT_TRUE(unit.diags().has_errors());
  EXPECT_TRUE(has_message(unit.diags(), "unterminated string literal"));

  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  const auto * f = dyn_cast<MethodDecl>(cls->members[0]);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->name, "f");
}

TEST(SyntaxParserRecovery, StrayClosingBraceAtTopLevel)
{
  auto unit = parse(
    "}\n"
    "function f(): void {}\n");
  EXPECT_TRUE(has_message(unit.diags(), "unexpected `}`"));
  ASSERT_EQ(unit.program().decls.size(), 1U);
  EXPECT_NE(unit.decl_as<FunDecl>(0), nullptr);
}

TEST(SyntaxParserRecovery, MethodWithoutNameIsDropped)
{
  auto unit = parse(
    "class C {\n"
    "  public function (): void {}\n"
    "  public function ok(): void {}\n"
    "}\n");
  EXPECT_TRUE(has_message(unit.diags(), "expected function name"));
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  const auto * ok = dyn_cast<MethodDecl>(cls->members[0]);
  ASSERT_NE(ok, nullptr);
  EXPECT_EQ(ok->name, "ok");
}

TEST(SyntaxParserRecovery, GarbageMemberIsSkipped)
{
  auto unit = parse(
    "class C {\n"
    "  42 + 1;\n"
    "  public function f(): void {}\n"
    "}\n");
  EXPECT_TRUE(has_message(unit.diags(), "expected a class member declaration"));
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  EXPECT_TRUE(isa<MethodDecl>(cls->members[0]));
}

TEST(SyntaxParserRecovery, ConstantWithoutInitializerSpansItsName)
{
  auto unit = parse("class C { const int X; }\n");
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  const auto * group = dyn_cast<ClassConstDecl>(cls->members[0]);
  ASSERT_NE(group, nullptr);
  ASSERT_EQ(group->entries.size(), 1U);
  EXPECT_TRUE(isa<MissingExpr>(group->entries[0]->value));
  EXPECT_EQ(unit.slice(group->entries[0]), "X");
}

TEST(SyntaxParserRecovery, EmptyAndTagOnlyFilesParse)
{
  EXPECT_TRUE(parse("").program().decls.empty());
  auto unit = parse("<?hh\n");
  EXPECT_TRUE(unit.diags().empty());
  EXPECT_TRUE(unit.program().decls.empty());
}

TEST(SyntaxParserRecovery, BestEffortDropsDiagnostics)
{
  auto parsed = parse_best_effort("class C { public int $x }\n");
  EXPECT_TRUE(parsed->diags.empty());
  ASSERT_NE(parsed->program, nullptr);
  EXPECT_EQ(parsed->program->decls.size(), 1U);
}
