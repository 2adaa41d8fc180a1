#include <gtest/gtest.h>

#include <vector>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/test_support/parse_helpers.hpp"

using namespace hh_outline;
using hh_outline::test_support::parse;

namespace
{

std::vector<ModifierKeyword> mods_of(gsl::span<ModifierKeyword> mods)
{
  return std::vector<ModifierKeyword>(mods.begin(), mods.end());
}

}  // namespace

TEST(SyntaxParserMembers, EveryMemberShape)
{
  auto unit = parse(
    "abstract class C extends B implements I {\n"
    "  const int A = 1, B = 2;\n"
    "  abstract const string NAME;\n"
    "  const type T = int;\n"
    "  abstract const type U as arraykey;\n"
    "  public static int $x = 1, $y;\n"
    "  private ?string $s;\n"
    "  use SomeTrait;\n"
    "  require extends Base;\n"
    "  public async function m(): Awaitable<void> {}\n"
    "  abstract protected function n(): void;\n"
    "}\n");
  ASSERT_TRUE(unit.diags().empty());

  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 10U);

  const auto * consts = dyn_cast<ClassConstDecl>(cls->members[0]);
  ASSERT_NE(consts, nullptr);
  ASSERT_EQ(consts->entries.size(), 2U);
  EXPECT_EQ(consts->entries[0]->name, "A");
  EXPECT_EQ(unit.slice(consts->entries[0]->value), "1");
  EXPECT_EQ(unit.slice(consts->entries[0]), "A = 1");
  EXPECT_EQ(consts->entries[1]->name, "B");

  const auto * abs = dyn_cast<AbsConstDecl>(cls->members[1]);
  ASSERT_NE(abs, nullptr);
  EXPECT_EQ(abs->name, "NAME");
  EXPECT_EQ(unit.slice(abs->nameRange), "NAME");
  EXPECT_EQ(unit.slice(abs), "abstract const string NAME;");

  const auto * t = dyn_cast<TypeConstDecl>(cls->members[2]);
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->name, "T");
  EXPECT_FALSE(t->isAbstract);
  EXPECT_EQ(unit.slice(t), "const type T = int;");

  const auto * u = dyn_cast<TypeConstDecl>(cls->members[3]);
  ASSERT_NE(u, nullptr);
  EXPECT_TRUE(u->isAbstract);

  const auto * xy = dyn_cast<ClassVarsDecl>(cls->members[4]);
  ASSERT_NE(xy, nullptr);
  EXPECT_EQ(
    mods_of(xy->modifiers),
    (std::vector<ModifierKeyword>{ModifierKeyword::Public, ModifierKeyword::Static}));
  ASSERT_EQ(xy->vars.size(), 2U);
  EXPECT_EQ(xy->vars[0]->name, "x");
  EXPECT_EQ(unit.slice(xy->vars[0]->nameRange), "$x");
  EXPECT_EQ(unit.slice(xy->vars[0]), "$x = 1");
  EXPECT_EQ(xy->vars[1]->name, "y");
  EXPECT_EQ(unit.slice(xy->vars[1]), "$y");
  EXPECT_EQ(xy->vars[1]->init, nullptr);

  const auto * s = dyn_cast<ClassVarsDecl>(cls->members[5]);
  ASSERT_NE(s, nullptr);
  ASSERT_EQ(s->vars.size(), 1U);
  EXPECT_EQ(s->vars[0]->name, "s");

  const auto * use = dyn_cast<TraitUseDecl>(cls->members[6]);
  ASSERT_NE(use, nullptr);
  ASSERT_EQ(use->traits.size(), 1U);
  EXPECT_EQ(use->traits[0], "SomeTrait");

  const auto * req = dyn_cast<ClassRequireDecl>(cls->members[7]);
  ASSERT_NE(req, nullptr);
  EXPECT_EQ(req->requireKind, RequireKind::Extends);
  EXPECT_EQ(req->name, "Base");

  const auto * m = dyn_cast<MethodDecl>(cls->members[8]);
  ASSERT_NE(m, nullptr);
  EXPECT_EQ(m->name, "m");
  EXPECT_EQ(m->funKind, FunKind::Async);
  EXPECT_EQ(mods_of(m->modifiers), (std::vector<ModifierKeyword>{ModifierKeyword::Public}));
  EXPECT_EQ(unit.slice(m), "public async function m(): Awaitable<void> {}");

  const auto * n = dyn_cast<MethodDecl>(cls->members[9]);
  ASSERT_NE(n, nullptr);
  EXPECT_EQ(
    mods_of(n->modifiers),
    (std::vector<ModifierKeyword>{ModifierKeyword::Abstract, ModifierKeyword::Protected}));
  EXPECT_EQ(unit.slice(n), "abstract protected function n(): void;");
}

TEST(SyntaxParserMembers, DuplicateModifiersAreKept)
{
  auto unit = parse("class C { public public static function f(): void {} }\n");
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  const auto * f = dyn_cast<MethodDecl>(cls->members[0]);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(
    mods_of(f->modifiers),
    (std::vector<ModifierKeyword>{
      ModifierKeyword::Public, ModifierKeyword::Public, ModifierKeyword::Static}));
}

TEST(SyntaxParserMembers, VarPropertiesAndGroupedTraitUse)
{
  auto unit = parse(
    "class C {\n"
    "  var $legacy;\n"
    "  use A, B {\n"
    "    A::f insteadof B;\n"
    "  }\n"
    "}\n");
  ASSERT_TRUE(unit.diags().empty());
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 2U);

  const auto * v = dyn_cast<ClassVarsDecl>(cls->members[0]);
  ASSERT_NE(v, nullptr);
  EXPECT_TRUE(v->isVar);
  EXPECT_TRUE(v->modifiers.empty());
  ASSERT_EQ(v->vars.size(), 1U);
  EXPECT_EQ(v->vars[0]->name, "legacy");

  const auto * use = dyn_cast<TraitUseDecl>(cls->members[1]);
  ASSERT_NE(use, nullptr);
  ASSERT_EQ(use->traits.size(), 2U);
  EXPECT_EQ(use->traits[1], "B");
}

TEST(SyntaxParserMembers, MethodWithAttributeAndGenericReturn)
{
  auto unit = parse(
    "class C {\n"
    "  <<__Override>>\n"
    "  public function get<T>(): dict<string, vec<T>> { return dict[]; }\n"
    "}\n");
  ASSERT_TRUE(unit.diags().empty());
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  const auto * get = dyn_cast<MethodDecl>(cls->members[0]);
  ASSERT_NE(get, nullptr);
  EXPECT_EQ(get->name, "get");
  EXPECT_EQ(
    unit.slice(get), "public function get<T>(): dict<string, vec<T>> { return dict[]; }");
}

TEST(SyntaxParserMembers, EnumMembersAreConstants)
{
  auto unit = parse(
    "enum Color: string {\n"
    "  RED = 'red';\n"
    "  GREEN = 'green';\n"
    "}\n");
  ASSERT_TRUE(unit.diags().empty());
  const auto * e = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->classKind, ClassKind::Enum);
  ASSERT_EQ(e->members.size(), 2U);

  const auto * red = dyn_cast<ClassConstDecl>(e->members[0]);
  ASSERT_NE(red, nullptr);
  ASSERT_EQ(red->entries.size(), 1U);
  EXPECT_EQ(red->entries[0]->name, "RED");
  EXPECT_EQ(unit.slice(red->entries[0]), "RED = 'red'");
}

TEST(SyntaxParserMembers, XhpClassMembers)
{
  auto unit = parse(
    "final class :ui:button extends :x:element {\n"
    "  attribute string title @required, int size = 3;\n"
    "  category %flow, %phrase;\n"
    "  children (:ui:icon)*;\n"
    "}\n");
  ASSERT_TRUE(unit.diags().empty());
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, ":ui:button");
  EXPECT_EQ(unit.slice(cls->nameRange), ":ui:button");
  EXPECT_TRUE(cls->isFinal);
  ASSERT_EQ(cls->members.size(), 4U);

  const auto * title = dyn_cast<XhpAttrDecl>(cls->members[0]);
  ASSERT_NE(title, nullptr);
  EXPECT_EQ(title->var->name, "title");
  EXPECT_TRUE(title->required);
  EXPECT_EQ(unit.slice(title), "attribute string title @required");

  const auto * size = dyn_cast<XhpAttrDecl>(cls->members[1]);
  ASSERT_NE(size, nullptr);
  EXPECT_EQ(size->var->name, "size");
  EXPECT_FALSE(size->required);
  EXPECT_EQ(unit.slice(size->var->init), "3");
  EXPECT_EQ(unit.slice(size), "int size = 3");

  const auto * cat = dyn_cast<XhpCategoryDecl>(cls->members[2]);
  ASSERT_NE(cat, nullptr);
  ASSERT_EQ(cat->categories.size(), 2U);
  EXPECT_EQ(cat->categories[0], "flow");
  EXPECT_EQ(cat->categories[1], "phrase");

  EXPECT_TRUE(isa<XhpChildrenDecl>(cls->members[3]));
}

TEST(SyntaxParserMembers, HyphenatedXhpAttributeName)
{
  auto unit = parse("class :a { attribute string data-id; }\n");
  ASSERT_TRUE(unit.diags().empty());
  const auto * cls = unit.decl_as<ClassDecl>(0);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1U);
  const auto * attr = dyn_cast<XhpAttrDecl>(cls->members[0]);
  ASSERT_NE(attr, nullptr);
  EXPECT_EQ(attr->var->name, "data-id");
}
