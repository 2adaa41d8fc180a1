#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "hh_outline/outline/legacy.hpp"
#include "hh_outline/outline/outline_builder.hpp"

using namespace hh_outline;

namespace
{

const char * const k_fixture =
  "<?hh\n"
  "function a(): void {}\n"
  "class B {\n"
  "  public function m1(): void {}\n"
  "  public static function m2(): void {}\n"
  "  public int $p = 1;\n"
  "  const C = 1;\n"
  "  const type T = int;\n"
  "}\n"
  "interface I { public function im(): void; }\n"
  "function z(): void {}\n";

Def make(DefKind kind, std::string name, std::vector<Modifier> mods = {}, std::vector<Def> children = {})
{
  Def d;
  d.kind = kind;
  d.name = std::move(name);
  d.modifiers = std::move(mods);
  d.children = std::move(children);
  return d;
}

std::vector<std::string> names_of(const std::vector<LegacyEntry> & entries)
{
  std::vector<std::string> out;
  for (const auto & e : entries) out.push_back(e.name);
  return out;
}

std::vector<std::string> types_of(const std::vector<LegacyEntry> & entries)
{
  std::vector<std::string> out;
  for (const auto & e : entries) out.emplace_back(to_string(e.type));
  return out;
}

}  // namespace

// Regression: a container precedes its members and siblings keep source order.
TEST(OutlineLegacy, ForwardPreOrder)
{
  const auto entries = outline_legacy(k_fixture, "f.php");
  EXPECT_EQ(
    names_of(entries),
    (std::vector<std::string>{"a", "B", "B::m1", "B::m2", "I", "I::im", "z"}));
  EXPECT_EQ(
    types_of(entries), (std::vector<std::string>{
                         "function", "class", "method", "static method", "class", "method",
                         "function"}));
}

TEST(OutlineLegacy, PositionsAreTheDefPositions)
{
  const Outline out = outline(k_fixture, "f.php");
  const auto entries = to_legacy(out);
  ASSERT_EQ(entries.size(), 7U);
  EXPECT_EQ(entries[0].pos, out[0].pos);
  EXPECT_EQ(entries[1].pos, out[1].pos);
  EXPECT_EQ(entries[2].pos, out[1].children[0].pos);
  EXPECT_EQ(entries[3].pos, out[1].children[1].pos);
  EXPECT_EQ(entries[5].pos, out[2].children[0].pos);
  EXPECT_EQ(entries[0].pos.file, "f.php");
}

TEST(OutlineLegacy, EntryCountMatchesFunctionsContainersAndMethods)
{
  const Outline out = outline(k_fixture);
  size_t expected = 0;
  for (const Def & def : out) {
    ++expected;
    for (const Def & child : def.children) {
      if (child.kind == DefKind::Method) ++expected;
    }
  }
  EXPECT_EQ(to_legacy(out).size(), expected);
}

TEST(OutlineLegacy, NestedContainersQualifyMethods)
{
  const Outline forest = {
    make(
      DefKind::Class, "Outer", {},
      {
        make(DefKind::Property, "prop"),
        make(
          DefKind::Trait, "Inner", {},
          {make(DefKind::Method, "m", {Modifier::Public}),
           make(DefKind::Method, "s", {Modifier::Private, Modifier::Static})}),
        make(DefKind::Typeconst, "T"),
      }),
    make(DefKind::Enum, "E", {}, {make(DefKind::Const, "A")}),
  };

  const auto entries = to_legacy(forest);
  EXPECT_EQ(
    names_of(entries),
    (std::vector<std::string>{"Outer", "Inner", "Outer::Inner::m", "Outer::Inner::s", "E"}));
  EXPECT_EQ(
    types_of(entries),
    (std::vector<std::string>{"class", "class", "method", "static method", "class"}));
}

TEST(OutlineLegacy, LeafKindsProduceNoEntries)
{
  const Outline forest = {
    make(DefKind::Class, "C", {}, {make(DefKind::Property, "p"), make(DefKind::Const, "K")}),
  };
  const auto entries = to_legacy(forest);
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0].name, "C");
  EXPECT_TRUE(to_legacy({}).empty());
}

TEST(OutlineLegacy, KindLabels)
{
  EXPECT_EQ(to_string(LegacyKind::Function), "function");
  EXPECT_EQ(to_string(LegacyKind::Class), "class");
  EXPECT_EQ(to_string(LegacyKind::Method), "method");
  EXPECT_EQ(to_string(LegacyKind::StaticMethod), "static method");

  const auto entries = outline_legacy("class C { public static function s(): void {} }");
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].type, LegacyKind::Class);
  EXPECT_EQ(entries[1].type, LegacyKind::StaticMethod);
}
