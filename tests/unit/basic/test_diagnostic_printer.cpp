#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "hh_outline/basic/diagnostic.hpp"
#include "hh_outline/basic/diagnostic_printer.hpp"
#include "hh_outline/basic/source_manager.hpp"
#include "hh_outline/syntax/frontend.hpp"

using namespace hh_outline;

TEST(BasicDiagnosticPrinter, MissingSemicolonWithFixit)
{
  const auto parsed = parse_file(
    "class C {\n"
    "  public int $x\n"
    "}\n",
    "a.php");
  ASSERT_EQ(parsed->diags.size(), 1U);

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(parsed->diags, parsed->source);
  const std::string text = out.str();

  EXPECT_NE(text.find("error: expected `;` after property declaration\n"), std::string::npos);
  EXPECT_NE(text.find("  --> a.php:2:14\n"), std::string::npos);
  EXPECT_NE(text.find("    2 |   public int $x\n"), std::string::npos);
  EXPECT_NE(text.find("^^ expected `;` after this"), std::string::npos);
  EXPECT_NE(text.find("help: add ';' here"), std::string::npos);
  EXPECT_NE(text.find("    2 |   public int $x;\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, CodeAndHelpAreRendered)
{
  const SourceFile file("b.php", "function f() {}\n");
  DiagnosticBag bag;
  bag.report_warning(SourceRange(9, 10), "odd name", "here").with_code("W0001").with_help("rename it");

  ASSERT_EQ(bag.size(), 1U);
  EXPECT_FALSE(bag.has_errors());
  EXPECT_EQ(bag.error_count(), 0U);

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, file);
  const std::string text = out.str();

  EXPECT_NE(text.find("warning[W0001]: odd name\n"), std::string::npos);
  EXPECT_NE(text.find("  --> b.php:1:10\n"), std::string::npos);
  EXPECT_NE(text.find("^ here"), std::string::npos);
  EXPECT_NE(text.find("   = help: rename it\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, StdinSourceHasPlaceholderName)
{
  const SourceFile file("x");
  DiagnosticBag bag;
  bag.report_error(SourceRange(0, 1), "boom");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, file);
  EXPECT_NE(out.str().find("  --> <stdin>:1:1\n"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, DiagnosticsAreSortedByLocation)
{
  const SourceFile file("c.php", "aaa\nbbb\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(4, 5), "second");
  bag.report_error(SourceRange(0, 1), "first");
  EXPECT_EQ(bag.error_count(), 2U);

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(bag, file);
  const std::string text = out.str();
  EXPECT_LT(text.find("error: first"), text.find("error: second"));
}
