// hh_outline/test_support/parse_helpers.hpp - helpers for unit tests
//
// A thin wrapper over parse_file() that keeps the source, AST arena and
// diagnostics together and offers slice helpers for range assertions.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "hh_outline/ast/ast.hpp"
#include "hh_outline/basic/casting.hpp"
#include "hh_outline/syntax/frontend.hpp"

namespace hh_outline::test_support
{

struct TestParseUnit
{
  std::unique_ptr<ParsedFile> parsed;

  [[nodiscard]] const SourceFile & source() const noexcept { return parsed->source; }
  [[nodiscard]] const DiagnosticBag & diags() const noexcept { return parsed->diags; }
  [[nodiscard]] const Program & program() const noexcept { return *parsed->program; }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return parsed->source.get_slice(r);
  }

  [[nodiscard]] std::string_view slice(const AstNode * node) const noexcept
  {
    return slice(get_range(node));
  }

  /// Top-level declaration `i` as T, or nullptr if out of range or of another kind.
  template <typename T>
  [[nodiscard]] const T * decl_as(size_t i) const
  {
    const auto decls = parsed->program->decls;
    if (i >= decls.size()) return nullptr;
    return dyn_cast<T>(decls[i]);
  }

  /// The n-th top-level declaration of type T.
  template <typename T>
  [[nodiscard]] const T * nth(size_t n) const
  {
    for (const Decl * d : parsed->program->decls) {
      if (const auto * x = dyn_cast<T>(d)) {
        if (n == 0) return x;
        --n;
      }
    }
    return nullptr;
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "test.php")
{
  TestParseUnit out;
  out.parsed = parse_file(std::move(src), virtual_path);
  return out;
}

}  // namespace hh_outline::test_support
