// xmas/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-string parsing pipeline that keeps the source text, the AST arena
// and the diagnostics together for the lifetime of a test.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "xmas/ast/ast_context.hpp"
#include "xmas/basic/diagnostic.hpp"
#include "xmas/basic/source_manager.hpp"
#include "xmas/syntax/frontend.hpp"

namespace xmas::test_support
{

struct TestParseUnit
{
  SourceManager source;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] bool ok() const noexcept { return program != nullptr && !diags.has_errors(); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source.get_source_slice(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(std::string src)
{
  TestParseUnit out;
  out.source = SourceManager(std::move(src));
  out.ast = std::make_unique<AstContext>();
  out.program = parse_source(out.source.get_source(), *out.ast, out.diags);
  return out;
}

}  // namespace xmas::test_support
