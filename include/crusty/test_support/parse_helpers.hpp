// crusty/test_support/parse_helpers.hpp - helpers for unit tests
//
// These helpers provide a lightweight single-unit parsing pipeline for tests.
// A TestParseUnit owns the source, the AST arena and the diagnostics so that
// the returned nodes stay valid for the lifetime of the unit.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "crusty/ast/ast_context.hpp"
#include "crusty/basic/diagnostic.hpp"
#include "crusty/basic/source_manager.hpp"
#include "crusty/syntax/frontend.hpp"

namespace crusty::test_support
{

struct TestParseUnit
{
  std::unique_ptr<SourceManager> source;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;
  Expr * expr = nullptr;
  Stmt * stmt = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return source->get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return source->get_full_range(r);
  }
};

namespace detail
{

inline TestParseUnit make_unit(std::string src)
{
  TestParseUnit out;
  out.source = std::make_unique<SourceManager>("<test>.crst", std::move(src));
  out.ast = std::make_unique<AstContext>();
  return out;
}

}  // namespace detail

/// Parse a whole unit.
[[nodiscard]] inline TestParseUnit parse(std::string src)
{
  TestParseUnit out = detail::make_unit(std::move(src));
  out.program = parse_source(*out.source, *out.ast, out.diags);
  return out;
}

/// Parse a single expression.
[[nodiscard]] inline TestParseUnit parse_expr(std::string src)
{
  TestParseUnit out = detail::make_unit(std::move(src));
  out.expr = parse_expression_source(*out.source, *out.ast, out.diags);
  return out;
}

/// Parse a single statement.
[[nodiscard]] inline TestParseUnit parse_stmt(std::string src)
{
  TestParseUnit out = detail::make_unit(std::move(src));
  out.stmt = parse_statement_source(*out.source, *out.ast, out.diags);
  return out;
}

}  // namespace crusty::test_support
