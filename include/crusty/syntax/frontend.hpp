// crusty/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include "crusty/ast/ast.hpp"
#include "crusty/ast/ast_context.hpp"
#include "crusty/basic/diagnostic.hpp"
#include "crusty/basic/source_manager.hpp"

namespace crusty
{

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// Each entry point returns nullptr when a lexical or parse error was reported.
[[nodiscard]] Program * parse_source(
  const SourceManager & sm, AstContext & ast, DiagnosticBag & diags);

[[nodiscard]] Expr * parse_expression_source(
  const SourceManager & sm, AstContext & ast, DiagnosticBag & diags);

[[nodiscard]] Stmt * parse_statement_source(
  const SourceManager & sm, AstContext & ast, DiagnosticBag & diags);

}  // namespace crusty
