// crusty/syntax/frontend.cpp - Parse pipeline entry points
//
#include "crusty/syntax/frontend.hpp"

#include <utility>

#include "crusty/basic/log.hpp"
#include "crusty/syntax/lexer.hpp"
#include "crusty/syntax/parser.hpp"

namespace crusty
{
namespace
{

syntax::Parser make_parser(const SourceManager & sm, AstContext & ast, DiagnosticBag & diags)
{
  syntax::Lexer lexer(sm.get_source());
  auto tokens = lexer.lex_all();
  CRUSTY_LOG_TRACE("parser", "{}: {} tokens", sm.get_display_name(), tokens.size());
  return syntax::Parser(ast, sm, diags, std::move(tokens));
}

}  // namespace

Program * parse_source(const SourceManager & sm, AstContext & ast, DiagnosticBag & diags)
{
  auto parser = make_parser(sm, ast, diags);
  return parser.parse_program();
}

Expr * parse_expression_source(const SourceManager & sm, AstContext & ast, DiagnosticBag & diags)
{
  auto parser = make_parser(sm, ast, diags);
  return parser.parse_standalone_expr();
}

Stmt * parse_statement_source(const SourceManager & sm, AstContext & ast, DiagnosticBag & diags)
{
  auto parser = make_parser(sm, ast, diags);
  return parser.parse_standalone_stmt();
}

}  // namespace crusty
