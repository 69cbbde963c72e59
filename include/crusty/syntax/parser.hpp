// crusty/syntax/parser.hpp - Recursive-descent parser for crusty source
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crusty/ast/ast.hpp"
#include "crusty/ast/ast_context.hpp"
#include "crusty/basic/diagnostic.hpp"
#include "crusty/basic/source_manager.hpp"
#include "crusty/syntax/token.hpp"

namespace crusty::syntax
{

/**
 * Recursive-descent / precedence-climbing parser.
 *
 * Parsing is fail-fast: the first malformed construct reports one E0001
 * diagnostic (expected/found) and the whole unit is abandoned.
 *
 * Local ambiguities (cast vs. parenthesized expression vs. tuple, C-style
 * declaration vs. expression statement, nested function vs. call) are
 * resolved by speculative parsing from a saved cursor checkpoint. While
 * speculating no diagnostics are reported.
 */
class Parser
{
public:
  Parser(AstContext & ast, const SourceManager & sm, DiagnosticBag & diags, std::vector<Token> tokens);

  /// Parse a whole unit. Returns nullptr after a parse error.
  [[nodiscard]] Program * parse_program();

  /// Parse a single expression spanning the whole token stream.
  [[nodiscard]] Expr * parse_standalone_expr();

  /// Parse a single statement spanning the whole token stream.
  [[nodiscard]] Stmt * parse_standalone_stmt();

private:
  struct Checkpoint
  {
    size_t idx;
  };

  // Token helpers. `adjacent(n)` is true when token n starts exactly where
  // token n-1 ends (n = 0 compares the current token with the previous one).
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;
  [[nodiscard]] bool adjacent(size_t lookahead) const;
  [[nodiscard]] bool at_shr() const;
  [[nodiscard]] bool at_shr_assign() const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  const Token & expect(TokenKind k, std::string_view what);
  void expect_kw(std::string_view kw);
  std::string_view expect_ident(std::string_view what);

  [[noreturn]] void fail(
    SourceRange range, const std::string & message, const char * code = diag_code::k_parse_error);
  /// Report `expected <what>, found <current token>` and abort.
  [[noreturn]] void fail_here(const std::string & expected);
  [[nodiscard]] bool check_lexical_errors();

  [[nodiscard]] Checkpoint save() const { return Checkpoint{idx_}; }
  void restore(Checkpoint cp) { idx_ = cp.idx; }

  template <typename Fn>
  auto speculate(Fn && fn) -> decltype(fn());

  [[nodiscard]] SourceRange range_from(const Token & start) const;

  // Docs / attributes
  [[nodiscard]] std::vector<std::string_view> collect_line_docs();
  void skip_docs();
  [[nodiscard]] std::vector<Attribute *> parse_attributes();

  // Items
  [[nodiscard]] Decl * parse_item(
    const std::vector<std::string_view> & docs, const std::vector<Attribute *> & attrs);
  [[nodiscard]] FunctionDecl * parse_function_rest(
    TypeNode * ret, std::string_view name, const Token & start,
    const std::vector<std::string_view> & docs);
  [[nodiscard]] gsl::span<ParamDecl *> parse_params();
  [[nodiscard]] ParamDecl * parse_param();
  [[nodiscard]] StructDecl * parse_struct(const Token & start, Visibility vis);
  [[nodiscard]] EnumDecl * parse_enum(const Token & start, Visibility vis);
  [[nodiscard]] TypedefDecl * parse_typedef(const Token & start, Visibility vis);
  [[nodiscard]] ImplBlockDecl * parse_impl_block(const Token & start);
  [[nodiscard]] ExternBlockDecl * parse_extern_block(const Token & start);
  [[nodiscard]] MacroDefDecl * parse_macro_def(const Token & start);
  [[nodiscard]] std::vector<FunctionDecl *> parse_member_functions_until_rbrace();

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] BlockStmt * parse_body();
  [[nodiscard]] Stmt * parse_labeled_loop();
  [[nodiscard]] Stmt * parse_if();
  [[nodiscard]] Stmt * parse_while(std::string_view label, const Token & start);
  [[nodiscard]] Stmt * parse_loop(std::string_view label, const Token & start);
  [[nodiscard]] Stmt * parse_for(std::string_view label, const Token & start);
  [[nodiscard]] Stmt * parse_switch();
  [[nodiscard]] std::vector<Stmt *> parse_case_body();
  [[nodiscard]] Stmt * parse_return();
  [[nodiscard]] std::string_view parse_jump_label();
  [[nodiscard]] DeclStmt * parse_keyword_decl();
  [[nodiscard]] DeclStmt * try_parse_implicit_decl();
  [[nodiscard]] NestedFunctionStmt * try_parse_nested_function(bool is_static, const Token & start);
  [[nodiscard]] DeclStmt * finish_decl(
    DeclStmt * decl, TypeNode * type, const Token & start, bool require_init);

  // Types
  [[nodiscard]] TypeNode * parse_type();
  [[nodiscard]] TypeNode * parse_type_atom();
  [[nodiscard]] gsl::span<TypeNode *> parse_generic_args();
  void expect_generic_close();
  [[nodiscard]] static bool is_unambiguous_type(const TypeNode * type);

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_assignment();
  [[nodiscard]] Expr * parse_ternary();
  [[nodiscard]] Expr * parse_range();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_bitor();
  [[nodiscard]] Expr * parse_bitxor();
  [[nodiscard]] Expr * parse_bitand();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_shift();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * try_parse_cast();
  [[nodiscard]] Expr * parse_postfix(Expr * base);
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_paren_or_tuple();
  [[nodiscard]] Expr * parse_array_literal();
  [[nodiscard]] Expr * parse_type_scoped_call();
  [[nodiscard]] Expr * parse_struct_init_body(TypeNode * type, bool parenthesized, const Token & start);
  [[nodiscard]] gsl::span<Expr *> parse_call_args();
  [[nodiscard]] Expr * parse_int_literal();
  [[nodiscard]] Expr * parse_float_literal();

  [[nodiscard]] bool at_unary_start(bool after_bare_name) const;
  [[nodiscard]] bool at_propagation_end() const;
  [[nodiscard]] bool at_struct_init_brace() const;
  [[nodiscard]] std::optional<AssignOp> peek_assign_op(size_t & width) const;

  AstContext & ast_;
  const SourceManager & sm_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  int speculating_ = 0;
};

}  // namespace crusty::syntax
