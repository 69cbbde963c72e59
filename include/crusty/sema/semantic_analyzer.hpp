// crusty/sema/semantic_analyzer.hpp - Name resolution and type checking
//
// Builds the TypeEnvironment of one compilation unit, then checks every
// function body against it. Annotates Expr::resolvedType and
// NestedFunctionStmt::captures in place.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "crusty/ast/ast.hpp"
#include "crusty/ast/ast_context.hpp"
#include "crusty/basic/diagnostic.hpp"
#include "crusty/sema/capture_analyzer.hpp"
#include "crusty/sema/type.hpp"
#include "crusty/sema/type_environment.hpp"

namespace crusty
{

/**
 * Semantic analyzer for one compilation unit.
 *
 * ## Phases
 * 1. Register structs, enums and typedefs (cycle check at registration).
 * 2. Register functions and methods; validate every written type.
 * 3. Freeze the environment.
 * 4. Check function bodies: scopes, expression types, assignments,
 *    calls, returns, conditions, nested functions and their captures.
 *
 * Errors accumulate in the DiagnosticBag; analysis continues past them.
 *
 * ## Usage
 * ```cpp
 * TypeContext types;
 * SemanticAnalyzer sema(ast, types, diags);
 * if (sema.analyze(*program)) { ... generate ... }
 * ```
 */
class SemanticAnalyzer
{
public:
  SemanticAnalyzer(AstContext & ast, TypeContext & types, DiagnosticBag & diags);

  SemanticAnalyzer(const SemanticAnalyzer &) = delete;
  SemanticAnalyzer & operator=(const SemanticAnalyzer &) = delete;

  /**
   * Analyze a whole unit.
   *
   * @return true if no error was reported
   */
  bool analyze(Program & program);

  [[nodiscard]] const TypeEnvironment & environment() const noexcept { return env_; }

  /// Captures of the first nested function called `name`, if it was analyzed.
  [[nodiscard]] std::optional<gsl::span<const CaptureEntry>> get_captures(
    std::string_view name) const;

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

private:
  // ===========================================================================
  // Per-type and per-function context
  // ===========================================================================

  struct MethodInfo
  {
    const FunctionDecl * decl = nullptr;
    const Type * type = nullptr;  ///< Function type, self excluded
    bool hasSelf = false;
    bool mutatesSelf = false;
  };

  struct TypeMembers
  {
    std::unordered_map<std::string_view, MethodInfo> methods;
  };

  struct LoopFrame
  {
    std::string_view label;
  };

  struct FunctionFrame
  {
    const FunctionDecl * decl = nullptr;
    const Type * returnType = nullptr;
    int depth = 0;         ///< 0 for items and methods, 1 for nested functions
    size_t scopeBase = 0;  ///< First scope owned by this function
    size_t continuationBase = 0;
    std::vector<LoopFrame> loops;
    /// Every local and nested-function name declared anywhere in the body.
    std::unordered_set<std::string_view> declaredLocals;
    std::unordered_set<std::string_view> nestedFunctions;
  };

  /// Statements that run after the one being checked, innermost block first.
  struct Continuation
  {
    gsl::span<Stmt *> stmts;
    size_t next = 0;
  };

  // ===========================================================================
  // Phase 1-2: declarations
  // ===========================================================================

  void register_types(Program & program);
  void register_functions(Program & program);
  void register_method(std::string_view type_name, FunctionDecl * method);
  void validate_signatures(Program & program);
  void check_function_name(const FunctionDecl * fn);
  [[nodiscard]] bool is_top_level_name_taken(std::string_view name) const;

  // ===========================================================================
  // Types
  // ===========================================================================

  /// Lower a written type. `Self` maps to the current impl target.
  const Type * lower_type(const TypeNode * node);
  /// Report every undeclared name in a written type (E0101).
  void validate_type_node(const TypeNode * node);
  const Type * function_type_of(const FunctionDecl * fn, bool skip_self);
  [[nodiscard]] const Type * resolved(const Type * t) const { return env_.resolve_type(t); }
  [[nodiscard]] const Type * default_literal(const Type * t) const;
  [[nodiscard]] const StructDecl * struct_of(const Type * t) const;
  [[nodiscard]] const EnumDecl * enum_of(const Type * t) const;
  [[nodiscard]] bool is_copy_type(const Type * t) const;
  [[nodiscard]] const TypeMembers * members_of(const Type * t) const;

  // ===========================================================================
  // Phase 4: bodies
  // ===========================================================================

  void check_function(const FunctionDecl * fn, std::string_view self_type, int depth);
  void check_block(BlockStmt * block);
  /// Check a statement list in a fresh scope, tracking what follows each statement.
  void check_statements(gsl::span<Stmt *> stmts);
  void check_stmt(Stmt * stmt);
  void check_decl_stmt(DeclStmt * node);
  void check_return_stmt(ReturnStmt * node);
  void check_condition(Expr * cond);
  void check_switch_stmt(SwitchStmt * node);
  void check_jump(SourceRange range, std::string_view label, const char * keyword);
  void check_loop_body(std::string_view label, BlockStmt * body);
  void check_nested_function(NestedFunctionStmt * node);

  // ===========================================================================
  // Expressions
  // ===========================================================================

  const Type * check_expr(Expr * expr, const Type * expected = nullptr);
  const Type * check_ident(IdentExpr * node);
  const Type * check_binary(BinaryExpr * node);
  const Type * check_assign(AssignExpr * node);
  const Type * check_unary(UnaryExpr * node);
  const Type * check_ternary(TernaryExpr * node);
  const Type * check_call(CallExpr * node);
  const Type * check_method_call(MethodCallExpr * node);
  const Type * check_field_access(FieldAccessExpr * node);
  const Type * check_index(IndexExpr * node);
  const Type * check_type_scoped_call(TypeScopedCallExpr * node);
  const Type * check_error_propagate(ErrorPropagateExpr * node);
  const Type * check_struct_init(StructInitExpr * node);
  const Type * check_array_literal(ArrayLiteralExpr * node);
  const Type * check_range(RangeExpr * node);

  /// Check call arguments against a function type (arity and types).
  void check_arguments(
    SourceRange call_range, std::string_view callee, const Type * fn_type,
    gsl::span<Expr *> args);

  /// Verify `target` may be written. Reports E0108 and returns false if not.
  bool check_assignable(const Expr * target, SourceRange report_range);

  /// Report E0102 unless `actual` fits `expected`.
  bool expect_compatible(const Type * expected, const Type * actual, SourceRange range,
                         std::string_view what);

  // ===========================================================================
  // Scopes
  // ===========================================================================

  void push_scope();
  void pop_scope();
  bool declare_local(std::string_view name, const Symbol & symbol, SourceRange range);

  /// Innermost binding of `name`; `scope_index` receives its scope.
  const Symbol * lookup_local(std::string_view name, size_t * scope_index = nullptr) const;

  [[nodiscard]] FunctionFrame & current_function() { return functions_.back(); }
  [[nodiscard]] bool in_function() const noexcept { return !functions_.empty(); }

  /// Statements that follow the current one in every enclosing block of
  /// the current function.
  [[nodiscard]] std::vector<const Stmt *> following_statements() const;

  // ===========================================================================
  // Diagnostics
  // ===========================================================================

  void error(SourceRange range, const char * code, std::string message, std::string label = "");

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  AstContext & ast_;
  TypeContext & types_;
  DiagnosticBag & diags_;
  TypeEnvironment env_;

  std::unordered_map<std::string_view, TypeMembers> members_;
  std::unordered_map<std::string_view, const NestedFunctionStmt *> nestedByName_;

  std::vector<std::unordered_map<std::string_view, Symbol>> scopes_;
  std::vector<FunctionFrame> functions_;
  std::vector<Continuation> continuations_;
  std::string_view selfType_;

  size_t errorCount_ = 0;
};

}  // namespace crusty
