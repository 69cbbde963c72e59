// crusty/codegen/source_printer.hpp - Pretty-print crusty source from the AST
#pragma once

#include <string>

#include "crusty/ast/ast.hpp"
#include "crusty/codegen/rust_generator.hpp"

namespace crusty
{

/**
 * Re-emits crusty source in a canonical layout.
 *
 * Parentheses appear exactly where the tree has ParenExpr nodes, so parsing
 * the printed text yields a structurally equivalent tree (source ranges
 * aside). Declarations use one canonical spelling per DeclForm:
 * `T x = e;`, `let x: T = e;`, `var x: T = e;`, `const X: T = e;`.
 */
class SourcePrinter
{
public:
  explicit SourcePrinter(CodegenOptions options = {}) : options_(options) {}

  [[nodiscard]] std::string print(const Program & program) const;
  [[nodiscard]] std::string print_type(const TypeNode * type) const;
  [[nodiscard]] std::string print_expr(const Expr * expr) const;
  [[nodiscard]] std::string print_stmt(const Stmt * stmt) const;

private:
  CodegenOptions options_;
};

}  // namespace crusty
