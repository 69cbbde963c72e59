// crusty/codegen/rust_generator.hpp - Generate Rust source from the AST
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "crusty/ast/ast.hpp"
#include "crusty/basic/source_manager.hpp"

namespace crusty
{

class TypeEnvironment;
struct Type;

struct CodegenOptions
{
  /// Spaces per indentation level
  int indent_width = 4;
};

/**
 * A construct the generator has no mapping for.
 *
 * Semantic analysis accepted something the mapping table cannot express;
 * this is a compiler bug, not a user error. The driver turns it into a
 * single E0900 diagnostic and discards the partial output.
 */
class InternalCodegenError : public std::runtime_error
{
public:
  InternalCodegenError(const std::string & message, SourceRange range)
  : std::runtime_error(message), range_(range)
  {
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  SourceRange range_;
};

/**
 * Rust code generator.
 *
 * A pure syntax mapping over an analyzed Program: identifiers pass through
 * unchanged, types go through the fixed primitive table, nested functions
 * become closures whose form follows the capture modes recorded on each
 * NestedFunctionStmt. When a TypeEnvironment is supplied, alias names in
 * signatures and bindings are expanded to their resolved targets.
 *
 * Output depends only on the AST and the options, so two runs over the same
 * tree are byte-identical.
 */
class RustGenerator
{
public:
  explicit RustGenerator(CodegenOptions options = {}, const TypeEnvironment * env = nullptr)
  : options_(options), env_(env)
  {
  }

  /**
   * Generate a complete Rust source file.
   * @throws InternalCodegenError on a construct without a mapping
   */
  [[nodiscard]] std::string generate(const Program & program) const;

  /// Rust spelling of a single written type.
  [[nodiscard]] std::string generate_type(const TypeNode * type) const;

  /// Rust spelling of a single expression.
  [[nodiscard]] std::string generate_expr(const Expr * expr) const;

  /// Rust spelling of one statement at indentation level 0.
  [[nodiscard]] std::string generate_stmt(const Stmt * stmt) const;

  /// Rust name of a `__NAME__` macro (`__MAX__` -> `max`).
  [[nodiscard]] static std::string macro_name(std::string_view crusty_name);

  /// Rust spelling of a primitive keyword (`int` -> `i32`, `void` -> `()`).
  [[nodiscard]] static std::string_view primitive_name(PrimitiveKind kind) noexcept;

  /// Rust spelling of a semantic type; literal placeholders take their defaults.
  [[nodiscard]] static std::string semantic_type_name(const Type * type);

private:
  CodegenOptions options_;
  const TypeEnvironment * env_ = nullptr;
};

}  // namespace crusty
