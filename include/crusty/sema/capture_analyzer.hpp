// crusty/sema/capture_analyzer.hpp - Closure capture classification
//
// Classifies how a nested function uses the variables of its enclosing
// function. The result selects the closure form emitted for it.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "crusty/ast/ast.hpp"

namespace crusty
{

/**
 * What the analyzer knows about one variable visible at the point where a
 * nested function is declared.
 */
struct OuterVariable
{
  /// Values of this type are copied, never moved (primitives, pointers,
  /// shared references, enums).
  bool isCopy = true;
  /// The variable is itself a closure that mutates its captures; calling
  /// it needs mutable access.
  bool isMutableClosure = false;
  /// Methods of the variable's struct type that take `&var self`.
  std::unordered_set<std::string_view> mutatingMethods;
};

using OuterScope = std::unordered_map<std::string_view, OuterVariable>;

/**
 * Capture classifier for one nested function.
 *
 * A captured variable is
 * - Mutable if the body assigns to it (`=`, compound assignment, `++`,
 *   `--`, `&var`), calls a `&var self` method on it, or calls it while it
 *   is a mutating closure;
 * - Move if the body passes it by value (call argument, return value,
 *   initializer, aggregate element), its type is not copied, it is not
 *   Mutable, and no statement after the nested function mentions it;
 * - ReadOnly otherwise.
 *
 * Captures are listed in first-reference order.
 */
class CaptureAnalyzer
{
public:
  explicit CaptureAnalyzer(const OuterScope & outer) : outer_(outer) {}

  /**
   * Classify the captures of `function`.
   *
   * @param function The nested function
   * @param following Statements of the enclosing function that run after
   *        the declaration, used to decide Move
   */
  [[nodiscard]] std::vector<CaptureEntry> analyze(
    const FunctionDecl * function, const std::vector<const Stmt *> & following) const;

private:
  const OuterScope & outer_;
};

/// True if any IdentExpr named `name` appears in `stmts`.
[[nodiscard]] bool mentions_name(const std::vector<const Stmt *> & stmts, std::string_view name);

}  // namespace crusty
