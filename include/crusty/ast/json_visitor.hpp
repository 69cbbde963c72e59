// crusty/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Provides a visitor-based JSON serialization for the AST,
// returning nlohmann::json objects for any AST node.
//
#pragma once

#include <nlohmann/json.hpp>

#include "crusty/ast/ast.hpp"

namespace crusty
{

struct JsonOptions
{
  /// Emit `range` objects. Disable to compare trees structurally.
  bool includeRanges = true;
  /// Emit the capture lists attached to nested functions by Sema.
  bool includeCaptures = true;
};

/**
 * Serialize an AST node (any kind) to JSON.
 *
 * Every object carries a `kind` field holding the snake_case node name.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node, const JsonOptions & options = {});

}  // namespace crusty
