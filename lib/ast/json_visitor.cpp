// crusty/ast/json_visitor.cpp - JSON serialization implementation
//
#include "crusty/ast/json_visitor.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include "crusty/ast/ast.hpp"
#include "crusty/ast/ast_enums.hpp"
#include "crusty/ast/visitor.hpp"
#include "crusty/basic/source_manager.hpp"

namespace crusty
{
namespace
{

using nlohmann::json;

json j_strings(gsl::span<std::string_view> items)
{
  json arr = json::array();
  for (const auto s : items) {
    arr.push_back(std::string(s));
  }
  return arr;
}

class JsonBuilder : public ConstAstVisitor<JsonBuilder, json>
{
public:
  explicit JsonBuilder(const JsonOptions & options) : options_(options) {}

  // ===========================================================================
  // Expressions
  // ===========================================================================

  json visit_int_literal(const IntLiteralExpr * n)
  {
    json j = base(n);
    j["text"] = std::string(n->text);
    j["value"] = n->value;
    return j;
  }

  json visit_float_literal(const FloatLiteralExpr * n)
  {
    json j = base(n);
    j["text"] = std::string(n->text);
    return j;
  }

  json visit_string_literal(const StringLiteralExpr * n)
  {
    json j = base(n);
    j["value"] = std::string(n->value);
    return j;
  }

  json visit_char_literal(const CharLiteralExpr * n)
  {
    json j = base(n);
    j["value"] = std::string(n->value);
    return j;
  }

  json visit_bool_literal(const BoolLiteralExpr * n)
  {
    json j = base(n);
    j["value"] = n->value;
    return j;
  }

  json visit_ident(const IdentExpr * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    return j;
  }

  json visit_binary_expr(const BinaryExpr * n)
  {
    json j = base(n);
    j["op"] = std::string(to_string(n->op));
    j["lhs"] = visit(n->lhs);
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_assign_expr(const AssignExpr * n)
  {
    json j = base(n);
    j["op"] = std::string(to_string(n->op));
    j["target"] = visit(n->target);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_unary_expr(const UnaryExpr * n)
  {
    json j = base(n);
    j["op"] = std::string(to_string(n->op));
    j["operand"] = visit(n->operand);
    return j;
  }

  json visit_ternary_expr(const TernaryExpr * n)
  {
    json j = base(n);
    j["condition"] = visit(n->condition);
    j["then"] = visit(n->thenExpr);
    j["else"] = visit(n->elseExpr);
    return j;
  }

  json visit_cast_expr(const CastExpr * n)
  {
    json j = base(n);
    j["targetType"] = visit(n->targetType);
    j["expr"] = visit(n->expr);
    return j;
  }

  json visit_sizeof_expr(const SizeofExpr * n)
  {
    json j = base(n);
    j["targetType"] = visit(n->targetType);
    return j;
  }

  json visit_paren_expr(const ParenExpr * n)
  {
    json j = base(n);
    j["inner"] = visit(n->inner);
    return j;
  }

  json visit_tuple_expr(const TupleExpr * n)
  {
    json j = base(n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_call_expr(const CallExpr * n)
  {
    json j = base(n);
    j["callee"] = visit(n->callee);
    j["args"] = list(n->args);
    return j;
  }

  json visit_method_call_expr(const MethodCallExpr * n)
  {
    json j = base(n);
    j["receiver"] = visit(n->receiver);
    j["method"] = std::string(n->method);
    j["args"] = list(n->args);
    return j;
  }

  json visit_field_access_expr(const FieldAccessExpr * n)
  {
    json j = base(n);
    j["base"] = visit(n->base);
    j["field"] = std::string(n->field);
    j["arrow"] = n->isArrow;
    return j;
  }

  json visit_index_expr(const IndexExpr * n)
  {
    json j = base(n);
    j["base"] = visit(n->base);
    j["index"] = visit(n->index);
    return j;
  }

  json visit_type_scoped_call_expr(const TypeScopedCallExpr * n)
  {
    json j = base(n);
    j["type"] = visit(n->typeNode);
    j["method"] = std::string(n->method);
    j["args"] = list(n->args);
    j["call"] = n->isCall;
    return j;
  }

  json visit_macro_call_expr(const MacroCallExpr * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["args"] = list(n->args);
    return j;
  }

  json visit_error_propagate_expr(const ErrorPropagateExpr * n)
  {
    json j = base(n);
    j["operand"] = visit(n->operand);
    return j;
  }

  json visit_struct_init_expr(const StructInitExpr * n)
  {
    json j = base(n);
    j["type"] = visit(n->typeNode);
    j["fields"] = list(n->fields);
    j["parenthesized"] = n->isParenthesized;
    return j;
  }

  json visit_array_literal_expr(const ArrayLiteralExpr * n)
  {
    json j = base(n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_array_repeat_expr(const ArrayRepeatExpr * n)
  {
    json j = base(n);
    j["value"] = visit(n->value);
    j["count"] = visit(n->count);
    return j;
  }

  json visit_range_expr(const RangeExpr * n)
  {
    json j = base(n);
    j["start"] = visit(n->start);
    j["end"] = visit(n->end);
    j["inclusive"] = n->inclusive;
    return j;
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  json visit_primitive_type(const PrimitiveTypeNode * n)
  {
    json j = base(n);
    j["name"] = std::string(to_string(n->primitive));
    return j;
  }

  json visit_named_type(const NamedTypeNode * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    return j;
  }

  json visit_pointer_type(const PointerTypeNode * n)
  {
    json j = base(n);
    j["pointee"] = visit(n->pointee);
    j["mutable"] = n->isMutable;
    return j;
  }

  json visit_reference_type(const ReferenceTypeNode * n)
  {
    json j = base(n);
    j["referent"] = visit(n->referent);
    j["mutable"] = n->isMutable;
    return j;
  }

  json visit_array_type(const ArrayTypeNode * n)
  {
    json j = base(n);
    j["element"] = visit(n->element);
    j["size"] = n->size;
    return j;
  }

  json visit_slice_type(const SliceTypeNode * n)
  {
    json j = base(n);
    j["element"] = visit(n->element);
    return j;
  }

  json visit_tuple_type(const TupleTypeNode * n)
  {
    json j = base(n);
    j["elements"] = list(n->elements);
    return j;
  }

  json visit_generic_type(const GenericTypeNode * n)
  {
    json j = base(n);
    j["base"] = std::string(n->base);
    j["args"] = list(n->args);
    return j;
  }

  json visit_fallible_type(const FallibleTypeNode * n)
  {
    json j = base(n);
    j["inner"] = visit(n->inner);
    return j;
  }

  // ===========================================================================
  // Supporting nodes
  // ===========================================================================

  json visit_attribute(const Attribute * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    if (n->hasArgs) {
      j["args"] = std::string(n->args);
    }
    return j;
  }

  json visit_field_init(const FieldInit * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_switch_case(const SwitchCase * n)
  {
    json j = base(n);
    j["values"] = list(n->values);
    j["body"] = list(n->body);
    return j;
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  json visit_decl_stmt(const DeclStmt * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["form"] = std::string(to_string(n->form));
    j["declType"] = visit(n->type);
    j["init"] = visit(n->init);
    return j;
  }

  json visit_expr_stmt(const ExprStmt * n)
  {
    json j = base(n);
    j["expr"] = visit(n->expr);
    return j;
  }

  json visit_return_stmt(const ReturnStmt * n)
  {
    json j = base(n);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_if_stmt(const IfStmt * n)
  {
    json j = base(n);
    j["condition"] = visit(n->condition);
    j["then"] = visit(n->thenBranch);
    j["else"] = visit(n->elseBranch);
    return j;
  }

  json visit_while_stmt(const WhileStmt * n)
  {
    json j = labeled(n, n->label);
    j["condition"] = visit(n->condition);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_loop_stmt(const LoopStmt * n)
  {
    json j = labeled(n, n->label);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_for_stmt(const ForStmt * n)
  {
    json j = labeled(n, n->label);
    j["init"] = visit(n->init);
    j["condition"] = visit(n->condition);
    j["step"] = visit(n->step);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_for_in_stmt(const ForInStmt * n)
  {
    json j = labeled(n, n->label);
    j["variable"] = std::string(n->variable);
    j["iterable"] = visit(n->iterable);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_switch_stmt(const SwitchStmt * n)
  {
    json j = base(n);
    j["subject"] = visit(n->subject);
    j["cases"] = list(n->cases);
    if (n->hasDefault) {
      j["default"] = list(n->defaultBody);
    }
    return j;
  }

  json visit_break_stmt(const BreakStmt * n) { return labeled(n, n->label); }

  json visit_continue_stmt(const ContinueStmt * n) { return labeled(n, n->label); }

  json visit_block_stmt(const BlockStmt * n)
  {
    json j = base(n);
    j["stmts"] = list(n->stmts);
    return j;
  }

  json visit_nested_function_stmt(const NestedFunctionStmt * n)
  {
    json j = base(n);
    j["static"] = n->isStatic;
    j["function"] = visit(n->function);
    if (options_.includeCaptures) {
      json caps = json::array();
      for (const auto & cap : n->captures) {
        caps.push_back(json{{"name", std::string(cap.name)}, {"mode", std::string(to_string(cap.mode))}});
      }
      j["captures"] = std::move(caps);
    }
    return j;
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  json visit_function_decl(const FunctionDecl * n)
  {
    json j = item(n, n->visibility, n->attributes, n->docs);
    j["name"] = std::string(n->name);
    j["params"] = list(n->params);
    j["returnType"] = visit(n->returnType);
    j["body"] = visit(n->body);
    return j;
  }

  json visit_param_decl(const ParamDecl * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["paramType"] = visit(n->type);
    return j;
  }

  json visit_struct_decl(const StructDecl * n)
  {
    json j = item(n, n->visibility, n->attributes, n->docs);
    j["name"] = std::string(n->name);
    j["fields"] = list(n->fields);
    j["methods"] = list(n->methods);
    return j;
  }

  json visit_field_decl(const FieldDecl * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["fieldType"] = visit(n->type);
    j["visibility"] = std::string(to_string(n->visibility));
    if (!n->docs.empty()) {
      j["docs"] = j_strings(n->docs);
    }
    return j;
  }

  json visit_enum_decl(const EnumDecl * n)
  {
    json j = item(n, n->visibility, n->attributes, n->docs);
    j["name"] = std::string(n->name);
    j["variants"] = list(n->variants);
    return j;
  }

  json visit_enum_variant_decl(const EnumVariantDecl * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["value"] = n->value;
    j["explicit"] = n->hasExplicitValue;
    return j;
  }

  json visit_typedef_decl(const TypedefDecl * n)
  {
    json j = item(n, n->visibility, n->attributes, n->docs);
    j["name"] = std::string(n->name);
    j["aliasedType"] = visit(n->aliasedType);
    return j;
  }

  json visit_impl_block_decl(const ImplBlockDecl * n)
  {
    json j = item(n, Visibility::Public, n->attributes, n->docs);
    j["target"] = std::string(n->targetName);
    if (!n->blockName.empty()) {
      j["blockName"] = std::string(n->blockName);
    }
    j["methods"] = list(n->methods);
    return j;
  }

  json visit_extern_block_decl(const ExternBlockDecl * n)
  {
    json j = base(n);
    j["abi"] = std::string(n->abi);
    j["tokens"] = j_strings(n->tokens);
    return j;
  }

  json visit_macro_def_decl(const MacroDefDecl * n)
  {
    json j = base(n);
    j["name"] = std::string(n->name);
    j["params"] = j_strings(n->params);
    json body = json::array();
    for (const auto & tok : n->body) {
      body.push_back(std::string(tok.spelling));
    }
    j["body"] = std::move(body);
    return j;
  }

  json visit_program(const Program * n)
  {
    json j = base(n);
    if (!n->innerDocs.empty()) {
      j["innerDocs"] = j_strings(n->innerDocs);
    }
    j["items"] = list(n->items);
    return j;
  }

  /// Fallback for nodes that carry nothing but their kind.
  json visit_node(const AstNode * n) { return base(n); }

private:
  json base(const AstNode * n) const
  {
    json j{{"kind", std::string(to_string(n->get_kind()))}};
    if (options_.includeRanges) {
      const SourceRange r = n->get_range();
      if (r.is_invalid()) {
        j["range"] = json{{"start", nullptr}, {"end", nullptr}};
      } else {
        j["range"] =
          json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
      }
    }
    return j;
  }

  json labeled(const AstNode * n, std::string_view label) const
  {
    json j = base(n);
    if (!label.empty()) {
      j["label"] = std::string(label);
    }
    return j;
  }

  json item(
    const AstNode * n, Visibility vis, gsl::span<Attribute *> attrs,
    gsl::span<std::string_view> docs)
  {
    json j = base(n);
    j["visibility"] = std::string(to_string(vis));
    if (!attrs.empty()) {
      j["attributes"] = list(attrs);
    }
    if (!docs.empty()) {
      j["docs"] = j_strings(docs);
    }
    return j;
  }

  template <typename T>
  json list(gsl::span<T *> nodes)
  {
    json arr = json::array();
    for (const auto * node : nodes) {
      arr.push_back(visit(node));
    }
    return arr;
  }

  const JsonOptions & options_;
};

}  // namespace

nlohmann::json to_json(const AstNode * node, const JsonOptions & options)
{
  JsonBuilder builder(options);
  return builder.visit(node);
}

}  // namespace crusty
