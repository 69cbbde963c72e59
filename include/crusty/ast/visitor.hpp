// crusty/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// Dispatch is generated from ast_nodes.def; RecursiveAstVisitor walks every
// child of every node kind.
//
#pragma once

#include <type_traits>

#include "crusty/ast/ast.hpp"
#include "crusty/ast/ast_enums.hpp"
#include "crusty/basic/casting.hpp"

namespace crusty
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements `visit_<snake_name>` for the node kinds it
 * cares about; everything else falls through to the category hooks
 * (`visit_expr`, `visit_stmt`, ...) and finally `visit_node`.
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_DISPATCH(Class, Kind, Snake) \
  case NodeKind::Kind:                        \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR AST_NODE_DISPATCH
#define AST_NODE_TYPE AST_NODE_DISPATCH
#define AST_NODE_STMT AST_NODE_DISPATCH
#define AST_NODE_DECL AST_NODE_DISPATCH
#define AST_NODE_SUPPORT AST_NODE_DISPATCH
#define AST_NODE_TOP AST_NODE_DISPATCH
#include "crusty/ast/ast_nodes.def"
#undef AST_NODE_DISPATCH
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (auto-generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "crusty/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that traverses child nodes in source order.
 *
 * Override specific visit methods to customize behavior. Call the base
 * implementation to continue traversal, or return without it to prune the
 * subtree. Returning false stops the whole walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and anything without children
  bool visit_node(NodePtrT /*node*/) { return true; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_assign_expr(NodePtr<AssignExpr> node)
  {
    return get_derived().visit(node->target) && get_derived().visit(node->value);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_ternary_expr(NodePtr<TernaryExpr> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->thenExpr) &&
           get_derived().visit(node->elseExpr);
  }

  bool visit_cast_expr(NodePtr<CastExpr> node)
  {
    return get_derived().visit(node->targetType) && get_derived().visit(node->expr);
  }

  bool visit_sizeof_expr(NodePtr<SizeofExpr> node)
  {
    return get_derived().visit(node->targetType);
  }

  bool visit_paren_expr(NodePtr<ParenExpr> node) { return get_derived().visit(node->inner); }

  bool visit_tuple_expr(NodePtr<TupleExpr> node) { return visit_all(node->elements); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return get_derived().visit(node->callee) && visit_all(node->args);
  }

  bool visit_method_call_expr(NodePtr<MethodCallExpr> node)
  {
    return get_derived().visit(node->receiver) && visit_all(node->args);
  }

  bool visit_field_access_expr(NodePtr<FieldAccessExpr> node)
  {
    return get_derived().visit(node->base);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index);
  }

  bool visit_type_scoped_call_expr(NodePtr<TypeScopedCallExpr> node)
  {
    return get_derived().visit(node->typeNode) && visit_all(node->args);
  }

  bool visit_macro_call_expr(NodePtr<MacroCallExpr> node) { return visit_all(node->args); }

  bool visit_error_propagate_expr(NodePtr<ErrorPropagateExpr> node)
  {
    return get_derived().visit(node->operand);
  }

  bool visit_struct_init_expr(NodePtr<StructInitExpr> node)
  {
    return get_derived().visit(node->typeNode) && visit_all(node->fields);
  }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    return visit_all(node->elements);
  }

  bool visit_array_repeat_expr(NodePtr<ArrayRepeatExpr> node)
  {
    return get_derived().visit(node->value) && get_derived().visit(node->count);
  }

  bool visit_range_expr(NodePtr<RangeExpr> node)
  {
    return get_derived().visit(node->start) && get_derived().visit(node->end);
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  bool visit_pointer_type(NodePtr<PointerTypeNode> node)
  {
    return get_derived().visit(node->pointee);
  }

  bool visit_reference_type(NodePtr<ReferenceTypeNode> node)
  {
    return get_derived().visit(node->referent);
  }

  bool visit_array_type(NodePtr<ArrayTypeNode> node) { return get_derived().visit(node->element); }

  bool visit_slice_type(NodePtr<SliceTypeNode> node) { return get_derived().visit(node->element); }

  bool visit_tuple_type(NodePtr<TupleTypeNode> node) { return visit_all(node->elements); }

  bool visit_generic_type(NodePtr<GenericTypeNode> node) { return visit_all(node->args); }

  bool visit_fallible_type(NodePtr<FallibleTypeNode> node)
  {
    return get_derived().visit(node->inner);
  }

  // ===========================================================================
  // Supporting nodes
  // ===========================================================================

  bool visit_field_init(NodePtr<FieldInit> node) { return get_derived().visit(node->value); }

  bool visit_switch_case(NodePtr<SwitchCase> node)
  {
    return visit_all(node->values) && visit_all(node->body);
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_decl_stmt(NodePtr<DeclStmt> node)
  {
    return get_derived().visit(node->type) && get_derived().visit(node->init);
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return get_derived().visit(node->value); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->thenBranch) &&
           get_derived().visit(node->elseBranch);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return get_derived().visit(node->condition) && get_derived().visit(node->body);
  }

  bool visit_loop_stmt(NodePtr<LoopStmt> node) { return get_derived().visit(node->body); }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return get_derived().visit(node->init) && get_derived().visit(node->condition) &&
           get_derived().visit(node->step) && get_derived().visit(node->body);
  }

  bool visit_for_in_stmt(NodePtr<ForInStmt> node)
  {
    return get_derived().visit(node->iterable) && get_derived().visit(node->body);
  }

  bool visit_switch_stmt(NodePtr<SwitchStmt> node)
  {
    return get_derived().visit(node->subject) && visit_all(node->cases) &&
           visit_all(node->defaultBody);
  }

  bool visit_block_stmt(NodePtr<BlockStmt> node) { return visit_all(node->stmts); }

  bool visit_nested_function_stmt(NodePtr<NestedFunctionStmt> node)
  {
    return get_derived().visit(node->function);
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  bool visit_param_decl(NodePtr<ParamDecl> node) { return get_derived().visit(node->type); }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return visit_all(node->params) && get_derived().visit(node->returnType) &&
           get_derived().visit(node->body);
  }

  bool visit_field_decl(NodePtr<FieldDecl> node) { return get_derived().visit(node->type); }

  bool visit_struct_decl(NodePtr<StructDecl> node)
  {
    return visit_all(node->fields) && visit_all(node->methods);
  }

  bool visit_enum_decl(NodePtr<EnumDecl> node) { return visit_all(node->variants); }

  bool visit_typedef_decl(NodePtr<TypedefDecl> node)
  {
    return get_derived().visit(node->aliasedType);
  }

  bool visit_impl_block_decl(NodePtr<ImplBlockDecl> node) { return visit_all(node->methods); }

  bool visit_program(NodePtr<Program> node) { return visit_all(node->items); }

private:
  template <typename Span>
  bool visit_all(const Span & children)
  {
    for (auto * child : children) {
      if (!get_derived().visit(child)) return false;
    }
    return true;
  }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace crusty
