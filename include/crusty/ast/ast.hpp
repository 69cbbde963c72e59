// crusty/ast/ast.hpp - AST node class definitions for crusty
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "crusty/ast/ast_enums.hpp"
#include "crusty/basic/casting.hpp"
#include "crusty/basic/source_manager.hpp"

namespace crusty
{

// Forward declaration for the sema type representation
struct Type;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceManager.

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  /// Get the node kind
  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  /// Get the source range (byte offsets only)
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  /// Resolved semantic type (set during Sema phase, nullptr before resolution)
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for written types.
 */
class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for declarations.
 */
class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;
class FunctionDecl;

// ============================================================================
// Plain records stored in arena spans
// ============================================================================

/// One captured outer variable of a nested function.
struct CaptureEntry
{
  std::string_view name;
  CaptureMode mode = CaptureMode::ReadOnly;
};

/// One token of a `#define` body. `spelling` is the exact source text.
struct MacroToken
{
  std::string_view spelling;
  bool isIdentifier = false;
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Integer literal expression. `text` keeps the written spelling (radix, `_`).
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  std::string_view text;
  uint64_t value;

  IntLiteralExpr(std::string_view t, uint64_t v, SourceRange r = {})
  : NodeBase(r), text(t), value(v)
  {
  }
};

/// Float literal expression.
class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  std::string_view text;
  double value;

  FloatLiteralExpr(std::string_view t, double v, SourceRange r = {})
  : NodeBase(r), text(t), value(v)
  {
  }
};

/// String literal expression. `value` is the raw contents with escapes.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Character literal expression. `value` is the raw contents with escapes.
class CharLiteralExpr : public NodeBase<CharLiteralExpr, Expr, NodeKind::CharLiteral>
{
public:
  std::string_view value;

  explicit CharLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Boolean literal expression.
class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `NULL`.
class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Identifier reference (variables, functions, enum names, `self`).
class IdentExpr : public NodeBase<IdentExpr, Expr, NodeKind::Ident>
{
public:
  std::string_view name;

  explicit IdentExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Missing expression (parser failure placeholder).
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Binary expression.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// Assignment, simple or compound.
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::AssignExpr>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignExpr(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

/// Prefix unary expression.
class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `cond ? a : b`.
class TernaryExpr : public NodeBase<TernaryExpr, Expr, NodeKind::TernaryExpr>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  TernaryExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// `(Type)expr`.
class CastExpr : public NodeBase<CastExpr, Expr, NodeKind::CastExpr>
{
public:
  TypeNode * targetType;
  Expr * expr;

  CastExpr(TypeNode * t, Expr * e, SourceRange r = {}) : NodeBase(r), targetType(t), expr(e) {}
};

/// `sizeof(Type)`.
class SizeofExpr : public NodeBase<SizeofExpr, Expr, NodeKind::SizeofExpr>
{
public:
  TypeNode * targetType;

  explicit SizeofExpr(TypeNode * t, SourceRange r = {}) : NodeBase(r), targetType(t) {}
};

/// `(expr)`.
class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::ParenExpr>
{
public:
  Expr * inner;

  explicit ParenExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

/// `()`, `(a,)` or `(a, b, ...)`.
class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::TupleExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit TupleExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems)
  {
  }
};

/// `callee(args)`.
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// `receiver.method(args)`.
class MethodCallExpr : public NodeBase<MethodCallExpr, Expr, NodeKind::MethodCallExpr>
{
public:
  Expr * receiver;
  std::string_view method;
  gsl::span<Expr *> args;

  MethodCallExpr(Expr * recv, std::string_view m, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), receiver(recv), method(m), args(a)
  {
  }
};

/// `base.field`, `base.0` or `base->field`.
class FieldAccessExpr : public NodeBase<FieldAccessExpr, Expr, NodeKind::FieldAccessExpr>
{
public:
  Expr * base;
  std::string_view field;
  bool isArrow = false;

  FieldAccessExpr(Expr * b, std::string_view f, bool arrow, SourceRange r = {})
  : NodeBase(r), base(b), field(f), isArrow(arrow)
  {
  }
};

/// `base[index]`.
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

/// `@Type.method(args)`; `typeNode` is a named or generic type.
/// Without an argument list (`@Color.Red`) it names an associated item.
class TypeScopedCallExpr
: public NodeBase<TypeScopedCallExpr, Expr, NodeKind::TypeScopedCallExpr>
{
public:
  TypeNode * typeNode;
  std::string_view method;
  gsl::span<Expr *> args;
  bool isCall = true;

  TypeScopedCallExpr(TypeNode * t, std::string_view m, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), typeNode(t), method(m), args(a)
  {
  }
};

/// `__name__(args)`; `name` keeps the delimiters.
class MacroCallExpr : public NodeBase<MacroCallExpr, Expr, NodeKind::MacroCallExpr>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  MacroCallExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

/// `expr?`.
class ErrorPropagateExpr
: public NodeBase<ErrorPropagateExpr, Expr, NodeKind::ErrorPropagateExpr>
{
public:
  Expr * operand;

  explicit ErrorPropagateExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

class FieldInit;

/// `(Point){ .x = 1 }` or `Point { .x = 1 }`.
class StructInitExpr : public NodeBase<StructInitExpr, Expr, NodeKind::StructInitExpr>
{
public:
  TypeNode * typeNode;
  gsl::span<FieldInit *> fields;
  bool isParenthesized = false;

  StructInitExpr(TypeNode * t, gsl::span<FieldInit *> f, bool paren, SourceRange r = {})
  : NodeBase(r), typeNode(t), fields(f), isParenthesized(paren)
  {
  }
};

/// `[a, b, c]`.
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteralExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// `[value; count]`.
class ArrayRepeatExpr : public NodeBase<ArrayRepeatExpr, Expr, NodeKind::ArrayRepeatExpr>
{
public:
  Expr * value;
  Expr * count;

  ArrayRepeatExpr(Expr * v, Expr * c, SourceRange r = {}) : NodeBase(r), value(v), count(c) {}
};

/// `a..b`, `a..=b`; either bound may be absent.
class RangeExpr : public NodeBase<RangeExpr, Expr, NodeKind::RangeExpr>
{
public:
  Expr * start;
  Expr * end;
  bool inclusive = false;

  RangeExpr(Expr * s, Expr * e, bool incl, SourceRange r = {})
  : NodeBase(r), start(s), end(e), inclusive(incl)
  {
  }
};

// ============================================================================
// Type Nodes
// ============================================================================

/// Built-in primitive (`int`, `float`, `void`, ...).
class PrimitiveTypeNode : public NodeBase<PrimitiveTypeNode, TypeNode, NodeKind::PrimitiveType>
{
public:
  PrimitiveKind primitive;

  explicit PrimitiveTypeNode(PrimitiveKind p, SourceRange r = {}) : NodeBase(r), primitive(p) {}
};

/// User-defined or alias name, including `Self`.
class NamedTypeNode : public NodeBase<NamedTypeNode, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;

  explicit NamedTypeNode(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `T*`.
class PointerTypeNode : public NodeBase<PointerTypeNode, TypeNode, NodeKind::PointerType>
{
public:
  TypeNode * pointee;
  bool isMutable = true;

  PointerTypeNode(TypeNode * p, bool mut, SourceRange r = {})
  : NodeBase(r), pointee(p), isMutable(mut)
  {
  }
};

/// `&T` / `&var T`.
class ReferenceTypeNode : public NodeBase<ReferenceTypeNode, TypeNode, NodeKind::ReferenceType>
{
public:
  TypeNode * referent;
  bool isMutable = false;

  ReferenceTypeNode(TypeNode * t, bool mut, SourceRange r = {})
  : NodeBase(r), referent(t), isMutable(mut)
  {
  }
};

/// `T[N]`.
class ArrayTypeNode : public NodeBase<ArrayTypeNode, TypeNode, NodeKind::ArrayType>
{
public:
  TypeNode * element;
  uint64_t size;

  ArrayTypeNode(TypeNode * e, uint64_t n, SourceRange r = {}) : NodeBase(r), element(e), size(n) {}
};

/// `T[]`.
class SliceTypeNode : public NodeBase<SliceTypeNode, TypeNode, NodeKind::SliceType>
{
public:
  TypeNode * element;

  explicit SliceTypeNode(TypeNode * e, SourceRange r = {}) : NodeBase(r), element(e) {}
};

/// `(A, B, ...)`.
class TupleTypeNode : public NodeBase<TupleTypeNode, TypeNode, NodeKind::TupleType>
{
public:
  gsl::span<TypeNode *> elements;

  explicit TupleTypeNode(gsl::span<TypeNode *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// `Name<A, B>`.
class GenericTypeNode : public NodeBase<GenericTypeNode, TypeNode, NodeKind::GenericType>
{
public:
  std::string_view base;
  gsl::span<TypeNode *> args;

  GenericTypeNode(std::string_view b, gsl::span<TypeNode *> a, SourceRange r = {})
  : NodeBase(r), base(b), args(a)
  {
  }
};

/// `T?`.
class FallibleTypeNode : public NodeBase<FallibleTypeNode, TypeNode, NodeKind::FallibleType>
{
public:
  TypeNode * inner;

  explicit FallibleTypeNode(TypeNode * t, SourceRange r = {}) : NodeBase(r), inner(t) {}
};

/// `auto`.
class AutoTypeNode : public NodeBase<AutoTypeNode, TypeNode, NodeKind::AutoType>
{
public:
  explicit AutoTypeNode(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// `#[name]` or `#[name(args)]`; `args` is the canonical argument text.
class Attribute : public NodeBase<Attribute, AstNode, NodeKind::Attribute>
{
public:
  std::string_view name;
  std::string_view args;
  bool hasArgs = false;

  explicit Attribute(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `.name = value` inside a struct initializer.
class FieldInit : public NodeBase<FieldInit, AstNode, NodeKind::FieldInit>
{
public:
  std::string_view name;
  Expr * value;

  FieldInit(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/// `case a, b: stmts`.
class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  gsl::span<Expr *> values;
  gsl::span<Stmt *> body;

  explicit SwitchCase(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// Local binding in any of its surface forms.
class DeclStmt : public NodeBase<DeclStmt, Stmt, NodeKind::DeclStmt>
{
public:
  std::string_view name;
  DeclForm form;
  TypeNode * type = nullptr;  ///< nullptr when inferred
  Expr * init = nullptr;      ///< nullptr when uninitialized

  DeclStmt(std::string_view n, DeclForm f, SourceRange r = {}) : NodeBase(r), name(n), form(f) {}

  [[nodiscard]] bool is_mutable() const noexcept { return form == DeclForm::Var; }
};

/// Expression followed by `;`.
class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// `return [expr];`.
class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `if (cond) { ... } [else ...]`; `elseBranch` is a BlockStmt or IfStmt.
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  BlockStmt * thenBranch;
  Stmt * elseBranch = nullptr;

  IfStmt(Expr * c, BlockStmt * t, Stmt * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenBranch(t), elseBranch(e)
  {
  }
};

/// `[.label:] while (cond) { ... }`.
class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  std::string_view label;
  Expr * condition;
  BlockStmt * body;

  WhileStmt(std::string_view l, Expr * c, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), label(l), condition(c), body(b)
  {
  }
};

/// `[.label:] loop { ... }`.
class LoopStmt : public NodeBase<LoopStmt, Stmt, NodeKind::LoopStmt>
{
public:
  std::string_view label;
  BlockStmt * body;

  LoopStmt(std::string_view l, BlockStmt * b, SourceRange r = {}) : NodeBase(r), label(l), body(b)
  {
  }
};

/// C-style `for (init; cond; step) { ... }`; every clause is optional.
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  std::string_view label;
  Stmt * init = nullptr;
  Expr * condition = nullptr;
  Expr * step = nullptr;
  BlockStmt * body = nullptr;

  explicit ForStmt(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

/// `for (x in iterable) { ... }`.
class ForInStmt : public NodeBase<ForInStmt, Stmt, NodeKind::ForInStmt>
{
public:
  std::string_view label;
  std::string_view variable;
  Expr * iterable;
  BlockStmt * body;

  ForInStmt(std::string_view l, std::string_view v, Expr * it, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), label(l), variable(v), iterable(it), body(b)
  {
  }
};

/// `switch (subject) { case ...: ... default: ... }`.
class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Expr * subject;
  gsl::span<SwitchCase *> cases;
  gsl::span<Stmt *> defaultBody;
  bool hasDefault = false;

  explicit SwitchStmt(Expr * s, SourceRange r = {}) : NodeBase(r), subject(s) {}
};

/// `break [.label];`.
class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  std::string_view label;

  explicit BreakStmt(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

/// `continue [.label];`.
class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  std::string_view label;

  explicit ContinueStmt(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

/// `{ stmts }`.
class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> stmts;

  explicit BlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), stmts(s) {}
};

/// Function declared inside a function body.
class NestedFunctionStmt : public NodeBase<NestedFunctionStmt, Stmt, NodeKind::NestedFunctionStmt>
{
public:
  FunctionDecl * function;
  bool isStatic = false;

  /// Outer variables used by the body (set during Sema phase, first-use order)
  gsl::span<CaptureEntry> captures;

  NestedFunctionStmt(FunctionDecl * f, bool stat, SourceRange r = {})
  : NodeBase(r), function(f), isStatic(stat)
  {
  }
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// Function parameter. `self` receivers use the name `self`.
class ParamDecl : public NodeBase<ParamDecl, Decl, NodeKind::ParamDecl>
{
public:
  std::string_view name;
  TypeNode * type;

  ParamDecl(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t) {}

  [[nodiscard]] bool is_self() const noexcept { return name == "self"; }
};

/// Function, method or nested function.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  gsl::span<ParamDecl *> params;
  TypeNode * returnType;  ///< `void` is a PrimitiveTypeNode
  BlockStmt * body = nullptr;
  Visibility visibility = Visibility::Public;
  gsl::span<Attribute *> attributes;
  gsl::span<std::string_view> docs;

  FunctionDecl(std::string_view n, TypeNode * ret, SourceRange r = {})
  : NodeBase(r), name(n), returnType(ret)
  {
  }
};

/// Struct field.
class FieldDecl : public NodeBase<FieldDecl, Decl, NodeKind::FieldDecl>
{
public:
  std::string_view name;
  TypeNode * type;
  Visibility visibility = Visibility::Public;
  gsl::span<std::string_view> docs;

  FieldDecl(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t) {}
};

/// `struct Name { fields; methods }`.
class StructDecl : public NodeBase<StructDecl, Decl, NodeKind::StructDecl>
{
public:
  std::string_view name;
  gsl::span<FieldDecl *> fields;
  gsl::span<FunctionDecl *> methods;
  Visibility visibility = Visibility::Public;
  gsl::span<Attribute *> attributes;
  gsl::span<std::string_view> docs;

  explicit StructDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Enum variant with its discriminant.
class EnumVariantDecl : public NodeBase<EnumVariantDecl, Decl, NodeKind::EnumVariantDecl>
{
public:
  std::string_view name;
  int64_t value = 0;
  bool hasExplicitValue = false;

  EnumVariantDecl(std::string_view n, int64_t v, bool expl, SourceRange r = {})
  : NodeBase(r), name(n), value(v), hasExplicitValue(expl)
  {
  }
};

/// `enum Name { A, B = 5, C }`.
class EnumDecl : public NodeBase<EnumDecl, Decl, NodeKind::EnumDecl>
{
public:
  std::string_view name;
  gsl::span<EnumVariantDecl *> variants;
  Visibility visibility = Visibility::Public;
  gsl::span<Attribute *> attributes;
  gsl::span<std::string_view> docs;

  explicit EnumDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `typedef Type Name;`.
class TypedefDecl : public NodeBase<TypedefDecl, Decl, NodeKind::TypedefDecl>
{
public:
  std::string_view name;
  TypeNode * aliasedType;
  Visibility visibility = Visibility::Public;
  gsl::span<Attribute *> attributes;
  gsl::span<std::string_view> docs;

  TypedefDecl(std::string_view n, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), aliasedType(t)
  {
  }
};

/// `typedef struct { methods } @Target[.blockName];`.
class ImplBlockDecl : public NodeBase<ImplBlockDecl, Decl, NodeKind::ImplBlockDecl>
{
public:
  std::string_view targetName;
  std::string_view blockName;  ///< empty when unnamed
  gsl::span<FunctionDecl *> methods;
  gsl::span<Attribute *> attributes;
  gsl::span<std::string_view> docs;

  explicit ImplBlockDecl(std::string_view target, SourceRange r = {})
  : NodeBase(r), targetName(target)
  {
  }
};

/// `extern "ABI" { ... }`; the body is kept as token spellings.
class ExternBlockDecl : public NodeBase<ExternBlockDecl, Decl, NodeKind::ExternBlockDecl>
{
public:
  std::string_view abi;
  gsl::span<std::string_view> tokens;

  explicit ExternBlockDecl(std::string_view a, SourceRange r = {}) : NodeBase(r), abi(a) {}
};

/// `#define __NAME__(params) body`.
class MacroDefDecl : public NodeBase<MacroDefDecl, Decl, NodeKind::MacroDefDecl>
{
public:
  std::string_view name;
  gsl::span<std::string_view> params;
  gsl::span<MacroToken> body;
  bool hasParamList = false;

  explicit MacroDefDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/// Program (root AST node). Items keep source order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<std::string_view> innerDocs;
  gsl::span<Decl *> items;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Get the SourceRange from any AST node.
 */
[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace crusty
