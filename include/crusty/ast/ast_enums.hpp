// crusty/ast/ast_enums.hpp - AST enumeration definitions
//
// This header contains all enumeration types used in the crusty AST,
// including node kinds, operators, and semantic attributes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace crusty
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for efficient range-based classof checks.
 * Auto-generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "crusty/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "crusty/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "crusty/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "crusty/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "crusty/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "crusty/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators, including the comma sequence operator.
 */
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
  // Bitwise
  BitAnd,  ///< &
  BitXor,  ///< ^
  BitOr,   ///< |
  Shl,     ///< <<
  Shr,     ///< >>
  // Sequencing
  Comma,  ///< ,
};

/**
 * Prefix unary operators. There are no postfix increment forms.
 */
enum class UnaryOp : uint8_t {
  Not,     ///< !
  Neg,     ///< -
  BitNot,  ///< ~
  Ref,     ///< &
  RefMut,  ///< &var
  Deref,   ///< *
  PreInc,  ///< ++
  PreDec,  ///< --
};

/**
 * Assignment operators.
 */
enum class AssignOp : uint8_t {
  Assign,     ///< =
  AddAssign,  ///< +=
  SubAssign,  ///< -=
  MulAssign,  ///< *=
  DivAssign,  ///< /=
  ModAssign,  ///< %=
  AndAssign,  ///< &=
  OrAssign,   ///< |=
  XorAssign,  ///< ^=
  ShlAssign,  ///< <<=
  ShrAssign,  ///< >>=
};

// ============================================================================
// Types and declarations
// ============================================================================

/// Built-in primitive type keywords.
enum class PrimitiveKind : uint8_t {
  Int,
  I32,
  I64,
  U32,
  U64,
  Float,
  F32,
  F64,
  Bool,
  Char,
  Void,
};

/// Item visibility. `static` marks an item private; the default is public.
enum class Visibility : uint8_t {
  Public,
  Private,
};

/// Surface form of a local declaration, kept for faithful re-printing.
enum class DeclForm : uint8_t {
  Implicit,  ///< Type name = e;
  Let,       ///< let [Type] name = e;  /  let name: Type = e;
  Var,       ///< var [Type] name = e;
  Const,     ///< const [Type] NAME = e;
};

/// How a nested function uses a variable of its enclosing function.
enum class CaptureMode : uint8_t {
  ReadOnly,
  Mutable,
  Move,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_EXPR AST_NODE_CASE
#define AST_NODE_TYPE AST_NODE_CASE
#define AST_NODE_STMT AST_NODE_CASE
#define AST_NODE_DECL AST_NODE_CASE
#define AST_NODE_SUPPORT AST_NODE_CASE
#define AST_NODE_TOP AST_NODE_CASE
#include "crusty/ast/ast_nodes.def"
#undef AST_NODE_CASE
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::Comma:
      return ",";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::Ref:
      return "&";
    case UnaryOp::RefMut:
      return "&var ";
    case UnaryOp::Deref:
      return "*";
    case UnaryOp::PreInc:
      return "++";
    case UnaryOp::PreDec:
      return "--";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
    case AssignOp::ModAssign:
      return "%=";
    case AssignOp::AndAssign:
      return "&=";
    case AssignOp::OrAssign:
      return "|=";
    case AssignOp::XorAssign:
      return "^=";
    case AssignOp::ShlAssign:
      return "<<=";
    case AssignOp::ShrAssign:
      return ">>=";
  }
  return "";
}

/// Source keyword of a primitive type.
[[nodiscard]] constexpr std::string_view to_string(PrimitiveKind kind) noexcept
{
  switch (kind) {
    case PrimitiveKind::Int:
      return "int";
    case PrimitiveKind::I32:
      return "i32";
    case PrimitiveKind::I64:
      return "i64";
    case PrimitiveKind::U32:
      return "u32";
    case PrimitiveKind::U64:
      return "u64";
    case PrimitiveKind::Float:
      return "float";
    case PrimitiveKind::F32:
      return "f32";
    case PrimitiveKind::F64:
      return "f64";
    case PrimitiveKind::Bool:
      return "bool";
    case PrimitiveKind::Char:
      return "char";
    case PrimitiveKind::Void:
      return "void";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(Visibility vis) noexcept
{
  switch (vis) {
    case Visibility::Public:
      return "public";
    case Visibility::Private:
      return "private";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(DeclForm form) noexcept
{
  switch (form) {
    case DeclForm::Implicit:
      return "implicit";
    case DeclForm::Let:
      return "let";
    case DeclForm::Var:
      return "var";
    case DeclForm::Const:
      return "const";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(CaptureMode mode) noexcept
{
  switch (mode) {
    case CaptureMode::ReadOnly:
      return "read_only";
    case CaptureMode::Mutable:
      return "mutable";
    case CaptureMode::Move:
      return "move";
  }
  return "";
}

// ============================================================================
// Operator classification
// ============================================================================

[[nodiscard]] constexpr bool is_comparison_op(BinaryOp op) noexcept
{
  return op == BinaryOp::Eq || op == BinaryOp::Ne || op == BinaryOp::Lt || op == BinaryOp::Le ||
         op == BinaryOp::Gt || op == BinaryOp::Ge;
}

[[nodiscard]] constexpr bool is_logical_op(BinaryOp op) noexcept
{
  return op == BinaryOp::And || op == BinaryOp::Or;
}

[[nodiscard]] constexpr bool is_integer_primitive(PrimitiveKind kind) noexcept
{
  return kind == PrimitiveKind::Int || kind == PrimitiveKind::I32 || kind == PrimitiveKind::I64 ||
         kind == PrimitiveKind::U32 || kind == PrimitiveKind::U64;
}

[[nodiscard]] constexpr bool is_float_primitive(PrimitiveKind kind) noexcept
{
  return kind == PrimitiveKind::Float || kind == PrimitiveKind::F32 || kind == PrimitiveKind::F64;
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

/// First expression node kind
inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
/// Last expression node kind
inline constexpr NodeKind k_last_expr_kind = NodeKind::RangeExpr;

/// First type node kind
inline constexpr NodeKind k_first_type_kind = NodeKind::PrimitiveType;
/// Last type node kind
inline constexpr NodeKind k_last_type_kind = NodeKind::AutoType;

/// First statement node kind
inline constexpr NodeKind k_first_stmt_kind = NodeKind::DeclStmt;
/// Last statement node kind
inline constexpr NodeKind k_last_stmt_kind = NodeKind::NestedFunctionStmt;

/// First declaration node kind
inline constexpr NodeKind k_first_decl_kind = NodeKind::FunctionDecl;
/// Last declaration node kind
inline constexpr NodeKind k_last_decl_kind = NodeKind::MacroDefDecl;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a type
[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace crusty
