// crusty/codegen/rust_generator.cpp - Rust code generation
//
#include "crusty/codegen/rust_generator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "crusty/ast/ast_enums.hpp"
#include "crusty/ast/visitor.hpp"
#include "crusty/basic/casting.hpp"
#include "crusty/basic/log.hpp"
#include "crusty/sema/type.hpp"
#include "crusty/sema/type_environment.hpp"

namespace crusty
{

namespace
{

constexpr std::string_view k_boxed_error = "Box<dyn std::error::Error>";

[[nodiscard]] bool is_rust_keyword(std::string_view s)
{
  static const std::unordered_set<std::string_view> keywords = {
    "as",    "break",  "const",  "continue", "crate",    "else",    "enum",   "extern",
    "false", "fn",     "for",    "if",       "impl",     "in",      "let",    "loop",
    "match", "mod",    "move",   "mut",      "pub",      "ref",     "return", "self",
    "Self",  "static", "struct", "super",    "trait",    "true",    "type",   "unsafe",
    "use",   "where",  "while",  "async",    "await",    "dyn",     "abstract", "become",
    "box",   "do",     "final",  "macro",    "override", "priv",    "typeof", "unsized",
    "virtual", "yield", "try",
  };
  return keywords.count(s) > 0;
}

[[nodiscard]] bool is_delimited_macro_name(std::string_view s)
{
  return s.size() > 4 && s.substr(0, 2) == "__" && s.substr(s.size() - 2) == "__";
}

const Expr * unparen(const Expr * e)
{
  while (const auto * p = dyn_cast<ParenExpr>(e)) {
    e = p->inner;
  }
  return e;
}

/// Expressions whose Rust form can be followed by a postfix operator or
/// preceded by a prefix operator without extra parentheses.
[[nodiscard]] bool is_atomic(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::CharLiteral:
    case NodeKind::BoolLiteral:
    case NodeKind::NullLiteral:
    case NodeKind::Ident:
    case NodeKind::CastExpr:
    case NodeKind::SizeofExpr:
    case NodeKind::ParenExpr:
    case NodeKind::TupleExpr:
    case NodeKind::CallExpr:
    case NodeKind::MethodCallExpr:
    case NodeKind::FieldAccessExpr:
    case NodeKind::IndexExpr:
    case NodeKind::TypeScopedCallExpr:
    case NodeKind::MacroCallExpr:
    case NodeKind::ErrorPropagateExpr:
    case NodeKind::ArrayLiteralExpr:
    case NodeKind::ArrayRepeatExpr:
      return true;
    case NodeKind::BinaryExpr:
      return cast<BinaryExpr>(e)->op != BinaryOp::Comma;
    default:
      return false;
  }
}

/// Names and literals.
[[nodiscard]] bool is_leaf(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::CharLiteral:
    case NodeKind::BoolLiteral:
    case NodeKind::Ident:
      return true;
    default:
      return false;
  }
}

/// Rust renders these with their own outer parentheses.
[[nodiscard]] bool renders_parenthesized(const Expr * e)
{
  if (const auto * b = dyn_cast<BinaryExpr>(e)) {
    return b->op != BinaryOp::Comma;
  }
  return isa<CastExpr>(e) || isa<ParenExpr>(e);
}

// ============================================================================
// Expressions and types
// ============================================================================

class ExprEmitter : public ConstAstVisitor<ExprEmitter, std::string>
{
public:
  ExprEmitter(const TypeEnvironment * env, bool expand_aliases)
  : env_(env), expandAliases_(expand_aliases)
  {
  }

  /// Anything without a mapping is a codegen bug.
  std::string visit_node(const AstNode * node)
  {
    throw InternalCodegenError(
      fmt::format("no Rust mapping for node `{}`", to_string(node->get_kind())),
      node->get_range());
  }

  /// Expression without the outer parentheses a binary operator adds;
  /// used where Rust syntax delimits the expression itself (`if c {`).
  std::string bare(const Expr * e)
  {
    e = unparen(e);
    if (const auto * b = dyn_cast<BinaryExpr>(e); b && b->op != BinaryOp::Comma) {
      return fmt::format("{} {} {}", visit(b->lhs), to_string(b->op), visit(b->rhs));
    }
    return visit(e);
  }

  /// Expression wrapped in parentheses unless it already carries them.
  std::string parenthesized(const Expr * e)
  {
    const std::string s = visit(e);
    return renders_parenthesized(e) ? s : "(" + s + ")";
  }

  /// Operand of a postfix operator or a prefix operator.
  std::string operand(const Expr * e)
  {
    const std::string s = visit(e);
    return is_atomic(e) ? s : "(" + s + ")";
  }

  std::string args(gsl::span<Expr * const> items)
  {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) out += ", ";
      out += visit(items[i]);
    }
    return out;
  }

  /// Type in path position: `Name`, `Vec::<i32>`, `<[i32]>`.
  std::string path(const TypeNode * type)
  {
    if (const auto * named = dyn_cast<NamedTypeNode>(type)) {
      return std::string(named->name);
    }
    if (const auto * generic = dyn_cast<GenericTypeNode>(type)) {
      return fmt::format("{}::<{}>", generic->base, type_list(generic->args));
    }
    return "<" + visit(type) + ">";
  }

  std::string type_list(gsl::span<TypeNode * const> types)
  {
    std::string out;
    for (size_t i = 0; i < types.size(); ++i) {
      if (i > 0) out += ", ";
      out += visit(types[i]);
    }
    return out;
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  std::string visit_primitive_type(const PrimitiveTypeNode * n)
  {
    return std::string(RustGenerator::primitive_name(n->primitive));
  }

  std::string visit_named_type(const NamedTypeNode * n)
  {
    if (expandAliases_ && env_ != nullptr) {
      const AliasEntry * entry = env_->lookup_alias(n->name);
      if (entry != nullptr && entry->is_alias() && entry->target != nullptr) {
        const Type * resolved = env_->resolve_type(entry->target);
        if (resolved != nullptr && !resolved->is_error() && !resolved->is_placeholder()) {
          return RustGenerator::semantic_type_name(resolved);
        }
      }
    }
    return std::string(n->name);
  }

  std::string visit_pointer_type(const PointerTypeNode * n)
  {
    return fmt::format("*{} {}", n->isMutable ? "mut" : "const", visit(n->pointee));
  }

  std::string visit_reference_type(const ReferenceTypeNode * n)
  {
    return fmt::format("&{}{}", n->isMutable ? "mut " : "", visit(n->referent));
  }

  std::string visit_array_type(const ArrayTypeNode * n)
  {
    return fmt::format("[{}; {}]", visit(n->element), n->size);
  }

  std::string visit_slice_type(const SliceTypeNode * n) { return "[" + visit(n->element) + "]"; }

  std::string visit_tuple_type(const TupleTypeNode * n)
  {
    if (n->elements.size() == 1) {
      return "(" + visit(n->elements[0]) + ",)";
    }
    return "(" + type_list(n->elements) + ")";
  }

  std::string visit_generic_type(const GenericTypeNode * n)
  {
    return fmt::format("{}<{}>", n->base, type_list(n->args));
  }

  std::string visit_fallible_type(const FallibleTypeNode * n)
  {
    return fmt::format("Result<{}, {}>", visit(n->inner), k_boxed_error);
  }

  std::string visit_auto_type(const AutoTypeNode * /*n*/) { return "_"; }

  // ===========================================================================
  // Literals and names
  // ===========================================================================

  std::string visit_int_literal(const IntLiteralExpr * n) { return std::string(n->text); }
  std::string visit_float_literal(const FloatLiteralExpr * n) { return std::string(n->text); }

  std::string visit_string_literal(const StringLiteralExpr * n)
  {
    return "\"" + std::string(n->value) + "\"";
  }

  std::string visit_char_literal(const CharLiteralExpr * n)
  {
    return "'" + std::string(n->value) + "'";
  }

  std::string visit_bool_literal(const BoolLiteralExpr * n) { return n->value ? "true" : "false"; }
  std::string visit_null_literal(const NullLiteralExpr * /*n*/) { return "Option::None"; }
  std::string visit_ident(const IdentExpr * n) { return std::string(n->name); }

  // ===========================================================================
  // Operators
  // ===========================================================================

  std::string visit_binary_expr(const BinaryExpr * n)
  {
    if (n->op == BinaryOp::Comma) {
      return fmt::format("{{ {}; {} }}", visit(n->lhs), visit(n->rhs));
    }
    return fmt::format("({} {} {})", visit(n->lhs), to_string(n->op), visit(n->rhs));
  }

  std::string visit_assign_expr(const AssignExpr * n)
  {
    return fmt::format("{} {} {}", visit(n->target), to_string(n->op), visit(n->value));
  }

  std::string visit_unary_expr(const UnaryExpr * n)
  {
    switch (n->op) {
      case UnaryOp::Not:
      case UnaryOp::BitNot:
        return "!" + operand(n->operand);
      case UnaryOp::Neg:
        return "-" + operand(n->operand);
      case UnaryOp::Ref:
        return "&" + operand(n->operand);
      case UnaryOp::RefMut:
        return "&mut " + operand(n->operand);
      case UnaryOp::Deref:
        return "*" + operand(n->operand);
      case UnaryOp::PreInc:
      case UnaryOp::PreDec:
        return fmt::format(
          "{{ let __tmp = &mut ({}); *__tmp {}= 1; *__tmp }}", visit(n->operand),
          n->op == UnaryOp::PreInc ? '+' : '-');
    }
    return visit_node(n);
  }

  std::string visit_ternary_expr(const TernaryExpr * n)
  {
    return fmt::format(
      "if {} {{ {} }} else {{ {} }}", bare(n->condition), visit(n->thenExpr), visit(n->elseExpr));
  }

  std::string visit_cast_expr(const CastExpr * n)
  {
    const Expr * inner = n->expr;
    std::string value = visit(inner);
    if (!is_atomic(inner) && !isa<UnaryExpr>(inner)) {
      value = "(" + value + ")";
    }
    return fmt::format("({} as {})", value, visit(n->targetType));
  }

  std::string visit_sizeof_expr(const SizeofExpr * n)
  {
    return fmt::format("std::mem::size_of::<{}>()", visit(n->targetType));
  }

  std::string visit_paren_expr(const ParenExpr * n)
  {
    if (renders_parenthesized(n->inner) || is_leaf(n->inner)) {
      return visit(n->inner);
    }
    return "(" + visit(n->inner) + ")";
  }

  std::string visit_tuple_expr(const TupleExpr * n)
  {
    if (n->elements.size() == 1) {
      return "(" + visit(n->elements[0]) + ",)";
    }
    return "(" + args(n->elements) + ")";
  }

  // ===========================================================================
  // Postfix forms
  // ===========================================================================

  std::string visit_call_expr(const CallExpr * n)
  {
    return fmt::format("{}({})", operand(n->callee), args(n->args));
  }

  std::string visit_method_call_expr(const MethodCallExpr * n)
  {
    return fmt::format("{}.{}({})", operand(n->receiver), n->method, args(n->args));
  }

  std::string visit_field_access_expr(const FieldAccessExpr * n)
  {
    if (n->isArrow) {
      return fmt::format("(*{}).{}", operand(n->base), n->field);
    }
    return fmt::format("{}.{}", operand(n->base), n->field);
  }

  std::string visit_index_expr(const IndexExpr * n)
  {
    return fmt::format("{}[{}]", operand(n->base), visit(n->index));
  }

  std::string visit_type_scoped_call_expr(const TypeScopedCallExpr * n)
  {
    std::string out = fmt::format("{}::{}", path(n->typeNode), n->method);
    if (n->isCall) {
      out += "(" + args(n->args) + ")";
    }
    return out;
  }

  std::string visit_macro_call_expr(const MacroCallExpr * n)
  {
    return fmt::format("{}!({})", RustGenerator::macro_name(n->name), args(n->args));
  }

  std::string visit_error_propagate_expr(const ErrorPropagateExpr * n)
  {
    return operand(n->operand) + "?";
  }

  // ===========================================================================
  // Aggregates
  // ===========================================================================

  std::string visit_struct_init_expr(const StructInitExpr * n)
  {
    if (n->fields.empty()) {
      return path(n->typeNode) + " {}";
    }
    std::string out = path(n->typeNode) + " { ";
    for (size_t i = 0; i < n->fields.size(); ++i) {
      if (i > 0) out += ", ";
      out += fmt::format("{}: {}", n->fields[i]->name, visit(n->fields[i]->value));
    }
    return out + " }";
  }

  std::string visit_array_literal_expr(const ArrayLiteralExpr * n)
  {
    return "[" + args(n->elements) + "]";
  }

  std::string visit_array_repeat_expr(const ArrayRepeatExpr * n)
  {
    return fmt::format("[{}; {}]", visit(n->value), visit(n->count));
  }

  std::string visit_range_expr(const RangeExpr * n)
  {
    return fmt::format("{}{}{}", visit(n->start), n->inclusive ? "..=" : "..", visit(n->end));
  }

private:
  const TypeEnvironment * env_;
  bool expandAliases_;
};

// ============================================================================
// Statements and items
// ============================================================================

/// Every method contributed to one `impl` block, in source order.
struct ImplGroup
{
  std::vector<const FunctionDecl *> methods;
  std::vector<const ImplBlockDecl *> blocks;
  bool emitted = false;
};

class RustWriter
{
public:
  RustWriter(const CodegenOptions & options, const TypeEnvironment * env)
  : options_(options), env_(env), exprs_(env, true), written_(env, false)
  {
  }

  std::string take() { return std::move(out_); }

  void emit_program(const Program & program)
  {
    for (const auto doc : program.innerDocs) {
      doc_line("//!", doc);
    }
    if (!program.innerDocs.empty()) {
      out_ += "\n";
    }

    collect_impl_groups(program);

    for (const auto * item : program.items) {
      emit_item(item);
    }
  }

  void emit_stmt(const Stmt * stmt)
  {
    switch (stmt->get_kind()) {
      case NodeKind::DeclStmt:
        emit_decl(cast<DeclStmt>(stmt));
        return;
      case NodeKind::ExprStmt:
        line(exprs_.visit(cast<ExprStmt>(stmt)->expr) + ";");
        return;
      case NodeKind::ReturnStmt: {
        const auto * ret = cast<ReturnStmt>(stmt);
        line(ret->value ? "return " + exprs_.visit(ret->value) + ";" : std::string("return;"));
        return;
      }
      case NodeKind::IfStmt:
        emit_if(cast<IfStmt>(stmt), "");
        return;
      case NodeKind::WhileStmt: {
        const auto * w = cast<WhileStmt>(stmt);
        line(label_prefix(w->label) + "while " + exprs_.bare(w->condition) + " {");
        emit_block_body(w->body);
        line("}");
        return;
      }
      case NodeKind::LoopStmt: {
        const auto * l = cast<LoopStmt>(stmt);
        line(label_prefix(l->label) + "loop {");
        emit_block_body(l->body);
        line("}");
        return;
      }
      case NodeKind::ForStmt:
        emit_for(cast<ForStmt>(stmt));
        return;
      case NodeKind::ForInStmt: {
        const auto * f = cast<ForInStmt>(stmt);
        line(fmt::format(
          "{}for {} in {} {{", label_prefix(f->label), f->variable, exprs_.bare(f->iterable)));
        emit_block_body(f->body);
        line("}");
        return;
      }
      case NodeKind::SwitchStmt:
        emit_switch(cast<SwitchStmt>(stmt));
        return;
      case NodeKind::BreakStmt:
        line(jump("break", cast<BreakStmt>(stmt)->label));
        return;
      case NodeKind::ContinueStmt:
        line(jump("continue", cast<ContinueStmt>(stmt)->label));
        return;
      case NodeKind::BlockStmt:
        line("{");
        emit_block_body(cast<BlockStmt>(stmt));
        line("}");
        return;
      case NodeKind::NestedFunctionStmt:
        emit_closure(cast<NestedFunctionStmt>(stmt));
        return;
      default:
        throw InternalCodegenError(
          fmt::format("no Rust mapping for statement `{}`", to_string(stmt->get_kind())),
          stmt->get_range());
    }
  }

  ExprEmitter & exprs() { return exprs_; }

private:
  // ===========================================================================
  // Output helpers
  // ===========================================================================

  void line(std::string_view text)
  {
    out_.append(static_cast<size_t>(level_ * options_.indent_width), ' ');
    out_ += text;
    out_ += '\n';
  }

  void doc_line(std::string_view marker, std::string_view text)
  {
    line(text.empty() ? std::string(marker) : fmt::format("{} {}", marker, text));
  }

  void indent() { ++level_; }
  void dedent() { --level_; }

  /// Blank line between top-level items.
  void begin_item()
  {
    if (!out_.empty() && out_.back() == '\n' && out_.size() >= 2 && out_[out_.size() - 2] != '\n') {
      out_ += '\n';
    }
  }

  static std::string label_prefix(std::string_view label)
  {
    return label.empty() ? std::string() : fmt::format("'{}: ", label);
  }

  static std::string jump(std::string_view keyword, std::string_view label)
  {
    return label.empty() ? fmt::format("{};", keyword) : fmt::format("{} '{};", keyword, label);
  }

  static std::string_view visibility(Visibility v)
  {
    return v == Visibility::Private ? "" : "pub ";
  }

  void emit_docs(gsl::span<std::string_view> docs)
  {
    for (const auto d : docs) {
      doc_line("///", d);
    }
  }

  void emit_attributes(gsl::span<Attribute *> attrs)
  {
    for (const auto * a : attrs) {
      line(attribute_text(a));
    }
  }

  static std::string attribute_text(const Attribute * a)
  {
    if (a->hasArgs) {
      return fmt::format("#[{}({})]", a->name, a->args);
    }
    return fmt::format("#[{}]", a->name);
  }

  void emit_block_body(const BlockStmt * block)
  {
    indent();
    if (block != nullptr) {
      for (const auto * s : block->stmts) {
        emit_stmt(s);
      }
    }
    dedent();
  }

  void emit_stmts(gsl::span<Stmt *> stmts)
  {
    indent();
    for (const auto * s : stmts) {
      emit_stmt(s);
    }
    dedent();
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  void emit_decl(const DeclStmt * d)
  {
    const bool has_type = d->type != nullptr && !isa<AutoTypeNode>(d->type);
    const std::string init = d->init ? " = " + exprs_.visit(d->init) : std::string();

    if (d->form == DeclForm::Const) {
      std::string type;
      if (has_type) {
        type = exprs_.visit(d->type);
      } else if (d->init != nullptr && d->init->resolvedType != nullptr) {
        type = RustGenerator::semantic_type_name(d->init->resolvedType);
      } else {
        throw InternalCodegenError(
          fmt::format("constant `{}` has no type", d->name), d->get_range());
      }
      line(fmt::format("const {}: {}{};", d->name, type, init));
      return;
    }

    const std::string type = has_type ? ": " + exprs_.visit(d->type) : std::string();
    line(fmt::format("let {}{}{}{};", d->is_mutable() ? "mut " : "", d->name, type, init));
  }

  void emit_if(const IfStmt * node, std::string_view prefix)
  {
    line(fmt::format("{}if {} {{", prefix, exprs_.bare(node->condition)));
    emit_block_body(node->thenBranch);
    if (node->elseBranch == nullptr) {
      line("}");
      return;
    }
    if (const auto * elif = dyn_cast<IfStmt>(node->elseBranch)) {
      emit_if(elif, "} else ");
      return;
    }
    line("} else {");
    if (const auto * block = dyn_cast<BlockStmt>(node->elseBranch)) {
      emit_block_body(block);
    } else {
      indent();
      emit_stmt(node->elseBranch);
      dedent();
    }
    line("}");
  }

  /// `for (i; c; s) b` keeps `continue` running the step:
  /// `{ i; let mut __first = true; loop { if !__first { s; } __first = false;
  ///   if !(c) { break; } b } }`.
  void emit_for(const ForStmt * f)
  {
    line("{");
    indent();
    if (f->init != nullptr) {
      emit_stmt(f->init);
    }
    if (f->step != nullptr) {
      line("let mut __first = true;");
    }
    line(label_prefix(f->label) + "loop {");
    indent();
    if (f->step != nullptr) {
      line("if !__first {");
      indent();
      line(exprs_.visit(f->step) + ";");
      dedent();
      line("}");
      line("__first = false;");
    }
    if (f->condition != nullptr) {
      line("if !" + exprs_.parenthesized(unparen(f->condition)) + " {");
      indent();
      line("break;");
      dedent();
      line("}");
    }
    dedent();
    emit_block_body(f->body);
    line("}");
    dedent();
    line("}");
  }

  void emit_switch(const SwitchStmt * sw)
  {
    line("match " + exprs_.bare(sw->subject) + " {");
    indent();
    for (const auto * c : sw->cases) {
      std::string pattern;
      for (size_t i = 0; i < c->values.size(); ++i) {
        if (i > 0) pattern += " | ";
        pattern += exprs_.visit(c->values[i]);
      }
      line(pattern + " => {");
      emit_stmts(c->body);
      line("}");
    }
    if (sw->hasDefault) {
      line("_ => {");
      emit_stmts(sw->defaultBody);
      line("}");
    } else {
      line("_ => {}");
    }
    dedent();
    line("}");
  }

  std::string params(const FunctionDecl * fn)
  {
    std::string out;
    for (size_t i = 0; i < fn->params.size(); ++i) {
      const auto * p = fn->params[i];
      if (i > 0) out += ", ";
      if (p->is_self()) {
        if (const auto * ref = dyn_cast<ReferenceTypeNode>(p->type)) {
          out += ref->isMutable ? "&mut self" : "&self";
        } else {
          out += "self";
        }
        continue;
      }
      out += fmt::format("{}: {}", p->name, exprs_.visit(p->type));
    }
    return out;
  }

  /// ` -> T`, or nothing for `void` and `auto`.
  std::string return_suffix(const TypeNode * ret)
  {
    if (ret == nullptr || isa<AutoTypeNode>(ret)) {
      return {};
    }
    if (const auto * prim = dyn_cast<PrimitiveTypeNode>(ret); prim && prim->primitive == PrimitiveKind::Void) {
      return {};
    }
    return " -> " + exprs_.visit(ret);
  }

  void emit_closure(const NestedFunctionStmt * node)
  {
    const FunctionDecl * fn = node->function;
    bool is_mutable = false;
    bool is_move = false;
    for (const auto & c : node->captures) {
      is_mutable = is_mutable || c.mode == CaptureMode::Mutable;
      is_move = is_move || c.mode == CaptureMode::Move;
    }

    line(fmt::format(
      "let {}{} = {}|{}|{} {{", is_mutable ? "mut " : "", fn->name, is_move ? "move " : "",
      params(fn), return_suffix(fn->returnType)));
    emit_block_body(fn->body);
    line("};");
  }

  // ===========================================================================
  // Items
  // ===========================================================================

  void collect_impl_groups(const Program & program)
  {
    for (const auto * item : program.items) {
      if (const auto * s = dyn_cast<StructDecl>(item); s && !s->methods.empty()) {
        auto & group = impls_[s->name];
        group.methods.insert(group.methods.end(), s->methods.begin(), s->methods.end());
      } else if (const auto * impl = dyn_cast<ImplBlockDecl>(item)) {
        auto & group = impls_[impl_target(impl)];
        group.methods.insert(group.methods.end(), impl->methods.begin(), impl->methods.end());
        group.blocks.push_back(impl);
      }
    }
  }

  /// Blocks on aliases of the same struct share one group.
  [[nodiscard]] std::string_view impl_target(const ImplBlockDecl * impl) const
  {
    return env_ != nullptr ? env_->concrete_name(impl->targetName) : impl->targetName;
  }

  void emit_item(const Decl * item)
  {
    switch (item->get_kind()) {
      case NodeKind::FunctionDecl:
        begin_item();
        emit_function(cast<FunctionDecl>(item));
        return;
      case NodeKind::StructDecl: {
        const auto * s = cast<StructDecl>(item);
        begin_item();
        emit_struct(s);
        if (!s->methods.empty()) {
          emit_impl_group(s->name);
        }
        return;
      }
      case NodeKind::EnumDecl:
        begin_item();
        emit_enum(cast<EnumDecl>(item));
        return;
      case NodeKind::TypedefDecl: {
        const auto * t = cast<TypedefDecl>(item);
        begin_item();
        emit_docs(t->docs);
        emit_attributes(t->attributes);
        line(fmt::format(
          "{}type {} = {};", visibility(t->visibility), t->name, written_.visit(t->aliasedType)));
        return;
      }
      case NodeKind::ImplBlockDecl:
        emit_impl_group(impl_target(cast<ImplBlockDecl>(item)));
        return;
      case NodeKind::ExternBlockDecl:
        begin_item();
        emit_extern(cast<ExternBlockDecl>(item));
        return;
      case NodeKind::MacroDefDecl:
        begin_item();
        emit_macro(cast<MacroDefDecl>(item));
        return;
      default:
        throw InternalCodegenError(
          fmt::format("no Rust mapping for item `{}`", to_string(item->get_kind())),
          item->get_range());
    }
  }

  void emit_function(const FunctionDecl * fn)
  {
    emit_docs(fn->docs);
    emit_attributes(fn->attributes);
    line(fmt::format(
      "{}fn {}({}){} {{", visibility(fn->visibility), fn->name, params(fn),
      return_suffix(fn->returnType)));
    emit_block_body(fn->body);
    line("}");
  }

  void emit_struct(const StructDecl * s)
  {
    emit_docs(s->docs);
    emit_attributes(s->attributes);
    if (s->fields.empty()) {
      line(fmt::format("{}struct {} {{}}", visibility(s->visibility), s->name));
      return;
    }
    line(fmt::format("{}struct {} {{", visibility(s->visibility), s->name));
    indent();
    for (const auto * f : s->fields) {
      emit_docs(f->docs);
      line(fmt::format("{}{}: {},", visibility(f->visibility), f->name, exprs_.visit(f->type)));
    }
    dedent();
    line("}");
  }

  /// The merged `impl` for `target`, written at its first contribution.
  void emit_impl_group(std::string_view target)
  {
    auto it = impls_.find(target);
    if (it == impls_.end() || it->second.emitted) {
      return;
    }
    ImplGroup & group = it->second;
    group.emitted = true;

    begin_item();
    std::vector<std::string> attrs;
    for (const auto * block : group.blocks) {
      emit_docs(block->docs);
      for (const auto * a : block->attributes) {
        std::string text = attribute_text(a);
        if (std::find(attrs.begin(), attrs.end(), text) == attrs.end()) {
          attrs.push_back(std::move(text));
        }
      }
    }
    for (const auto & a : attrs) {
      line(a);
    }

    line(fmt::format("impl {} {{", target));
    indent();
    bool first = true;
    for (const auto * m : group.methods) {
      if (!first) {
        out_ += '\n';
      }
      first = false;
      emit_function(m);
    }
    dedent();
    line("}");
    CRUSTY_LOG_DEBUG(
      "codegen", "impl {}: {} methods from {} blocks", target, group.methods.size(),
      group.blocks.size());
  }

  void emit_enum(const EnumDecl * e)
  {
    emit_docs(e->docs);
    emit_attributes(e->attributes);
    line(fmt::format("{}enum {} {{", visibility(e->visibility), e->name));
    indent();
    for (const auto * v : e->variants) {
      if (v->hasExplicitValue) {
        line(fmt::format("{} = {},", v->name, v->value));
      } else {
        line(fmt::format("{},", v->name));
      }
    }
    dedent();
    line("}");
  }

  void emit_extern(const ExternBlockDecl * ext)
  {
    line(fmt::format("extern \"{}\" {{", ext->abi));
    indent();
    std::string current;
    for (const auto tok : ext->tokens) {
      if (!current.empty()) current += ' ';
      current += tok;
      if (tok == ";" || tok == "{" || tok == "}") {
        line(current);
        current.clear();
      }
    }
    if (!current.empty()) {
      line(current);
    }
    dedent();
    line("}");
  }

  void emit_macro(const MacroDefDecl * m)
  {
    const auto is_param = [&](std::string_view name) {
      return std::find(m->params.begin(), m->params.end(), name) != m->params.end();
    };

    std::string pattern;
    for (size_t i = 0; i < m->params.size(); ++i) {
      if (i > 0) pattern += ", ";
      pattern += fmt::format("${}:expr", m->params[i]);
    }

    std::string body;
    for (const auto & tok : m->body) {
      if (!body.empty()) body += ' ';
      if (tok.isIdentifier && is_param(tok.spelling)) {
        body += "$" + std::string(tok.spelling);
      } else if (tok.isIdentifier && is_delimited_macro_name(tok.spelling)) {
        body += RustGenerator::macro_name(tok.spelling) + "!";
      } else {
        body += tok.spelling;
      }
    }

    line(fmt::format("macro_rules! {} {{", RustGenerator::macro_name(m->name)));
    indent();
    line(fmt::format("({}) => {{", pattern));
    indent();
    if (!body.empty()) {
      line(body);
    }
    dedent();
    line("};");
    dedent();
    line("}");
  }

  const CodegenOptions & options_;
  const TypeEnvironment * env_;
  ExprEmitter exprs_;
  /// Types exactly as written (typedef targets keep the alias chain).
  ExprEmitter written_;
  std::unordered_map<std::string_view, ImplGroup> impls_;
  std::string out_;
  int level_ = 0;
};

}  // namespace

// ============================================================================
// RustGenerator
// ============================================================================

std::string RustGenerator::generate(const Program & program) const
{
  RustWriter writer(options_, env_);
  writer.emit_program(program);
  std::string out = writer.take();
  CRUSTY_LOG_DEBUG("codegen", "generated {} bytes for {} items", out.size(), program.items.size());
  return out;
}

std::string RustGenerator::generate_type(const TypeNode * type) const
{
  ExprEmitter emitter(env_, true);
  return emitter.visit(type);
}

std::string RustGenerator::generate_expr(const Expr * expr) const
{
  ExprEmitter emitter(env_, true);
  return emitter.visit(expr);
}

std::string RustGenerator::generate_stmt(const Stmt * stmt) const
{
  RustWriter writer(options_, env_);
  writer.emit_stmt(stmt);
  return writer.take();
}

std::string RustGenerator::macro_name(std::string_view crusty_name)
{
  std::string_view core = crusty_name;
  if (is_delimited_macro_name(core)) {
    core = core.substr(2, core.size() - 4);
  }
  std::string out;
  out.reserve(core.size());
  for (const char c : core) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (is_rust_keyword(out)) {
    out += "_macro";
  }
  return out;
}

std::string_view RustGenerator::primitive_name(PrimitiveKind kind) noexcept
{
  switch (kind) {
    case PrimitiveKind::Int:
    case PrimitiveKind::I32:
      return "i32";
    case PrimitiveKind::I64:
      return "i64";
    case PrimitiveKind::U32:
      return "u32";
    case PrimitiveKind::U64:
      return "u64";
    case PrimitiveKind::Float:
    case PrimitiveKind::F64:
      return "f64";
    case PrimitiveKind::F32:
      return "f32";
    case PrimitiveKind::Bool:
      return "bool";
    case PrimitiveKind::Char:
      return "char";
    case PrimitiveKind::Void:
      return "()";
  }
  return "()";
}

std::string RustGenerator::semantic_type_name(const Type * type)
{
  if (type == nullptr) {
    return "_";
  }

  const auto list = [](gsl::span<const Type * const> types) {
    std::string out;
    for (size_t i = 0; i < types.size(); ++i) {
      if (i > 0) out += ", ";
      out += semantic_type_name(types[i]);
    }
    return out;
  };

  switch (type->kind) {
    case TypeKind::Primitive:
      return std::string(primitive_name(type->primitive));
    case TypeKind::Named:
      return std::string(type->name);
    case TypeKind::Pointer:
      return fmt::format("*{} {}", type->isMutable ? "mut" : "const", semantic_type_name(type->inner));
    case TypeKind::Reference:
      return fmt::format("&{}{}", type->isMutable ? "mut " : "", semantic_type_name(type->inner));
    case TypeKind::Array:
      return fmt::format("[{}; {}]", semantic_type_name(type->inner), type->size);
    case TypeKind::Slice:
      return "[" + semantic_type_name(type->inner) + "]";
    case TypeKind::Tuple:
      if (type->elements.size() == 1) {
        return "(" + semantic_type_name(type->elements[0]) + ",)";
      }
      return "(" + list(type->elements) + ")";
    case TypeKind::Generic:
      return fmt::format("{}<{}>", type->name, list(type->elements));
    case TypeKind::Function: {
      std::string out = "fn(" + list(type->elements) + ")";
      if (type->inner != nullptr && !type->inner->is_void()) {
        out += " -> " + semantic_type_name(type->inner);
      }
      return out;
    }
    case TypeKind::Fallible:
      return fmt::format("Result<{}, {}>", semantic_type_name(type->inner), k_boxed_error);
    case TypeKind::IntegerLiteral:
      return "i32";
    case TypeKind::FloatLiteral:
      return "f64";
    case TypeKind::Auto:
    case TypeKind::NullLiteral:
      return "_";
    case TypeKind::Error:
      break;
  }
  throw InternalCodegenError(fmt::format("no Rust mapping for type `{}`", to_string(type)), {});
}

}  // namespace crusty
