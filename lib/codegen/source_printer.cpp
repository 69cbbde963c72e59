// crusty/codegen/source_printer.cpp - crusty pretty printer
//
#include "crusty/codegen/source_printer.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>

#include "crusty/ast/ast_enums.hpp"
#include "crusty/ast/visitor.hpp"
#include "crusty/basic/casting.hpp"

namespace crusty
{

namespace
{

class SourceExprPrinter : public ConstAstVisitor<SourceExprPrinter, std::string>
{
public:
  std::string visit_node(const AstNode * node)
  {
    throw InternalCodegenError(
      fmt::format("cannot print node `{}`", to_string(node->get_kind())), node->get_range());
  }

  std::string list(gsl::span<Expr * const> items)
  {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) out += ", ";
      out += visit(items[i]);
    }
    return out;
  }

  std::string type_list(gsl::span<TypeNode * const> items)
  {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0) out += ", ";
      out += visit(items[i]);
    }
    return out;
  }

  // Types

  std::string visit_primitive_type(const PrimitiveTypeNode * n)
  {
    return std::string(to_string(n->primitive));
  }
  std::string visit_named_type(const NamedTypeNode * n) { return std::string(n->name); }
  std::string visit_pointer_type(const PointerTypeNode * n) { return visit(n->pointee) + "*"; }

  std::string visit_reference_type(const ReferenceTypeNode * n)
  {
    return (n->isMutable ? "&var " : "&") + visit(n->referent);
  }

  std::string visit_array_type(const ArrayTypeNode * n)
  {
    return fmt::format("{}[{}]", visit(n->element), n->size);
  }

  std::string visit_slice_type(const SliceTypeNode * n) { return visit(n->element) + "[]"; }

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

  std::string visit_fallible_type(const FallibleTypeNode * n) { return visit(n->inner) + "?"; }
  std::string visit_auto_type(const AutoTypeNode * /*n*/) { return "auto"; }

  // Expressions

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
  std::string visit_null_literal(const NullLiteralExpr * /*n*/) { return "NULL"; }
  std::string visit_ident(const IdentExpr * n) { return std::string(n->name); }

  std::string visit_binary_expr(const BinaryExpr * n)
  {
    if (n->op == BinaryOp::Comma) {
      return visit(n->lhs) + ", " + visit(n->rhs);
    }
    return fmt::format("{} {} {}", visit(n->lhs), to_string(n->op), visit(n->rhs));
  }

  std::string visit_assign_expr(const AssignExpr * n)
  {
    return fmt::format("{} {} {}", visit(n->target), to_string(n->op), visit(n->value));
  }

  std::string visit_unary_expr(const UnaryExpr * n)
  {
    const std::string_view op = to_string(n->op);
    const std::string operand = visit(n->operand);
    // `- -x` must not lex as `--x`.
    if (!operand.empty() && (operand.front() == '-' || operand.front() == '+') &&
        (op.back() == '-' || op.back() == '+')) {
      return fmt::format("{} {}", op, operand);
    }
    return std::string(op) + operand;
  }

  std::string visit_ternary_expr(const TernaryExpr * n)
  {
    return fmt::format("{} ? {} : {}", visit(n->condition), visit(n->thenExpr), visit(n->elseExpr));
  }

  std::string visit_cast_expr(const CastExpr * n)
  {
    return fmt::format("({}){}", visit(n->targetType), visit(n->expr));
  }

  std::string visit_sizeof_expr(const SizeofExpr * n)
  {
    return "sizeof(" + visit(n->targetType) + ")";
  }

  std::string visit_paren_expr(const ParenExpr * n) { return "(" + visit(n->inner) + ")"; }

  std::string visit_tuple_expr(const TupleExpr * n)
  {
    if (n->elements.size() == 1) {
      return "(" + visit(n->elements[0]) + ",)";
    }
    return "(" + list(n->elements) + ")";
  }

  std::string visit_call_expr(const CallExpr * n)
  {
    return fmt::format("{}({})", visit(n->callee), list(n->args));
  }

  std::string visit_method_call_expr(const MethodCallExpr * n)
  {
    return fmt::format("{}.{}({})", visit(n->receiver), n->method, list(n->args));
  }

  std::string visit_field_access_expr(const FieldAccessExpr * n)
  {
    return fmt::format("{}{}{}", visit(n->base), n->isArrow ? "->" : ".", n->field);
  }

  std::string visit_index_expr(const IndexExpr * n)
  {
    return fmt::format("{}[{}]", visit(n->base), visit(n->index));
  }

  std::string visit_type_scoped_call_expr(const TypeScopedCallExpr * n)
  {
    std::string out = fmt::format("@{}.{}", visit(n->typeNode), n->method);
    if (n->isCall) {
      out += "(" + list(n->args) + ")";
    }
    return out;
  }

  std::string visit_macro_call_expr(const MacroCallExpr * n)
  {
    return fmt::format("{}({})", n->name, list(n->args));
  }

  std::string visit_error_propagate_expr(const ErrorPropagateExpr * n)
  {
    return visit(n->operand) + "?";
  }

  std::string visit_struct_init_expr(const StructInitExpr * n)
  {
    std::string out = n->isParenthesized ? "(" + visit(n->typeNode) + ")" : visit(n->typeNode) + " ";
    if (n->fields.empty()) {
      return out + "{}";
    }
    out += "{ ";
    for (size_t i = 0; i < n->fields.size(); ++i) {
      if (i > 0) out += ", ";
      out += fmt::format(".{} = {}", n->fields[i]->name, visit(n->fields[i]->value));
    }
    return out + " }";
  }

  std::string visit_array_literal_expr(const ArrayLiteralExpr * n)
  {
    return "[" + list(n->elements) + "]";
  }

  std::string visit_array_repeat_expr(const ArrayRepeatExpr * n)
  {
    return fmt::format("[{}; {}]", visit(n->value), visit(n->count));
  }

  std::string visit_range_expr(const RangeExpr * n)
  {
    return fmt::format("{}{}{}", visit(n->start), n->inclusive ? "..=" : "..", visit(n->end));
  }
};

class SourceWriter
{
public:
  explicit SourceWriter(const CodegenOptions & options) : options_(options) {}

  std::string take() { return std::move(out_); }
  SourceExprPrinter & exprs() { return exprs_; }

  void emit_program(const Program & program)
  {
    for (const auto doc : program.innerDocs) {
      doc_line("//!", doc);
    }
    for (const auto * item : program.items) {
      if (!out_.empty()) {
        out_ += '\n';
      }
      emit_item(item);
    }
  }

  void emit_stmt(const Stmt * stmt)
  {
    switch (stmt->get_kind()) {
      case NodeKind::DeclStmt:
      case NodeKind::ExprStmt:
        line(simple_stmt(stmt));
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
        line(label_prefix(w->label) + "while (" + exprs_.visit(w->condition) + ") {");
        emit_body(w->body);
        line("}");
        return;
      }
      case NodeKind::LoopStmt: {
        const auto * l = cast<LoopStmt>(stmt);
        line(label_prefix(l->label) + "loop {");
        emit_body(l->body);
        line("}");
        return;
      }
      case NodeKind::ForStmt: {
        const auto * f = cast<ForStmt>(stmt);
        std::string head = label_prefix(f->label) + "for (";
        head += f->init ? simple_stmt(f->init) : std::string(";");
        if (f->condition) head += " " + exprs_.visit(f->condition);
        head += ";";
        if (f->step) head += " " + exprs_.visit(f->step);
        line(head + ") {");
        emit_body(f->body);
        line("}");
        return;
      }
      case NodeKind::ForInStmt: {
        const auto * f = cast<ForInStmt>(stmt);
        line(fmt::format(
          "{}for ({} in {}) {{", label_prefix(f->label), f->variable, exprs_.visit(f->iterable)));
        emit_body(f->body);
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
        emit_body(cast<BlockStmt>(stmt));
        line("}");
        return;
      case NodeKind::NestedFunctionStmt: {
        const auto * nested = cast<NestedFunctionStmt>(stmt);
        emit_function(nested->function, nested->isStatic ? "static " : "");
        return;
      }
      default:
        throw InternalCodegenError(
          fmt::format("cannot print statement `{}`", to_string(stmt->get_kind())),
          stmt->get_range());
    }
  }

private:
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

  static std::string label_prefix(std::string_view label)
  {
    return label.empty() ? std::string() : fmt::format(".{}: ", label);
  }

  static std::string jump(std::string_view keyword, std::string_view label)
  {
    return label.empty() ? fmt::format("{};", keyword) : fmt::format("{} .{};", keyword, label);
  }

  static std::string_view storage(Visibility v) { return v == Visibility::Private ? "static " : ""; }

  /// Declaration or expression statement on one line, `;` included.
  std::string simple_stmt(const Stmt * stmt)
  {
    if (const auto * e = dyn_cast<ExprStmt>(stmt)) {
      return exprs_.visit(e->expr) + ";";
    }
    const auto * d = cast<DeclStmt>(stmt);
    const std::string init = d->init ? " = " + exprs_.visit(d->init) : std::string();
    if (d->form == DeclForm::Implicit) {
      return fmt::format("{} {}{};", exprs_.visit(d->type), d->name, init);
    }
    const std::string type = d->type ? ": " + exprs_.visit(d->type) : std::string();
    return fmt::format("{} {}{}{};", to_string(d->form), d->name, type, init);
  }

  void emit_body(const BlockStmt * block)
  {
    ++level_;
    if (block != nullptr) {
      for (const auto * s : block->stmts) {
        emit_stmt(s);
      }
    }
    --level_;
  }

  void emit_if(const IfStmt * node, std::string_view prefix)
  {
    line(fmt::format("{}if ({}) {{", prefix, exprs_.visit(node->condition)));
    emit_body(node->thenBranch);
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
      emit_body(block);
    } else {
      ++level_;
      emit_stmt(node->elseBranch);
      --level_;
    }
    line("}");
  }

  void emit_switch(const SwitchStmt * sw)
  {
    line("switch (" + exprs_.visit(sw->subject) + ") {");
    ++level_;
    for (const auto * c : sw->cases) {
      line("case " + exprs_.list(c->values) + ":");
      ++level_;
      for (const auto * s : c->body) {
        emit_stmt(s);
      }
      --level_;
    }
    if (sw->hasDefault) {
      line("default:");
      ++level_;
      for (const auto * s : sw->defaultBody) {
        emit_stmt(s);
      }
      --level_;
    }
    --level_;
    line("}");
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
      line(a->hasArgs ? fmt::format("#[{}({})]", a->name, a->args) : fmt::format("#[{}]", a->name));
    }
  }

  std::string params(const FunctionDecl * fn)
  {
    std::string out;
    for (size_t i = 0; i < fn->params.size(); ++i) {
      const auto * p = fn->params[i];
      if (i > 0) out += ", ";
      if (p->is_self()) {
        if (const auto * ref = dyn_cast<ReferenceTypeNode>(p->type)) {
          out += ref->isMutable ? "&var self" : "&self";
        } else {
          out += "self";
        }
        continue;
      }
      out += fmt::format("{} {}", exprs_.visit(p->type), p->name);
    }
    return out;
  }

  void emit_function(const FunctionDecl * fn, std::string_view storage_class)
  {
    emit_docs(fn->docs);
    emit_attributes(fn->attributes);
    line(fmt::format(
      "{}{} {}({}) {{", storage_class, exprs_.visit(fn->returnType), fn->name, params(fn)));
    emit_body(fn->body);
    line("}");
  }

  void emit_item(const Decl * item)
  {
    switch (item->get_kind()) {
      case NodeKind::FunctionDecl: {
        const auto * fn = cast<FunctionDecl>(item);
        emit_function(fn, storage(fn->visibility));
        return;
      }
      case NodeKind::StructDecl:
        emit_struct(cast<StructDecl>(item));
        return;
      case NodeKind::EnumDecl: {
        const auto * e = cast<EnumDecl>(item);
        emit_docs(e->docs);
        emit_attributes(e->attributes);
        line(fmt::format("{}enum {} {{", storage(e->visibility), e->name));
        ++level_;
        for (const auto * v : e->variants) {
          line(v->hasExplicitValue ? fmt::format("{} = {},", v->name, v->value)
                                   : fmt::format("{},", v->name));
        }
        --level_;
        line("}");
        return;
      }
      case NodeKind::TypedefDecl: {
        const auto * t = cast<TypedefDecl>(item);
        emit_docs(t->docs);
        emit_attributes(t->attributes);
        line(fmt::format(
          "{}typedef {} {};", storage(t->visibility), exprs_.visit(t->aliasedType), t->name));
        return;
      }
      case NodeKind::ImplBlockDecl: {
        const auto * impl = cast<ImplBlockDecl>(item);
        emit_docs(impl->docs);
        emit_attributes(impl->attributes);
        line("typedef struct {");
        emit_members(impl->methods);
        if (impl->blockName.empty()) {
          line(fmt::format("}} @{};", impl->targetName));
        } else {
          line(fmt::format("}} @{}.{};", impl->targetName, impl->blockName));
        }
        return;
      }
      case NodeKind::ExternBlockDecl: {
        const auto * ext = cast<ExternBlockDecl>(item);
        line(fmt::format("extern \"{}\" {{", ext->abi));
        ++level_;
        std::string current;
        for (const auto tok : ext->tokens) {
          if (!current.empty()) current += ' ';
          current += tok;
          if (tok == ";") {
            line(current);
            current.clear();
          }
        }
        if (!current.empty()) {
          line(current);
        }
        --level_;
        line("}");
        return;
      }
      case NodeKind::MacroDefDecl: {
        const auto * m = cast<MacroDefDecl>(item);
        std::string head = "#define " + std::string(m->name);
        if (m->hasParamList) {
          head += "(";
          for (size_t i = 0; i < m->params.size(); ++i) {
            if (i > 0) head += ", ";
            head += m->params[i];
          }
          head += ")";
        }
        for (const auto & tok : m->body) {
          head += ' ';
          head += tok.spelling;
        }
        line(head);
        return;
      }
      default:
        throw InternalCodegenError(
          fmt::format("cannot print item `{}`", to_string(item->get_kind())), item->get_range());
    }
  }

  void emit_members(gsl::span<FunctionDecl *> methods)
  {
    ++level_;
    for (size_t i = 0; i < methods.size(); ++i) {
      if (i > 0) out_ += '\n';
      emit_function(methods[i], storage(methods[i]->visibility));
    }
    --level_;
  }

  void emit_struct(const StructDecl * s)
  {
    emit_docs(s->docs);
    emit_attributes(s->attributes);
    line(fmt::format("{}struct {} {{", storage(s->visibility), s->name));
    ++level_;
    for (const auto * f : s->fields) {
      emit_docs(f->docs);
      line(fmt::format("{}{} {};", storage(f->visibility), exprs_.visit(f->type), f->name));
    }
    --level_;
    if (!s->fields.empty() && !s->methods.empty()) {
      out_ += '\n';
    }
    emit_members(s->methods);
    line("}");
  }

  const CodegenOptions & options_;
  SourceExprPrinter exprs_;
  std::string out_;
  int level_ = 0;
};

}  // namespace

std::string SourcePrinter::print(const Program & program) const
{
  SourceWriter writer(options_);
  writer.emit_program(program);
  return writer.take();
}

std::string SourcePrinter::print_type(const TypeNode * type) const
{
  SourceExprPrinter printer;
  return printer.visit(type);
}

std::string SourcePrinter::print_expr(const Expr * expr) const
{
  SourceExprPrinter printer;
  return printer.visit(expr);
}

std::string SourcePrinter::print_stmt(const Stmt * stmt) const
{
  SourceWriter writer(options_);
  writer.emit_stmt(stmt);
  return writer.take();
}

}  // namespace crusty
