// crusty/sema/capture_analyzer.cpp - Closure capture classification
//
#include "crusty/sema/capture_analyzer.hpp"

#include <unordered_set>

#include "crusty/ast/visitor.hpp"
#include "crusty/basic/casting.hpp"
#include "crusty/basic/log.hpp"

namespace crusty
{

namespace
{

/// Strip parentheses.
const Expr * unparen(const Expr * e)
{
  while (const auto * p = dyn_cast<ParenExpr>(e)) {
    e = p->inner;
  }
  return e;
}

/// The variable an assignment target writes through, if any:
/// `x`, `x.f`, `x[i]`, `*x`, `(x)` all write through `x`.
const IdentExpr * target_root(const Expr * e)
{
  while (e) {
    e = unparen(e);
    if (const auto * id = dyn_cast<IdentExpr>(e)) {
      return id;
    }
    if (const auto * fa = dyn_cast<FieldAccessExpr>(e)) {
      e = fa->base;
    } else if (const auto * ix = dyn_cast<IndexExpr>(e)) {
      e = ix->base;
    } else if (const auto * un = dyn_cast<UnaryExpr>(e); un && un->op == UnaryOp::Deref) {
      e = un->operand;
    } else {
      return nullptr;
    }
  }
  return nullptr;
}

// ============================================================================
// UseCollector
// ============================================================================

struct CaptureUse
{
  std::string_view name;
  bool assigned = false;
  bool consumed = false;
};

class UseCollector : public ConstRecursiveAstVisitor<UseCollector>
{
public:
  UseCollector(const OuterScope & outer, std::string_view self_name)
  : outer_(outer), selfName_(self_name)
  {
  }

  void run(const FunctionDecl * fn)
  {
    scopes_.emplace_back();
    for (const auto * param : fn->params) {
      scopes_.back().insert(param->name);
    }
    visit(fn->body);
    scopes_.pop_back();
  }

  [[nodiscard]] const std::vector<CaptureUse> & uses() const { return uses_; }

  // --- references --------------------------------------------------------

  bool visit_ident(const IdentExpr * node)
  {
    record(node->name);
    return true;
  }

  // --- writes ------------------------------------------------------------

  bool visit_assign_expr(const AssignExpr * node)
  {
    mark_assigned(target_root(node->target));
    mark_consumed(node->value);
    return visit(node->target) && visit(node->value);
  }

  bool visit_unary_expr(const UnaryExpr * node)
  {
    if (node->op == UnaryOp::PreInc || node->op == UnaryOp::PreDec || node->op == UnaryOp::RefMut) {
      mark_assigned(target_root(node->operand));
    }
    return visit(node->operand);
  }

  // --- by-value positions ------------------------------------------------

  bool visit_call_expr(const CallExpr * node)
  {
    if (const auto * callee = dyn_cast<IdentExpr>(unparen(node->callee))) {
      const auto * var = lookup_outer(callee->name);
      if (var && var->isMutableClosure) {
        mark_assigned(callee);
      }
    }
    for (const auto * arg : node->args) {
      mark_consumed(arg);
    }
    return RecursiveAstVisitor::visit_call_expr(node);
  }

  bool visit_method_call_expr(const MethodCallExpr * node)
  {
    if (const auto * recv = target_root(node->receiver)) {
      const auto * var = lookup_outer(recv->name);
      if (var && var->mutatingMethods.count(node->method) > 0) {
        mark_assigned(recv);
      }
    }
    for (const auto * arg : node->args) {
      mark_consumed(arg);
    }
    return RecursiveAstVisitor::visit_method_call_expr(node);
  }

  bool visit_type_scoped_call_expr(const TypeScopedCallExpr * node)
  {
    for (const auto * arg : node->args) {
      mark_consumed(arg);
    }
    return RecursiveAstVisitor::visit_type_scoped_call_expr(node);
  }

  bool visit_field_init(const FieldInit * node)
  {
    mark_consumed(node->value);
    return RecursiveAstVisitor::visit_field_init(node);
  }

  bool visit_array_literal_expr(const ArrayLiteralExpr * node)
  {
    for (const auto * e : node->elements) {
      mark_consumed(e);
    }
    return RecursiveAstVisitor::visit_array_literal_expr(node);
  }

  bool visit_tuple_expr(const TupleExpr * node)
  {
    for (const auto * e : node->elements) {
      mark_consumed(e);
    }
    return RecursiveAstVisitor::visit_tuple_expr(node);
  }

  bool visit_return_stmt(const ReturnStmt * node)
  {
    mark_consumed(node->value);
    return RecursiveAstVisitor::visit_return_stmt(node);
  }

  // --- scopes ------------------------------------------------------------

  bool visit_decl_stmt(const DeclStmt * node)
  {
    mark_consumed(node->init);
    visit(node->init);
    scopes_.back().insert(node->name);
    return true;
  }

  bool visit_block_stmt(const BlockStmt * node)
  {
    scopes_.emplace_back();
    const bool ok = RecursiveAstVisitor::visit_block_stmt(node);
    scopes_.pop_back();
    return ok;
  }

  bool visit_for_stmt(const ForStmt * node)
  {
    scopes_.emplace_back();
    const bool ok = RecursiveAstVisitor::visit_for_stmt(node);
    scopes_.pop_back();
    return ok;
  }

  bool visit_for_in_stmt(const ForInStmt * node)
  {
    mark_consumed(node->iterable);
    visit(node->iterable);
    scopes_.emplace_back();
    scopes_.back().insert(node->variable);
    visit(node->body);
    scopes_.pop_back();
    return true;
  }

  bool visit_switch_case(const SwitchCase * node)
  {
    scopes_.emplace_back();
    const bool ok = RecursiveAstVisitor::visit_switch_case(node);
    scopes_.pop_back();
    return ok;
  }

  bool visit_nested_function_stmt(const NestedFunctionStmt * /*node*/)
  {
    // Deeper nesting is rejected by the analyzer.
    return true;
  }

private:
  [[nodiscard]] bool is_local(std::string_view name) const
  {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
      if (it->count(name) > 0) return true;
    }
    return false;
  }

  [[nodiscard]] const OuterVariable * lookup_outer(std::string_view name) const
  {
    if (name == selfName_ || is_local(name)) return nullptr;
    auto it = outer_.find(name);
    return it != outer_.end() ? &it->second : nullptr;
  }

  CaptureUse * record(std::string_view name)
  {
    if (!lookup_outer(name)) return nullptr;
    for (auto & use : uses_) {
      if (use.name == name) return &use;
    }
    uses_.push_back(CaptureUse{name});
    return &uses_.back();
  }

  void mark_assigned(const IdentExpr * root)
  {
    if (!root) return;
    if (auto * use = record(root->name)) {
      use->assigned = true;
    }
  }

  void mark_consumed(const Expr * value)
  {
    if (!value) return;
    if (const auto * id = dyn_cast<IdentExpr>(unparen(value))) {
      if (auto * use = record(id->name)) {
        use->consumed = true;
      }
    }
  }

  const OuterScope & outer_;
  std::string_view selfName_;
  std::vector<std::unordered_set<std::string_view>> scopes_;
  std::vector<CaptureUse> uses_;
};

class NameFinder : public ConstRecursiveAstVisitor<NameFinder>
{
public:
  explicit NameFinder(std::string_view name) : name_(name) {}

  bool visit_ident(const IdentExpr * node)
  {
    if (node->name == name_) {
      found_ = true;
      return false;
    }
    return true;
  }

  [[nodiscard]] bool found() const noexcept { return found_; }

private:
  std::string_view name_;
  bool found_ = false;
};

}  // namespace

// ============================================================================
// Public API
// ============================================================================

bool mentions_name(const std::vector<const Stmt *> & stmts, std::string_view name)
{
  NameFinder finder(name);
  for (const auto * stmt : stmts) {
    finder.visit(stmt);
    if (finder.found()) return true;
  }
  return false;
}

std::vector<CaptureEntry> CaptureAnalyzer::analyze(
  const FunctionDecl * function, const std::vector<const Stmt *> & following) const
{
  UseCollector collector(outer_, function->name);
  collector.run(function);

  std::vector<CaptureEntry> captures;
  captures.reserve(collector.uses().size());
  for (const auto & use : collector.uses()) {
    CaptureMode mode = CaptureMode::ReadOnly;
    if (use.assigned) {
      mode = CaptureMode::Mutable;
    } else if (use.consumed && !outer_.at(use.name).isCopy && !mentions_name(following, use.name)) {
      mode = CaptureMode::Move;
    }
    captures.push_back(CaptureEntry{use.name, mode});
    CRUSTY_LOG_TRACE("sema", "'{}' captures '{}' ({})", function->name, use.name, to_string(mode));
  }
  return captures;
}

}  // namespace crusty
