// crusty/sema/semantic_analyzer.cpp - Name resolution and type checking
//
#include "crusty/sema/semantic_analyzer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>

#include "crusty/ast/visitor.hpp"
#include "crusty/basic/casting.hpp"
#include "crusty/basic/log.hpp"
#include "crusty/syntax/keywords.hpp"

namespace crusty
{

namespace
{

const Expr * unparen(const Expr * e)
{
  while (const auto * p = dyn_cast<ParenExpr>(e)) {
    e = p->inner;
  }
  return e;
}

/// Prefer the concrete side when one operand is a literal placeholder.
const Type * pick(const Type * a, const Type * b)
{
  return a->is_placeholder() ? b : a;
}

std::string_view plural(size_t n, std::string_view one, std::string_view many)
{
  return n == 1 ? one : many;
}

/// Collects the names a function body declares, at any depth, without
/// descending into nested function bodies.
class LocalNameCollector : public ConstRecursiveAstVisitor<LocalNameCollector>
{
public:
  LocalNameCollector(
    std::unordered_set<std::string_view> & locals, std::unordered_set<std::string_view> & nested)
  : locals_(locals), nested_(nested)
  {
  }

  bool visit_decl_stmt(const DeclStmt * node)
  {
    locals_.insert(node->name);
    return RecursiveAstVisitor::visit_decl_stmt(node);
  }

  bool visit_for_in_stmt(const ForInStmt * node)
  {
    locals_.insert(node->variable);
    return RecursiveAstVisitor::visit_for_in_stmt(node);
  }

  bool visit_nested_function_stmt(const NestedFunctionStmt * node)
  {
    locals_.insert(node->function->name);
    nested_.insert(node->function->name);
    return true;
  }

private:
  std::unordered_set<std::string_view> & locals_;
  std::unordered_set<std::string_view> & nested_;
};

bool has_derive(const StructDecl * decl, std::string_view trait)
{
  for (const auto * attr : decl->attributes) {
    if (attr->name == "derive" && attr->args.find(trait) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

bool always_returns(gsl::span<Stmt * const> stmts);

gsl::span<Stmt * const> loop_body(const BlockStmt * body)
{
  return body ? gsl::span<Stmt * const>(body->stmts) : gsl::span<Stmt * const>();
}

/// True if a `break` in `stmts` leaves the loop labelled `label`. `nested`
/// counts the unlabelled loops entered below that loop.
bool breaks_out(gsl::span<Stmt * const> stmts, std::string_view label, int nested)
{
  for (const auto * stmt : stmts) {
    if (!stmt) continue;
    switch (stmt->get_kind()) {
      case NodeKind::BreakStmt: {
        const auto * node = cast<BreakStmt>(stmt);
        if (node->label.empty() ? nested == 0 : node->label == label) return true;
        break;
      }
      case NodeKind::BlockStmt:
        if (breaks_out(cast<BlockStmt>(stmt)->stmts, label, nested)) return true;
        break;
      case NodeKind::IfStmt: {
        const auto * node = cast<IfStmt>(stmt);
        if (node->thenBranch && breaks_out(node->thenBranch->stmts, label, nested)) return true;
        if (node->elseBranch) {
          Stmt * const else_branch[] = {node->elseBranch};
          if (breaks_out(else_branch, label, nested)) return true;
        }
        break;
      }
      case NodeKind::SwitchStmt: {
        const auto * node = cast<SwitchStmt>(stmt);
        for (const auto * c : node->cases) {
          if (breaks_out(c->body, label, nested)) return true;
        }
        if (breaks_out(node->defaultBody, label, nested)) return true;
        break;
      }
      case NodeKind::WhileStmt:
        if (breaks_out(loop_body(cast<WhileStmt>(stmt)->body), label, nested + 1)) return true;
        break;
      case NodeKind::LoopStmt:
        if (breaks_out(loop_body(cast<LoopStmt>(stmt)->body), label, nested + 1)) return true;
        break;
      case NodeKind::ForStmt:
        if (breaks_out(loop_body(cast<ForStmt>(stmt)->body), label, nested + 1)) return true;
        break;
      case NodeKind::ForInStmt:
        if (breaks_out(loop_body(cast<ForInStmt>(stmt)->body), label, nested + 1)) return true;
        break;
      default:
        break;
    }
  }
  return false;
}

/// True if control cannot reach the end of `stmt`.
bool stmt_always_returns(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::ReturnStmt:
      return true;
    case NodeKind::BlockStmt:
      return always_returns(cast<BlockStmt>(stmt)->stmts);
    case NodeKind::IfStmt: {
      const auto * node = cast<IfStmt>(stmt);
      return node->elseBranch != nullptr && node->thenBranch != nullptr &&
             always_returns(node->thenBranch->stmts) && stmt_always_returns(node->elseBranch);
    }
    case NodeKind::SwitchStmt: {
      const auto * node = cast<SwitchStmt>(stmt);
      if (!node->hasDefault || !always_returns(node->defaultBody)) return false;
      return std::all_of(node->cases.begin(), node->cases.end(), [](const SwitchCase * c) {
        return always_returns(c->body);
      });
    }
    // Only `loop` and a condition-less `for` diverge in the generated code.
    case NodeKind::LoopStmt: {
      const auto * node = cast<LoopStmt>(stmt);
      return !breaks_out(loop_body(node->body), node->label, 0);
    }
    case NodeKind::ForStmt: {
      const auto * node = cast<ForStmt>(stmt);
      return node->condition == nullptr && !breaks_out(loop_body(node->body), node->label, 0);
    }
    default:
      return false;
  }
}

bool always_returns(gsl::span<Stmt * const> stmts)
{
  return std::any_of(stmts.begin(), stmts.end(), [](const Stmt * stmt) {
    return stmt != nullptr && stmt_always_returns(stmt);
  });
}

}  // namespace

SemanticAnalyzer::SemanticAnalyzer(AstContext & ast, TypeContext & types, DiagnosticBag & diags)
: ast_(ast), types_(types), diags_(diags), env_(types)
{
}

// ============================================================================
// Entry point
// ============================================================================

bool SemanticAnalyzer::analyze(Program & program)
{
  CRUSTY_LOG_DEBUG("sema", "analyzing {} items", program.items.size());

  register_types(program);
  register_functions(program);
  validate_signatures(program);
  env_.freeze();

  CRUSTY_LOG_DEBUG(
    "sema", "environment frozen: {} aliases, {} symbols", env_.alias_count(),
    env_.symbol_count());

  for (auto * item : program.items) {
    if (auto * fn = dyn_cast<FunctionDecl>(item)) {
      check_function(fn, {}, 0);
    } else if (auto * s = dyn_cast<StructDecl>(item)) {
      for (auto * method : s->methods) {
        check_function(method, s->name, 0);
      }
    } else if (auto * impl = dyn_cast<ImplBlockDecl>(item)) {
      if (!env_.is_declared_type(impl->targetName)) continue;
      for (auto * method : impl->methods) {
        check_function(method, env_.concrete_name(impl->targetName), 0);
      }
    }
  }

  CRUSTY_LOG_DEBUG("sema", "analysis finished with {} error(s)", errorCount_);
  return errorCount_ == 0;
}

std::optional<gsl::span<const CaptureEntry>> SemanticAnalyzer::get_captures(
  std::string_view name) const
{
  auto it = nestedByName_.find(name);
  if (it == nestedByName_.end()) {
    return std::nullopt;
  }
  const auto & captures = it->second->captures;
  return gsl::span<const CaptureEntry>(captures.data(), captures.size());
}

void SemanticAnalyzer::error(
  SourceRange range, const char * code, std::string message, std::string label)
{
  CRUSTY_LOG_TRACE("sema", "{} {}", code, message);
  diags_.report_error(range, std::move(message), std::move(label)).with_code(code);
  ++errorCount_;
}

// ============================================================================
// Phase 1: types
// ============================================================================

void SemanticAnalyzer::register_types(Program & program)
{
  for (auto * item : program.items) {
    if (auto * s = dyn_cast<StructDecl>(item)) {
      if (!env_.register_concrete(s->name, s)) {
        error(
          s->get_range(), diag_code::k_duplicate_definition,
          fmt::format("the name `{}` is defined multiple times", s->name), "redefined here");
      }
      std::unordered_set<std::string_view> fields;
      for (const auto * field : s->fields) {
        if (!fields.insert(field->name).second) {
          error(
            field->get_range(), diag_code::k_duplicate_definition,
            fmt::format("field `{}` is already declared in `{}`", field->name, s->name));
        }
      }
    } else if (auto * e = dyn_cast<EnumDecl>(item)) {
      if (!env_.register_concrete(e->name, e)) {
        error(
          e->get_range(), diag_code::k_duplicate_definition,
          fmt::format("the name `{}` is defined multiple times", e->name), "redefined here");
      }
      std::unordered_set<std::string_view> variants;
      for (const auto * variant : e->variants) {
        if (!variants.insert(variant->name).second) {
          error(
            variant->get_range(), diag_code::k_duplicate_definition,
            fmt::format("variant `{}` is already declared in `{}`", variant->name, e->name));
        }
      }
    }
  }

  // Every typedef is announced first so that cycles through later
  // declarations are seen from each member.
  std::vector<std::pair<TypedefDecl *, const Type *>> typedefs;
  for (auto * item : program.items) {
    if (auto * t = dyn_cast<TypedefDecl>(item)) {
      const Type * target = lower_type(t->aliasedType);
      env_.declare_pending_alias(t->name, target);
      typedefs.emplace_back(t, target);
    }
  }

  for (const auto & [decl, target] : typedefs) {
    switch (env_.register_alias(decl->name, target, decl)) {
      case AliasRegistration::Registered:
        break;
      case AliasRegistration::Circular:
        error(
          decl->get_range(), diag_code::k_circular_type_alias,
          fmt::format("circular type alias `{}`", decl->name),
          fmt::format("`{}` refers back to itself", decl->name));
        break;
      case AliasRegistration::Duplicate:
        error(
          decl->get_range(), diag_code::k_duplicate_definition,
          fmt::format("the name `{}` is defined multiple times", decl->name), "redefined here");
        break;
    }
  }
}

// ============================================================================
// Phase 2: functions and methods
// ============================================================================

void SemanticAnalyzer::check_function_name(const FunctionDecl * fn)
{
  if (syntax::is_macro_name(fn->name)) {
    error(
      fn->get_range(), diag_code::k_invalid_operation,
      fmt::format("function name `{}` uses the reserved macro form `__name__`", fn->name));
  }
}

bool SemanticAnalyzer::is_top_level_name_taken(std::string_view name) const
{
  return env_.lookup_symbol(name) != nullptr || env_.is_declared_type(name);
}

void SemanticAnalyzer::register_method(std::string_view type_name, FunctionDecl * method)
{
  MethodInfo info;
  info.decl = method;
  info.hasSelf = !method->params.empty() && method->params[0]->is_self();
  if (info.hasSelf) {
    if (const auto * ref = dyn_cast<ReferenceTypeNode>(method->params[0]->type)) {
      info.mutatesSelf = ref->isMutable;
    }
  }
  info.type = function_type_of(method, true);

  auto [it, inserted] = members_[type_name].methods.emplace(method->name, info);
  if (!inserted) {
    error(
      method->get_range(), diag_code::k_duplicate_definition,
      fmt::format("duplicate definitions with name `{}` for type `{}`", method->name, type_name),
      "duplicate definition");
  }
}

void SemanticAnalyzer::register_functions(Program & program)
{
  for (auto * item : program.items) {
    if (auto * fn = dyn_cast<FunctionDecl>(item)) {
      check_function_name(fn);
      selfType_ = {};
      Symbol symbol;
      symbol.type = function_type_of(fn, false);
      symbol.kind = SymbolKind::Function;
      symbol.visibility = fn->visibility;
      symbol.decl = fn;
      if (is_top_level_name_taken(fn->name) || !env_.declare_symbol(fn->name, symbol)) {
        error(
          fn->get_range(), diag_code::k_duplicate_definition,
          fmt::format("the name `{}` is defined multiple times", fn->name), "redefined here");
      }
    } else if (auto * s = dyn_cast<StructDecl>(item)) {
      selfType_ = s->name;
      for (auto * method : s->methods) {
        check_function_name(method);
        register_method(s->name, method);
      }
    } else if (auto * impl = dyn_cast<ImplBlockDecl>(item)) {
      if (!env_.is_declared_type(impl->targetName)) {
        error(
          impl->get_range(), diag_code::k_undefined_type,
          fmt::format("cannot find type `{}` in this scope", impl->targetName),
          "methods are attached to an undeclared type");
        continue;
      }
      // Blocks naming an alias of a struct extend that struct.
      selfType_ = env_.concrete_name(impl->targetName);
      for (auto * method : impl->methods) {
        check_function_name(method);
        register_method(selfType_, method);
      }
    }
  }
  selfType_ = {};
}

void SemanticAnalyzer::validate_signatures(Program & program)
{
  auto validate_fn = [this](const FunctionDecl * fn) {
    for (const auto * param : fn->params) {
      validate_type_node(param->type);
    }
    validate_type_node(fn->returnType);
  };

  for (auto * item : program.items) {
    if (auto * fn = dyn_cast<FunctionDecl>(item)) {
      selfType_ = {};
      validate_fn(fn);
    } else if (auto * s = dyn_cast<StructDecl>(item)) {
      selfType_ = s->name;
      for (const auto * field : s->fields) {
        validate_type_node(field->type);
      }
      for (const auto * method : s->methods) {
        validate_fn(method);
      }
    } else if (auto * t = dyn_cast<TypedefDecl>(item)) {
      // Rejected typedefs already carry their own diagnostic.
      const auto * entry = env_.lookup_alias(t->name);
      if (entry && entry->decl == t) {
        selfType_ = {};
        validate_type_node(t->aliasedType);
      }
    } else if (auto * impl = dyn_cast<ImplBlockDecl>(item)) {
      if (!env_.is_declared_type(impl->targetName)) continue;
      selfType_ = env_.concrete_name(impl->targetName);
      for (const auto * method : impl->methods) {
        validate_fn(method);
      }
    }
  }
  selfType_ = {};
}

// ============================================================================
// Types
// ============================================================================

const Type * SemanticAnalyzer::lower_type(const TypeNode * node)
{
  if (!node) return types_.void_type();

  switch (node->get_kind()) {
    case NodeKind::PrimitiveType:
      return types_.primitive_type(cast<PrimitiveTypeNode>(node)->primitive);
    case NodeKind::NamedType: {
      const auto name = cast<NamedTypeNode>(node)->name;
      if (name == "Self" && !selfType_.empty()) {
        return types_.get_named_type(selfType_);
      }
      return types_.get_named_type(name);
    }
    case NodeKind::PointerType: {
      const auto * n = cast<PointerTypeNode>(node);
      return types_.get_pointer_type(lower_type(n->pointee), n->isMutable);
    }
    case NodeKind::ReferenceType: {
      const auto * n = cast<ReferenceTypeNode>(node);
      return types_.get_reference_type(lower_type(n->referent), n->isMutable);
    }
    case NodeKind::ArrayType: {
      const auto * n = cast<ArrayTypeNode>(node);
      return types_.get_array_type(lower_type(n->element), n->size);
    }
    case NodeKind::SliceType:
      return types_.get_slice_type(lower_type(cast<SliceTypeNode>(node)->element));
    case NodeKind::TupleType: {
      std::vector<const Type *> elements;
      for (const auto * e : cast<TupleTypeNode>(node)->elements) {
        elements.push_back(lower_type(e));
      }
      return types_.get_tuple_type(elements);
    }
    case NodeKind::GenericType: {
      const auto * n = cast<GenericTypeNode>(node);
      std::vector<const Type *> args;
      for (const auto * a : n->args) {
        args.push_back(lower_type(a));
      }
      return types_.get_generic_type(n->base, args);
    }
    case NodeKind::FallibleType:
      return types_.get_fallible_type(lower_type(cast<FallibleTypeNode>(node)->inner));
    case NodeKind::AutoType:
      return types_.auto_type();
    default:
      return types_.error_type();
  }
}

void SemanticAnalyzer::validate_type_node(const TypeNode * node)
{
  if (!node) return;

  switch (node->get_kind()) {
    case NodeKind::NamedType: {
      const auto name = cast<NamedTypeNode>(node)->name;
      if (name == "Self") {
        if (selfType_.empty()) {
          error(
            node->get_range(), diag_code::k_undefined_type,
            "`Self` is only available inside a struct or impl block");
        }
      } else if (!env_.is_known_type_name(name)) {
        error(
          node->get_range(), diag_code::k_undefined_type,
          fmt::format("cannot find type `{}` in this scope", name), "not found in this scope");
      }
      return;
    }
    case NodeKind::PointerType:
      validate_type_node(cast<PointerTypeNode>(node)->pointee);
      return;
    case NodeKind::ReferenceType:
      validate_type_node(cast<ReferenceTypeNode>(node)->referent);
      return;
    case NodeKind::ArrayType:
      validate_type_node(cast<ArrayTypeNode>(node)->element);
      return;
    case NodeKind::SliceType:
      validate_type_node(cast<SliceTypeNode>(node)->element);
      return;
    case NodeKind::FallibleType:
      validate_type_node(cast<FallibleTypeNode>(node)->inner);
      return;
    case NodeKind::TupleType:
      for (const auto * e : cast<TupleTypeNode>(node)->elements) {
        validate_type_node(e);
      }
      return;
    case NodeKind::GenericType:
      // The base is a host generic (`Vec`, `Option`, ...); only arguments are checked.
      for (const auto * a : cast<GenericTypeNode>(node)->args) {
        validate_type_node(a);
      }
      return;
    default:
      return;
  }
}

const Type * SemanticAnalyzer::function_type_of(const FunctionDecl * fn, bool skip_self)
{
  std::vector<const Type *> params;
  for (const auto * param : fn->params) {
    if (skip_self && param->is_self()) continue;
    params.push_back(lower_type(param->type));
  }
  return types_.get_function_type(params, lower_type(fn->returnType));
}

const Type * SemanticAnalyzer::default_literal(const Type * t) const
{
  if (!t) return types_.auto_type();
  switch (t->kind) {
    case TypeKind::IntegerLiteral:
      return types_.int_type();
    case TypeKind::FloatLiteral:
      return types_.primitive_type(PrimitiveKind::Float);
    case TypeKind::NullLiteral:
      return types_.auto_type();
    default:
      return t;
  }
}

const StructDecl * SemanticAnalyzer::struct_of(const Type * t) const
{
  const Type * r = resolved(t);
  if (!r || r->kind != TypeKind::Named) return nullptr;
  const auto * entry = env_.lookup_alias(r->name);
  return entry ? dyn_cast<StructDecl>(entry->decl) : nullptr;
}

const EnumDecl * SemanticAnalyzer::enum_of(const Type * t) const
{
  const Type * r = resolved(t);
  if (!r || r->kind != TypeKind::Named) return nullptr;
  const auto * entry = env_.lookup_alias(r->name);
  return entry ? dyn_cast<EnumDecl>(entry->decl) : nullptr;
}

bool SemanticAnalyzer::is_copy_type(const Type * t) const
{
  const Type * r = resolved(t);
  if (!r) return true;

  switch (r->kind) {
    case TypeKind::Reference:
      return !r->isMutable;
    case TypeKind::Named:
      if (enum_of(r)) return true;
      if (const auto * s = struct_of(r)) return has_derive(s, "Copy");
      return !env_.is_known_type_name(r->name);
    case TypeKind::Array:
      return is_copy_type(r->inner);
    case TypeKind::Tuple:
      return std::all_of(r->elements.begin(), r->elements.end(), [this](const Type * e) {
        return is_copy_type(e);
      });
    case TypeKind::Slice:
    case TypeKind::Generic:
    case TypeKind::Fallible:
      return false;
    default:
      return true;
  }
}

const SemanticAnalyzer::TypeMembers * SemanticAnalyzer::members_of(const Type * t) const
{
  const Type * r = resolved(t);
  if (r && r->is_indirection()) {
    r = resolved(r->inner);
  }
  if (!r || r->kind != TypeKind::Named) return nullptr;
  auto it = members_.find(r->name);
  return it != members_.end() ? &it->second : nullptr;
}

// ============================================================================
// Scopes
// ============================================================================

void SemanticAnalyzer::push_scope() { scopes_.emplace_back(); }

void SemanticAnalyzer::pop_scope() { scopes_.pop_back(); }

bool SemanticAnalyzer::declare_local(
  std::string_view name, const Symbol & symbol, SourceRange range)
{
  auto [it, inserted] = scopes_.back().emplace(name, symbol);
  if (!inserted) {
    error(
      range, diag_code::k_duplicate_definition,
      fmt::format("`{}` is already declared in this scope", name), "redeclared here");
  }
  return inserted;
}

const Symbol * SemanticAnalyzer::lookup_local(std::string_view name, size_t * scope_index) const
{
  for (size_t i = scopes_.size(); i > 0; --i) {
    auto it = scopes_[i - 1].find(name);
    if (it != scopes_[i - 1].end()) {
      if (scope_index) *scope_index = i - 1;
      return &it->second;
    }
  }
  return nullptr;
}

std::vector<const Stmt *> SemanticAnalyzer::following_statements() const
{
  std::vector<const Stmt *> result;
  if (functions_.empty()) return result;

  const size_t base = functions_.back().continuationBase;
  for (size_t i = continuations_.size(); i > base; --i) {
    const auto & cont = continuations_[i - 1];
    for (size_t j = cont.next; j < cont.stmts.size(); ++j) {
      result.push_back(cont.stmts[j]);
    }
  }
  return result;
}

// ============================================================================
// Phase 4: function bodies
// ============================================================================

void SemanticAnalyzer::check_function(const FunctionDecl * fn, std::string_view self_type, int depth)
{
  const auto saved_self = selfType_;
  selfType_ = self_type;

  FunctionFrame frame;
  frame.decl = fn;
  frame.returnType = lower_type(fn->returnType);
  frame.depth = depth;
  frame.scopeBase = scopes_.size();
  frame.continuationBase = continuations_.size();
  LocalNameCollector collector(frame.declaredLocals, frame.nestedFunctions);
  collector.visit(fn->body);
  functions_.push_back(std::move(frame));

  push_scope();
  for (const auto * param : fn->params) {
    Symbol symbol;
    symbol.type = lower_type(param->type);
    symbol.kind = SymbolKind::Parameter;
    symbol.decl = param;
    if (!scopes_.back().emplace(param->name, symbol).second) {
      error(
        param->get_range(), diag_code::k_duplicate_definition,
        fmt::format("identifier `{}` is bound more than once in this parameter list", param->name));
    }
  }
  check_block(fn->body);
  pop_scope();

  const Type * return_type = resolved(functions_.back().returnType);
  if (
    fn->body && !return_type->is_void() && !return_type->is_unknown() &&
    !always_returns(fn->body->stmts)) {
    error(
      fn->get_range(), diag_code::k_type_mismatch,
      fmt::format(
        "function `{}` may reach its end without returning `{}`", fn->name,
        to_string(functions_.back().returnType)),
      "add a `return` on every path");
  }

  functions_.pop_back();
  selfType_ = saved_self;
}

void SemanticAnalyzer::check_block(BlockStmt * block)
{
  if (block) {
    check_statements(block->stmts);
  }
}

void SemanticAnalyzer::check_statements(gsl::span<Stmt *> stmts)
{
  push_scope();
  continuations_.push_back(Continuation{stmts, 0});
  for (size_t i = 0; i < stmts.size(); ++i) {
    continuations_.back().next = i + 1;
    check_stmt(stmts[i]);
  }
  continuations_.pop_back();
  pop_scope();
}

void SemanticAnalyzer::check_stmt(Stmt * stmt)
{
  if (!stmt) return;

  switch (stmt->get_kind()) {
    case NodeKind::DeclStmt:
      check_decl_stmt(cast<DeclStmt>(stmt));
      return;
    case NodeKind::ExprStmt:
      check_expr(cast<ExprStmt>(stmt)->expr);
      return;
    case NodeKind::ReturnStmt:
      check_return_stmt(cast<ReturnStmt>(stmt));
      return;
    case NodeKind::IfStmt: {
      auto * node = cast<IfStmt>(stmt);
      check_condition(node->condition);
      check_block(node->thenBranch);
      check_stmt(node->elseBranch);
      return;
    }
    case NodeKind::WhileStmt: {
      auto * node = cast<WhileStmt>(stmt);
      check_condition(node->condition);
      check_loop_body(node->label, node->body);
      return;
    }
    case NodeKind::LoopStmt: {
      auto * node = cast<LoopStmt>(stmt);
      check_loop_body(node->label, node->body);
      return;
    }
    case NodeKind::ForStmt: {
      auto * node = cast<ForStmt>(stmt);
      push_scope();
      check_stmt(node->init);
      if (node->condition) check_condition(node->condition);
      if (node->step) check_expr(node->step);
      check_loop_body(node->label, node->body);
      pop_scope();
      return;
    }
    case NodeKind::ForInStmt: {
      auto * node = cast<ForInStmt>(stmt);
      const Type * iter = resolved(check_expr(node->iterable));
      if (iter->kind == TypeKind::Reference) {
        iter = resolved(iter->inner);
      }
      const Type * element = types_.auto_type();
      if (iter->kind == TypeKind::Array || iter->kind == TypeKind::Slice) {
        element = iter->inner;
      } else if (iter->kind == TypeKind::Generic && !iter->elements.empty()) {
        element = default_literal(iter->elements[0]);
      }
      push_scope();
      Symbol symbol;
      symbol.type = element;
      symbol.decl = node;
      declare_local(node->variable, symbol, node->get_range());
      check_loop_body(node->label, node->body);
      pop_scope();
      return;
    }
    case NodeKind::SwitchStmt:
      check_switch_stmt(cast<SwitchStmt>(stmt));
      return;
    case NodeKind::BreakStmt:
      check_jump(stmt->get_range(), cast<BreakStmt>(stmt)->label, "break");
      return;
    case NodeKind::ContinueStmt:
      check_jump(stmt->get_range(), cast<ContinueStmt>(stmt)->label, "continue");
      return;
    case NodeKind::BlockStmt:
      check_block(cast<BlockStmt>(stmt));
      return;
    case NodeKind::NestedFunctionStmt:
      check_nested_function(cast<NestedFunctionStmt>(stmt));
      return;
    default:
      return;
  }
}

void SemanticAnalyzer::check_decl_stmt(DeclStmt * node)
{
  const Type * declared = nullptr;
  if (node->type) {
    validate_type_node(node->type);
    declared = lower_type(node->type);
  }

  const Type * init = node->init ? check_expr(node->init, declared) : nullptr;
  if (declared && init) {
    expect_compatible(declared, init, node->init->get_range(), "initializer");
  }

  Symbol symbol;
  symbol.type = declared && !declared->is_auto() ? declared : default_literal(init);
  symbol.kind = node->form == DeclForm::Const ? SymbolKind::Constant : SymbolKind::Variable;
  symbol.isMutable = node->is_mutable();
  symbol.decl = node;
  declare_local(node->name, symbol, node->get_range());
}

void SemanticAnalyzer::check_return_stmt(ReturnStmt * node)
{
  const Type * expected = current_function().returnType;
  const Type * r = resolved(expected);

  if (!node->value) {
    if (!r->is_void() && !r->is_unknown()) {
      error(
        node->get_range(), diag_code::k_type_mismatch,
        fmt::format("`return;` in a function whose return type is `{}`", to_string(expected)),
        "expected a value");
    }
    return;
  }

  const Type * actual = check_expr(node->value, expected);
  // A fallible function may return its success value directly.
  if (r->kind == TypeKind::Fallible && env_.is_compatible(r->inner, actual)) {
    return;
  }
  expect_compatible(expected, actual, node->value->get_range(), "return value");
}

void SemanticAnalyzer::check_condition(Expr * cond)
{
  const Type * t = check_expr(cond, types_.bool_type());
  if (!env_.is_compatible(types_.bool_type(), t)) {
    error(
      cond->get_range(), diag_code::k_type_mismatch,
      fmt::format("mismatched types: expected `bool`, found `{}`", to_string(t)),
      "condition must be a `bool`");
  }
}

void SemanticAnalyzer::check_switch_stmt(SwitchStmt * node)
{
  const Type * subject = check_expr(node->subject);
  for (auto * c : node->cases) {
    for (auto * value : c->values) {
      const Type * vt = check_expr(value, subject);
      expect_compatible(subject, vt, value->get_range(), "case value");
    }
    check_statements(c->body);
  }
  if (node->hasDefault) {
    check_statements(node->defaultBody);
  }
}

void SemanticAnalyzer::check_jump(SourceRange range, std::string_view label, const char * keyword)
{
  const auto & loops = current_function().loops;
  if (loops.empty()) {
    error(
      range, diag_code::k_invalid_operation, fmt::format("`{}` outside of a loop", keyword),
      "cannot leave a non-loop");
    return;
  }
  if (label.empty()) return;
  const bool found = std::any_of(
    loops.begin(), loops.end(), [label](const LoopFrame & f) { return f.label == label; });
  if (!found) {
    error(
      range, diag_code::k_invalid_operation, fmt::format("use of undeclared label `.{}`", label),
      "undeclared label");
  }
}

void SemanticAnalyzer::check_loop_body(std::string_view label, BlockStmt * body)
{
  current_function().loops.push_back(LoopFrame{label});
  check_block(body);
  current_function().loops.pop_back();
}

// ============================================================================
// Nested functions
// ============================================================================

void SemanticAnalyzer::check_nested_function(NestedFunctionStmt * node)
{
  FunctionDecl * fn = node->function;

  if (current_function().depth >= 1) {
    error(
      node->get_range(), diag_code::k_capture_violation,
      fmt::format("nested function `{}` cannot be declared inside another nested function", fn->name),
      "only one level of nesting is allowed");
    return;
  }
  if (node->isStatic) {
    error(
      node->get_range(), diag_code::k_visibility_error,
      fmt::format("nested function `{}` cannot be declared `static`", fn->name),
      "nested functions are always local to their enclosing function");
  }
  if (syntax::is_macro_name(fn->name)) {
    error(
      node->get_range(), diag_code::k_invalid_operation,
      fmt::format("nested function `{}` cannot use the macro form `__name__`", fn->name));
  }

  for (const auto * param : fn->params) {
    validate_type_node(param->type);
  }
  validate_type_node(fn->returnType);

  // Declared before its body is checked so the body may call itself.
  Symbol symbol;
  symbol.type = function_type_of(fn, false);
  symbol.kind = SymbolKind::Function;
  symbol.visibility = Visibility::Private;
  symbol.decl = node;
  declare_local(fn->name, symbol, node->get_range());

  // Everything visible here is a capture candidate; inner scopes shadow outer ones.
  OuterScope outer;
  for (size_t i = current_function().scopeBase; i < scopes_.size(); ++i) {
    for (const auto & [name, sym] : scopes_[i]) {
      OuterVariable var;
      var.isCopy = is_copy_type(sym.type);
      if (const auto * other = dyn_cast<NestedFunctionStmt>(sym.decl)) {
        var.isMutableClosure = std::any_of(
          other->captures.begin(), other->captures.end(),
          [](const CaptureEntry & c) { return c.mode == CaptureMode::Mutable; });
      }
      if (const auto * members = members_of(sym.type)) {
        for (const auto & [method, info] : members->methods) {
          if (info.mutatesSelf) var.mutatingMethods.insert(method);
        }
      }
      outer[name] = std::move(var);
    }
  }

  check_function(fn, selfType_, 1);

  const CaptureAnalyzer analyzer(outer);
  const auto captures = analyzer.analyze(fn, following_statements());
  node->captures = ast_.copy_to_arena(captures);
  nestedByName_.emplace(fn->name, node);

  CRUSTY_LOG_DEBUG("sema", "nested function '{}' has {} capture(s)", fn->name, captures.size());
}

// ============================================================================
// Expressions
// ============================================================================

bool SemanticAnalyzer::expect_compatible(
  const Type * expected, const Type * actual, SourceRange range, std::string_view what)
{
  if (env_.is_compatible(expected, actual)) {
    return true;
  }
  error(
    range, diag_code::k_type_mismatch,
    fmt::format(
      "mismatched types: expected `{}`, found `{}`", to_string(expected), to_string(actual)),
    fmt::format("this {} has type `{}`", what, to_string(actual)));
  return false;
}

const Type * SemanticAnalyzer::check_expr(Expr * expr, const Type * expected)
{
  if (!expr) return types_.error_type();

  const Type * t = nullptr;
  switch (expr->get_kind()) {
    case NodeKind::IntLiteral:
      t = types_.integer_literal_type();
      break;
    case NodeKind::FloatLiteral:
      t = types_.float_literal_type();
      break;
    case NodeKind::StringLiteral:
      t = types_.get_reference_type(types_.get_named_type("str"), false);
      break;
    case NodeKind::CharLiteral:
      t = types_.primitive_type(PrimitiveKind::Char);
      break;
    case NodeKind::BoolLiteral:
      t = types_.bool_type();
      break;
    case NodeKind::NullLiteral:
      t = types_.null_literal_type();
      break;
    case NodeKind::Ident:
      t = check_ident(cast<IdentExpr>(expr));
      break;
    case NodeKind::BinaryExpr:
      t = check_binary(cast<BinaryExpr>(expr));
      break;
    case NodeKind::AssignExpr:
      t = check_assign(cast<AssignExpr>(expr));
      break;
    case NodeKind::UnaryExpr:
      t = check_unary(cast<UnaryExpr>(expr));
      break;
    case NodeKind::TernaryExpr:
      t = check_ternary(cast<TernaryExpr>(expr));
      break;
    case NodeKind::CastExpr: {
      auto * node = cast<CastExpr>(expr);
      check_expr(node->expr);
      validate_type_node(node->targetType);
      t = lower_type(node->targetType);
      break;
    }
    case NodeKind::SizeofExpr:
      validate_type_node(cast<SizeofExpr>(expr)->targetType);
      t = types_.primitive_type(PrimitiveKind::U64);
      break;
    case NodeKind::ParenExpr:
      t = check_expr(cast<ParenExpr>(expr)->inner, expected);
      break;
    case NodeKind::TupleExpr: {
      std::vector<const Type *> elements;
      for (auto * e : cast<TupleExpr>(expr)->elements) {
        elements.push_back(check_expr(e));
      }
      t = types_.get_tuple_type(elements);
      break;
    }
    case NodeKind::CallExpr:
      t = check_call(cast<CallExpr>(expr));
      break;
    case NodeKind::MethodCallExpr:
      t = check_method_call(cast<MethodCallExpr>(expr));
      break;
    case NodeKind::FieldAccessExpr:
      t = check_field_access(cast<FieldAccessExpr>(expr));
      break;
    case NodeKind::IndexExpr:
      t = check_index(cast<IndexExpr>(expr));
      break;
    case NodeKind::TypeScopedCallExpr:
      t = check_type_scoped_call(cast<TypeScopedCallExpr>(expr));
      break;
    case NodeKind::MacroCallExpr:
      for (auto * arg : cast<MacroCallExpr>(expr)->args) {
        check_expr(arg);
      }
      t = types_.auto_type();
      break;
    case NodeKind::ErrorPropagateExpr:
      t = check_error_propagate(cast<ErrorPropagateExpr>(expr));
      break;
    case NodeKind::StructInitExpr:
      t = check_struct_init(cast<StructInitExpr>(expr));
      break;
    case NodeKind::ArrayLiteralExpr:
      t = check_array_literal(cast<ArrayLiteralExpr>(expr));
      break;
    case NodeKind::ArrayRepeatExpr: {
      auto * node = cast<ArrayRepeatExpr>(expr);
      const Type * value = check_expr(node->value);
      const Type * count = resolved(check_expr(node->count));
      if (!count->is_integer() && !count->is_unknown()) {
        error(
          node->count->get_range(), diag_code::k_type_mismatch,
          fmt::format("array repeat count must be an integer, found `{}`", to_string(count)));
      }
      const auto * literal = dyn_cast<IntLiteralExpr>(unparen(node->count));
      t = types_.get_array_type(value, literal ? literal->value : 0);
      break;
    }
    case NodeKind::RangeExpr:
      t = check_range(cast<RangeExpr>(expr));
      break;
    default:
      t = types_.error_type();
      break;
  }

  expr->resolvedType = t;
  return t;
}

const Type * SemanticAnalyzer::check_ident(IdentExpr * node)
{
  if (const auto * sym = lookup_local(node->name)) {
    return sym->type;
  }
  if (const auto * sym = env_.lookup_symbol(node->name)) {
    return sym->type;
  }
  if (env_.is_prelude_value(node->name)) {
    // Constructors take their payload type from context.
    return types_.auto_type();
  }

  for (auto it = functions_.rbegin(); it != functions_.rend(); ++it) {
    if (it->nestedFunctions.count(node->name) > 0) {
      error(
        node->get_range(), diag_code::k_undefined_variable,
        fmt::format("`{}` is used before its declaration", node->name),
        "nested functions must be declared before they are called");
      return types_.error_type();
    }
  }

  if (functions_.size() >= 2 && current_function().depth >= 1 &&
      functions_[functions_.size() - 2].declaredLocals.count(node->name) > 0) {
    error(
      node->get_range(), diag_code::k_capture_violation,
      fmt::format(
        "nested function `{}` captures `{}` before it is declared", current_function().decl->name,
        node->name),
      "declared later in the enclosing function");
    return types_.error_type();
  }

  error(
    node->get_range(), diag_code::k_undefined_variable,
    fmt::format("cannot find value `{}` in this scope", node->name), "not found in this scope");
  return types_.error_type();
}

const Type * SemanticAnalyzer::check_binary(BinaryExpr * node)
{
  if (node->op == BinaryOp::Comma) {
    check_expr(node->lhs);
    return check_expr(node->rhs);
  }

  const Type * lhs = check_expr(node->lhs);
  const Type * rhs = check_expr(node->rhs);
  const Type * l = resolved(lhs);
  const Type * r = resolved(rhs);
  const bool yields_bool = is_comparison_op(node->op) || is_logical_op(node->op);

  if (l->is_unknown() || r->is_unknown()) {
    if (l->is_error() || r->is_error()) return types_.error_type();
    return yields_bool ? types_.bool_type() : types_.auto_type();
  }

  auto mismatch = [&]() {
    error(
      node->get_range(), diag_code::k_type_mismatch,
      fmt::format(
        "cannot apply `{}` to `{}` and `{}`", to_string(node->op), to_string(lhs),
        to_string(rhs)));
    return types_.error_type();
  };

  if (is_logical_op(node->op)) {
    if (!env_.is_compatible(types_.bool_type(), l) || !env_.is_compatible(types_.bool_type(), r)) {
      mismatch();
    }
    return types_.bool_type();
  }

  if (is_comparison_op(node->op)) {
    if (!env_.is_compatible(lhs, rhs)) {
      mismatch();
    }
    return types_.bool_type();
  }

  switch (node->op) {
    case BinaryOp::Add:
    case BinaryOp::Sub:
      if (l->kind == TypeKind::Pointer && r->is_integer()) return lhs;
      [[fallthrough]];
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
      if (!l->is_numeric() || !r->is_numeric() || !env_.is_compatible(lhs, rhs)) {
        return mismatch();
      }
      return pick(lhs, rhs);
    case BinaryOp::BitAnd:
    case BinaryOp::BitOr:
    case BinaryOp::BitXor:
      if (!((l->is_integer() && r->is_integer()) || (l->is_bool() && r->is_bool())) ||
          !env_.is_compatible(lhs, rhs)) {
        return mismatch();
      }
      return pick(lhs, rhs);
    case BinaryOp::Shl:
    case BinaryOp::Shr:
      if (!l->is_integer() || !r->is_integer()) {
        return mismatch();
      }
      return lhs;
    default:
      return mismatch();
  }
}

bool SemanticAnalyzer::check_assignable(const Expr * target, SourceRange report_range)
{
  const Expr * e = unparen(target);

  if (const auto * id = dyn_cast<IdentExpr>(e)) {
    const Symbol * sym = lookup_local(id->name);
    if (!sym) sym = env_.lookup_symbol(id->name);
    if (!sym) return false;  // already reported as undefined

    if (sym->kind == SymbolKind::Function) {
      error(
        report_range, diag_code::k_invalid_operation,
        fmt::format("cannot assign to function `{}`", id->name));
      return false;
    }
    if (sym->kind == SymbolKind::Constant) {
      error(
        report_range, diag_code::k_invalid_operation,
        fmt::format("cannot assign to constant `{}`", id->name), "constants cannot be modified");
      return false;
    }
    if (!sym->isMutable) {
      diags_
        .report_error(
          report_range, fmt::format("cannot assign to immutable variable `{}`", id->name),
          "cannot assign")
        .with_code(diag_code::k_invalid_operation)
        .with_help(fmt::format("declare `{}` with `var` to make it mutable", id->name));
      ++errorCount_;
      return false;
    }
    return true;
  }

  const Expr * base = nullptr;
  if (const auto * fa = dyn_cast<FieldAccessExpr>(e)) {
    if (fa->isArrow) return true;
    base = fa->base;
  } else if (const auto * ix = dyn_cast<IndexExpr>(e)) {
    base = ix->base;
  } else if (const auto * un = dyn_cast<UnaryExpr>(e); un && un->op == UnaryOp::Deref) {
    const Type * ot = un->operand->resolvedType ? resolved(un->operand->resolvedType) : nullptr;
    if (ot && ot->kind == TypeKind::Reference && !ot->isMutable) {
      error(
        report_range, diag_code::k_invalid_operation,
        "cannot assign through a `&` reference", "the reference is not `&var`");
      return false;
    }
    return true;
  } else {
    error(
      report_range, diag_code::k_invalid_operation, "invalid left-hand side of assignment",
      "cannot assign to this expression");
    return false;
  }

  const Type * bt = base->resolvedType ? resolved(base->resolvedType) : nullptr;
  if (bt && bt->kind == TypeKind::Pointer) return true;
  if (bt && bt->kind == TypeKind::Reference) {
    if (bt->isMutable) return true;
    error(
      report_range, diag_code::k_invalid_operation,
      "cannot assign through a `&` reference", "the reference is not `&var`");
    return false;
  }
  return check_assignable(base, report_range);
}

const Type * SemanticAnalyzer::check_assign(AssignExpr * node)
{
  const Type * target = check_expr(node->target);
  const Type * value = check_expr(node->value, target);
  check_assignable(node->target, node->target->get_range());

  const Type * t = resolved(target);
  if (node->op == AssignOp::Assign || t->is_unknown()) {
    if (node->op == AssignOp::Assign) {
      expect_compatible(target, value, node->value->get_range(), "assigned value");
    }
    return types_.void_type();
  }

  const bool bitwise_bool = t->is_bool() && (node->op == AssignOp::AndAssign ||
                                             node->op == AssignOp::OrAssign ||
                                             node->op == AssignOp::XorAssign);
  const bool shift = node->op == AssignOp::ShlAssign || node->op == AssignOp::ShrAssign;
  if (!bitwise_bool && !t->is_numeric()) {
    error(
      node->get_range(), diag_code::k_type_mismatch,
      fmt::format("cannot apply `{}` to `{}`", to_string(node->op), to_string(target)));
    return types_.void_type();
  }
  if (shift) {
    if (!resolved(value)->is_integer() && !resolved(value)->is_unknown()) {
      expect_compatible(types_.int_type(), value, node->value->get_range(), "shift amount");
    }
  } else {
    expect_compatible(target, value, node->value->get_range(), "operand");
  }
  return types_.void_type();
}

const Type * SemanticAnalyzer::check_unary(UnaryExpr * node)
{
  const Type * operand = check_expr(node->operand);
  const Type * r = resolved(operand);

  auto reject = [&]() {
    error(
      node->get_range(), diag_code::k_type_mismatch,
      fmt::format(
        "cannot apply unary operator `{}` to type `{}`", to_string(node->op),
        to_string(operand)));
    return types_.error_type();
  };

  switch (node->op) {
    case UnaryOp::Ref:
      return types_.get_reference_type(default_literal(operand), false);
    case UnaryOp::RefMut:
      check_assignable(node->operand, node->get_range());
      return types_.get_reference_type(default_literal(operand), true);
    case UnaryOp::Deref:
      if (r->is_unknown()) return r;
      if (r->is_indirection()) return r->inner;
      error(
        node->get_range(), diag_code::k_invalid_operation,
        fmt::format("type `{}` cannot be dereferenced", to_string(operand)),
        "not a pointer or reference");
      return types_.error_type();
    case UnaryOp::Not:
      if (r->is_unknown() || r->is_bool() || r->is_integer()) return operand;
      return reject();
    case UnaryOp::Neg:
      if (r->is_unknown() || r->is_numeric()) return operand;
      return reject();
    case UnaryOp::BitNot:
      if (r->is_unknown() || r->is_integer()) return operand;
      return reject();
    case UnaryOp::PreInc:
    case UnaryOp::PreDec:
      if (!r->is_unknown() && !r->is_numeric()) return reject();
      check_assignable(node->operand, node->get_range());
      return operand;
  }
  return types_.error_type();
}

const Type * SemanticAnalyzer::check_ternary(TernaryExpr * node)
{
  check_condition(node->condition);
  const Type * a = check_expr(node->thenExpr);
  const Type * b = check_expr(node->elseExpr);
  if (!env_.is_compatible(a, b)) {
    error(
      node->get_range(), diag_code::k_type_mismatch,
      fmt::format(
        "`?:` branches have incompatible types `{}` and `{}`", to_string(a), to_string(b)));
    return types_.error_type();
  }
  return pick(a, b);
}

void SemanticAnalyzer::check_arguments(
  SourceRange call_range, std::string_view callee, const Type * fn_type, gsl::span<Expr *> args)
{
  const auto params = fn_type->elements;
  if (args.size() != params.size()) {
    error(
      call_range, diag_code::k_invalid_operation,
      fmt::format(
        "function `{}` takes {} argument{} but {} {} supplied", callee, params.size(),
        plural(params.size(), "", "s"), args.size(), plural(args.size(), "was", "were")));
    for (auto * arg : args) {
      check_expr(arg);
    }
    return;
  }
  for (size_t i = 0; i < args.size(); ++i) {
    const Type * at = check_expr(args[i], params[i]);
    expect_compatible(params[i], at, args[i]->get_range(), "argument");
  }
}

const Type * SemanticAnalyzer::check_call(CallExpr * node)
{
  const Type * callee = check_expr(node->callee);
  const Type * r = resolved(callee);

  std::string_view name = "expression";
  if (const auto * id = dyn_cast<IdentExpr>(unparen(node->callee))) {
    name = id->name;
  }

  if (r->is_unknown()) {
    for (auto * arg : node->args) {
      check_expr(arg);
    }
    return r;
  }
  if (r->kind != TypeKind::Function) {
    error(
      node->callee->get_range(), diag_code::k_invalid_operation,
      fmt::format("`{}` is not a function", name),
      fmt::format("has type `{}`", to_string(callee)));
    for (auto * arg : node->args) {
      check_expr(arg);
    }
    return types_.error_type();
  }

  check_arguments(node->get_range(), name, r, node->args);
  return r->inner;
}

const Type * SemanticAnalyzer::check_method_call(MethodCallExpr * node)
{
  const Type * receiver = check_expr(node->receiver);
  if (const auto * members = members_of(receiver)) {
    auto it = members->methods.find(node->method);
    if (it != members->methods.end()) {
      check_arguments(node->get_range(), node->method, it->second.type, node->args);
      return it->second.type->inner;
    }
  }
  for (auto * arg : node->args) {
    check_expr(arg);
  }
  return types_.auto_type();
}

const Type * SemanticAnalyzer::check_field_access(FieldAccessExpr * node)
{
  const Type * base = check_expr(node->base);
  const Type * r = resolved(base);
  if (r->is_unknown()) return r;

  if (node->isArrow) {
    if (!r->is_indirection()) {
      error(
        node->get_range(), diag_code::k_invalid_operation,
        fmt::format("`->` requires a pointer, found `{}`", to_string(base)));
      return types_.error_type();
    }
    r = resolved(r->inner);
  } else if (r->is_indirection()) {
    r = resolved(r->inner);
  }
  if (r->is_unknown()) return r;

  if (r->kind == TypeKind::Tuple) {
    size_t index = 0;
    const auto field = node->field;
    const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), index);
    if (ec == std::errc() && ptr == field.data() + field.size() && index < r->elements.size()) {
      return r->elements[index];
    }
    error(
      node->get_range(), diag_code::k_invalid_operation,
      fmt::format("no field `{}` on tuple type `{}`", field, to_string(r)));
    return types_.error_type();
  }

  if (const auto * s = struct_of(r)) {
    for (const auto * field : s->fields) {
      if (field->name == node->field) {
        const auto saved = selfType_;
        selfType_ = s->name;
        const Type * t = lower_type(field->type);
        selfType_ = saved;
        return t;
      }
    }
    error(
      node->get_range(), diag_code::k_invalid_operation,
      fmt::format("no field `{}` on type `{}`", node->field, s->name), "unknown field");
    return types_.error_type();
  }

  if (r->kind == TypeKind::Generic ||
      (r->kind == TypeKind::Named && !env_.is_declared_type(r->name))) {
    return types_.auto_type();
  }

  error(
    node->get_range(), diag_code::k_invalid_operation,
    fmt::format("type `{}` has no fields", to_string(r)));
  return types_.error_type();
}

const Type * SemanticAnalyzer::check_index(IndexExpr * node)
{
  const Type * base = check_expr(node->base);
  const Type * index = resolved(check_expr(node->index));
  const bool is_slice = index->kind == TypeKind::Generic && index->name == "Range";

  if (!is_slice && !index->is_integer() && !index->is_unknown()) {
    error(
      node->index->get_range(), diag_code::k_type_mismatch,
      fmt::format("array index must be an integer, found `{}`", to_string(index)));
  }

  const Type * r = resolved(base);
  if (r->kind == TypeKind::Reference) {
    r = resolved(r->inner);
  }
  if (r->is_unknown()) return r;

  const Type * element = nullptr;
  switch (r->kind) {
    case TypeKind::Array:
    case TypeKind::Slice:
    case TypeKind::Pointer:
      element = r->inner;
      break;
    case TypeKind::Generic:
      element = r->name == "Vec" && !r->elements.empty() ? r->elements[0] : types_.auto_type();
      break;
    case TypeKind::Named:
      if (!env_.is_declared_type(r->name)) {
        element = types_.auto_type();
      }
      break;
    default:
      break;
  }

  if (!element) {
    error(
      node->get_range(), diag_code::k_invalid_operation,
      fmt::format("type `{}` cannot be indexed", to_string(base)));
    return types_.error_type();
  }
  return is_slice ? types_.get_slice_type(element) : element;
}

const Type * SemanticAnalyzer::check_type_scoped_call(TypeScopedCallExpr * node)
{
  validate_type_node(node->typeNode);
  const Type * t = lower_type(node->typeNode);

  if (const auto * e = enum_of(t); e && !node->isCall) {
    for (const auto * variant : e->variants) {
      if (variant->name == node->method) return t;
    }
    error(
      node->get_range(), diag_code::k_invalid_operation,
      fmt::format("no variant `{}` in enum `{}`", node->method, e->name), "variant not found");
    return types_.error_type();
  }

  if (const auto * members = members_of(t)) {
    auto it = members->methods.find(node->method);
    if (it != members->methods.end()) {
      if (!node->isCall) return it->second.type;
      check_arguments(node->get_range(), node->method, it->second.type, node->args);
      return it->second.type->inner;
    }
  }

  for (auto * arg : node->args) {
    check_expr(arg);
  }
  return types_.auto_type();
}

const Type * SemanticAnalyzer::check_error_propagate(ErrorPropagateExpr * node)
{
  const Type * operand = check_expr(node->operand);
  const Type * r = resolved(operand);
  if (r->is_unknown()) return r;
  if (r->kind == TypeKind::Fallible) return r->inner;
  if (r->kind == TypeKind::Generic && (r->name == "Result" || r->name == "Option") &&
      !r->elements.empty()) {
    return r->elements[0];
  }
  error(
    node->get_range(), diag_code::k_invalid_operation,
    fmt::format("the `?` operator cannot be applied to type `{}`", to_string(operand)),
    "not a fallible value");
  return types_.error_type();
}

const Type * SemanticAnalyzer::check_struct_init(StructInitExpr * node)
{
  validate_type_node(node->typeNode);
  const Type * t = lower_type(node->typeNode);
  const StructDecl * s = struct_of(t);

  if (!s) {
    const Type * r = resolved(t);
    if (r->kind == TypeKind::Named && env_.is_declared_type(r->name)) {
      error(
        node->typeNode->get_range(), diag_code::k_invalid_operation,
        fmt::format("`{}` is not a struct", to_string(t)));
    }
    for (auto * field : node->fields) {
      check_expr(field->value);
    }
    return r->kind == TypeKind::Named && !env_.is_declared_type(r->name) ? t
                                                                          : types_.error_type();
  }

  std::unordered_set<std::string_view> seen;
  for (auto * init : node->fields) {
    if (!seen.insert(init->name).second) {
      error(
        init->get_range(), diag_code::k_duplicate_definition,
        fmt::format("field `{}` specified more than once", init->name));
    }
    const FieldDecl * decl = nullptr;
    for (const auto * field : s->fields) {
      if (field->name == init->name) {
        decl = field;
        break;
      }
    }
    if (!decl) {
      error(
        init->get_range(), diag_code::k_invalid_operation,
        fmt::format("struct `{}` has no field named `{}`", s->name, init->name), "unknown field");
      check_expr(init->value);
      continue;
    }
    const auto saved = selfType_;
    selfType_ = s->name;
    const Type * ft = lower_type(decl->type);
    selfType_ = saved;
    const Type * vt = check_expr(init->value, ft);
    expect_compatible(ft, vt, init->value->get_range(), "field value");
  }
  return t;
}

const Type * SemanticAnalyzer::check_array_literal(ArrayLiteralExpr * node)
{
  if (node->elements.empty()) {
    return types_.get_array_type(types_.auto_type(), 0);
  }

  const Type * element = check_expr(node->elements[0]);
  for (size_t i = 1; i < node->elements.size(); ++i) {
    const Type * t = check_expr(node->elements[i], element);
    if (!env_.is_compatible(element, t)) {
      error(
        node->elements[i]->get_range(), diag_code::k_type_mismatch,
        fmt::format(
          "array elements have mismatched types: expected `{}`, found `{}`", to_string(element),
          to_string(t)));
      continue;
    }
    element = pick(element, t);
  }
  return types_.get_array_type(element, node->elements.size());
}

const Type * SemanticAnalyzer::check_range(RangeExpr * node)
{
  const Type * element = nullptr;
  for (auto * bound : {node->start, node->end}) {
    if (!bound) continue;
    const Type * t = check_expr(bound);
    const Type * r = resolved(t);
    if (!r->is_integer() && !r->is_unknown()) {
      error(
        bound->get_range(), diag_code::k_type_mismatch,
        fmt::format("range bounds must be integers, found `{}`", to_string(t)));
      continue;
    }
    if (!element) {
      element = t;
    } else if (!env_.is_compatible(element, t)) {
      error(
        node->get_range(), diag_code::k_type_mismatch,
        fmt::format("range bounds have mismatched types `{}` and `{}`", to_string(element),
                    to_string(t)));
    } else {
      element = pick(element, t);
    }
  }
  return types_.get_generic_type("Range", {element ? element : types_.integer_literal_type()});
}

}  // namespace crusty
