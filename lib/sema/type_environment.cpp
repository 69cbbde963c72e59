// crusty/sema/type_environment.cpp - Alias resolution, cycle detection, compatibility
//
#include "crusty/sema/type_environment.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "crusty/basic/log.hpp"

namespace crusty
{

namespace
{

/// Host prelude types accepted without a declaration in the unit.
constexpr std::array<std::string_view, 12> k_prelude_types = {
  "String", "Vec",  "Box", "Option",  "Result", "HashMap",
  "HashSet", "Rc", "Arc", "RefCell", "Cell",   "str",
};

/// Host prelude constructors of `Option` and `Result`.
constexpr std::array<std::string_view, 4> k_prelude_values = {"Some", "None", "Ok", "Err"};

[[nodiscard]] bool same_primitive(PrimitiveKind a, PrimitiveKind b) noexcept
{
  // `int` and `float` are spellings of i32 and f64
  auto canonical = [](PrimitiveKind k) {
    if (k == PrimitiveKind::Int) return PrimitiveKind::I32;
    if (k == PrimitiveKind::Float) return PrimitiveKind::F64;
    return k;
  };
  return canonical(a) == canonical(b);
}

}  // namespace

// ============================================================================
// Write phase
// ============================================================================

void TypeEnvironment::ensure_writable() const
{
  if (frozen_) {
    throw std::logic_error("TypeEnvironment is frozen");
  }
}

void TypeEnvironment::declare_pending_alias(std::string_view name, const Type * target)
{
  ensure_writable();
  pending_aliases_.emplace(name, target);
}

AliasRegistration TypeEnvironment::register_alias(
  std::string_view name, const Type * target, const Decl * decl)
{
  ensure_writable();

  // The memos describe the chains as the cycle walk follows them. They stay
  // valid only while `name` already leads to `target` there; a redefinition
  // or an unannounced alias is walked with fresh sets.
  const bool memo_valid = !is_declared_type(name) && chain_target(name) == target;
  std::unordered_set<std::string_view> local_cleared;
  std::unordered_set<std::string_view> local_cyclic;
  auto & cleared = memo_valid ? acyclic_ : local_cleared;
  auto & cyclic = memo_valid ? onCycle_ : local_cyclic;

  std::unordered_set<std::string_view> visited{name};
  if (walk_alias_chain(target, visited, cleared, cyclic)) {
    CRUSTY_LOG_DEBUG("sema", "rejected circular alias '{}'", name);
    return AliasRegistration::Circular;
  }

  auto [it, inserted] = aliases_.emplace(name, AliasEntry{AliasKind::Alias, target, decl});
  if (!inserted) {
    return AliasRegistration::Duplicate;
  }
  if (!memo_valid) {
    // A new edge in the chain graph invalidates both memos.
    acyclic_.clear();
    onCycle_.clear();
  }
  CRUSTY_LOG_TRACE("sema", "registered alias '{}' = {}", name, to_string(target));
  return AliasRegistration::Registered;
}

bool TypeEnvironment::register_concrete(std::string_view name, const Decl * decl)
{
  ensure_writable();
  auto [it, inserted] = aliases_.emplace(name, AliasEntry{AliasKind::Concrete, nullptr, decl});
  return inserted;
}

bool TypeEnvironment::declare_symbol(std::string_view name, const Symbol & symbol)
{
  ensure_writable();
  auto [it, inserted] = symbols_.emplace(name, symbol);
  return inserted;
}

// ============================================================================
// Lookup
// ============================================================================

const AliasEntry * TypeEnvironment::lookup_alias(std::string_view name) const
{
  auto it = aliases_.find(name);
  return it != aliases_.end() ? &it->second : nullptr;
}

const Symbol * TypeEnvironment::lookup_symbol(std::string_view name) const
{
  auto it = symbols_.find(name);
  return it != symbols_.end() ? &it->second : nullptr;
}

bool TypeEnvironment::is_declared_type(std::string_view name) const
{
  return aliases_.find(name) != aliases_.end();
}

bool TypeEnvironment::is_known_type_name(std::string_view name) const
{
  return is_declared_type(name) ||
         std::find(k_prelude_types.begin(), k_prelude_types.end(), name) != k_prelude_types.end();
}

bool TypeEnvironment::is_prelude_value(std::string_view name) const
{
  return lookup_symbol(name) == nullptr &&
         std::find(k_prelude_values.begin(), k_prelude_values.end(), name) !=
           k_prelude_values.end();
}

const Type * TypeEnvironment::chain_target(std::string_view name) const
{
  if (const auto * entry = lookup_alias(name)) {
    return entry->is_alias() ? entry->target : nullptr;
  }
  auto it = pending_aliases_.find(name);
  return it != pending_aliases_.end() ? it->second : nullptr;
}

// ============================================================================
// Cycle detection
// ============================================================================

bool TypeEnvironment::has_circular_reference(
  const Type * type, std::unordered_set<std::string_view> & visited) const
{
  std::unordered_set<std::string_view> cleared;
  std::unordered_set<std::string_view> cyclic;
  return walk_alias_chain(type, visited, cleared, cyclic);
}

bool TypeEnvironment::walk_alias_chain(
  const Type * type, std::unordered_set<std::string_view> & visited,
  std::unordered_set<std::string_view> & cleared,
  std::unordered_set<std::string_view> & cyclic) const
{
  // A work item is either a type to inspect or, with `type == nullptr`, the
  // exit marker of the alias named `leave`.
  struct WorkItem
  {
    const Type * type;
    std::string_view leave;
  };

  std::vector<WorkItem> stack{{type, {}}};

  while (!stack.empty()) {
    const WorkItem item = stack.back();
    stack.pop_back();

    if (!item.type) {
      visited.erase(item.leave);
      cleared.insert(item.leave);
      continue;
    }

    if (item.type->kind == TypeKind::Named) {
      const std::string_view name = item.type->name;
      if (visited.count(name) > 0 || cyclic.count(name) > 0) {
        // Everything on the chain so far runs into the cycle. Undo our own
        // insertions; the caller's chain stays as it was.
        cyclic.insert(visited.begin(), visited.end());
        for (const auto & pending : stack) {
          if (!pending.type) visited.erase(pending.leave);
        }
        return true;
      }
      if (cleared.count(name) > 0) {
        continue;
      }
      const Type * target = chain_target(name);
      if (!target) {
        continue;
      }
      visited.insert(name);
      stack.push_back({nullptr, name});
      stack.push_back({target, {}});
      continue;
    }

    const auto children = TypeContext::children_of(item.type);
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back({*it, {}});
    }
  }
  return false;
}

// ============================================================================
// Resolution
// ============================================================================

const Type * TypeEnvironment::resolve_type(const Type * type) const
{
  if (!type) return nullptr;

  struct Frame
  {
    const Type * type;
    bool expanded;
  };

  std::unordered_map<const Type *, const Type *> resolved;
  std::vector<Frame> stack{{type, false}};

  while (!stack.empty()) {
    Frame & frame = stack.back();
    const Type * current = frame.type;

    if (resolved.count(current) > 0) {
      stack.pop_back();
      continue;
    }

    if (current->kind == TypeKind::Named) {
      const AliasEntry * entry = lookup_alias(current->name);
      if (!entry || !entry->is_alias()) {
        resolved.emplace(current, current);
        stack.pop_back();
        continue;
      }
      if (!frame.expanded) {
        frame.expanded = true;
        stack.push_back({entry->target, false});
        continue;
      }
      resolved.emplace(current, resolved.at(entry->target));
      stack.pop_back();
      continue;
    }

    const auto children = TypeContext::children_of(current);
    if (children.empty()) {
      resolved.emplace(current, current);
      stack.pop_back();
      continue;
    }

    if (!frame.expanded) {
      frame.expanded = true;
      for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (resolved.count(*it) == 0) {
          stack.push_back({*it, false});
        }
      }
      continue;
    }

    std::vector<const Type *> new_children;
    new_children.reserve(children.size());
    for (const Type * child : children) {
      new_children.push_back(resolved.at(child));
    }
    resolved.emplace(current, types_.rebuild(current, new_children));
    stack.pop_back();
  }

  return resolved.at(type);
}

std::string_view TypeEnvironment::concrete_name(std::string_view name) const
{
  std::string_view current = name;
  // Registered chains are acyclic, so this terminates.
  while (const AliasEntry * entry = lookup_alias(current)) {
    if (!entry->is_alias() || !entry->target || entry->target->kind != TypeKind::Named) {
      break;
    }
    current = entry->target->name;
  }
  return current;
}

// ============================================================================
// Compatibility
// ============================================================================

bool TypeEnvironment::shallow_compatible(
  const Type * a, const Type * b,
  std::vector<std::pair<const Type *, const Type *>> & pending) const
{
  if (a == b) return true;
  if (a->is_unknown() || b->is_unknown()) return true;

  // Literal placeholders adopt any type of their family.
  if (a->kind == TypeKind::IntegerLiteral || b->kind == TypeKind::IntegerLiteral) {
    return a->is_integer() && b->is_integer();
  }
  if (a->kind == TypeKind::FloatLiteral || b->kind == TypeKind::FloatLiteral) {
    return a->is_float() && b->is_float();
  }
  if (a->kind == TypeKind::NullLiteral || b->kind == TypeKind::NullLiteral) {
    const Type * other = a->kind == TypeKind::NullLiteral ? b : a;
    return other->kind == TypeKind::NullLiteral || other->kind == TypeKind::Pointer ||
           (other->kind == TypeKind::Generic && other->name == "Option");
  }

  if (a->kind != b->kind) return false;

  switch (a->kind) {
    case TypeKind::Primitive:
      return same_primitive(a->primitive, b->primitive);
    case TypeKind::Named:
      return a->name == b->name;
    case TypeKind::Pointer:
    case TypeKind::Reference:
      if (a->isMutable != b->isMutable) return false;
      pending.emplace_back(a->inner, b->inner);
      return true;
    case TypeKind::Array:
      if (a->size != b->size) return false;
      pending.emplace_back(a->inner, b->inner);
      return true;
    case TypeKind::Slice:
    case TypeKind::Fallible:
      pending.emplace_back(a->inner, b->inner);
      return true;
    case TypeKind::Generic:
      if (a->name != b->name) return false;
      break;
    case TypeKind::Function:
      pending.emplace_back(a->inner, b->inner);
      break;
    case TypeKind::Tuple:
      break;
    default:
      return false;
  }

  if (a->elements.size() != b->elements.size()) return false;
  for (size_t i = 0; i < a->elements.size(); ++i) {
    pending.emplace_back(a->elements[i], b->elements[i]);
  }
  return true;
}

bool TypeEnvironment::is_compatible(const Type * a, const Type * b) const
{
  if (!a || !b) return false;

  std::vector<std::pair<const Type *, const Type *>> pending{
    {resolve_type(a), resolve_type(b)}};
  while (!pending.empty()) {
    const auto [lhs, rhs] = pending.back();
    pending.pop_back();
    if (!shallow_compatible(lhs, rhs, pending)) {
      return false;
    }
  }
  return true;
}

}  // namespace crusty
