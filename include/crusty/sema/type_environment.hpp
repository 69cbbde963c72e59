// crusty/sema/type_environment.hpp - Per-unit alias and symbol tables
//
// The TypeEnvironment is populated once from the top-level items of a
// compilation unit (write phase) and then frozen. Resolution and
// compatibility queries never mutate it.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "crusty/ast/ast.hpp"
#include "crusty/sema/type.hpp"

namespace crusty
{

// ============================================================================
// Table entries
// ============================================================================

enum class AliasKind : uint8_t {
  Alias,     ///< typedef: resolves to `target`
  Concrete,  ///< struct or enum: resolves to itself
};

/**
 * An entry of the alias table.
 */
struct AliasEntry
{
  AliasKind kind = AliasKind::Concrete;
  const Type * target = nullptr;  ///< For Alias
  const Decl * decl = nullptr;    ///< TypedefDecl, StructDecl or EnumDecl

  [[nodiscard]] bool is_alias() const noexcept { return kind == AliasKind::Alias; }
};

enum class SymbolKind : uint8_t {
  Variable,
  Parameter,
  Function,
  Constant,
};

/**
 * A value-namespace symbol (global function or local binding).
 */
struct Symbol
{
  const Type * type = nullptr;
  SymbolKind kind = SymbolKind::Variable;
  Visibility visibility = Visibility::Public;
  bool isMutable = false;
  const AstNode * decl = nullptr;
};

/// Outcome of TypeEnvironment::register_alias.
enum class AliasRegistration : uint8_t {
  Registered,
  Circular,
  Duplicate,
};

// ============================================================================
// TypeEnvironment
// ============================================================================

/**
 * Alias table plus global symbol table of one compilation unit.
 *
 * Aliases are checked for cycles when they are registered, so every
 * registered alias chain terminates. `resolve_type` and
 * `has_circular_reference` walk chains with an explicit stack; alias chains
 * are author-controlled and may be arbitrarily deep.
 *
 * ## Usage
 * ```cpp
 * TypeContext types;
 * TypeEnvironment env(types);
 * env.declare_pending_alias("B", types.get_named_type("A"));
 * env.register_alias("B", types.get_named_type("A"), decl);
 * env.freeze();
 * const Type * t = env.resolve_type(types.get_named_type("B"));
 * ```
 */
class TypeEnvironment
{
public:
  explicit TypeEnvironment(TypeContext & types) : types_(types) {}

  TypeEnvironment(const TypeEnvironment &) = delete;
  TypeEnvironment & operator=(const TypeEnvironment &) = delete;

  [[nodiscard]] TypeContext & types() const noexcept { return types_; }

  // ===========================================================================
  // Write phase
  // ===========================================================================

  /**
   * Announce a typedef of the unit before registration starts.
   *
   * Cycle detection follows pending aliases too, so a cycle is reported on
   * every typedef that takes part in it, whatever the declaration order.
   * Only the first pending target of a name is kept.
   */
  void declare_pending_alias(std::string_view name, const Type * target);

  /**
   * Register `typedef target name;`.
   *
   * The cycle check runs first, so `typedef int A; typedef A A;` is reported
   * as Circular rather than Duplicate. A rejected alias is never added.
   */
  AliasRegistration register_alias(std::string_view name, const Type * target, const Decl * decl);

  /// Register a struct or enum name. Returns false if the name is taken.
  bool register_concrete(std::string_view name, const Decl * decl);

  /// Declare a global symbol. Returns false if the name is taken.
  bool declare_symbol(std::string_view name, const Symbol & symbol);

  /// End the write phase. Later registrations throw std::logic_error.
  void freeze() noexcept { frozen_ = true; }

  [[nodiscard]] bool is_frozen() const noexcept { return frozen_; }

  // ===========================================================================
  // Query phase
  // ===========================================================================

  [[nodiscard]] const AliasEntry * lookup_alias(std::string_view name) const;
  [[nodiscard]] const Symbol * lookup_symbol(std::string_view name) const;

  /// True for registered aliases, structs and enums.
  [[nodiscard]] bool is_declared_type(std::string_view name) const;

  /// True for declared types and the host prelude types (`String`, `Vec`, ...).
  [[nodiscard]] bool is_known_type_name(std::string_view name) const;

  /// True for `Some`, `None`, `Ok` and `Err` unless the unit declares the name.
  [[nodiscard]] bool is_prelude_value(std::string_view name) const;

  /// Follow registered aliases, structurally. Idempotent; structurally equal
  /// results are the same pointer.
  [[nodiscard]] const Type * resolve_type(const Type * type) const;

  /// Name of the struct or enum that `name` denotes after following
  /// aliases. Returns `name` itself when the chain ends in a non-named type.
  [[nodiscard]] std::string_view concrete_name(std::string_view name) const;

  /// Symmetric structural compatibility of the resolved forms.
  [[nodiscard]] bool is_compatible(const Type * a, const Type * b) const;

  /**
   * True if following aliases from `type` re-enters a name already on the
   * current chain. `visited` holds the chain so far; names this call adds are
   * removed again before it returns.
   */
  [[nodiscard]] bool has_circular_reference(
    const Type * type, std::unordered_set<std::string_view> & visited) const;

  [[nodiscard]] size_t alias_count() const noexcept { return aliases_.size(); }
  [[nodiscard]] size_t symbol_count() const noexcept { return symbols_.size(); }

private:
  void ensure_writable() const;

  /// Cycle walk shared by has_circular_reference and register_alias.
  /// `cleared` holds aliases whose whole chain is known to terminate; the
  /// walk adds every alias it finishes without finding a cycle. `cyclic`
  /// holds aliases whose chain is known to reach a cycle; on a hit the walk
  /// adds `visited` and every alias on its current path.
  [[nodiscard]] bool walk_alias_chain(
    const Type * type, std::unordered_set<std::string_view> & visited,
    std::unordered_set<std::string_view> & cleared,
    std::unordered_set<std::string_view> & cyclic) const;

  /// Target followed by the cycle check: registered alias, then pending.
  [[nodiscard]] const Type * chain_target(std::string_view name) const;

  /// Shallow compatibility of two resolved types; pushes child pairs.
  [[nodiscard]] bool shallow_compatible(
    const Type * a, const Type * b,
    std::vector<std::pair<const Type *, const Type *>> & pending) const;

  TypeContext & types_;
  std::unordered_map<std::string_view, AliasEntry> aliases_;
  std::unordered_map<std::string_view, const Type *> pending_aliases_;
  std::unordered_map<std::string_view, Symbol> symbols_;
  /// Aliases already walked to a terminating type during registration.
  std::unordered_set<std::string_view> acyclic_;
  /// Aliases whose chain was found to run into a cycle during registration.
  std::unordered_set<std::string_view> onCycle_;
  bool frozen_ = false;
};

}  // namespace crusty
