// crusty/sema/type.hpp - Semantic type representation
//
// Represents resolved types for semantic analysis. Types are hash-consed by
// TypeContext, so two structurally equal types share one address.
//
#pragma once

#include <cstdint>
#include <deque>
#include <gsl/span>
#include <map>
#include <memory_resource>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_set>
#include <vector>

#include "crusty/ast/ast_enums.hpp"

namespace crusty
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of semantic type.
 */
enum class TypeKind : uint8_t {
  Primitive,  ///< int, f64, bool, void, ...
  Named,      ///< alias or concrete struct/enum name
  Pointer,    ///< T*
  Reference,  ///< &T / &var T
  Array,      ///< T[N]
  Slice,      ///< T[]
  Tuple,      ///< (A, B)
  Generic,    ///< Base<A, B>
  Function,   ///< fn(params) -> ret
  Fallible,   ///< T?
  Auto,       ///< inferred

  // Inference placeholders
  IntegerLiteral,  ///< {integer}
  FloatLiteral,    ///< {float}
  NullLiteral,     ///< NULL

  // Error
  Error,  ///< Error recovery placeholder
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type representation.
 *
 * Unlike AST TypeNode (syntactic representation), Type is a structural
 * value. Aliases stay `Named` until TypeEnvironment::resolve_type follows
 * them.
 */
struct Type
{
  TypeKind kind;

  /// For Primitive
  PrimitiveKind primitive = PrimitiveKind::Void;

  /// For Named: the name. For Generic: the base name.
  std::string_view name;

  /// Pointer/Reference pointee, Array/Slice element, Fallible inner,
  /// Function return type.
  const Type * inner = nullptr;

  /// For Pointer/Reference
  bool isMutable = false;

  /// For Array: element count
  uint64_t size = 0;

  /// Tuple elements, Generic arguments, Function parameters.
  gsl::span<const Type * const> elements;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_primitive(PrimitiveKind p) const noexcept
  {
    return kind == TypeKind::Primitive && primitive == p;
  }

  [[nodiscard]] bool is_void() const noexcept { return is_primitive(PrimitiveKind::Void); }

  [[nodiscard]] bool is_bool() const noexcept { return is_primitive(PrimitiveKind::Bool); }

  /// Any integer type, including the {integer} placeholder
  [[nodiscard]] bool is_integer() const noexcept
  {
    if (kind == TypeKind::IntegerLiteral) return true;
    if (kind != TypeKind::Primitive) return false;
    switch (primitive) {
      case PrimitiveKind::Int:
      case PrimitiveKind::I32:
      case PrimitiveKind::I64:
      case PrimitiveKind::U32:
      case PrimitiveKind::U64:
        return true;
      default:
        return false;
    }
  }

  /// Any floating point type, including the {float} placeholder
  [[nodiscard]] bool is_float() const noexcept
  {
    if (kind == TypeKind::FloatLiteral) return true;
    if (kind != TypeKind::Primitive) return false;
    return primitive == PrimitiveKind::Float || primitive == PrimitiveKind::F32 ||
           primitive == PrimitiveKind::F64;
  }

  [[nodiscard]] bool is_numeric() const noexcept { return is_integer() || is_float(); }

  [[nodiscard]] bool is_auto() const noexcept { return kind == TypeKind::Auto; }

  [[nodiscard]] bool is_error() const noexcept { return kind == TypeKind::Error; }

  /// Auto or Error: anything goes, no further diagnostics
  [[nodiscard]] bool is_unknown() const noexcept { return is_auto() || is_error(); }

  [[nodiscard]] bool is_placeholder() const noexcept
  {
    return kind == TypeKind::IntegerLiteral || kind == TypeKind::FloatLiteral ||
           kind == TypeKind::NullLiteral;
  }

  /// Pointer or reference
  [[nodiscard]] bool is_indirection() const noexcept
  {
    return kind == TypeKind::Pointer || kind == TypeKind::Reference;
  }
};

/// Render a type in crusty surface syntax (`int`, `&var T`, `Vec<int>`, ...).
[[nodiscard]] std::string to_string(const Type * type);

// ============================================================================
// Type Context
// ============================================================================

/**
 * Type context for interning semantic types.
 *
 * Provides singleton instances for built-in types and hash-conses composite
 * types, so structural equality is pointer equality. Interning is guarded by
 * a mutex; queries over an already built TypeEnvironment may intern the
 * resolved forms of compound types from several threads.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * primitive_type(PrimitiveKind kind) const noexcept;

  [[nodiscard]] const Type * int_type() const noexcept { return primitive_type(PrimitiveKind::Int); }
  [[nodiscard]] const Type * bool_type() const noexcept
  {
    return primitive_type(PrimitiveKind::Bool);
  }
  [[nodiscard]] const Type * void_type() const noexcept
  {
    return primitive_type(PrimitiveKind::Void);
  }
  [[nodiscard]] const Type * auto_type() const noexcept { return &auto_; }
  [[nodiscard]] const Type * error_type() const noexcept { return &error_; }

  // ===========================================================================
  // Inference Placeholder Types
  // ===========================================================================

  [[nodiscard]] const Type * integer_literal_type() const noexcept { return &integer_literal_; }
  [[nodiscard]] const Type * float_literal_type() const noexcept { return &float_literal_; }
  [[nodiscard]] const Type * null_literal_type() const noexcept { return &null_literal_; }

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  const Type * get_named_type(std::string_view name);
  const Type * get_pointer_type(const Type * pointee, bool is_mutable);
  const Type * get_reference_type(const Type * referent, bool is_mutable);
  const Type * get_array_type(const Type * element, uint64_t size);
  const Type * get_slice_type(const Type * element);
  const Type * get_tuple_type(const std::vector<const Type *> & elements);
  const Type * get_generic_type(std::string_view base, const std::vector<const Type *> & args);
  const Type * get_function_type(const std::vector<const Type *> & params, const Type * ret);
  const Type * get_fallible_type(const Type * inner);

  /// Rebuild `shape` with new children. `children` holds the inner type (if
  /// any) followed by the element list, in the same order as
  /// `TypeContext::children_of` yields them.
  const Type * rebuild(const Type * shape, const std::vector<const Type *> & children);

  /// Direct child types of `type`: inner first, then elements.
  [[nodiscard]] static std::vector<const Type *> children_of(const Type * type);

  /// Number of distinct composite types interned so far
  [[nodiscard]] size_t composite_count() const;

private:
  using Key = std::tuple<
    TypeKind, std::string_view, const Type *, bool, uint64_t, std::vector<const Type *>>;

  const Type * intern(
    TypeKind kind, std::string_view name, const Type * inner, bool is_mutable, uint64_t size,
    const std::vector<const Type *> & elements);

  std::string_view intern_name(std::string_view name);

  // Built-in type singletons, indexed by PrimitiveKind
  Type primitives_[static_cast<size_t>(PrimitiveKind::Void) + 1];
  Type auto_;
  Type error_;
  Type integer_literal_, float_literal_, null_literal_;

  mutable std::mutex mutex_;

  // Arena for composite types, their element arrays and their names
  std::pmr::monotonic_buffer_resource arena_{4096};
  // NOTE: pointers to interned composite types are handed out widely.
  // We must use a container with stable element addresses.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::pmr::unordered_set<std::string_view> names_{&arena_};
  std::map<Key, const Type *> index_;
};

}  // namespace crusty
