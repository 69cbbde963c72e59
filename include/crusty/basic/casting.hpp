// crusty/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any hierarchy that provides a static `classof` predicate.
//
//   if (isa<BinaryExpr>(node)) { ... }
//   auto * bin = cast<BinaryExpr>(node);
//   if (auto * bin = dyn_cast<BinaryExpr>(node)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace crusty
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/// True when `node` is non-null and of dynamic type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/// Checked downcast. The node must be non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Downcast returning nullptr when the node is null or of another type.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * cast_or_null(From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast_or_null(const From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

}  // namespace crusty
