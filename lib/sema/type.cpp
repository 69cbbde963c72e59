// crusty/sema/type.cpp - Type context implementation
//
#include "crusty/sema/type.hpp"

#include <cstring>

namespace crusty
{

// ============================================================================
// Type rendering
// ============================================================================

namespace
{

void append_type(std::string & out, const Type * type)
{
  if (!type) {
    out += "<null>";
    return;
  }

  auto append_list = [&out](gsl::span<const Type * const> list) {
    for (size_t i = 0; i < list.size(); ++i) {
      if (i > 0) out += ", ";
      append_type(out, list[i]);
    }
  };

  switch (type->kind) {
    case TypeKind::Primitive:
      out += to_string(type->primitive);
      return;
    case TypeKind::Named:
      out += type->name;
      return;
    case TypeKind::Pointer:
      append_type(out, type->inner);
      out += '*';
      return;
    case TypeKind::Reference:
      out += type->isMutable ? "&var " : "&";
      append_type(out, type->inner);
      return;
    case TypeKind::Array:
      append_type(out, type->inner);
      out += '[';
      out += std::to_string(type->size);
      out += ']';
      return;
    case TypeKind::Slice:
      append_type(out, type->inner);
      out += "[]";
      return;
    case TypeKind::Tuple:
      out += '(';
      append_list(type->elements);
      out += ')';
      return;
    case TypeKind::Generic:
      out += type->name;
      out += '<';
      append_list(type->elements);
      out += '>';
      return;
    case TypeKind::Function:
      out += "fn(";
      append_list(type->elements);
      out += ") -> ";
      append_type(out, type->inner);
      return;
    case TypeKind::Fallible:
      append_type(out, type->inner);
      out += '?';
      return;
    case TypeKind::Auto:
      out += "auto";
      return;
    case TypeKind::IntegerLiteral:
      out += "{integer}";
      return;
    case TypeKind::FloatLiteral:
      out += "{float}";
      return;
    case TypeKind::NullLiteral:
      out += "NULL";
      return;
    case TypeKind::Error:
      out += "<error>";
      return;
  }
}

}  // namespace

std::string to_string(const Type * type)
{
  std::string out;
  append_type(out, type);
  return out;
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
{
  // Initialize built-in type singletons
  for (size_t i = 0; i <= static_cast<size_t>(PrimitiveKind::Void); ++i) {
    primitives_[i] = Type{TypeKind::Primitive};
    primitives_[i].primitive = static_cast<PrimitiveKind>(i);
  }
  auto_ = Type{TypeKind::Auto};
  error_ = Type{TypeKind::Error};

  // Inference placeholders
  integer_literal_ = Type{TypeKind::IntegerLiteral};
  float_literal_ = Type{TypeKind::FloatLiteral};
  null_literal_ = Type{TypeKind::NullLiteral};
}

const Type * TypeContext::primitive_type(PrimitiveKind kind) const noexcept
{
  return &primitives_[static_cast<size_t>(kind)];
}

std::string_view TypeContext::intern_name(std::string_view name)
{
  auto it = names_.find(name);
  if (it != names_.end()) {
    return *it;
  }
  char * const ptr = static_cast<char *>(arena_.allocate(name.empty() ? 1 : name.size(), 1));
  std::memcpy(ptr, name.data(), name.size());
  const std::string_view stored(ptr, name.size());
  names_.insert(stored);
  return stored;
}

const Type * TypeContext::intern(
  TypeKind kind, std::string_view name, const Type * inner, bool is_mutable, uint64_t size,
  const std::vector<const Type *> & elements)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  const std::string_view stable_name = name.empty() ? std::string_view{} : intern_name(name);
  Key key{kind, stable_name, inner, is_mutable, size, elements};
  auto it = index_.find(key);
  if (it != index_.end()) {
    return it->second;
  }

  Type new_type{kind};
  new_type.name = stable_name;
  new_type.inner = inner;
  new_type.isMutable = is_mutable;
  new_type.size = size;
  if (!elements.empty()) {
    auto * const storage = static_cast<const Type **>(
      arena_.allocate(sizeof(const Type *) * elements.size(), alignof(const Type *)));
    std::memcpy(storage, elements.data(), sizeof(const Type *) * elements.size());
    new_type.elements = gsl::span<const Type * const>(storage, elements.size());
  }

  composite_types_.push_back(new_type);
  const Type * result = &composite_types_.back();
  index_.emplace(std::move(key), result);
  return result;
}

const Type * TypeContext::get_named_type(std::string_view name)
{
  return intern(TypeKind::Named, name, nullptr, false, 0, {});
}

const Type * TypeContext::get_pointer_type(const Type * pointee, bool is_mutable)
{
  return intern(TypeKind::Pointer, {}, pointee, is_mutable, 0, {});
}

const Type * TypeContext::get_reference_type(const Type * referent, bool is_mutable)
{
  return intern(TypeKind::Reference, {}, referent, is_mutable, 0, {});
}

const Type * TypeContext::get_array_type(const Type * element, uint64_t size)
{
  return intern(TypeKind::Array, {}, element, false, size, {});
}

const Type * TypeContext::get_slice_type(const Type * element)
{
  return intern(TypeKind::Slice, {}, element, false, 0, {});
}

const Type * TypeContext::get_tuple_type(const std::vector<const Type *> & elements)
{
  return intern(TypeKind::Tuple, {}, nullptr, false, 0, elements);
}

const Type * TypeContext::get_generic_type(
  std::string_view base, const std::vector<const Type *> & args)
{
  return intern(TypeKind::Generic, base, nullptr, false, 0, args);
}

const Type * TypeContext::get_function_type(
  const std::vector<const Type *> & params, const Type * ret)
{
  return intern(TypeKind::Function, {}, ret, false, 0, params);
}

const Type * TypeContext::get_fallible_type(const Type * inner)
{
  return intern(TypeKind::Fallible, {}, inner, false, 0, {});
}

std::vector<const Type *> TypeContext::children_of(const Type * type)
{
  std::vector<const Type *> children;
  if (type->inner) {
    children.push_back(type->inner);
  }
  children.insert(children.end(), type->elements.begin(), type->elements.end());
  return children;
}

const Type * TypeContext::rebuild(const Type * shape, const std::vector<const Type *> & children)
{
  if (children == children_of(shape)) {
    return shape;
  }

  const bool has_inner = shape->inner != nullptr;
  const Type * inner = has_inner ? children.front() : nullptr;
  const std::vector<const Type *> elements(
    children.begin() + (has_inner ? 1 : 0), children.end());
  return intern(shape->kind, shape->name, inner, shape->isMutable, shape->size, elements);
}

size_t TypeContext::composite_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return composite_types_.size();
}

}  // namespace crusty
