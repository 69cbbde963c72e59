// crusty/syntax/keywords.hpp - Reserved words of the source language
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace crusty::syntax
{

// Keywords are lexed as identifiers; the parser checks them by text.
inline constexpr std::array<std::string_view, 28> k_keywords = {
  "let",     "var",    "const", "static", "if",     "else",  "while",   "for",
  "in",      "loop",   "return", "break", "continue", "struct", "enum", "typedef",
  "switch",  "case",   "default", "sizeof", "true",  "false", "NULL",   "extern",
  "auto",    "self",   "Self",  "define",
};

inline constexpr std::array<std::string_view, 11> k_primitive_type_names = {
  "int", "i32", "i64", "u32", "u64", "float", "f32", "f64", "bool", "char", "void",
};

[[nodiscard]] inline bool is_keyword(std::string_view s) noexcept
{
  return std::find(k_keywords.begin(), k_keywords.end(), s) != k_keywords.end();
}

[[nodiscard]] inline bool is_primitive_type_name(std::string_view s) noexcept
{
  return std::find(k_primitive_type_names.begin(), k_primitive_type_names.end(), s) !=
         k_primitive_type_names.end();
}

/// Macro names use the `__NAME__` convention.
[[nodiscard]] inline bool is_macro_name(std::string_view s) noexcept
{
  return s.size() > 4 && s.substr(0, 2) == "__" && s.substr(s.size() - 2) == "__";
}

}  // namespace crusty::syntax
