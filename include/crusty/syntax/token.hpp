// crusty/syntax/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "crusty/basic/source_manager.hpp"

namespace crusty::syntax
{

// `>>` and `>>=` are never produced as single tokens. The parser joins
// adjacent `>` tokens so that nested generic argument lists close cleanly.
enum class TokenKind : uint8_t {
  Eof,
  Unknown,
  Error,  // unterminated string/char/comment; text holds the offending slice

  DocLine,    // /// ...
  DocModule,  // //! ...
  LineComment,
  BlockComment,

  Identifier,
  IntLiteral,
  FloatLiteral,
  StringLiteral,  // text is the string contents (escapes not processed)
  CharLiteral,    // text is the char contents (escapes not processed)

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  ColonColon,
  Semicolon,
  Dot,
  DotDot,
  DotDotEq,
  Arrow,

  At,
  Hash,
  Bang,
  Question,
  Tilde,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  PlusPlus,
  MinusMinus,

  Amp,
  Pipe,
  Caret,
  Shl,

  AndAnd,
  OrOr,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  PercentEq,
  AmpEq,
  PipeEq,
  CaretEq,
  ShlEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;  // byte range in the source (including quotes for literals)
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Error:
      return "<error>";
    case TokenKind::DocLine:
      return "<doc_line>";
    case TokenKind::DocModule:
      return "<doc_module>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer literal";
    case TokenKind::FloatLiteral:
      return "float literal";
    case TokenKind::StringLiteral:
      return "string literal";
    case TokenKind::CharLiteral:
      return "char literal";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDot:
      return "..";
    case TokenKind::DotDotEq:
      return "..=";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::At:
      return "@";
    case TokenKind::Hash:
      return "#";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Question:
      return "?";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::PlusPlus:
      return "++";
    case TokenKind::MinusMinus:
      return "--";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Shl:
      return "<<";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PercentEq:
      return "%=";
    case TokenKind::AmpEq:
      return "&=";
    case TokenKind::PipeEq:
      return "|=";
    case TokenKind::CaretEq:
      return "^=";
    case TokenKind::ShlEq:
      return "<<=";
  }
  return "";
}

/// Comments and doc comments; the parser skips these except where it
/// collects doc lines for items.
[[nodiscard]] constexpr bool is_trivia(TokenKind k) noexcept
{
  return k == TokenKind::LineComment || k == TokenKind::BlockComment || k == TokenKind::DocLine ||
         k == TokenKind::DocModule;
}

}  // namespace crusty::syntax
