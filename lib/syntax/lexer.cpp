// crusty/syntax/lexer.cpp - Hand-written tokenizer
//
#include "crusty/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace crusty::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Longest match first.
constexpr std::array<std::pair<std::string_view, TokenKind>, 31> k_operators = {{
  {"<<=", TokenKind::ShlEq},     {"..=", TokenKind::DotDotEq}, {"::", TokenKind::ColonColon},
  {"..", TokenKind::DotDot},     {"->", TokenKind::Arrow},     {"++", TokenKind::PlusPlus},
  {"--", TokenKind::MinusMinus}, {"&&", TokenKind::AndAnd},    {"||", TokenKind::OrOr},
  {"==", TokenKind::EqEq},       {"!=", TokenKind::Ne},        {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},         {"<<", TokenKind::Shl},       {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},    {"*=", TokenKind::StarEq},    {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},  {"&=", TokenKind::AmpEq},     {"|=", TokenKind::PipeEq},
  {"^=", TokenKind::CaretEq},    {"(", TokenKind::LParen},     {")", TokenKind::RParen},
  {"{", TokenKind::LBrace},      {"}", TokenKind::RBrace},     {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},    {",", TokenKind::Comma},      {";", TokenKind::Semicolon},
  {"@", TokenKind::At},
}};

TokenKind single_char_kind(char ch)
{
  switch (ch) {
    case ':':
      return TokenKind::Colon;
    case '.':
      return TokenKind::Dot;
    case '#':
      return TokenKind::Hash;
    case '!':
      return TokenKind::Bang;
    case '?':
      return TokenKind::Question;
    case '~':
      return TokenKind::Tilde;
    case '+':
      return TokenKind::Plus;
    case '-':
      return TokenKind::Minus;
    case '*':
      return TokenKind::Star;
    case '/':
      return TokenKind::Slash;
    case '%':
      return TokenKind::Percent;
    case '&':
      return TokenKind::Amp;
    case '|':
      return TokenKind::Pipe;
    case '^':
      return TokenKind::Caret;
    case '=':
      return TokenKind::Eq;
    case '<':
      return TokenKind::Lt;
    case '>':
      return TokenKind::Gt;
    default:
      return TokenKind::Unknown;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make(TokenKind kind, size_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::lex_line_comment()
{
  const size_t start = pos_;
  advance(2);

  // `////...` is a plain comment, not a doc comment.
  const char kind = peek();
  const bool is_doc = (kind == '!') || (kind == '/' && peek(1) != '/');
  if (!is_doc) {
    while (!eof() && peek() != '\n') {
      advance(1);
    }
    Token t = make(TokenKind::LineComment, start);
    t.text = {};
    return t;
  }

  advance(1);
  if (peek() == ' ') {
    advance(1);
  }
  const size_t payload_start = pos_;
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  size_t payload_end = pos_;
  if (payload_end > payload_start && src_[payload_end - 1] == '\r') {
    --payload_end;
  }

  Token t = make(kind == '!' ? TokenKind::DocModule : TokenKind::DocLine, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_block_comment()
{
  const size_t start = pos_;
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }
  if (eof()) {
    return make(TokenKind::Error, start);
  }
  advance(2);
  Token t = make(TokenKind::BlockComment, start);
  t.text = {};
  return t;
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O') {
      const int base = (p1 == 'x' || p1 == 'X') ? 16 : (p1 == 'b' || p1 == 'B') ? 2 : 8;
      advance(2);

      bool any = false;
      bool invalid = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        bool ok = false;
        if (base == 16) {
          ok = is_hex_digit(c);
        } else if (base == 8) {
          ok = (c >= '0' && c <= '7');
        } else {
          ok = (c == '0' || c == '1');
        }

        if (ok) {
          any = true;
          advance(1);
        } else if (c == '_') {
          advance(1);
        } else if (std::isalnum(c) != 0) {
          // Still part of the literal, but not a valid digit.
          invalid = true;
          advance(1);
        } else {
          break;
        }
      }

      return make((!any || invalid) ? TokenKind::Unknown : TokenKind::IntLiteral, start);
    }
  }

  auto skip_digits = [this]() {
    while (!eof() && ((std::isdigit(static_cast<unsigned char>(peek())) != 0) || peek() == '_')) {
      advance(1);
    }
  };

  skip_digits();

  bool is_float = false;

  // `1..5` is a range, not a float.
  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    is_float = true;
    advance(1);
    skip_digits();
  }

  if (peek() == 'e' || peek() == 'E') {
    const char sign = peek(1);
    const size_t digit_at = (sign == '+' || sign == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(digit_at))) != 0) {
      is_float = true;
      advance(digit_at);
      skip_digits();
    }
  }

  return make(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::lex_quoted(char quote)
{
  const size_t start = pos_;
  advance(1);
  const size_t payload_start = pos_;

  while (!eof() && peek() != quote) {
    const char c = peek();
    if (c == '\n') {
      // Raw newlines terminate the literal as an error.
      return make(TokenKind::Error, start);
    }
    if (c == '\\') {
      advance(1);
      if (eof()) {
        break;
      }
    }
    advance(1);
  }

  if (eof()) {
    return make(TokenKind::Error, start);
  }

  const size_t payload_end = pos_;
  advance(1);

  Token t = make(quote == '"' ? TokenKind::StringLiteral : TokenKind::CharLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  if (t.kind == TokenKind::CharLiteral && t.text.empty()) {
    t.kind = TokenKind::Error;
    t.text = src_.substr(start, pos_ - start);
  }
  return t;
}

Token Lexer::lex_punctuation()
{
  const size_t start = pos_;

  for (const auto & [spelling, kind] : k_operators) {
    if (starts_with(spelling)) {
      advance(spelling.size());
      return make(kind, start);
    }
  }

  const char ch = peek();
  advance(1);
  return make(single_char_kind(ch), start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    return make(TokenKind::Eof, pos_);
  }

  if (starts_with("//")) {
    return lex_line_comment();
  }
  if (starts_with("/*")) {
    return lex_block_comment();
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (c == '"' || c == '\'') {
    return lex_quoted(static_cast<char>(c));
  }

  return lex_punctuation();
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace crusty::syntax
