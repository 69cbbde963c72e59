// crusty/syntax/parser.cpp - Recursive-descent parser
//
#include "crusty/syntax/parser.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "crusty/basic/casting.hpp"
#include "crusty/basic/log.hpp"
#include "crusty/syntax/keywords.hpp"

namespace crusty::syntax
{
namespace
{

// Thrown to unwind out of a failed parse. Caught by the public entry points
// (abandon the unit) and by speculate() (restore and try the next form).
struct ParseAbort
{
};

[[nodiscard]] std::optional<PrimitiveKind> primitive_from_name(std::string_view s) noexcept
{
  if (s == "int") return PrimitiveKind::Int;
  if (s == "i32") return PrimitiveKind::I32;
  if (s == "i64") return PrimitiveKind::I64;
  if (s == "u32") return PrimitiveKind::U32;
  if (s == "u64") return PrimitiveKind::U64;
  if (s == "float") return PrimitiveKind::Float;
  if (s == "f32") return PrimitiveKind::F32;
  if (s == "f64") return PrimitiveKind::F64;
  if (s == "bool") return PrimitiveKind::Bool;
  if (s == "char") return PrimitiveKind::Char;
  if (s == "void") return PrimitiveKind::Void;
  return std::nullopt;
}

/// Decode an integer literal spelling (`42`, `0xff`, `0b1010`, `1_000`).
/// Returns nullopt on overflow.
[[nodiscard]] std::optional<uint64_t> parse_integer_text(std::string_view text)
{
  int base = 10;
  if (text.size() > 2 && text[0] == '0') {
    const char p = text[1];
    if (p == 'x' || p == 'X') {
      base = 16;
    } else if (p == 'b' || p == 'B') {
      base = 2;
    } else if (p == 'o' || p == 'O') {
      base = 8;
    }
    if (base != 10) {
      text.remove_prefix(2);
    }
  }

  std::string digits;
  digits.reserve(text.size());
  for (const char c : text) {
    if (c != '_') {
      digits.push_back(c);
    }
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  uint64_t value = 0;
  const char * const first = digits.data();
  const char * const last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, base);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

[[nodiscard]] bool is_all_digits(std::string_view s) noexcept
{
  if (s.empty()) return false;
  for (const char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

/// Identifiers that may begin an operand even though they are keywords.
[[nodiscard]] bool is_operand_keyword(std::string_view s) noexcept
{
  return s == "true" || s == "false" || s == "NULL" || s == "self" || s == "sizeof";
}

[[nodiscard]] bool is_word_token(TokenKind k) noexcept
{
  return k == TokenKind::Identifier || k == TokenKind::IntLiteral ||
         k == TokenKind::FloatLiteral || k == TokenKind::StringLiteral ||
         k == TokenKind::CharLiteral;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Parser::Parser(
  AstContext & ast, const SourceManager & sm, DiagnosticBag & diags, std::vector<Token> tokens)
: ast_(ast), sm_(sm), diags_(diags)
{
  tokens_.reserve(tokens.size() + 1);
  for (const auto & t : tokens) {
    if (t.kind == TokenKind::LineComment || t.kind == TokenKind::BlockComment) {
      continue;
    }
    tokens_.push_back(t);
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    const auto end = static_cast<uint32_t>(sm_.get_source().size());
    Token eof;
    eof.kind = TokenKind::Eof;
    eof.range = SourceRange(end, end);
    tokens_.push_back(eof);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ == 0 ? 0 : idx_ - 1]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const
{
  const Token & t = cur(lookahead);
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::adjacent(size_t lookahead) const
{
  if (idx_ + lookahead == 0) {
    return false;
  }
  const Token & before = (lookahead == 0) ? prev() : cur(lookahead - 1);
  return before.end() == cur(lookahead).begin();
}

bool Parser::at_shr() const
{
  return at(TokenKind::Gt) && cur(1).kind == TokenKind::Gt && adjacent(1);
}

bool Parser::at_shr_assign() const
{
  return at(TokenKind::Gt) && cur(1).kind == TokenKind::Ge && adjacent(1);
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (!at(k)) {
    return false;
  }
  advance();
  return true;
}

bool Parser::match_kw(std::string_view kw)
{
  if (!at_kw(kw)) {
    return false;
  }
  advance();
  return true;
}

const Token & Parser::expect(TokenKind k, std::string_view what)
{
  if (!at(k)) {
    fail_here(std::string(what));
  }
  return advance();
}

void Parser::expect_kw(std::string_view kw)
{
  if (!match_kw(kw)) {
    fail_here(fmt::format("'{}'", kw));
  }
}

std::string_view Parser::expect_ident(std::string_view what)
{
  if (!at(TokenKind::Identifier) || is_keyword(cur().text)) {
    fail_here(std::string(what));
  }
  return ast_.intern(advance().text);
}

SourceRange Parser::range_from(const Token & start) const
{
  const uint32_t end = (idx_ == 0) ? start.end() : prev().end();
  return {start.begin(), end < start.begin() ? start.end() : end};
}

// ============================================================================
// Failure handling
// ============================================================================

void Parser::fail(SourceRange range, const std::string & message, const char * code)
{
  if (speculating_ == 0) {
    CRUSTY_LOG_DEBUG("parser", "abort at offset {}: {}", range.get_begin().get_offset(), message);
    diags_.report_error(range, message).with_code(code);
  }
  throw ParseAbort{};
}

void Parser::fail_here(const std::string & expected)
{
  const Token & t = cur();
  std::string found;
  if (t.kind == TokenKind::Eof) {
    found = "end of file";
  } else {
    found = fmt::format("'{}'", sm_.get_slice(t.range));
  }

  if (speculating_ == 0) {
    diags_.report_error(
      t.range, fmt::format("expected {}, found {}", expected, found),
      fmt::format("expected {}", expected))
      .with_code(diag_code::k_parse_error);
  }
  throw ParseAbort{};
}

bool Parser::check_lexical_errors()
{
  for (const auto & t : tokens_) {
    if (t.kind != TokenKind::Error && t.kind != TokenKind::Unknown) {
      continue;
    }

    const std::string_view text = sm_.get_slice(t.range);
    std::string message;
    if (t.kind == TokenKind::Unknown) {
      message = fmt::format("invalid token '{}'", text);
    } else if (text.substr(0, 2) == "/*") {
      message = "unterminated block comment";
    } else if (text == "''") {
      message = "empty character literal";
    } else if (!text.empty() && text[0] == '\'') {
      message = "unterminated character literal";
    } else {
      message = "unterminated string literal";
    }
    diags_.report_error(t.range, message).with_code(diag_code::k_invalid_token);
    return true;
  }
  return false;
}

template <typename Fn>
auto Parser::speculate(Fn && fn) -> decltype(fn())
{
  const Checkpoint cp = save();
  ++speculating_;
  try {
    auto result = fn();
    --speculating_;
    return result;
  } catch (const ParseAbort &) {
    --speculating_;
    restore(cp);
    return nullptr;
  }
}

// ============================================================================
// Entry points
// ============================================================================

Program * Parser::parse_program()
{
  if (check_lexical_errors()) {
    return nullptr;
  }

  try {
    std::vector<std::string_view> inner_docs;
    std::vector<Decl *> items;

    while (!at_eof()) {
      if (at(TokenKind::DocModule)) {
        inner_docs.push_back(ast_.intern(advance().text));
        continue;
      }

      auto docs = collect_line_docs();
      const auto attrs = parse_attributes();
      for (const auto d : collect_line_docs()) {
        docs.push_back(d);
      }
      if (at_eof()) {
        if (!attrs.empty()) {
          fail_here("item after attributes");
        }
        break;
      }
      if (at(TokenKind::DocModule)) {
        continue;
      }
      items.push_back(parse_item(docs, attrs));
    }

    const auto end = static_cast<uint32_t>(sm_.get_source().size());
    auto * program = ast_.create<Program>(SourceRange(0, end));
    program->innerDocs = ast_.copy_to_arena(inner_docs);
    program->items = ast_.copy_to_arena(items);
    CRUSTY_LOG_DEBUG("parser", "{}: {} top-level items", sm_.get_display_name(), items.size());
    return program;
  } catch (const ParseAbort &) {
    return nullptr;
  }
}

Expr * Parser::parse_standalone_expr()
{
  if (check_lexical_errors()) {
    return nullptr;
  }
  try {
    Expr * e = parse_expr();
    if (!at_eof()) {
      fail_here("end of input");
    }
    return e;
  } catch (const ParseAbort &) {
    return nullptr;
  }
}

Stmt * Parser::parse_standalone_stmt()
{
  if (check_lexical_errors()) {
    return nullptr;
  }
  try {
    Stmt * s = parse_stmt();
    skip_docs();
    if (!at_eof()) {
      fail_here("end of input");
    }
    return s;
  } catch (const ParseAbort &) {
    return nullptr;
  }
}

// ============================================================================
// Docs / attributes
// ============================================================================

std::vector<std::string_view> Parser::collect_line_docs()
{
  std::vector<std::string_view> docs;
  while (at(TokenKind::DocLine)) {
    docs.push_back(ast_.intern(advance().text));
  }
  return docs;
}

void Parser::skip_docs()
{
  while (at(TokenKind::DocLine) || at(TokenKind::DocModule)) {
    advance();
  }
}

std::vector<Attribute *> Parser::parse_attributes()
{
  std::vector<Attribute *> attrs;
  while (at(TokenKind::Hash) && cur(1).kind == TokenKind::LBracket) {
    const Token & start = advance();
    advance();

    const Token & name_tok = expect(TokenKind::Identifier, "attribute name");
    auto * attr = ast_.create<Attribute>(ast_.intern(name_tok.text));

    if (match(TokenKind::LParen)) {
      // Canonical spelling: ", " after commas, " = " around '=', single
      // spaces between adjacent words.
      std::string args;
      int depth = 0;
      TokenKind last = TokenKind::LParen;
      while (!(at(TokenKind::RParen) && depth == 0)) {
        if (at_eof()) {
          fail_here("')'");
        }
        const Token & t = advance();
        if (t.kind == TokenKind::LParen) {
          ++depth;
        } else if (t.kind == TokenKind::RParen) {
          --depth;
        }

        if (t.kind == TokenKind::Comma) {
          args += ", ";
        } else if (t.kind == TokenKind::Eq) {
          args += " = ";
        } else {
          if (is_word_token(t.kind) && is_word_token(last)) {
            args += ' ';
          }
          args += sm_.get_slice(t.range);
        }
        last = t.kind;
      }
      advance();
      attr->args = ast_.intern(args);
      attr->hasArgs = true;
    }

    expect(TokenKind::RBracket, "']' to close attribute");
    attr->range_ = range_from(start);
    attrs.push_back(attr);
  }
  return attrs;
}

// ============================================================================
// Items
// ============================================================================

Decl * Parser::parse_item(
  const std::vector<std::string_view> & docs, const std::vector<Attribute *> & attrs)
{
  const Token & start = cur();

  if (at(TokenKind::Hash) && at_kw("define", 1)) {
    return parse_macro_def(start);
  }

  const bool is_static = match_kw("static");
  const Visibility vis = is_static ? Visibility::Private : Visibility::Public;

  if (at_kw("struct")) {
    auto * decl = parse_struct(start, vis);
    decl->attributes = ast_.copy_to_arena(attrs);
    decl->docs = ast_.copy_to_arena(docs);
    return decl;
  }

  if (at_kw("enum")) {
    auto * decl = parse_enum(start, vis);
    decl->attributes = ast_.copy_to_arena(attrs);
    decl->docs = ast_.copy_to_arena(docs);
    return decl;
  }

  if (at_kw("typedef")) {
    if (at_kw("struct", 1) && cur(2).kind == TokenKind::LBrace) {
      if (is_static) {
        fail(start.range, "implementation blocks cannot be declared 'static'");
      }
      auto * decl = parse_impl_block(start);
      decl->attributes = ast_.copy_to_arena(attrs);
      decl->docs = ast_.copy_to_arena(docs);
      return decl;
    }
    auto * decl = parse_typedef(start, vis);
    decl->attributes = ast_.copy_to_arena(attrs);
    decl->docs = ast_.copy_to_arena(docs);
    return decl;
  }

  if (at_kw("extern")) {
    return parse_extern_block(start);
  }

  TypeNode * ret = parse_type();
  const auto name = expect_ident("function name");
  auto * fn = parse_function_rest(ret, name, start, docs);
  fn->visibility = vis;
  fn->attributes = ast_.copy_to_arena(attrs);
  return fn;
}

FunctionDecl * Parser::parse_function_rest(
  TypeNode * ret, std::string_view name, const Token & start,
  const std::vector<std::string_view> & docs)
{
  const auto params = parse_params();
  BlockStmt * body = parse_block();

  auto * fn = ast_.create<FunctionDecl>(name, ret, range_from(start));
  fn->params = params;
  fn->body = body;
  fn->docs = ast_.copy_to_arena(docs);
  return fn;
}

gsl::span<ParamDecl *> Parser::parse_params()
{
  expect(TokenKind::LParen, "'(' to start parameter list");
  std::vector<ParamDecl *> params;

  if (at_kw("void") && cur(1).kind == TokenKind::RParen) {
    advance();
  } else if (!at(TokenKind::RParen)) {
    do {
      params.push_back(parse_param());
    } while (match(TokenKind::Comma));
  }

  expect(TokenKind::RParen, "')' to close parameter list");
  return ast_.copy_to_arena(params);
}

ParamDecl * Parser::parse_param()
{
  const Token & start = cur();
  const auto self_name = ast_.intern("self");

  if (at_kw("self")) {
    advance();
    auto * self_type = ast_.create<NamedTypeNode>(ast_.intern("Self"), start.range);
    return ast_.create<ParamDecl>(self_name, self_type, range_from(start));
  }

  if (at(TokenKind::Amp) && (at_kw("self", 1) || (at_kw("var", 1) && at_kw("self", 2)))) {
    advance();
    const bool is_mut = match_kw("var");
    const Token & self_tok = advance();
    auto * self_type = ast_.create<NamedTypeNode>(ast_.intern("Self"), self_tok.range);
    auto * ref = ast_.create<ReferenceTypeNode>(self_type, is_mut, range_from(start));
    return ast_.create<ParamDecl>(self_name, ref, range_from(start));
  }

  TypeNode * type = parse_type();
  const auto name = expect_ident("parameter name");
  return ast_.create<ParamDecl>(name, type, range_from(start));
}

StructDecl * Parser::parse_struct(const Token & start, Visibility vis)
{
  expect_kw("struct");
  const auto name = expect_ident("struct name");
  expect(TokenKind::LBrace, "'{' to start struct body");

  std::vector<FieldDecl *> fields;
  std::vector<FunctionDecl *> methods;

  while (true) {
    auto docs = collect_line_docs();
    const auto attrs = parse_attributes();
    for (const auto d : collect_line_docs()) {
      docs.push_back(d);
    }
    if (match(TokenKind::RBrace)) {
      break;
    }
    if (at_eof()) {
      fail_here("'}' to close struct body");
    }

    const Token & member_start = cur();
    const Visibility member_vis =
      match_kw("static") ? Visibility::Private : Visibility::Public;
    TypeNode * type = parse_type();
    const auto member_name = expect_ident("field or method name");

    if (at(TokenKind::LParen)) {
      auto * method = parse_function_rest(type, member_name, member_start, docs);
      method->visibility = member_vis;
      method->attributes = ast_.copy_to_arena(attrs);
      methods.push_back(method);
      continue;
    }

    expect(TokenKind::Semicolon, "';' after field");
    auto * field = ast_.create<FieldDecl>(member_name, type, range_from(member_start));
    field->visibility = member_vis;
    field->docs = ast_.copy_to_arena(docs);
    fields.push_back(field);
  }
  match(TokenKind::Semicolon);

  auto * decl = ast_.create<StructDecl>(name, range_from(start));
  decl->fields = ast_.copy_to_arena(fields);
  decl->methods = ast_.copy_to_arena(methods);
  decl->visibility = vis;
  return decl;
}

EnumDecl * Parser::parse_enum(const Token & start, Visibility vis)
{
  expect_kw("enum");
  const auto name = expect_ident("enum name");
  expect(TokenKind::LBrace, "'{' to start enum body");

  std::vector<EnumVariantDecl *> variants;
  int64_t next = 0;
  while (true) {
    skip_docs();
    if (at(TokenKind::RBrace)) {
      break;
    }

    const Token & variant_start = cur();
    const auto variant_name = expect_ident("enum variant name");
    int64_t value = next;
    bool is_explicit = false;
    if (match(TokenKind::Eq)) {
      const bool negative = match(TokenKind::Minus);
      const Token & lit = expect(TokenKind::IntLiteral, "integer discriminant");
      const auto v = parse_integer_text(lit.text);
      if (!v || *v > static_cast<uint64_t>(INT64_MAX)) {
        fail(lit.range, "enum discriminant is out of range");
      }
      value = negative ? -static_cast<int64_t>(*v) : static_cast<int64_t>(*v);
      is_explicit = true;
    }
    variants.push_back(
      ast_.create<EnumVariantDecl>(variant_name, value, is_explicit, range_from(variant_start)));
    next = value + 1;

    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  skip_docs();
  expect(TokenKind::RBrace, "'}' to close enum body");
  match(TokenKind::Semicolon);

  auto * decl = ast_.create<EnumDecl>(name, range_from(start));
  decl->variants = ast_.copy_to_arena(variants);
  decl->visibility = vis;
  return decl;
}

TypedefDecl * Parser::parse_typedef(const Token & start, Visibility vis)
{
  expect_kw("typedef");
  TypeNode * aliased = parse_type();
  const auto name = expect_ident("type alias name");
  expect(TokenKind::Semicolon, "';' after typedef");

  auto * decl = ast_.create<TypedefDecl>(name, aliased, range_from(start));
  decl->visibility = vis;
  return decl;
}

ImplBlockDecl * Parser::parse_impl_block(const Token & start)
{
  expect_kw("typedef");
  expect_kw("struct");
  expect(TokenKind::LBrace, "'{'");
  const auto methods = parse_member_functions_until_rbrace();

  expect(TokenKind::At, "'@' before the implementation target");
  const auto target = expect_ident("type name");

  std::string_view block_name;
  if (match(TokenKind::Dot)) {
    block_name = expect_ident("implementation block name");
  }
  expect(TokenKind::Semicolon, "';' after implementation block");

  auto * decl = ast_.create<ImplBlockDecl>(target, range_from(start));
  decl->blockName = block_name;
  decl->methods = ast_.copy_to_arena(methods);
  return decl;
}

std::vector<FunctionDecl *> Parser::parse_member_functions_until_rbrace()
{
  std::vector<FunctionDecl *> methods;
  while (true) {
    auto docs = collect_line_docs();
    const auto attrs = parse_attributes();
    for (const auto d : collect_line_docs()) {
      docs.push_back(d);
    }
    if (match(TokenKind::RBrace)) {
      break;
    }
    if (at_eof()) {
      fail_here("'}'");
    }

    const Token & member_start = cur();
    const Visibility vis = match_kw("static") ? Visibility::Private : Visibility::Public;
    TypeNode * ret = parse_type();
    const auto name = expect_ident("method name");
    auto * method = parse_function_rest(ret, name, member_start, docs);
    method->visibility = vis;
    method->attributes = ast_.copy_to_arena(attrs);
    methods.push_back(method);
  }
  return methods;
}

ExternBlockDecl * Parser::parse_extern_block(const Token & start)
{
  expect_kw("extern");
  const Token & abi = expect(TokenKind::StringLiteral, "ABI string");
  expect(TokenKind::LBrace, "'{' to start extern block");

  std::vector<std::string_view> body;
  int depth = 0;
  while (!(at(TokenKind::RBrace) && depth == 0)) {
    if (at_eof()) {
      fail_here("'}' to close extern block");
    }
    const Token & t = advance();
    if (t.kind == TokenKind::LBrace) {
      ++depth;
    } else if (t.kind == TokenKind::RBrace) {
      --depth;
    }
    if (is_trivia(t.kind)) {
      continue;
    }
    body.push_back(ast_.intern(sm_.get_slice(t.range)));
  }
  advance();

  auto * decl = ast_.create<ExternBlockDecl>(ast_.intern(abi.text), range_from(start));
  decl->tokens = ast_.copy_to_arena(body);
  return decl;
}

MacroDefDecl * Parser::parse_macro_def(const Token & start)
{
  advance();  // '#'
  const Token & define_tok = advance();
  const uint32_t line = sm_.get_line_column(define_tok.begin()).line;

  const Token & name_tok = expect(TokenKind::Identifier, "macro name");
  if (!is_macro_name(name_tok.text)) {
    if (speculating_ == 0) {
      diags_
        .report_error(
          name_tok.range, fmt::format("invalid macro name '{}'", name_tok.text),
          "macro names must be delimited by double underscores")
        .with_code(diag_code::k_invalid_macro_name)
        .with_help(fmt::format("rename it to '__{}__'", name_tok.text));
    }
    throw ParseAbort{};
  }

  auto * decl = ast_.create<MacroDefDecl>(ast_.intern(name_tok.text));

  // A parameter list only when '(' touches the name: `#define __F__(a)`.
  std::vector<std::string_view> params;
  if (at(TokenKind::LParen) && adjacent(0)) {
    advance();
    decl->hasParamList = true;
    if (!at(TokenKind::RParen)) {
      do {
        params.push_back(expect_ident("macro parameter name"));
      } while (match(TokenKind::Comma));
    }
    expect(TokenKind::RParen, "')' to close macro parameters");
  }

  std::vector<MacroToken> body;
  while (!at_eof() && !at(TokenKind::Semicolon) &&
         sm_.get_line_column(cur().begin()).line == line) {
    const Token & t = advance();
    if (is_trivia(t.kind)) {
      continue;
    }
    body.push_back(MacroToken{ast_.intern(sm_.get_slice(t.range)), t.kind == TokenKind::Identifier});
  }
  if (at(TokenKind::Semicolon) && sm_.get_line_column(cur().begin()).line == line) {
    advance();
  }

  decl->params = ast_.copy_to_arena(params);
  decl->body = ast_.copy_to_arena(body);
  decl->range_ = range_from(start);
  return decl;
}

// ============================================================================
// Statements
// ============================================================================

BlockStmt * Parser::parse_block()
{
  const Token & start = expect(TokenKind::LBrace, "'{'");
  std::vector<Stmt *> stmts;
  while (true) {
    skip_docs();
    if (at(TokenKind::RBrace)) {
      break;
    }
    if (at_eof()) {
      fail_here("'}'");
    }
    stmts.push_back(parse_stmt());
  }
  advance();
  return ast_.create<BlockStmt>(ast_.copy_to_arena(stmts), range_from(start));
}

BlockStmt * Parser::parse_body()
{
  if (at(TokenKind::LBrace)) {
    return parse_block();
  }
  Stmt * single = parse_stmt();
  auto stmts = ast_.allocate_array<Stmt *>(1);
  stmts[0] = single;
  return ast_.create<BlockStmt>(stmts, single->get_range());
}

Stmt * Parser::parse_stmt()
{
  skip_docs();
  const Token & start = cur();

  if (at(TokenKind::LBrace)) {
    return parse_block();
  }

  if (at(TokenKind::Dot) && cur(1).kind == TokenKind::Identifier && cur(2).kind == TokenKind::Colon) {
    return parse_labeled_loop();
  }

  if (at(TokenKind::Identifier)) {
    const std::string_view kw = cur().text;
    if (kw == "if") return parse_if();
    if (kw == "while") return parse_while({}, start);
    if (kw == "loop") return parse_loop({}, start);
    if (kw == "for") return parse_for({}, start);
    if (kw == "switch") return parse_switch();
    if (kw == "return") return parse_return();
    if (kw == "break" || kw == "continue") {
      advance();
      const auto label = parse_jump_label();
      expect(TokenKind::Semicolon, "';'");
      if (kw == "break") {
        return ast_.create<BreakStmt>(label, range_from(start));
      }
      return ast_.create<ContinueStmt>(label, range_from(start));
    }
    if (kw == "let" || kw == "var" || kw == "const") {
      return parse_keyword_decl();
    }
    if (kw == "static") {
      advance();
      if (auto * nested = try_parse_nested_function(true, start)) {
        return nested;
      }
      fail_here("function declaration after 'static'");
    }
  }

  if (auto * nested = try_parse_nested_function(false, start)) {
    return nested;
  }
  if (auto * decl = try_parse_implicit_decl()) {
    return decl;
  }

  Expr * e = parse_expr();
  expect(TokenKind::Semicolon, "';'");
  return ast_.create<ExprStmt>(e, range_from(start));
}

Stmt * Parser::parse_labeled_loop()
{
  const Token & start = advance();  // '.'
  const auto label = expect_ident("loop label");
  expect(TokenKind::Colon, "':' after loop label");

  if (at_kw("while")) return parse_while(label, start);
  if (at_kw("loop")) return parse_loop(label, start);
  if (at_kw("for")) return parse_for(label, start);
  fail_here("'while', 'for' or 'loop' after label");
}

Stmt * Parser::parse_if()
{
  const Token & start = advance();
  expect(TokenKind::LParen, "'(' after 'if'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after condition");
  BlockStmt * then_branch = parse_body();

  Stmt * else_branch = nullptr;
  if (match_kw("else")) {
    if (at_kw("if")) {
      else_branch = parse_if();
    } else {
      else_branch = parse_body();
    }
  }
  return ast_.create<IfStmt>(cond, then_branch, else_branch, range_from(start));
}

Stmt * Parser::parse_while(std::string_view label, const Token & start)
{
  expect_kw("while");
  expect(TokenKind::LParen, "'(' after 'while'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after condition");
  BlockStmt * body = parse_body();
  return ast_.create<WhileStmt>(label, cond, body, range_from(start));
}

Stmt * Parser::parse_loop(std::string_view label, const Token & start)
{
  expect_kw("loop");
  BlockStmt * body = parse_block();
  return ast_.create<LoopStmt>(label, body, range_from(start));
}

Stmt * Parser::parse_for(std::string_view label, const Token & start)
{
  expect_kw("for");
  expect(TokenKind::LParen, "'(' after 'for'");

  if (at(TokenKind::Identifier) && !is_keyword(cur().text) && at_kw("in", 1)) {
    const auto variable = expect_ident("loop variable");
    advance();  // 'in'
    Expr * iterable = parse_expr();
    expect(TokenKind::RParen, "')'");
    BlockStmt * body = parse_body();
    return ast_.create<ForInStmt>(label, variable, iterable, body, range_from(start));
  }

  auto * loop = ast_.create<ForStmt>(label);
  if (!match(TokenKind::Semicolon)) {
    const Token & init_start = cur();
    if (at_kw("let") || at_kw("var") || at_kw("const")) {
      loop->init = parse_keyword_decl();
    } else if (auto * decl = try_parse_implicit_decl()) {
      loop->init = decl;
    } else {
      Expr * e = parse_expr();
      expect(TokenKind::Semicolon, "';' after loop initializer");
      loop->init = ast_.create<ExprStmt>(e, range_from(init_start));
    }
  }
  if (!at(TokenKind::Semicolon)) {
    loop->condition = parse_expr();
  }
  expect(TokenKind::Semicolon, "';' after loop condition");
  if (!at(TokenKind::RParen)) {
    loop->step = parse_expr();
  }
  expect(TokenKind::RParen, "')'");
  loop->body = parse_body();
  loop->range_ = range_from(start);
  return loop;
}

Stmt * Parser::parse_switch()
{
  const Token & start = advance();
  expect(TokenKind::LParen, "'(' after 'switch'");
  Expr * subject = parse_expr();
  expect(TokenKind::RParen, "')'");
  expect(TokenKind::LBrace, "'{' to start switch body");

  auto * sw = ast_.create<SwitchStmt>(subject);
  std::vector<SwitchCase *> cases;

  while (true) {
    skip_docs();
    if (match(TokenKind::RBrace)) {
      break;
    }

    const Token & case_start = cur();
    if (match_kw("case")) {
      std::vector<Expr *> values;
      do {
        values.push_back(parse_ternary());
      } while (match(TokenKind::Comma));
      expect(TokenKind::Colon, "':' after case values");
      const auto body = parse_case_body();

      auto * c = ast_.create<SwitchCase>(range_from(case_start));
      c->values = ast_.copy_to_arena(values);
      c->body = ast_.copy_to_arena(body);
      cases.push_back(c);
    } else if (match_kw("default")) {
      if (sw->hasDefault) {
        fail(case_start.range, "multiple 'default' labels in one switch");
      }
      expect(TokenKind::Colon, "':' after 'default'");
      sw->hasDefault = true;
      sw->defaultBody = ast_.copy_to_arena(parse_case_body());
    } else {
      fail_here("'case', 'default' or '}'");
    }
  }

  sw->cases = ast_.copy_to_arena(cases);
  sw->range_ = range_from(start);
  return sw;
}

std::vector<Stmt *> Parser::parse_case_body()
{
  std::vector<Stmt *> body;
  while (true) {
    skip_docs();
    if (at_kw("case") || at_kw("default") || at(TokenKind::RBrace)) {
      break;
    }
    if (at_eof()) {
      fail_here("'}' to close switch body");
    }
    body.push_back(parse_stmt());
  }
  return body;
}

Stmt * Parser::parse_return()
{
  const Token & start = advance();
  Expr * value = at(TokenKind::Semicolon) ? nullptr : parse_expr();
  expect(TokenKind::Semicolon, "';' after return");
  return ast_.create<ReturnStmt>(value, range_from(start));
}

std::string_view Parser::parse_jump_label()
{
  if (at(TokenKind::Dot) && cur(1).kind == TokenKind::Identifier) {
    advance();
    return expect_ident("loop label");
  }
  return {};
}

DeclStmt * Parser::parse_keyword_decl()
{
  const Token & start = advance();
  DeclForm form = DeclForm::Let;
  if (start.text == "var") {
    form = DeclForm::Var;
  } else if (start.text == "const") {
    form = DeclForm::Const;
  }

  // `let name: Type = e;` / `let name = e;`
  if (
    at(TokenKind::Identifier) && !is_keyword(cur().text) &&
    (cur(1).kind == TokenKind::Colon || cur(1).kind == TokenKind::Eq ||
     cur(1).kind == TokenKind::Semicolon)) {
    const auto name = expect_ident("variable name");
    TypeNode * type = nullptr;
    if (match(TokenKind::Colon)) {
      type = parse_type();
    }
    auto * decl = ast_.create<DeclStmt>(name, form);
    return finish_decl(decl, type, start, form == DeclForm::Const);
  }

  // `let Type name = e;`
  TypeNode * type = parse_type();
  const auto name = expect_ident("variable name");
  auto * decl = ast_.create<DeclStmt>(name, form);
  return finish_decl(decl, type, start, form == DeclForm::Const);
}

DeclStmt * Parser::try_parse_implicit_decl()
{
  const Checkpoint cp = save();
  TypeNode * type = speculate([&]() -> TypeNode * {
    TypeNode * t = parse_type();
    if (
      !at(TokenKind::Identifier) || is_keyword(cur().text) || cur(1).kind != TokenKind::Eq) {
      throw ParseAbort{};
    }
    return t;
  });
  if (type == nullptr) {
    return nullptr;
  }

  const Token & start = tokens_[cp.idx];
  const auto name = expect_ident("variable name");
  auto * decl = ast_.create<DeclStmt>(name, DeclForm::Implicit);
  return finish_decl(decl, type, start, true);
}

NestedFunctionStmt * Parser::try_parse_nested_function(bool is_static, const Token & start)
{
  // Shape check only: `Type name(params) {`. The real parse below reports
  // errors inside the body normally.
  const Checkpoint cp = save();
  TypeNode * shape = speculate([&]() -> TypeNode * {
    TypeNode * ret = parse_type();
    if (
      !at(TokenKind::Identifier) || is_keyword(cur().text) || cur(1).kind != TokenKind::LParen) {
      throw ParseAbort{};
    }
    advance();
    (void)parse_params();
    if (!at(TokenKind::LBrace)) {
      throw ParseAbort{};
    }
    return ret;
  });
  restore(cp);
  if (shape == nullptr) {
    return nullptr;
  }

  TypeNode * ret = parse_type();
  const auto name = expect_ident("function name");
  auto * fn = parse_function_rest(ret, name, start, {});
  if (is_static) {
    fn->visibility = Visibility::Private;
  }
  return ast_.create<NestedFunctionStmt>(fn, is_static, range_from(start));
}

DeclStmt * Parser::finish_decl(DeclStmt * decl, TypeNode * type, const Token & start, bool require_init)
{
  decl->type = type;
  if (match(TokenKind::Eq)) {
    decl->init = parse_assignment();
  } else if (require_init) {
    fail_here("'=' and an initializer");
  }
  expect(TokenKind::Semicolon, "';' after declaration");
  decl->range_ = range_from(start);
  return decl;
}

// ============================================================================
// Types
// ============================================================================

TypeNode * Parser::parse_type()
{
  const Token & start = cur();

  if (match(TokenKind::Amp)) {
    const bool is_mut = match_kw("var");
    TypeNode * inner = parse_type();
    return ast_.create<ReferenceTypeNode>(inner, is_mut, range_from(start));
  }

  TypeNode * type = parse_type_atom();
  while (true) {
    if (match(TokenKind::Star)) {
      type = ast_.create<PointerTypeNode>(type, true, range_from(start));
      continue;
    }
    if (at(TokenKind::LBracket) && cur(1).kind == TokenKind::RBracket) {
      advance();
      advance();
      type = ast_.create<SliceTypeNode>(type, range_from(start));
      continue;
    }
    if (
      at(TokenKind::LBracket) && cur(1).kind == TokenKind::IntLiteral &&
      cur(2).kind == TokenKind::RBracket) {
      advance();
      const Token & size_tok = advance();
      const auto size = parse_integer_text(size_tok.text);
      if (!size) {
        fail(size_tok.range, "array size is out of range");
      }
      advance();
      type = ast_.create<ArrayTypeNode>(type, *size, range_from(start));
      continue;
    }
    if (match(TokenKind::Question)) {
      type = ast_.create<FallibleTypeNode>(type, range_from(start));
      continue;
    }
    break;
  }
  return type;
}

TypeNode * Parser::parse_type_atom()
{
  const Token & start = cur();

  if (match(TokenKind::LParen)) {
    if (match(TokenKind::RParen)) {
      return ast_.create<TupleTypeNode>(gsl::span<TypeNode *>{}, range_from(start));
    }
    std::vector<TypeNode *> elements;
    elements.push_back(parse_type());
    if (!at(TokenKind::Comma)) {
      fail_here("',' in tuple type");
    }
    while (match(TokenKind::Comma)) {
      if (at(TokenKind::RParen)) {
        break;
      }
      elements.push_back(parse_type());
    }
    expect(TokenKind::RParen, "')' to close tuple type");
    return ast_.create<TupleTypeNode>(ast_.copy_to_arena(elements), range_from(start));
  }

  if (!at(TokenKind::Identifier)) {
    fail_here("type");
  }

  const std::string_view text = cur().text;
  if (text == "auto") {
    advance();
    return ast_.create<AutoTypeNode>(start.range);
  }
  if (const auto prim = primitive_from_name(text)) {
    advance();
    return ast_.create<PrimitiveTypeNode>(*prim, start.range);
  }
  if (is_keyword(text) && text != "Self") {
    fail_here("type");
  }

  advance();
  const auto name = ast_.intern(text);
  if (at(TokenKind::Lt)) {
    const auto args = parse_generic_args();
    return ast_.create<GenericTypeNode>(name, args, range_from(start));
  }
  return ast_.create<NamedTypeNode>(name, start.range);
}

gsl::span<TypeNode *> Parser::parse_generic_args()
{
  expect(TokenKind::Lt, "'<'");
  std::vector<TypeNode *> args;
  do {
    args.push_back(parse_type());
  } while (match(TokenKind::Comma));
  expect_generic_close();
  return ast_.copy_to_arena(args);
}

void Parser::expect_generic_close()
{
  // `>>` is never a single token, so nested lists close one '>' at a time.
  expect(TokenKind::Gt, "'>' to close generic arguments");
}

bool Parser::is_unambiguous_type(const TypeNode * type)
{
  switch (type->get_kind()) {
    case NodeKind::PrimitiveType:
    case NodeKind::AutoType:
    case NodeKind::GenericType:
    case NodeKind::PointerType:
      return true;
    case NodeKind::ReferenceType:
      return is_unambiguous_type(cast<ReferenceTypeNode>(type)->referent);
    case NodeKind::ArrayType:
      return is_unambiguous_type(cast<ArrayTypeNode>(type)->element);
    case NodeKind::SliceType:
      return is_unambiguous_type(cast<SliceTypeNode>(type)->element);
    case NodeKind::FallibleType:
      return is_unambiguous_type(cast<FallibleTypeNode>(type)->inner);
    case NodeKind::TupleType: {
      for (const auto * e : cast<TupleTypeNode>(type)->elements) {
        if (!is_unambiguous_type(e)) return false;
      }
      return true;
    }
    default:
      return false;
  }
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr()
{
  Expr * lhs = parse_assignment();
  while (match(TokenKind::Comma)) {
    Expr * rhs = parse_assignment();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Comma, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

std::optional<AssignOp> Parser::peek_assign_op(size_t & width) const
{
  width = 1;
  switch (cur().kind) {
    case TokenKind::Eq:
      return AssignOp::Assign;
    case TokenKind::PlusEq:
      return AssignOp::AddAssign;
    case TokenKind::MinusEq:
      return AssignOp::SubAssign;
    case TokenKind::StarEq:
      return AssignOp::MulAssign;
    case TokenKind::SlashEq:
      return AssignOp::DivAssign;
    case TokenKind::PercentEq:
      return AssignOp::ModAssign;
    case TokenKind::AmpEq:
      return AssignOp::AndAssign;
    case TokenKind::PipeEq:
      return AssignOp::OrAssign;
    case TokenKind::CaretEq:
      return AssignOp::XorAssign;
    case TokenKind::ShlEq:
      return AssignOp::ShlAssign;
    default:
      break;
  }
  if (at_shr_assign()) {
    width = 2;
    return AssignOp::ShrAssign;
  }
  width = 0;
  return std::nullopt;
}

Expr * Parser::parse_assignment()
{
  Expr * target = parse_ternary();
  size_t width = 0;
  if (const auto op = peek_assign_op(width)) {
    for (size_t i = 0; i < width; ++i) {
      advance();
    }
    Expr * value = parse_assignment();
    return ast_.create<AssignExpr>(
      target, *op, value, join_ranges(target->get_range(), value->get_range()));
  }
  return target;
}

Expr * Parser::parse_ternary()
{
  Expr * cond = parse_range();
  if (!match(TokenKind::Question)) {
    return cond;
  }
  Expr * then_expr = parse_assignment();
  expect(TokenKind::Colon, "':' in conditional expression");
  Expr * else_expr = parse_ternary();
  return ast_.create<TernaryExpr>(
    cond, then_expr, else_expr, join_ranges(cond->get_range(), else_expr->get_range()));
}

Expr * Parser::parse_range()
{
  const Token & start = cur();
  auto at_open_end = [this]() {
    return at(TokenKind::RParen) || at(TokenKind::RBracket) || at(TokenKind::RBrace) ||
           at(TokenKind::Semicolon) || at(TokenKind::Comma) || at(TokenKind::Colon) || at_eof();
  };

  Expr * lhs = nullptr;
  if (!at(TokenKind::DotDot) && !at(TokenKind::DotDotEq)) {
    lhs = parse_or();
    if (!at(TokenKind::DotDot) && !at(TokenKind::DotDotEq)) {
      return lhs;
    }
  }

  const bool inclusive = advance().kind == TokenKind::DotDotEq;
  Expr * rhs = at_open_end() ? nullptr : parse_or();
  return ast_.create<RangeExpr>(lhs, rhs, inclusive, range_from(start));
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match(TokenKind::OrOr)) {
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_bitor();
  while (match(TokenKind::AndAnd)) {
    Expr * rhs = parse_bitor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitor()
{
  Expr * lhs = parse_bitxor();
  while (match(TokenKind::Pipe)) {
    Expr * rhs = parse_bitxor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitOr, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitxor()
{
  Expr * lhs = parse_bitand();
  while (match(TokenKind::Caret)) {
    Expr * rhs = parse_bitand();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitXor, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitand()
{
  Expr * lhs = parse_equality();
  while (match(TokenKind::Amp)) {
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitAnd, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_comparison();
  while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    const BinaryOp op = (advance().kind == TokenKind::EqEq) ? BinaryOp::Eq : BinaryOp::Ne;
    Expr * rhs = parse_comparison();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_shift();
  while (true) {
    BinaryOp op = BinaryOp::Lt;
    if (at(TokenKind::Lt)) {
      op = BinaryOp::Lt;
    } else if (at(TokenKind::Le)) {
      op = BinaryOp::Le;
    } else if (at(TokenKind::Gt) && !at_shr() && !at_shr_assign()) {
      op = BinaryOp::Gt;
    } else if (at(TokenKind::Ge)) {
      op = BinaryOp::Ge;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_shift();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_shift()
{
  Expr * lhs = parse_add();
  while (true) {
    BinaryOp op = BinaryOp::Shl;
    if (at(TokenKind::Shl)) {
      advance();
    } else if (at_shr()) {
      advance();
      advance();
      op = BinaryOp::Shr;
    } else {
      break;
    }
    Expr * rhs = parse_add();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = (advance().kind == TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_unary();
  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    const TokenKind k = advance().kind;
    BinaryOp op = BinaryOp::Mul;
    if (k == TokenKind::Slash) {
      op = BinaryOp::Div;
    } else if (k == TokenKind::Percent) {
      op = BinaryOp::Mod;
    }
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  const Token & start = cur();

  auto prefix = [&](UnaryOp op) -> Expr * {
    advance();
    Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(op, operand, range_from(start));
  };

  switch (cur().kind) {
    case TokenKind::Bang:
      return prefix(UnaryOp::Not);
    case TokenKind::Minus:
      return prefix(UnaryOp::Neg);
    case TokenKind::Tilde:
      return prefix(UnaryOp::BitNot);
    case TokenKind::Star:
      return prefix(UnaryOp::Deref);
    case TokenKind::PlusPlus:
      return prefix(UnaryOp::PreInc);
    case TokenKind::MinusMinus:
      return prefix(UnaryOp::PreDec);
    case TokenKind::Amp: {
      advance();
      const bool is_mut = match_kw("var");
      Expr * operand = parse_unary();
      return ast_.create<UnaryExpr>(
        is_mut ? UnaryOp::RefMut : UnaryOp::Ref, operand, range_from(start));
    }
    case TokenKind::AndAnd: {
      // `&&x` is a reference to a reference.
      advance();
      Expr * operand = parse_unary();
      auto * inner = ast_.create<UnaryExpr>(
        UnaryOp::Ref, operand,
        SourceRange(start.begin() + 1, operand->get_range().get_end().get_offset()));
      return ast_.create<UnaryExpr>(UnaryOp::Ref, inner, range_from(start));
    }
    case TokenKind::LParen:
      if (Expr * cast_expr = try_parse_cast()) {
        if (isa<StructInitExpr>(cast_expr)) {
          return parse_postfix(cast_expr);
        }
        return cast_expr;
      }
      break;
    default:
      break;
  }

  return parse_postfix(parse_primary());
}

Expr * Parser::try_parse_cast()
{
  const Token & start = cur();
  const Checkpoint cp = save();

  TypeNode * type = speculate([&]() -> TypeNode * {
    expect(TokenKind::LParen, "'('");
    TypeNode * t = parse_type();
    expect(TokenKind::RParen, "')'");
    return t;
  });
  if (type == nullptr) {
    return nullptr;
  }

  // `(Point){ .x = 1 }`
  if (
    at(TokenKind::LBrace) && (cur(1).kind == TokenKind::Dot || cur(1).kind == TokenKind::RBrace)) {
    return parse_struct_init_body(type, true, start);
  }

  if (at_unary_start(!is_unambiguous_type(type))) {
    Expr * operand = parse_unary();
    return ast_.create<CastExpr>(type, operand, range_from(start));
  }

  restore(cp);
  return nullptr;
}

bool Parser::at_unary_start(bool after_bare_name) const
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Identifier:
      return !is_keyword(t.text) || is_operand_keyword(t.text);
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::CharLiteral:
    case TokenKind::LParen:
    case TokenKind::Bang:
    case TokenKind::Tilde:
    case TokenKind::At:
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
      return true;
    // `(x) - 1` is a subtraction; `(int) -1` is a cast.
    case TokenKind::Minus:
    case TokenKind::Amp:
    case TokenKind::AndAnd:
    case TokenKind::Star:
    case TokenKind::LBracket:
      return !after_bare_name;
    default:
      return false;
  }
}

bool Parser::at_propagation_end() const
{
  switch (cur(1).kind) {
    case TokenKind::Semicolon:
    case TokenKind::RParen:
    case TokenKind::Comma:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::Dot:
    case TokenKind::Eof:
      return true;
    default:
      return false;
  }
}

bool Parser::at_struct_init_brace() const
{
  if (!at(TokenKind::LBrace)) {
    return false;
  }
  if (cur(1).kind == TokenKind::RBrace) {
    return true;
  }
  return cur(1).kind == TokenKind::Dot && cur(2).kind == TokenKind::Identifier &&
         cur(3).kind == TokenKind::Eq;
}

Expr * Parser::parse_postfix(Expr * base)
{
  Expr * e = base;
  const uint32_t begin = base->get_range().get_begin().get_offset();
  auto span_here = [&]() { return SourceRange(begin, prev().end()); };

  while (true) {
    if (at(TokenKind::LParen)) {
      const auto args = parse_call_args();
      e = ast_.create<CallExpr>(e, args, span_here());
      continue;
    }

    if (match(TokenKind::LBracket)) {
      Expr * index = parse_expr();
      expect(TokenKind::RBracket, "']' after index");
      e = ast_.create<IndexExpr>(e, index, span_here());
      continue;
    }

    if (match(TokenKind::Dot)) {
      if (at(TokenKind::IntLiteral)) {
        const auto field = ast_.intern(advance().text);
        e = ast_.create<FieldAccessExpr>(e, field, false, span_here());
        continue;
      }
      if (at(TokenKind::FloatLiteral)) {
        // `t.0.1` lexes its tail as the float `0.1`.
        const Token & t = advance();
        const auto dot = t.text.find('.');
        const auto first = t.text.substr(0, dot);
        const auto second = (dot == std::string_view::npos) ? std::string_view{} : t.text.substr(dot + 1);
        if (!is_all_digits(first) || !is_all_digits(second)) {
          fail(t.range, fmt::format("invalid tuple index '{}'", t.text));
        }
        e = ast_.create<FieldAccessExpr>(
          e, ast_.intern(first), false, SourceRange(begin, t.begin() + static_cast<uint32_t>(dot)));
        e = ast_.create<FieldAccessExpr>(e, ast_.intern(second), false, span_here());
        continue;
      }

      const auto name = expect_ident("field or method name");
      if (at(TokenKind::LParen)) {
        const auto args = parse_call_args();
        e = ast_.create<MethodCallExpr>(e, name, args, span_here());
      } else {
        e = ast_.create<FieldAccessExpr>(e, name, false, span_here());
      }
      continue;
    }

    if (match(TokenKind::Arrow)) {
      const auto name = expect_ident("field name after '->'");
      e = ast_.create<FieldAccessExpr>(e, name, true, span_here());
      continue;
    }

    if (at(TokenKind::Question) && at_propagation_end()) {
      advance();
      e = ast_.create<ErrorPropagateExpr>(e, span_here());
      continue;
    }

    break;
  }
  return e;
}

gsl::span<Expr *> Parser::parse_call_args()
{
  expect(TokenKind::LParen, "'('");
  std::vector<Expr *> args;
  if (!at(TokenKind::RParen)) {
    do {
      args.push_back(parse_assignment());
    } while (match(TokenKind::Comma));
  }
  expect(TokenKind::RParen, "')' to close argument list");
  return ast_.copy_to_arena(args);
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral:
      return parse_int_literal();
    case TokenKind::FloatLiteral:
      return parse_float_literal();
    case TokenKind::StringLiteral:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(t.text), t.range);
    case TokenKind::CharLiteral:
      advance();
      return ast_.create<CharLiteralExpr>(ast_.intern(t.text), t.range);
    case TokenKind::LParen:
      return parse_paren_or_tuple();
    case TokenKind::LBracket:
      return parse_array_literal();
    case TokenKind::At:
      return parse_type_scoped_call();
    case TokenKind::Identifier:
      break;
    default:
      fail_here("expression");
  }

  const std::string_view text = t.text;
  if (text == "true" || text == "false") {
    advance();
    return ast_.create<BoolLiteralExpr>(text == "true", t.range);
  }
  if (text == "NULL") {
    advance();
    return ast_.create<NullLiteralExpr>(t.range);
  }
  if (text == "sizeof") {
    advance();
    expect(TokenKind::LParen, "'(' after 'sizeof'");
    TypeNode * type = parse_type();
    expect(TokenKind::RParen, "')'");
    return ast_.create<SizeofExpr>(type, range_from(t));
  }
  if (text == "self") {
    advance();
    return ast_.create<IdentExpr>(ast_.intern(text), t.range);
  }
  if (is_macro_name(text) && cur(1).kind == TokenKind::LParen) {
    advance();
    const auto args = parse_call_args();
    return ast_.create<MacroCallExpr>(ast_.intern(text), args, range_from(t));
  }
  if (is_keyword(text)) {
    fail_here("expression");
  }

  advance();
  const auto name = ast_.intern(text);
  if (at_struct_init_brace()) {
    auto * type = ast_.create<NamedTypeNode>(name, t.range);
    return parse_struct_init_body(type, false, t);
  }
  return ast_.create<IdentExpr>(name, t.range);
}

Expr * Parser::parse_paren_or_tuple()
{
  const Token & start = advance();
  if (match(TokenKind::RParen)) {
    return ast_.create<TupleExpr>(gsl::span<Expr *>{}, range_from(start));
  }

  Expr * first = parse_assignment();
  if (match(TokenKind::RParen)) {
    return ast_.create<ParenExpr>(first, range_from(start));
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RParen)) {
      break;
    }
    elements.push_back(parse_assignment());
  }
  expect(TokenKind::RParen, "')' or ','");
  return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_array_literal()
{
  const Token & start = advance();
  if (match(TokenKind::RBracket)) {
    return ast_.create<ArrayLiteralExpr>(gsl::span<Expr *>{}, range_from(start));
  }

  Expr * first = parse_assignment();
  if (match(TokenKind::Semicolon)) {
    Expr * count = parse_assignment();
    expect(TokenKind::RBracket, "']'");
    return ast_.create<ArrayRepeatExpr>(first, count, range_from(start));
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RBracket)) {
      break;
    }
    elements.push_back(parse_assignment());
  }
  expect(TokenKind::RBracket, "']' or ','");
  return ast_.create<ArrayLiteralExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_type_scoped_call()
{
  const Token & start = advance();  // '@'
  const Token & name_tok = cur();
  if (!at(TokenKind::Identifier) || (is_keyword(name_tok.text) && name_tok.text != "Self")) {
    fail_here("type name after '@'");
  }
  advance();

  const auto name = ast_.intern(name_tok.text);
  TypeNode * type = nullptr;
  if (at(TokenKind::Lt)) {
    const auto args = parse_generic_args();
    type = ast_.create<GenericTypeNode>(name, args, range_from(name_tok));
  } else {
    type = ast_.create<NamedTypeNode>(name, name_tok.range);
  }

  expect(TokenKind::Dot, "'.' after type");
  const auto member = expect_ident("associated function name");

  auto * call = ast_.create<TypeScopedCallExpr>(type, member, gsl::span<Expr *>{});
  if (at(TokenKind::LParen)) {
    call->args = parse_call_args();
  } else {
    call->isCall = false;
  }
  call->range_ = range_from(start);
  return call;
}

Expr * Parser::parse_struct_init_body(TypeNode * type, bool parenthesized, const Token & start)
{
  expect(TokenKind::LBrace, "'{'");
  std::vector<FieldInit *> fields;
  while (!at(TokenKind::RBrace)) {
    const Token & field_start = expect(TokenKind::Dot, "'.' before field name");
    const auto name = expect_ident("field name");
    expect(TokenKind::Eq, "'=' after field name");
    Expr * value = parse_assignment();
    fields.push_back(ast_.create<FieldInit>(name, value, range_from(field_start)));
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}' to close initializer");
  return ast_.create<StructInitExpr>(
    type, ast_.copy_to_arena(fields), parenthesized, range_from(start));
}

Expr * Parser::parse_int_literal()
{
  const Token & t = advance();
  const auto value = parse_integer_text(t.text);
  if (!value) {
    fail(t.range, fmt::format("integer literal '{}' is too large", t.text));
  }
  return ast_.create<IntLiteralExpr>(ast_.intern(t.text), *value, t.range);
}

Expr * Parser::parse_float_literal()
{
  const Token & t = advance();
  std::string digits;
  for (const char c : t.text) {
    if (c != '_') {
      digits.push_back(c);
    }
  }
  const double value = std::strtod(digits.c_str(), nullptr);
  return ast_.create<FloatLiteralExpr>(ast_.intern(t.text), value, t.range);
}

}  // namespace crusty::syntax
