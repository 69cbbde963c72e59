#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "crusty/syntax/lexer.hpp"
#include "crusty/syntax/token.hpp"

using crusty::syntax::Lexer;
using crusty::syntax::Token;
using crusty::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds(std::string_view src)
{
  Lexer lex(src);
  std::vector<TokenKind> out;
  for (const auto & t : lex.lex_all()) {
    if (t.kind != TokenKind::Eof) {
      out.push_back(t.kind);
    }
  }
  return out;
}

const Token * first_of(const std::vector<Token> & toks, TokenKind kind)
{
  for (const auto & t : toks) {
    if (t.kind == kind) return &t;
  }
  return nullptr;
}

}  // namespace

TEST(SyntaxLexer, EmitsLineAndBlockCommentsAsTokens)
{
  const std::string_view src =
    "// line\n"
    "/* block */\n"
    "const X = 1; // trailing\n"
    "const Y = /* inline */ 2;\n";

  Lexer lex(src);
  const auto toks = lex.lex_all();

  int const_count = 0;
  int line_comment_count = 0;
  int block_comment_count = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Identifier && t.text == "const") {
      ++const_count;
    }
    if (t.kind == TokenKind::LineComment) {
      ++line_comment_count;
    }
    if (t.kind == TokenKind::BlockComment) {
      ++block_comment_count;
    }
  }
  EXPECT_EQ(const_count, 2);
  EXPECT_EQ(line_comment_count, 2);
  EXPECT_EQ(block_comment_count, 2);
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, DocCommentsCarryTheirPayload)
{
  Lexer lex("//! Module.\n/// Item docs.\r\n////// not docs\nint x;");
  const auto toks = lex.lex_all();

  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::DocModule);
  EXPECT_EQ(toks[0].text, "Module.");
  EXPECT_EQ(toks[1].kind, TokenKind::DocLine);
  EXPECT_EQ(toks[1].text, "Item docs.");
  EXPECT_EQ(toks[2].kind, TokenKind::LineComment);
}

TEST(SyntaxLexer, BasePrefixedIntegerLiterals)
{
  for (const std::string_view lit : {"0xDEADBEEF", "0b1010", "0o777", "1_000_000"}) {
    Lexer lex(lit);
    const auto toks = lex.lex_all();
    ASSERT_EQ(toks.size(), 2U) << lit;
    EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral) << lit;
    EXPECT_EQ(toks[0].text, lit);
  }
}

TEST(SyntaxLexer, InvalidBaseLiteralBecomesUnknown)
{
  Lexer lex("const X = 0o89;");
  const auto toks = lex.lex_all();
  const Token * bad = first_of(toks, TokenKind::Unknown);
  ASSERT_NE(bad, nullptr);
  EXPECT_EQ(bad->text, "0o89");
}

TEST(SyntaxLexer, FloatsAndRanges)
{
  EXPECT_EQ(kinds("3.14"), std::vector<TokenKind>{TokenKind::FloatLiteral});
  EXPECT_EQ(kinds("1e9"), std::vector<TokenKind>{TokenKind::FloatLiteral});
  EXPECT_EQ(kinds("2.5e-3"), std::vector<TokenKind>{TokenKind::FloatLiteral});
  EXPECT_EQ(
    kinds("0..10"),
    (std::vector<TokenKind>{TokenKind::IntLiteral, TokenKind::DotDot, TokenKind::IntLiteral}));
  EXPECT_EQ(
    kinds("0..=n"),
    (std::vector<TokenKind>{TokenKind::IntLiteral, TokenKind::DotDotEq, TokenKind::Identifier}));
}

TEST(SyntaxLexer, StringAndCharPayloadsExcludeQuotes)
{
  Lexer lex(R"("a \"b\"" 'c' '\n')");
  const auto toks = lex.lex_all();
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::StringLiteral);
  EXPECT_EQ(toks[0].text, R"(a \"b\")");
  EXPECT_EQ(toks[0].range.get_begin().get_offset(), 0U);
  EXPECT_EQ(toks[1].kind, TokenKind::CharLiteral);
  EXPECT_EQ(toks[1].text, "c");
  EXPECT_EQ(toks[2].text, R"(\n)");
}

TEST(SyntaxLexer, RawNewlineInStringIsAnError)
{
  Lexer lex("const X = \"hello\nworld\";");
  const auto toks = lex.lex_all();
  const Token * bad = first_of(toks, TokenKind::Error);
  ASSERT_NE(bad, nullptr);
  EXPECT_EQ(bad->text.front(), '"');
}

TEST(SyntaxLexer, UnterminatedBlockCommentIsAnError)
{
  Lexer lex("int x; /* never closed");
  const auto toks = lex.lex_all();
  EXPECT_NE(first_of(toks, TokenKind::Error), nullptr);
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, EmptyCharLiteralIsAnError)
{
  EXPECT_EQ(kinds("''"), std::vector<TokenKind>{TokenKind::Error});
}

TEST(SyntaxLexer, ShiftRightIsTwoTokens)
{
  EXPECT_EQ(kinds(">>"), (std::vector<TokenKind>{TokenKind::Gt, TokenKind::Gt}));
  EXPECT_EQ(kinds(">>="), (std::vector<TokenKind>{TokenKind::Gt, TokenKind::Ge}));
  EXPECT_EQ(kinds("<<="), std::vector<TokenKind>{TokenKind::ShlEq});
}

TEST(SyntaxLexer, LongestOperatorWins)
{
  EXPECT_EQ(
    kinds("a->b ++c --d"),
    (std::vector<TokenKind>{
      TokenKind::Identifier, TokenKind::Arrow, TokenKind::Identifier, TokenKind::PlusPlus,
      TokenKind::Identifier, TokenKind::MinusMinus, TokenKind::Identifier}));
  EXPECT_EQ(
    kinds("@Vec::new"),
    (std::vector<TokenKind>{
      TokenKind::At, TokenKind::Identifier, TokenKind::ColonColon, TokenKind::Identifier}));
}

TEST(SyntaxLexer, MacroNamesAreIdentifiers)
{
  Lexer lex("#define __MAX__(a, b)");
  const auto toks = lex.lex_all();
  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::Hash);
  EXPECT_EQ(toks[1].text, "define");
  EXPECT_EQ(toks[2].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[2].text, "__MAX__");
}

TEST(SyntaxLexer, RangesAreByteOffsets)
{
  Lexer lex("let  value");
  const auto toks = lex.lex_all();
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[1].begin(), 5U);
  EXPECT_EQ(toks[1].end(), 10U);
  EXPECT_EQ(toks[2].begin(), 10U);
}
