// crusty/syntax/lexer.hpp - Source text to token stream
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "crusty/syntax/token.hpp"

namespace crusty::syntax
{

/**
 * Hand-written lexer. Comments are emitted as tokens so that the parser can
 * pick up doc comments; lexical problems are emitted as Error/Unknown
 * tokens and reported by the parser.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  /// Tokenize the whole input. The last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();
  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_quoted(char quote);
  [[nodiscard]] Token lex_punctuation();

  [[nodiscard]] Token make(TokenKind kind, size_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace crusty::syntax
