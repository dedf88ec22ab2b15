// include/nick/lang/lexer.hpp
#pragma once

#include <string>
#include <vector>

#include "nick/lang/eval_error.hpp"

namespace nick::lang {

enum class TokenKind {
  kEnd,
  kIdent,
  kNumber,
  kString,  // plain or multiline; see Token::chunks

  // keywords
  kLet,
  kRec,
  kIn,
  kFun,
  kIf,
  kThen,
  kElse,
  kImport,
  kTrue,
  kFalse,
  kNull,

  // punctuation / operators
  kLBrace,
  kRBrace,
  kLBracket,
  kRBracket,
  kLParen,
  kRParen,
  kComma,
  kSemicolon,
  kDot,
  kDotDot,
  kEquals,
  kPipe,
  kColon,
  kArrow,  // =>
  kAmp,    // & (merge)
  kPlus,
  kPlusPlus,
  kMinus,
  kStar,
  kSlash,
  kPercent,
  kEqEq,
  kBangEq,
  kLess,
  kLessEq,
  kGreater,
  kGreaterEq,
  kAndAnd,
  kOrOr,
  kBang,
};

// A piece of a string literal: either literal text or the raw source of an
// interpolated `%{ ... }` expression together with where that source starts.
struct StringChunk {
  bool is_expr = false;
  std::string text;
  SourceSpan start;
};

struct Token {
  TokenKind kind = TokenKind::kEnd;
  std::string text;  // identifier name / number spelling / operator spelling
  double number = 0.0;
  std::vector<StringChunk> chunks;
  SourceSpan span;
};

const char* describe(TokenKind kind) noexcept;

// Raised by the lexer and parser; surfaced as an EvalError of kind kParse.
struct SyntaxError {
  std::string message;
  SourceSpan span;
};

// Tokenizes a whole buffer up-front. Throws SyntaxError on malformed input.
class Lexer {
 public:
  Lexer(const std::string& source, SourceSpan origin);

  std::vector<Token> tokenize();

 private:
  [[nodiscard]] bool at_end() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept;
  char advance();
  [[nodiscard]] SourceSpan here() const;

  void skip_trivia();
  Token lex_number();
  Token lex_ident_or_keyword();
  Token lex_string();
  Token lex_multiline_string();
  std::string take_interpolation();

  [[noreturn]] void fail(const std::string& msg, const SourceSpan& at) const;

  const std::string& src_;
  std::string file_;
  std::size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
};

}  // namespace nick::lang
