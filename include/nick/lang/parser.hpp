// include/nick/lang/parser.hpp
#pragma once

#include <string>
#include <vector>

#include "nick/lang/ast.hpp"
#include "nick/lang/lexer.hpp"

namespace nick::lang {

// Recursive-descent parser for the supported Nickel subset.
// Precedence, loosest first:
//   let / fun / if  <  `|` `:`  <  `&`  <  `||`  <  `&&`  <  `==` `!=`
//   <  `<` `<=` `>` `>=`  <  `+` `-` `++`  <  `*` `/` `%`  <  unary `!` `-`
//   <  application  <  field access
// Throws SyntaxError.
class Parser {
 public:
  explicit Parser(std::vector<Token> tokens);

  // Whole program: one expression followed by end of input.
  ExprPtr parse_program();

  static ExprPtr parse_source(const std::string& source, const SourceSpan& origin);

 private:
  [[nodiscard]] const Token& peek(std::size_t ahead = 0) const;
  const Token& advance();
  [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }
  bool accept(TokenKind kind);
  const Token& expect(TokenKind kind, const char* context);
  [[noreturn]] void fail_here(const std::string& expected) const;
  // Enters one nesting level; throws SyntaxError past the limit.
  void nest();

  ExprPtr parse_expr();
  ExprPtr parse_annot();
  ExprPtr parse_merge();
  ExprPtr parse_or();
  ExprPtr parse_and();
  ExprPtr parse_equality();
  ExprPtr parse_comparison();
  ExprPtr parse_additive();
  ExprPtr parse_multiplicative();
  ExprPtr parse_unary();
  ExprPtr parse_application();
  ExprPtr parse_postfix();
  ExprPtr parse_atom();

  ExprPtr parse_let();
  ExprPtr parse_fun();
  ExprPtr parse_if();
  ExprPtr parse_array();
  ExprPtr parse_record();
  ExprPtr parse_string(const Token& tok);

  FieldDef parse_field();
  std::string parse_field_name();
  std::string literal_string(const Token& tok, const char* context) const;

  [[nodiscard]] bool starts_atom() const;

  std::vector<Token> tokens_;
  std::size_t pos_ = 0;
  int depth_ = 0;
};

}  // namespace nick::lang
