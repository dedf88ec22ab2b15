// src/lang/parser.cpp
#include "nick/lang/parser.hpp"

#include <utility>

namespace nick::lang {
namespace {

// Nesting levels (sub-expressions, operator chains, dotted paths) a program
// may use before it is rejected; keeps the parser, evaluator and AST
// destructor within the native stack.
constexpr int kMaxNesting = 1000;

// Restores the nesting depth when a parse function returns.
struct NestingScope {
  explicit NestingScope(int& depth) : depth_(depth), saved_(depth) {}
  ~NestingScope() { depth_ = saved_; }
  NestingScope(const NestingScope&) = delete;
  NestingScope& operator=(const NestingScope&) = delete;

 private:
  int& depth_;
  int saved_;
};

std::string found(const Token& tok) {
  switch (tok.kind) {
    case TokenKind::kIdent: return "identifier `" + tok.text + "`";
    case TokenKind::kNumber: return "number `" + tok.text + "`";
    default: return describe(tok.kind);
  }
}

}  // namespace

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  if (tokens_.empty() || tokens_.back().kind != TokenKind::kEnd) {
    tokens_.push_back(Token{});
  }
}

ExprPtr Parser::parse_source(const std::string& source, const SourceSpan& origin) {
  Lexer lexer(source, origin);
  Parser parser(lexer.tokenize());
  return parser.parse_program();
}

const Token& Parser::peek(std::size_t ahead) const {
  const std::size_t i = pos_ + ahead;
  return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

const Token& Parser::advance() {
  const Token& t = peek();
  if (pos_ < tokens_.size() - 1) ++pos_;
  return t;
}

bool Parser::accept(TokenKind kind) {
  if (!check(kind)) return false;
  advance();
  return true;
}

const Token& Parser::expect(TokenKind kind, const char* context) {
  if (!check(kind)) {
    std::string what = describe(kind);
    if (context != nullptr && *context != '\0') what += std::string(" ") + context;
    fail_here(what);
  }
  return advance();
}

void Parser::nest() {
  if (++depth_ > kMaxNesting) {
    throw SyntaxError{"expression nested too deeply", peek().span};
  }
}

void Parser::fail_here(const std::string& expected) const {
  throw SyntaxError{"expected " + expected + ", found " + found(peek()), peek().span};
}

ExprPtr Parser::parse_program() {
  ExprPtr e = parse_expr();
  if (!check(TokenKind::kEnd)) fail_here("end of input");
  return e;
}

ExprPtr Parser::parse_expr() {
  const NestingScope scope(depth_);
  nest();
  switch (peek().kind) {
    case TokenKind::kLet: return parse_let();
    case TokenKind::kFun: return parse_fun();
    case TokenKind::kIf: return parse_if();
    default: return parse_annot();
  }
}

ExprPtr Parser::parse_annot() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_merge();
  while (check(TokenKind::kPipe) || check(TokenKind::kColon)) {
    nest();
    const Token op = advance();
    ExprPtr contract = parse_merge();
    lhs = make_expr(Annot{lhs, contract, op.kind == TokenKind::kColon}, op.span);
  }
  return lhs;
}

ExprPtr Parser::parse_merge() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_or();
  while (check(TokenKind::kAmp)) {
    nest();
    const SourceSpan at = advance().span;
    lhs = make_expr(Binary{BinaryOp::kMerge, lhs, parse_or()}, at);
  }
  return lhs;
}

ExprPtr Parser::parse_or() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_and();
  while (check(TokenKind::kOrOr)) {
    nest();
    const SourceSpan at = advance().span;
    lhs = make_expr(Binary{BinaryOp::kOr, lhs, parse_and()}, at);
  }
  return lhs;
}

ExprPtr Parser::parse_and() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_equality();
  while (check(TokenKind::kAndAnd)) {
    nest();
    const SourceSpan at = advance().span;
    lhs = make_expr(Binary{BinaryOp::kAnd, lhs, parse_equality()}, at);
  }
  return lhs;
}

ExprPtr Parser::parse_equality() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_comparison();
  while (check(TokenKind::kEqEq) || check(TokenKind::kBangEq)) {
    nest();
    const Token op = advance();
    const BinaryOp bop = op.kind == TokenKind::kEqEq ? BinaryOp::kEq : BinaryOp::kNeq;
    lhs = make_expr(Binary{bop, lhs, parse_comparison()}, op.span);
  }
  return lhs;
}

ExprPtr Parser::parse_comparison() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_additive();
  while (true) {
    BinaryOp bop;
    switch (peek().kind) {
      case TokenKind::kLess: bop = BinaryOp::kLt; break;
      case TokenKind::kLessEq: bop = BinaryOp::kLe; break;
      case TokenKind::kGreater: bop = BinaryOp::kGt; break;
      case TokenKind::kGreaterEq: bop = BinaryOp::kGe; break;
      default: return lhs;
    }
    nest();
    const SourceSpan at = advance().span;
    lhs = make_expr(Binary{bop, lhs, parse_additive()}, at);
  }
}

ExprPtr Parser::parse_additive() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_multiplicative();
  while (true) {
    BinaryOp bop;
    switch (peek().kind) {
      case TokenKind::kPlus: bop = BinaryOp::kAdd; break;
      case TokenKind::kMinus: bop = BinaryOp::kSub; break;
      case TokenKind::kPlusPlus: bop = BinaryOp::kConcat; break;
      default: return lhs;
    }
    nest();
    const SourceSpan at = advance().span;
    lhs = make_expr(Binary{bop, lhs, parse_multiplicative()}, at);
  }
}

ExprPtr Parser::parse_multiplicative() {
  const NestingScope scope(depth_);
  ExprPtr lhs = parse_unary();
  while (true) {
    BinaryOp bop;
    switch (peek().kind) {
      case TokenKind::kStar: bop = BinaryOp::kMul; break;
      case TokenKind::kSlash: bop = BinaryOp::kDiv; break;
      case TokenKind::kPercent: bop = BinaryOp::kMod; break;
      default: return lhs;
    }
    nest();
    const SourceSpan at = advance().span;
    lhs = make_expr(Binary{bop, lhs, parse_unary()}, at);
  }
}

ExprPtr Parser::parse_unary() {
  const NestingScope scope(depth_);
  nest();
  if (check(TokenKind::kBang)) {
    const SourceSpan at = advance().span;
    return make_expr(Unary{UnaryOp::kNot, parse_unary()}, at);
  }
  if (check(TokenKind::kMinus)) {
    const SourceSpan at = advance().span;
    return make_expr(Unary{UnaryOp::kNeg, parse_unary()}, at);
  }
  return parse_application();
}

bool Parser::starts_atom() const {
  switch (peek().kind) {
    case TokenKind::kIdent:
    case TokenKind::kNumber:
    case TokenKind::kString:
    case TokenKind::kTrue:
    case TokenKind::kFalse:
    case TokenKind::kNull:
    case TokenKind::kLParen:
    case TokenKind::kLBracket:
    case TokenKind::kLBrace:
    case TokenKind::kImport:
      return true;
    default:
      return false;
  }
}

ExprPtr Parser::parse_application() {
  const NestingScope scope(depth_);
  ExprPtr fn = parse_postfix();
  while (starts_atom()) {
    nest();
    const SourceSpan at = peek().span;
    fn = make_expr(App{fn, parse_postfix()}, at);
  }
  return fn;
}

ExprPtr Parser::parse_postfix() {
  const NestingScope scope(depth_);
  ExprPtr target = parse_atom();
  while (check(TokenKind::kDot)) {
    nest();
    const SourceSpan at = advance().span;
    std::string name;
    if (check(TokenKind::kIdent)) {
      name = advance().text;
    } else if (check(TokenKind::kString)) {
      name = literal_string(advance(), "as a field name");
    } else {
      fail_here("a field name after `.`");
    }
    target = make_expr(FieldAccess{target, std::move(name)}, at);
  }
  return target;
}

ExprPtr Parser::parse_atom() {
  const Token& tok = peek();
  switch (tok.kind) {
    case TokenKind::kNull: {
      const SourceSpan at = advance().span;
      return make_expr(NullLit{}, at);
    }
    case TokenKind::kTrue:
    case TokenKind::kFalse: {
      const Token t = advance();
      return make_expr(BoolLit{t.kind == TokenKind::kTrue}, t.span);
    }
    case TokenKind::kNumber: {
      const Token t = advance();
      return make_expr(NumberLit{t.number}, t.span);
    }
    case TokenKind::kString: {
      const Token t = advance();
      return parse_string(t);
    }
    case TokenKind::kIdent: {
      const Token t = advance();
      return make_expr(Var{t.text}, t.span);
    }
    case TokenKind::kImport: {
      const SourceSpan at = advance().span;
      if (!check(TokenKind::kString)) fail_here("a path string after `import`");
      std::string path = literal_string(advance(), "as an import path");
      return make_expr(Import{std::move(path)}, at);
    }
    case TokenKind::kLParen: {
      advance();
      ExprPtr inner = parse_expr();
      expect(TokenKind::kRParen, "to close the parenthesized expression");
      return inner;
    }
    case TokenKind::kLBracket: return parse_array();
    case TokenKind::kLBrace: return parse_record();
    case TokenKind::kLet: return parse_let();
    case TokenKind::kFun: return parse_fun();
    case TokenKind::kIf: return parse_if();
    default: fail_here("an expression");
  }
}

ExprPtr Parser::parse_let() {
  const SourceSpan at = expect(TokenKind::kLet, nullptr).span;
  Let let;
  let.rec = accept(TokenKind::kRec);

  do {
    const Token name = expect(TokenKind::kIdent, "to name the let binding");
    std::vector<std::pair<ExprPtr, bool>> annots;
    while (check(TokenKind::kPipe) || check(TokenKind::kColon)) {
      const bool is_type = advance().kind == TokenKind::kColon;
      annots.emplace_back(parse_merge(), is_type);
    }
    expect(TokenKind::kEquals, "in let binding");
    ExprPtr value = parse_expr();
    for (auto& [contract, is_type] : annots) {
      value = make_expr(Annot{value, contract, is_type}, name.span);
    }
    let.bindings.push_back(Binding{name.text, value, name.span});
  } while (accept(TokenKind::kComma));

  expect(TokenKind::kIn, "after let bindings");
  let.body = parse_expr();
  return make_expr(std::move(let), at);
}

ExprPtr Parser::parse_fun() {
  const SourceSpan at = expect(TokenKind::kFun, nullptr).span;
  const NestingScope scope(depth_);
  std::vector<std::string> params;
  while (check(TokenKind::kIdent)) {
    nest();
    params.push_back(advance().text);
  }
  if (params.empty()) fail_here("a parameter name");
  expect(TokenKind::kArrow, "after function parameters");

  ExprPtr body = parse_expr();
  for (auto it = params.rbegin(); it != params.rend(); ++it) {
    body = make_expr(Fun{*it, body}, at);
  }
  return body;
}

ExprPtr Parser::parse_if() {
  const SourceSpan at = expect(TokenKind::kIf, nullptr).span;
  ExprPtr cond = parse_expr();
  expect(TokenKind::kThen, "after the condition");
  ExprPtr then_branch = parse_expr();
  expect(TokenKind::kElse, "in if expression");
  ExprPtr else_branch = parse_expr();
  return make_expr(IfThenElse{cond, then_branch, else_branch}, at);
}

ExprPtr Parser::parse_array() {
  const SourceSpan at = expect(TokenKind::kLBracket, nullptr).span;
  ArrayLit arr;
  while (!check(TokenKind::kRBracket)) {
    arr.items.push_back(parse_expr());
    if (!accept(TokenKind::kComma)) break;
  }
  expect(TokenKind::kRBracket, "to close the array");
  return make_expr(std::move(arr), at);
}

ExprPtr Parser::parse_record() {
  const SourceSpan at = expect(TokenKind::kLBrace, nullptr).span;

  // `{ _ : T }` / `{ _ | C }`: dictionary contract.
  if (check(TokenKind::kIdent) && peek().text == "_" &&
      (peek(1).kind == TokenKind::kColon || peek(1).kind == TokenKind::kPipe)) {
    advance();
    advance();
    ExprPtr element = parse_merge();
    accept(TokenKind::kComma);
    expect(TokenKind::kRBrace, "to close the dictionary type");
    return make_expr(DictType{element}, at);
  }

  RecordLit rec;
  while (!check(TokenKind::kRBrace)) {
    if (accept(TokenKind::kDotDot)) {
      rec.open = true;
      break;
    }
    rec.fields.push_back(parse_field());
    if (!accept(TokenKind::kComma)) break;
  }
  expect(TokenKind::kRBrace, "to close the record");
  return make_expr(std::move(rec), at);
}

std::string Parser::parse_field_name() {
  if (check(TokenKind::kIdent)) return advance().text;
  if (check(TokenKind::kString)) return literal_string(advance(), "as a field name");
  fail_here("a field name");
}

FieldDef Parser::parse_field() {
  const SourceSpan at = peek().span;

  const NestingScope scope(depth_);
  std::vector<std::string> path;
  path.push_back(parse_field_name());
  while (accept(TokenKind::kDot)) {
    nest();
    path.push_back(parse_field_name());
  }

  FieldMeta meta;
  while (check(TokenKind::kPipe) || check(TokenKind::kColon)) {
    if (advance().kind == TokenKind::kColon) {
      meta.contracts.push_back(parse_merge());
      continue;
    }
    if (check(TokenKind::kIdent) && peek().text == "default") {
      advance();
      meta.is_default = true;
    } else if (check(TokenKind::kIdent) && peek().text == "optional") {
      advance();
      meta.is_optional = true;
    } else if (check(TokenKind::kIdent) && peek().text == "doc") {
      advance();
      if (!check(TokenKind::kString)) fail_here("a documentation string after `doc`");
      meta.doc = literal_string(advance(), "as documentation");
    } else {
      meta.contracts.push_back(parse_merge());
    }
  }

  ExprPtr value;
  if (accept(TokenKind::kEquals)) value = parse_expr();

  // Desugar `a.b.c = v` into `a = { b = { c = v } }`.
  FieldDef field{path.back(), value, std::move(meta), at};
  for (std::size_t i = path.size() - 1; i > 0; --i) {
    RecordLit wrapper;
    wrapper.fields.push_back(std::move(field));
    field = FieldDef{path[i - 1], make_expr(std::move(wrapper), at), FieldMeta{}, at};
  }
  return field;
}

std::string Parser::literal_string(const Token& tok, const char* context) const {
  if (tok.chunks.size() > 1 || (tok.chunks.size() == 1 && tok.chunks.front().is_expr)) {
    throw SyntaxError{std::string("interpolated strings are not supported ") + context, tok.span};
  }
  return tok.chunks.empty() ? std::string{} : tok.chunks.front().text;
}

ExprPtr Parser::parse_string(const Token& tok) {
  StringLit lit;
  for (const auto& chunk : tok.chunks) {
    if (!chunk.is_expr) {
      lit.parts.push_back(StringPart{chunk.text, nullptr});
      continue;
    }
    // Interpolations continue at the current depth.
    Lexer lexer(chunk.text, chunk.start);
    Parser inner(lexer.tokenize());
    inner.depth_ = depth_;
    lit.parts.push_back(StringPart{{}, inner.parse_program()});
  }
  return make_expr(std::move(lit), tok.span);
}

}  // namespace nick::lang
