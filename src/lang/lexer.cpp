// src/lang/lexer.cpp
#include "nick/lang/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace nick::lang {
namespace {

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_continue(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\'' || c == '-';
}

const std::unordered_map<std::string, TokenKind>& keywords() {
  static const std::unordered_map<std::string, TokenKind> kKeywords = {
      {"let", TokenKind::kLet},       {"rec", TokenKind::kRec},     {"in", TokenKind::kIn},
      {"fun", TokenKind::kFun},       {"if", TokenKind::kIf},       {"then", TokenKind::kThen},
      {"else", TokenKind::kElse},     {"import", TokenKind::kImport},
      {"true", TokenKind::kTrue},     {"false", TokenKind::kFalse}, {"null", TokenKind::kNull},
  };
  return kKeywords;
}

// Multiline strings drop the line holding the opening delimiter and the line
// holding the closing one when those are blank, then strip the indentation
// common to every non-blank line.
std::string strip_indentation(const std::string& raw) {
  std::vector<std::string> lines;
  std::stringstream ss(raw);
  std::string line;
  while (std::getline(ss, line)) lines.push_back(line);
  if (!raw.empty() && raw.back() == '\n') lines.emplace_back();

  auto blank = [](const std::string& l) {
    return std::all_of(l.begin(), l.end(), [](char c) { return c == ' ' || c == '\t'; });
  };

  if (!lines.empty() && blank(lines.front())) lines.erase(lines.begin());
  if (!lines.empty() && blank(lines.back())) lines.pop_back();

  std::size_t indent = std::string::npos;
  for (const auto& l : lines) {
    if (blank(l)) continue;
    const std::size_t n = l.find_first_not_of(" \t");
    indent = std::min(indent, n);
  }
  if (indent == std::string::npos) indent = 0;

  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out += '\n';
    if (lines[i].size() >= indent) out += lines[i].substr(indent);
  }
  return out;
}

}  // namespace

const char* describe(TokenKind kind) noexcept {
  switch (kind) {
    case TokenKind::kEnd: return "end of input";
    case TokenKind::kIdent: return "identifier";
    case TokenKind::kNumber: return "number";
    case TokenKind::kString: return "string";
    case TokenKind::kLet: return "`let`";
    case TokenKind::kRec: return "`rec`";
    case TokenKind::kIn: return "`in`";
    case TokenKind::kFun: return "`fun`";
    case TokenKind::kIf: return "`if`";
    case TokenKind::kThen: return "`then`";
    case TokenKind::kElse: return "`else`";
    case TokenKind::kImport: return "`import`";
    case TokenKind::kTrue: return "`true`";
    case TokenKind::kFalse: return "`false`";
    case TokenKind::kNull: return "`null`";
    case TokenKind::kLBrace: return "`{`";
    case TokenKind::kRBrace: return "`}`";
    case TokenKind::kLBracket: return "`[`";
    case TokenKind::kRBracket: return "`]`";
    case TokenKind::kLParen: return "`(`";
    case TokenKind::kRParen: return "`)`";
    case TokenKind::kComma: return "`,`";
    case TokenKind::kSemicolon: return "`;`";
    case TokenKind::kDot: return "`.`";
    case TokenKind::kDotDot: return "`..`";
    case TokenKind::kEquals: return "`=`";
    case TokenKind::kPipe: return "`|`";
    case TokenKind::kColon: return "`:`";
    case TokenKind::kArrow: return "`=>`";
    case TokenKind::kAmp: return "`&`";
    case TokenKind::kPlus: return "`+`";
    case TokenKind::kPlusPlus: return "`++`";
    case TokenKind::kMinus: return "`-`";
    case TokenKind::kStar: return "`*`";
    case TokenKind::kSlash: return "`/`";
    case TokenKind::kPercent: return "`%`";
    case TokenKind::kEqEq: return "`==`";
    case TokenKind::kBangEq: return "`!=`";
    case TokenKind::kLess: return "`<`";
    case TokenKind::kLessEq: return "`<=`";
    case TokenKind::kGreater: return "`>`";
    case TokenKind::kGreaterEq: return "`>=`";
    case TokenKind::kAndAnd: return "`&&`";
    case TokenKind::kOrOr: return "`||`";
    case TokenKind::kBang: return "`!`";
  }
  return "token";
}

Lexer::Lexer(const std::string& source, SourceSpan origin)
    : src_(source), file_(std::move(origin.file)) {
  if (origin.known()) {
    line_ = origin.line;
    column_ = origin.column;
  }
}

char Lexer::peek(std::size_t ahead) const noexcept {
  const std::size_t i = pos_ + ahead;
  return i < src_.size() ? src_[i] : '\0';
}

char Lexer::advance() {
  const char c = src_[pos_++];
  if (c == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return c;
}

SourceSpan Lexer::here() const { return SourceSpan{file_, line_, column_}; }

void Lexer::fail(const std::string& msg, const SourceSpan& at) const {
  throw SyntaxError{msg, at};
}

void Lexer::skip_trivia() {
  while (!at_end()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else if (c == '#') {
      while (!at_end() && peek() != '\n') advance();
    } else {
      return;
    }
  }
}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> out;

  while (true) {
    skip_trivia();
    if (at_end()) {
      Token end;
      end.kind = TokenKind::kEnd;
      end.span = here();
      out.push_back(std::move(end));
      return out;
    }

    const char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) {
      out.push_back(lex_number());
      continue;
    }
    if (c == 'm' && peek(1) == '%' && peek(2) == '"') {
      out.push_back(lex_multiline_string());
      continue;
    }
    if (is_ident_start(c)) {
      out.push_back(lex_ident_or_keyword());
      continue;
    }
    if (c == '"') {
      out.push_back(lex_string());
      continue;
    }

    Token t;
    t.span = here();

    struct Op {
      const char* spelling;
      TokenKind kind;
    };
    // Longest spellings first.
    static constexpr Op kOps[] = {
        {"..", TokenKind::kDotDot},   {"=>", TokenKind::kArrow},    {"==", TokenKind::kEqEq},
        {"!=", TokenKind::kBangEq},   {"<=", TokenKind::kLessEq},   {">=", TokenKind::kGreaterEq},
        {"&&", TokenKind::kAndAnd},   {"||", TokenKind::kOrOr},     {"++", TokenKind::kPlusPlus},
        {"{", TokenKind::kLBrace},    {"}", TokenKind::kRBrace},    {"[", TokenKind::kLBracket},
        {"]", TokenKind::kRBracket},  {"(", TokenKind::kLParen},    {")", TokenKind::kRParen},
        {",", TokenKind::kComma},     {";", TokenKind::kSemicolon}, {".", TokenKind::kDot},
        {"=", TokenKind::kEquals},    {"|", TokenKind::kPipe},      {":", TokenKind::kColon},
        {"&", TokenKind::kAmp},       {"+", TokenKind::kPlus},      {"-", TokenKind::kMinus},
        {"*", TokenKind::kStar},      {"/", TokenKind::kSlash},     {"%", TokenKind::kPercent},
        {"<", TokenKind::kLess},      {">", TokenKind::kGreater},   {"!", TokenKind::kBang},
    };

    bool matched = false;
    for (const auto& op : kOps) {
      const std::string spelling{op.spelling};
      if (src_.compare(pos_, spelling.size(), spelling) == 0) {
        for (std::size_t i = 0; i < spelling.size(); ++i) advance();
        t.kind = op.kind;
        t.text = spelling;
        matched = true;
        break;
      }
    }
    if (!matched) {
      fail(std::string("unexpected character '") + c + "'", t.span);
    }
    out.push_back(std::move(t));
  }
}

Token Lexer::lex_number() {
  Token t;
  t.kind = TokenKind::kNumber;
  t.span = here();

  const std::size_t start = pos_;
  while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
    advance();
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    const char sign = peek(1);
    const bool signed_exp = (sign == '+' || sign == '-');
    if (std::isdigit(static_cast<unsigned char>(peek(signed_exp ? 2 : 1)))) {
      advance();
      if (signed_exp) advance();
      while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }
  }

  t.text = src_.substr(start, pos_ - start);
  t.number = std::strtod(t.text.c_str(), nullptr);
  return t;
}

Token Lexer::lex_ident_or_keyword() {
  Token t;
  t.span = here();
  const std::size_t start = pos_;
  advance();
  while (!at_end() && is_ident_continue(peek())) advance();
  t.text = src_.substr(start, pos_ - start);

  const auto& kw = keywords();
  const auto it = kw.find(t.text);
  t.kind = (it == kw.end()) ? TokenKind::kIdent : it->second;
  return t;
}

std::string Lexer::take_interpolation() {
  const SourceSpan start = here();
  std::string out;
  int depth = 1;
  while (true) {
    if (at_end()) fail("unterminated string interpolation", start);
    const char c = peek();
    if (c == '"') {
      // Nested plain string inside the interpolated expression.
      out += advance();
      while (!at_end() && peek() != '"') {
        if (peek() == '\\') out += advance();
        if (!at_end()) out += advance();
      }
      if (at_end()) fail("unterminated string literal", start);
      out += advance();
      continue;
    }
    if (c == '{') ++depth;
    if (c == '}') {
      --depth;
      if (depth == 0) {
        advance();
        return out;
      }
    }
    out += advance();
  }
}

Token Lexer::lex_string() {
  Token t;
  t.kind = TokenKind::kString;
  t.span = here();
  advance();  // opening quote

  StringChunk literal;
  while (true) {
    if (at_end() || peek() == '\n') fail("unterminated string literal", t.span);
    const char c = peek();
    if (c == '"') {
      advance();
      break;
    }
    if (c == '%' && peek(1) == '{') {
      advance();
      advance();
      if (!literal.text.empty()) {
        t.chunks.push_back(std::move(literal));
        literal = StringChunk{};
      }
      StringChunk expr;
      expr.is_expr = true;
      expr.start = here();
      expr.text = take_interpolation();
      t.chunks.push_back(std::move(expr));
      continue;
    }
    if (c == '\\') {
      const SourceSpan esc_at = here();
      advance();
      if (at_end()) fail("unterminated escape sequence", esc_at);
      const char e = advance();
      switch (e) {
        case 'n': literal.text += '\n'; break;
        case 't': literal.text += '\t'; break;
        case 'r': literal.text += '\r'; break;
        case '"': literal.text += '"'; break;
        case '\\': literal.text += '\\'; break;
        case '%': literal.text += '%'; break;
        default: fail(std::string("unknown escape sequence '\\") + e + "'", esc_at);
      }
      continue;
    }
    literal.text += advance();
  }

  if (!literal.text.empty() || t.chunks.empty()) t.chunks.push_back(std::move(literal));
  return t;
}

Token Lexer::lex_multiline_string() {
  Token t;
  t.kind = TokenKind::kString;
  t.span = here();
  advance();  // m
  advance();  // %
  advance();  // "

  std::string raw;
  while (true) {
    if (at_end()) fail("unterminated multiline string", t.span);
    if (peek() == '"' && peek(1) == '%') {
      advance();
      advance();
      break;
    }
    raw += advance();
  }

  const std::string body = strip_indentation(raw);

  // Split into literal text and `%{ ... }` interpolations. Interpolated
  // sources are reported at the position of the string itself.
  StringChunk literal;
  std::size_t i = 0;
  while (i < body.size()) {
    if (body[i] == '%' && i + 1 < body.size() && body[i + 1] == '{') {
      std::size_t j = i + 2;
      int depth = 1;
      while (j < body.size() && depth > 0) {
        if (body[j] == '{') ++depth;
        if (body[j] == '}') --depth;
        if (depth > 0) ++j;
      }
      if (depth != 0) fail("unterminated string interpolation", t.span);
      if (!literal.text.empty()) {
        t.chunks.push_back(std::move(literal));
        literal = StringChunk{};
      }
      StringChunk expr;
      expr.is_expr = true;
      expr.start = t.span;
      expr.text = body.substr(i + 2, j - (i + 2));
      t.chunks.push_back(std::move(expr));
      i = j + 1;
      continue;
    }
    literal.text += body[i++];
  }

  if (!literal.text.empty() || t.chunks.empty()) t.chunks.push_back(std::move(literal));
  return t;
}

}  // namespace nick::lang
