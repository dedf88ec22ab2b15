// include/nick/lang/ast.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nick/lang/eval_error.hpp"

namespace nick::lang {

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

enum class UnaryOp { kNot, kNeg };

enum class BinaryOp {
  kAdd,
  kSub,
  kMul,
  kDiv,
  kMod,
  kConcat,
  kEq,
  kNeq,
  kLt,
  kLe,
  kGt,
  kGe,
  kAnd,
  kOr,
  kMerge,
};

// Metadata attached to a record field with `|` / `:`.
struct FieldMeta {
  bool is_default = false;
  bool is_optional = false;
  std::optional<std::string> doc;
  std::vector<ExprPtr> contracts;  // `| C` and `: T`, in source order
};

// A record field after dotted paths were desugared (`a.b = 1` becomes
// `a = { b = 1 }`). `value` is null for declarations such as `a | Number`.
struct FieldDef {
  std::string name;
  ExprPtr value;
  FieldMeta meta;
  SourceSpan span;
};

struct NullLit {};
struct BoolLit { bool value = false; };
struct NumberLit { double value = 0.0; };

struct StringPart {
  std::string text;   // used when expr is null
  ExprPtr expr;       // interpolated `%{ ... }`
};
struct StringLit { std::vector<StringPart> parts; };

struct ArrayLit { std::vector<ExprPtr> items; };
struct RecordLit {
  std::vector<FieldDef> fields;
  bool open = false;  // trailing `..`
};
struct DictType { ExprPtr element; };  // `{ _ : T }` / `{ _ | C }`

struct Var { std::string name; };

struct Binding {
  std::string name;
  ExprPtr value;
  SourceSpan span;
};
struct Let {
  bool rec = false;
  std::vector<Binding> bindings;
  ExprPtr body;
};

struct Fun {
  std::string param;
  ExprPtr body;
};
struct App {
  ExprPtr fn;
  ExprPtr arg;
};
struct FieldAccess {
  ExprPtr target;
  std::string field;
};
struct IfThenElse {
  ExprPtr cond;
  ExprPtr then_branch;
  ExprPtr else_branch;
};
struct Unary {
  UnaryOp op;
  ExprPtr operand;
};
struct Binary {
  BinaryOp op;
  ExprPtr lhs;
  ExprPtr rhs;
};
struct Annot {
  ExprPtr value;
  ExprPtr contract;
  bool is_type = false;  // `:` rather than `|`
};
struct Import { std::string path; };

struct Expr {
  using Node = std::variant<NullLit, BoolLit, NumberLit, StringLit, ArrayLit, RecordLit, DictType,
                            Var, Let, Fun, App, FieldAccess, IfThenElse, Unary, Binary, Annot,
                            Import>;
  Node node;
  SourceSpan span;
};

template <typename N>
ExprPtr make_expr(N node, SourceSpan span) {
  return std::make_shared<const Expr>(Expr{Expr::Node{std::move(node)}, std::move(span)});
}

}  // namespace nick::lang
