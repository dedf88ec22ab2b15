// include/nick/lang/value.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nick/lang/ast.hpp"

namespace nick::lang {

struct Value;
using ValuePtr = std::shared_ptr<const Value>;

// Lazily computed value. Thunks, environment frames and record bodies are
// owned by the Evaluator's arena and referenced by raw pointer, so recursive
// records and `let rec` never form shared_ptr cycles.
struct Thunk {
  enum class State { kPending, kForcing, kDone };

  std::function<ValuePtr()> compute;
  ValuePtr value;
  State state = State::kPending;
  SourceSpan span;
};

struct RecordData;

// A frame binds either one name to a thunk, or every field of a record
// (`record` set, `name` and `thunk` unused). Record frames make the fields of
// the record a field lives in visible to its definition.
struct EnvFrame {
  std::string name;
  Thunk* thunk = nullptr;
  const EnvFrame* parent = nullptr;
  RecordData* record = nullptr;
};
using Env = const EnvFrame*;

// Builds a field's thunk for the record that ends up owning it. Fields are
// bound late: after `a & b`, a field of `a` sees the merged siblings, so a
// `| default` overridden in `b` is overridden for every reference in `a`.
using Binder = std::function<Thunk*(RecordData* self)>;

struct Field {
  Binder value;                    // empty: declared but not defined
  std::vector<Binder> contracts;   // each forces to a contract value
  bool is_default = false;
  bool is_optional = false;
  std::optional<std::string> doc;
  SourceSpan span;

  Thunk* checked = nullptr;        // value bound to the owner, contracts applied
};

struct RecordData {
  std::map<std::string, Field> fields;
  bool open = false;
};

struct ArrayValue { std::vector<Thunk*> items; };
struct RecordValue { RecordData* data = nullptr; };

struct Closure {
  std::string param;
  ExprPtr body;
  Env env = nullptr;
};

struct Contract {
  enum class Kind { kNumber, kString, kBool, kDyn, kArray, kDict };
  Kind kind = Kind::kDyn;
  ValuePtr element;  // kArray / kDict only
};

// Built-in functions available in the prelude.
struct Builtin {
  enum class Kind { kArrayOf };  // `Array C`
  Kind kind = Kind::kArrayOf;
};

struct Value {
  using Node = std::variant<std::monostate, bool, double, std::string, ArrayValue, RecordValue,
                            Closure, Contract, Builtin>;
  Node node;
};

template <typename N>
ValuePtr make_value(N node) {
  return std::make_shared<const Value>(Value{Value::Node{std::move(node)}});
}

// "Null", "Bool", "Number", "String", "Array", "Record", "Function", "Contract"
const char* type_name(const Value& v) noexcept;

}  // namespace nick::lang
