// include/nick/lang/evaluator.hpp
#pragma once

#include <deque>
#include <filesystem>
#include <map>
#include <string>

#include <yaml-cpp/yaml.h>

#include "nick/lang/ast.hpp"
#include "nick/lang/eval_error.hpp"
#include "nick/lang/value.hpp"

namespace nick::lang {

// Internal unwinding type. Never escapes Program.
struct EvalFailure {
  EvalError error;
};

// Call-by-need interpreter. One Evaluator per program run: it owns every
// thunk, environment frame and record body created during evaluation.
class Evaluator {
 public:
  Evaluator();

  Evaluator(const Evaluator&) = delete;
  Evaluator& operator=(const Evaluator&) = delete;

  // Nesting limit shared by evaluation, merging, comparison and export.
  static constexpr int kMaxDepth = 2000;

  ValuePtr eval_root(const ExprPtr& root);

  // Forces the value completely and converts it to a tree.
  YAML::Node export_value(const ValuePtr& v);

 private:
  // One level of native recursion. Fails with kInfiniteRecursion instead of
  // letting the native stack overflow.
  class Depth {
   public:
    Depth(Evaluator& ev, const SourceSpan& at);
    ~Depth() { --ev_.depth_; }
    Depth(const Depth&) = delete;
    Depth& operator=(const Depth&) = delete;

   private:
    Evaluator& ev_;
  };

  ValuePtr eval(const ExprPtr& e, Env env);
  ValuePtr force(Thunk* t);

  Thunk* make_thunk(std::function<ValuePtr()> compute, SourceSpan span);
  Thunk* defer(const ExprPtr& e, Env env);
  Thunk* ready(ValuePtr v, SourceSpan span = {});
  Env bind(Env env, const std::string& name, Thunk* t);
  Env bind_record(Env env, RecordData* record);
  Binder bind_expr(const ExprPtr& e, Env scope);
  static Binder bind_ready(Thunk* t);
  RecordData* new_record();

  ValuePtr lookup(const std::string& name, Env env, const SourceSpan& at);
  ValuePtr eval_string(const StringLit& lit, Env env);
  ValuePtr eval_record(const RecordLit& lit, Env env);
  ValuePtr eval_let(const Let& let, Env env);
  ValuePtr eval_unary(const Unary& op, Env env, const SourceSpan& at);
  ValuePtr eval_binary(const Binary& op, Env env, const SourceSpan& at);
  ValuePtr eval_import(const Import& imp, const SourceSpan& at);

  ValuePtr apply(const ValuePtr& fn, Thunk* arg, const SourceSpan& at);
  ValuePtr apply_contract(const ValuePtr& contract, Thunk* value, const SourceSpan& at,
                          bool is_type);

  ValuePtr field_value(Field& field, const std::string& name, RecordData* owner,
                       const SourceSpan& at);
  ValuePtr merge(const ValuePtr& lhs, const ValuePtr& rhs, const std::string& where,
                 const SourceSpan& at);
  Field merge_fields(const Field& a, const Field& b, const std::string& where,
                     const SourceSpan& at);
  bool equal(const ValuePtr& a, const ValuePtr& b, const SourceSpan& at);

  YAML::Node export_at(const ValuePtr& v, const std::string& path);

  [[noreturn]] void fail(EvalError::Kind kind, std::string message, const SourceSpan& at) const;

  std::deque<Thunk> thunks_;
  std::deque<EnvFrame> frames_;
  std::deque<RecordData> records_;
  std::map<std::string, Thunk*> imports_;  // keyed by normalized path
  Env prelude_ = nullptr;
  int depth_ = 0;
};

}  // namespace nick::lang
