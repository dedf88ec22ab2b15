// src/lang/evaluator.cpp
#include "nick/lang/evaluator.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

#include "nick/core/scalar_tags.hpp"
#include "nick/lang/parser.hpp"

namespace nick::lang {
namespace {

namespace fs = std::filesystem;

std::string format_number(double d) {
  if (std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
    return std::to_string(static_cast<long long>(d));
  }
  std::ostringstream os;
  os.precision(15);
  os << d;
  if (std::strtod(os.str().c_str(), nullptr) == d) return os.str();

  std::ostringstream exact;
  exact.precision(std::numeric_limits<double>::max_digits10);
  exact << d;
  return exact.str();
}

const char* contract_name(Contract::Kind k) {
  switch (k) {
    case Contract::Kind::kNumber: return "Number";
    case Contract::Kind::kString: return "String";
    case Contract::Kind::kBool: return "Bool";
    case Contract::Kind::kDyn: return "Dyn";
    case Contract::Kind::kArray: return "Array";
    case Contract::Kind::kDict: return "Dict";
  }
  return "contract";
}

YAML::Node tagged(YAML::Node node, const char* tag) {
  node.SetTag(tag);
  return node;
}

std::string join(const std::string& path, const std::string& name) {
  return path.empty() ? name : path + "." + name;
}

}  // namespace

const char* type_name(const Value& v) noexcept {
  switch (v.node.index()) {
    case 0: return "Null";
    case 1: return "Bool";
    case 2: return "Number";
    case 3: return "String";
    case 4: return "Array";
    case 5: return "Record";
    case 6: return "Function";
    case 7: return "Contract";
    case 8: return "Function";
    default: return "Value";
  }
}

Evaluator::Evaluator() {
  Env env = nullptr;
  env = bind(env, "Dyn", ready(make_value(Contract{Contract::Kind::kDyn, nullptr})));
  env = bind(env, "Number", ready(make_value(Contract{Contract::Kind::kNumber, nullptr})));
  env = bind(env, "String", ready(make_value(Contract{Contract::Kind::kString, nullptr})));
  env = bind(env, "Bool", ready(make_value(Contract{Contract::Kind::kBool, nullptr})));
  env = bind(env, "Array", ready(make_value(Builtin{Builtin::Kind::kArrayOf})));
  prelude_ = env;
}

Evaluator::Depth::Depth(Evaluator& ev, const SourceSpan& at) : ev_(ev) {
  if (++ev_.depth_ > kMaxDepth) {
    --ev_.depth_;
    ev_.fail(EvalError::Kind::kInfiniteRecursion, "maximum evaluation depth exceeded", at);
  }
}

void Evaluator::fail(EvalError::Kind kind, std::string message, const SourceSpan& at) const {
  throw EvalFailure{EvalError{kind, std::move(message), at, {}}};
}

Thunk* Evaluator::make_thunk(std::function<ValuePtr()> compute, SourceSpan span) {
  thunks_.emplace_back();
  Thunk* t = &thunks_.back();
  t->compute = std::move(compute);
  t->span = std::move(span);
  return t;
}

Thunk* Evaluator::defer(const ExprPtr& e, Env env) {
  return make_thunk([this, e, env]() { return eval(e, env); }, e->span);
}

Thunk* Evaluator::ready(ValuePtr v, SourceSpan span) {
  Thunk* t = make_thunk(nullptr, std::move(span));
  t->value = std::move(v);
  t->state = Thunk::State::kDone;
  return t;
}

Env Evaluator::bind(Env env, const std::string& name, Thunk* t) {
  frames_.push_back(EnvFrame{name, t, env, nullptr});
  return &frames_.back();
}

Env Evaluator::bind_record(Env env, RecordData* record) {
  frames_.push_back(EnvFrame{{}, nullptr, env, record});
  return &frames_.back();
}

Binder Evaluator::bind_expr(const ExprPtr& e, Env scope) {
  return [this, e, scope](RecordData* self) { return defer(e, bind_record(scope, self)); };
}

Binder Evaluator::bind_ready(Thunk* t) {
  return [t](RecordData*) { return t; };
}

RecordData* Evaluator::new_record() {
  records_.emplace_back();
  return &records_.back();
}

ValuePtr Evaluator::force(Thunk* t) {
  switch (t->state) {
    case Thunk::State::kDone:
      return t->value;
    case Thunk::State::kForcing:
      fail(EvalError::Kind::kInfiniteRecursion,
           "infinite recursion: this value depends on itself", t->span);
    case Thunk::State::kPending:
      break;
  }
  t->state = Thunk::State::kForcing;
  t->value = t->compute();
  t->state = Thunk::State::kDone;
  t->compute = nullptr;
  return t->value;
}

ValuePtr Evaluator::eval_root(const ExprPtr& root) { return eval(root, prelude_); }

ValuePtr Evaluator::lookup(const std::string& name, Env env, const SourceSpan& at) {
  for (Env f = env; f != nullptr; f = f->parent) {
    if (f->record != nullptr) {
      const auto it = f->record->fields.find(name);
      if (it != f->record->fields.end()) return field_value(it->second, name, f->record, at);
    } else if (f->name == name) {
      return force(f->thunk);
    }
  }
  fail(EvalError::Kind::kUnboundIdentifier, "unbound identifier `" + name + "`", at);
}

ValuePtr Evaluator::eval(const ExprPtr& e, Env env) {
  const Depth depth(*this, e->span);

  const auto& node = e->node;

  if (std::holds_alternative<NullLit>(node)) return make_value(std::monostate{});
  if (const auto* n = std::get_if<BoolLit>(&node)) return make_value(n->value);
  if (const auto* n = std::get_if<NumberLit>(&node)) return make_value(n->value);
  if (const auto* n = std::get_if<StringLit>(&node)) return eval_string(*n, env);

  if (const auto* n = std::get_if<ArrayLit>(&node)) {
    ArrayValue arr;
    arr.items.reserve(n->items.size());
    for (const auto& item : n->items) arr.items.push_back(defer(item, env));
    return make_value(std::move(arr));
  }

  if (const auto* n = std::get_if<RecordLit>(&node)) return eval_record(*n, env);

  if (const auto* n = std::get_if<DictType>(&node)) {
    return make_value(Contract{Contract::Kind::kDict, eval(n->element, env)});
  }

  if (const auto* n = std::get_if<Var>(&node)) return lookup(n->name, env, e->span);
  if (const auto* n = std::get_if<Let>(&node)) return eval_let(*n, env);
  if (const auto* n = std::get_if<Fun>(&node)) return make_value(Closure{n->param, n->body, env});

  if (const auto* n = std::get_if<App>(&node)) {
    const ValuePtr fn = eval(n->fn, env);
    return apply(fn, defer(n->arg, env), e->span);
  }

  if (const auto* n = std::get_if<FieldAccess>(&node)) {
    const ValuePtr target = eval(n->target, env);
    const auto* rec = std::get_if<RecordValue>(&target->node);
    if (rec == nullptr) {
      fail(EvalError::Kind::kType,
           "cannot access field `" + n->field + "` of a " + type_name(*target), e->span);
    }
    const auto it = rec->data->fields.find(n->field);
    if (it == rec->data->fields.end()) {
      fail(EvalError::Kind::kMissingField, "record has no field `" + n->field + "`", e->span);
    }
    return field_value(it->second, n->field, rec->data, e->span);
  }

  if (const auto* n = std::get_if<IfThenElse>(&node)) {
    const ValuePtr cond = eval(n->cond, env);
    const auto* b = std::get_if<bool>(&cond->node);
    if (b == nullptr) {
      fail(EvalError::Kind::kType,
           std::string("if condition must be a Bool, got a ") + type_name(*cond), n->cond->span);
    }
    return eval(*b ? n->then_branch : n->else_branch, env);
  }

  if (const auto* n = std::get_if<Unary>(&node)) return eval_unary(*n, env, e->span);
  if (const auto* n = std::get_if<Binary>(&node)) return eval_binary(*n, env, e->span);

  if (const auto* n = std::get_if<Annot>(&node)) {
    const ValuePtr contract = eval(n->contract, env);
    return apply_contract(contract, defer(n->value, env), e->span, n->is_type);
  }

  if (const auto* n = std::get_if<Import>(&node)) return eval_import(*n, e->span);

  fail(EvalError::Kind::kRuntime, "unsupported expression", e->span);
}

ValuePtr Evaluator::eval_string(const StringLit& lit, Env env) {
  std::string out;
  for (const auto& part : lit.parts) {
    if (!part.expr) {
      out += part.text;
      continue;
    }
    const ValuePtr v = eval(part.expr, env);
    const auto* s = std::get_if<std::string>(&v->node);
    if (s == nullptr) {
      fail(EvalError::Kind::kType,
           std::string("string interpolation expects a String, got a ") + type_name(*v),
           part.expr->span);
    }
    out += *s;
  }
  return make_value(std::move(out));
}

ValuePtr Evaluator::eval_record(const RecordLit& lit, Env env) {
  RecordData* data = new_record();
  data->open = lit.open;

  for (const auto& fd : lit.fields) {
    Field f;
    if (fd.value) f.value = bind_expr(fd.value, env);
    for (const auto& c : fd.meta.contracts) f.contracts.push_back(bind_expr(c, env));
    f.is_default = fd.meta.is_default;
    f.is_optional = fd.meta.is_optional;
    f.doc = fd.meta.doc;
    f.span = fd.span;

    const auto it = data->fields.find(fd.name);
    if (it == data->fields.end()) {
      data->fields.emplace(fd.name, std::move(f));
    } else {
      it->second = merge_fields(it->second, f, fd.name, fd.span);
    }
  }

  return make_value(RecordValue{data});
}

ValuePtr Evaluator::eval_let(const Let& let, Env env) {
  Env inner = env;
  if (!let.rec) {
    for (const auto& b : let.bindings) inner = bind(inner, b.name, defer(b.value, env));
    return eval(let.body, inner);
  }

  std::vector<Thunk*> pending;
  for (const auto& b : let.bindings) {
    Thunk* t = make_thunk(nullptr, b.span);
    pending.push_back(t);
    inner = bind(inner, b.name, t);
  }
  for (std::size_t i = 0; i < let.bindings.size(); ++i) {
    const ExprPtr value = let.bindings[i].value;
    pending[i]->compute = [this, value, inner]() { return eval(value, inner); };
  }
  return eval(let.body, inner);
}

ValuePtr Evaluator::eval_unary(const Unary& op, Env env, const SourceSpan& at) {
  const ValuePtr v = eval(op.operand, env);
  if (op.op == UnaryOp::kNot) {
    const auto* b = std::get_if<bool>(&v->node);
    if (b == nullptr) {
      fail(EvalError::Kind::kType, std::string("`!` expects a Bool, got a ") + type_name(*v), at);
    }
    return make_value(!*b);
  }
  const auto* d = std::get_if<double>(&v->node);
  if (d == nullptr) {
    fail(EvalError::Kind::kType, std::string("`-` expects a Number, got a ") + type_name(*v), at);
  }
  return make_value(-*d);
}

ValuePtr Evaluator::eval_binary(const Binary& op, Env env, const SourceSpan& at) {
  if (op.op == BinaryOp::kAnd || op.op == BinaryOp::kOr) {
    const char* spelling = op.op == BinaryOp::kAnd ? "`&&`" : "`||`";
    const ValuePtr lhs = eval(op.lhs, env);
    const auto* l = std::get_if<bool>(&lhs->node);
    if (l == nullptr) {
      fail(EvalError::Kind::kType,
           std::string(spelling) + " expects Bool operands, got a " + type_name(*lhs), at);
    }
    if (op.op == BinaryOp::kAnd && !*l) return lhs;
    if (op.op == BinaryOp::kOr && *l) return lhs;
    const ValuePtr rhs = eval(op.rhs, env);
    if (!std::holds_alternative<bool>(rhs->node)) {
      fail(EvalError::Kind::kType,
           std::string(spelling) + " expects Bool operands, got a " + type_name(*rhs), at);
    }
    return rhs;
  }

  const ValuePtr lhs = eval(op.lhs, env);
  const ValuePtr rhs = eval(op.rhs, env);

  switch (op.op) {
    case BinaryOp::kMerge:
      return merge(lhs, rhs, "", at);
    case BinaryOp::kEq:
      return make_value(equal(lhs, rhs, at));
    case BinaryOp::kNeq:
      return make_value(!equal(lhs, rhs, at));
    case BinaryOp::kConcat: {
      if (const auto* ls = std::get_if<std::string>(&lhs->node)) {
        if (const auto* rs = std::get_if<std::string>(&rhs->node)) return make_value(*ls + *rs);
      }
      if (const auto* la = std::get_if<ArrayValue>(&lhs->node)) {
        if (const auto* ra = std::get_if<ArrayValue>(&rhs->node)) {
          ArrayValue out = *la;
          out.items.insert(out.items.end(), ra->items.begin(), ra->items.end());
          return make_value(std::move(out));
        }
      }
      fail(EvalError::Kind::kType,
           std::string("`++` expects two Strings or two Arrays, got a ") + type_name(*lhs) +
               " and a " + type_name(*rhs),
           at);
    }
    default:
      break;
  }

  const auto* l = std::get_if<double>(&lhs->node);
  const auto* r = std::get_if<double>(&rhs->node);
  if (l == nullptr || r == nullptr) {
    fail(EvalError::Kind::kType,
         std::string("arithmetic and comparison expect Numbers, got a ") + type_name(*lhs) +
             " and a " + type_name(*rhs),
         at);
  }

  switch (op.op) {
    case BinaryOp::kAdd: return make_value(*l + *r);
    case BinaryOp::kSub: return make_value(*l - *r);
    case BinaryOp::kMul: return make_value(*l * *r);
    case BinaryOp::kDiv:
      if (*r == 0.0) fail(EvalError::Kind::kRuntime, "division by zero", at);
      return make_value(*l / *r);
    case BinaryOp::kMod:
      if (*r == 0.0) fail(EvalError::Kind::kRuntime, "division by zero", at);
      return make_value(std::fmod(*l, *r));
    case BinaryOp::kLt: return make_value(*l < *r);
    case BinaryOp::kLe: return make_value(*l <= *r);
    case BinaryOp::kGt: return make_value(*l > *r);
    case BinaryOp::kGe: return make_value(*l >= *r);
    default: break;
  }
  fail(EvalError::Kind::kRuntime, "unsupported operator", at);
}

ValuePtr Evaluator::eval_import(const Import& imp, const SourceSpan& at) {
  fs::path target{imp.path};
  if (target.is_relative()) {
    const fs::path base = at.file.empty() ? fs::path{} : fs::path{at.file}.parent_path();
    target = base / target;
  }
  std::error_code ec;
  fs::path key = fs::weakly_canonical(target, ec);
  if (ec) key = target.lexically_normal();

  const auto cached = imports_.find(key.string());
  if (cached != imports_.end()) return force(cached->second);

  std::ifstream in(target, std::ios::binary);
  if (!in.is_open() || fs::is_directory(target, ec)) {
    fail(EvalError::Kind::kImport, "cannot import `" + imp.path + "`: failed to open " +
                                       target.string(), at);
  }
  std::ostringstream contents;
  contents << in.rdbuf();

  ExprPtr root;
  try {
    root = Parser::parse_source(contents.str(), SourceSpan{target.string(), 1, 1});
  } catch (const SyntaxError& e) {
    throw EvalFailure{EvalError{EvalError::Kind::kParse, e.message, e.span,
                                {"while importing `" + imp.path + "`"}}};
  }

  Thunk* t = make_thunk([this, root]() { return eval(root, prelude_); }, at);
  imports_.emplace(key.string(), t);
  return force(t);
}

ValuePtr Evaluator::apply(const ValuePtr& fn, Thunk* arg, const SourceSpan& at) {
  if (const auto* c = std::get_if<Closure>(&fn->node)) {
    return eval(c->body, bind(c->env, c->param, arg));
  }
  if (const auto* b = std::get_if<Builtin>(&fn->node)) {
    switch (b->kind) {
      case Builtin::Kind::kArrayOf:
        return make_value(Contract{Contract::Kind::kArray, force(arg)});
    }
  }
  fail(EvalError::Kind::kType, std::string("cannot apply a ") + type_name(*fn) +
                                   "; only functions can be applied", at);
}

ValuePtr Evaluator::apply_contract(const ValuePtr& contract, Thunk* value, const SourceSpan& at,
                                   bool is_type) {
  const Depth depth(*this, at);
  const EvalError::Kind broken = is_type ? EvalError::Kind::kType : EvalError::Kind::kContract;

  if (const auto* c = std::get_if<Contract>(&contract->node)) {
    if (c->kind == Contract::Kind::kDyn) return force(value);

    const ValuePtr v = force(value);
    auto expect = [&](bool ok) {
      if (!ok) {
        fail(broken, std::string("expected a ") + contract_name(c->kind) + ", got a " +
                         type_name(*v), at);
      }
    };

    switch (c->kind) {
      case Contract::Kind::kNumber:
        expect(std::holds_alternative<double>(v->node));
        return v;
      case Contract::Kind::kString:
        expect(std::holds_alternative<std::string>(v->node));
        return v;
      case Contract::Kind::kBool:
        expect(std::holds_alternative<bool>(v->node));
        return v;
      case Contract::Kind::kArray: {
        expect(std::holds_alternative<ArrayValue>(v->node));
        const ValuePtr element = c->element;
        ArrayValue out;
        for (Thunk* item : std::get<ArrayValue>(v->node).items) {
          out.items.push_back(make_thunk(
              [this, element, item, at, is_type]() {
                return apply_contract(element, item, at, is_type);
              },
              at));
        }
        return make_value(std::move(out));
      }
      case Contract::Kind::kDict: {
        expect(std::holds_alternative<RecordValue>(v->node));
        RecordData* data = new_record();
        *data = *std::get<RecordValue>(v->node).data;
        const Binder element = bind_ready(ready(c->element, at));
        for (auto& [name, field] : data->fields) {
          field.contracts.push_back(element);
          field.checked = nullptr;
        }
        return make_value(RecordValue{data});
      }
      case Contract::Kind::kDyn:
        return v;
    }
  }

  if (const auto* shape = std::get_if<RecordValue>(&contract->node)) {
    const ValuePtr v = force(value);
    const auto* rec = std::get_if<RecordValue>(&v->node);
    if (rec == nullptr) {
      fail(broken, std::string("expected a record, got a ") + type_name(*v), at);
    }
    if (!shape->data->open) {
      for (const auto& [name, field] : rec->data->fields) {
        if (shape->data->fields.count(name) == 0) {
          fail(broken, "extra field `" + name + "` is not allowed by the record contract", at);
        }
      }
    }
    for (const auto& [name, field] : shape->data->fields) {
      if (!field.value && !field.is_optional && rec->data->fields.count(name) == 0) {
        fail(EvalError::Kind::kMissingField,
             "missing field `" + name + "` required by the record contract", at);
      }
    }
    return merge(v, contract, "", at);
  }

  fail(EvalError::Kind::kType,
       std::string("a ") + type_name(*contract) + " cannot be used as a contract", at);
}

ValuePtr Evaluator::field_value(Field& field, const std::string& name, RecordData* owner,
                                const SourceSpan& at) {
  if (field.checked == nullptr) {
    if (!field.value) {
      fail(EvalError::Kind::kMissingField,
           "field `" + name + "` is declared but has no definition",
           field.span.known() ? field.span : at);
    }
    Thunk* raw = field.value(owner);
    if (field.contracts.empty()) {
      field.checked = raw;
    } else {
      std::vector<Thunk*> contracts;
      contracts.reserve(field.contracts.size());
      for (const auto& c : field.contracts) contracts.push_back(c(owner));
      const SourceSpan span = field.span;
      field.checked = make_thunk(
          [this, raw, contracts, span]() {
            Thunk* current = raw;
            for (Thunk* c : contracts) {
              current = ready(apply_contract(force(c), current, span, false), span);
            }
            return force(current);
          },
          span);
    }
  }
  return force(field.checked);
}

Field Evaluator::merge_fields(const Field& a, const Field& b, const std::string& where,
                              const SourceSpan& at) {
  Field out;
  out.span = a.span;
  out.is_optional = a.is_optional && b.is_optional;
  out.doc = a.doc ? a.doc : b.doc;
  out.contracts = a.contracts;
  out.contracts.insert(out.contracts.end(), b.contracts.begin(), b.contracts.end());

  if (!a.value) {
    out.value = b.value;
    out.is_default = b.is_default;
  } else if (!b.value) {
    out.value = a.value;
    out.is_default = a.is_default;
  } else if (a.is_default && !b.is_default) {
    out.value = b.value;
  } else if (!a.is_default && b.is_default) {
    out.value = a.value;
  } else {
    // Both sides are bound to the record that owns the merged field.
    const Binder va = a.value;
    const Binder vb = b.value;
    out.is_default = a.is_default;
    out.value = [this, va, vb, where, at](RecordData* self) {
      Thunk* ta = va(self);
      Thunk* tb = vb(self);
      return make_thunk(
          [this, ta, tb, where, at]() { return merge(force(ta), force(tb), where, at); }, at);
    };
  }
  return out;
}

ValuePtr Evaluator::merge(const ValuePtr& lhs, const ValuePtr& rhs, const std::string& where,
                          const SourceSpan& at) {
  const Depth depth(*this, at);
  const auto* lr = std::get_if<RecordValue>(&lhs->node);
  const auto* rr = std::get_if<RecordValue>(&rhs->node);
  if (lr != nullptr && rr != nullptr) {
    RecordData* data = new_record();
    data->open = lr->data->open && rr->data->open;
    for (const auto& [name, field] : lr->data->fields) {
      Field copy = field;
      copy.checked = nullptr;
      data->fields.emplace(name, std::move(copy));
    }
    for (const auto& [name, field] : rr->data->fields) {
      const auto it = data->fields.find(name);
      if (it == data->fields.end()) {
        Field copy = field;
        copy.checked = nullptr;
        data->fields.emplace(name, std::move(copy));
      } else {
        it->second = merge_fields(it->second, field, join(where, name), at);
      }
    }
    return make_value(RecordValue{data});
  }

  const bool primitive = lhs->node.index() <= 3 && rhs->node.index() <= 3;
  if (primitive && equal(lhs, rhs, at)) return lhs;

  std::string msg = std::string("cannot merge a ") + type_name(*lhs) + " with a " +
                    type_name(*rhs);
  if (primitive && lhs->node.index() == rhs->node.index()) {
    msg = "conflicting values";
  }
  if (!where.empty()) msg += " for field `" + where + "`";
  fail(EvalError::Kind::kMergeConflict, msg, at);
}

bool Evaluator::equal(const ValuePtr& a, const ValuePtr& b, const SourceSpan& at) {
  const Depth depth(*this, at);
  if (a->node.index() != b->node.index()) return false;

  if (std::holds_alternative<std::monostate>(a->node)) return true;
  if (const auto* x = std::get_if<bool>(&a->node)) return *x == std::get<bool>(b->node);
  if (const auto* x = std::get_if<double>(&a->node)) return *x == std::get<double>(b->node);
  if (const auto* x = std::get_if<std::string>(&a->node)) {
    return *x == std::get<std::string>(b->node);
  }
  if (const auto* x = std::get_if<ArrayValue>(&a->node)) {
    const auto& y = std::get<ArrayValue>(b->node);
    if (x->items.size() != y.items.size()) return false;
    for (std::size_t i = 0; i < x->items.size(); ++i) {
      if (!equal(force(x->items[i]), force(y.items[i]), at)) return false;
    }
    return true;
  }
  if (const auto* x = std::get_if<RecordValue>(&a->node)) {
    const auto& y = std::get<RecordValue>(b->node);
    if (x->data->fields.size() != y.data->fields.size()) return false;
    for (auto& [name, field] : x->data->fields) {
      const auto it = y.data->fields.find(name);
      if (it == y.data->fields.end()) return false;
      if (!equal(field_value(field, name, x->data, at), field_value(it->second, name, y.data, at),
                 at)) {
        return false;
      }
    }
    return true;
  }
  fail(EvalError::Kind::kType, std::string("cannot compare values of type ") + type_name(*a), at);
}

YAML::Node Evaluator::export_value(const ValuePtr& v) { return export_at(v, ""); }

YAML::Node Evaluator::export_at(const ValuePtr& v, const std::string& path) {
  const Depth depth(*this, SourceSpan{});
  const std::string where = path.empty() ? std::string("the top-level value")
                                         : "field `" + path + "`";

  if (std::holds_alternative<std::monostate>(v->node)) return YAML::Node(YAML::NodeType::Null);
  if (const auto* b = std::get_if<bool>(&v->node)) return tagged(YAML::Node(*b), kBoolTag);
  if (const auto* d = std::get_if<double>(&v->node)) {
    const bool integral = std::trunc(*d) == *d && std::fabs(*d) < 9007199254740992.0;
    return tagged(YAML::Node(format_number(*d)), integral ? kIntTag : kFloatTag);
  }
  if (const auto* s = std::get_if<std::string>(&v->node)) return tagged(YAML::Node(*s), kStrTag);

  if (const auto* arr = std::get_if<ArrayValue>(&v->node)) {
    YAML::Node seq(YAML::NodeType::Sequence);
    for (std::size_t i = 0; i < arr->items.size(); ++i) {
      const std::string item_path = path + "[" + std::to_string(i) + "]";
      try {
        seq.push_back(export_at(force(arr->items[i]), item_path));
      } catch (EvalFailure& f) {
        if (f.error.notes.empty()) f.error.notes.push_back("while exporting `" + item_path + "`");
        throw;
      }
    }
    return seq;
  }

  if (const auto* rec = std::get_if<RecordValue>(&v->node)) {
    YAML::Node map(YAML::NodeType::Map);
    for (auto& [name, field] : rec->data->fields) {
      if (!field.value && field.is_optional) continue;
      const std::string field_path = join(path, name);
      try {
        map[name] = export_at(field_value(field, name, rec->data, field.span), field_path);
      } catch (EvalFailure& f) {
        if (f.error.notes.empty()) {
          f.error.notes.push_back("while exporting field `" + field_path + "`");
        }
        throw;
      }
    }
    return map;
  }

  fail(EvalError::Kind::kNotExportable,
       std::string("a ") + type_name(*v) + " cannot be exported (" + where + ")", SourceSpan{});
}

}  // namespace nick::lang
