// src/lang/eval_error.cpp
#include "nick/lang/eval_error.hpp"

#include <sstream>

namespace nick::lang {

const char* to_string(EvalError::Kind kind) noexcept {
  switch (kind) {
    case EvalError::Kind::kParse: return "parse";
    case EvalError::Kind::kUnboundIdentifier: return "unbound-identifier";
    case EvalError::Kind::kType: return "type";
    case EvalError::Kind::kContract: return "contract";
    case EvalError::Kind::kMissingField: return "missing-field";
    case EvalError::Kind::kInfiniteRecursion: return "infinite-recursion";
    case EvalError::Kind::kImport: return "import";
    case EvalError::Kind::kNotExportable: return "not-exportable";
    case EvalError::Kind::kMergeConflict: return "merge-conflict";
    case EvalError::Kind::kRuntime: return "runtime";
  }
  return "unknown";
}

void render(std::ostream& os, const EvalError& e) {
  os << "error[" << to_string(e.kind) << "]: " << e.message << "\n";
  if (e.span.known()) {
    os << "  --> " << e.span.file << ":" << e.span.line << ":" << e.span.column << "\n";
  }
  for (const auto& note : e.notes) {
    os << "  = note: " << note << "\n";
  }
}

std::string summary(const EvalError& e) {
  std::ostringstream os;
  if (e.span.known()) {
    os << e.span.file << ":" << e.span.line << ":" << e.span.column << ": ";
  }
  os << to_string(e.kind) << ": " << e.message;
  return os.str();
}

}  // namespace nick::lang
