// include/nick/lang/eval_error.hpp
#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace nick::lang {

// 1-based position in a source file. line == 0 means "no location".
struct SourceSpan {
  std::string file;
  int line = 0;
  int column = 0;

  [[nodiscard]] bool known() const noexcept { return line > 0; }
};

struct EvalError {
  enum class Kind : int {
    kParse,
    kUnboundIdentifier,
    kType,
    kContract,
    kMissingField,
    kInfiniteRecursion,
    kImport,
    kNotExportable,
    kMergeConflict,
    kRuntime,
  };

  Kind kind = Kind::kRuntime;
  std::string message;
  SourceSpan span;

  // Extra context, innermost first (e.g. "while exporting field `server.port`").
  std::vector<std::string> notes;
};

const char* to_string(EvalError::Kind kind) noexcept;

// Renders:
//   error[contract]: expected a Number, got a String
//     --> config.ncl:3:11
//     = note: while exporting field `port`
void render(std::ostream& os, const EvalError& e);

// Single line: "config.ncl:3:11: contract: expected a Number, got a String"
std::string summary(const EvalError& e);

}  // namespace nick::lang
