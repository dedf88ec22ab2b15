// src/lang/program.cpp
#include "nick/lang/program.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

#include "nick/lang/evaluator.hpp"
#include "nick/lang/parser.hpp"

namespace nick::lang {

Program::Program(std::string source, std::string name, std::ostream& diagnostics)
    : source_(std::move(source)), name_(std::move(name)), diagnostics_(&diagnostics) {}

Result<Program, std::string> Program::from_file(const std::filesystem::path& path,
                                                std::ostream& diagnostics) {
  using R = Result<Program, std::string>;
  auto fail = [&diagnostics](std::string message) {
    diagnostics << "error: " << message << "\n";
    return R::err(std::move(message));
  };

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return fail("failed to open " + path.string() + ": is a directory");
  }

  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    return fail("failed to open " + path.string() + ": " + std::strerror(errno));
  }

  std::ostringstream contents;
  contents << f.rdbuf();
  if (f.bad()) {
    return fail("failed to read " + path.string());
  }

  return R::ok(Program(contents.str(), path.string(), diagnostics));
}

Program Program::from_source(std::string source, std::string name, std::ostream& diagnostics) {
  return Program(std::move(source), std::move(name), diagnostics);
}

Result<YAML::Node, EvalError> Program::eval_full_for_export() {
  using R = Result<YAML::Node, EvalError>;

  EvalError error;
  try {
    const ExprPtr root = Parser::parse_source(source_, SourceSpan{name_, 1, 1});
    Evaluator evaluator;
    return R::ok(evaluator.export_value(evaluator.eval_root(root)));
  } catch (const SyntaxError& e) {
    error = EvalError{EvalError::Kind::kParse, e.message, e.span, {}};
  } catch (const EvalFailure& f) {
    error = f.error;
  }

  render(*diagnostics_, error);
  return R::err(std::move(error));
}

}  // namespace nick::lang
