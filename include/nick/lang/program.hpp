// include/nick/lang/program.hpp
#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include <yaml-cpp/yaml.h>

#include "nick/core/status.hpp"
#include "nick/lang/eval_error.hpp"

namespace nick::lang {

// A Nickel program loaded from a file, ready to be evaluated.
//
// Loading only reads the file; parsing happens during evaluation, so a
// syntax error is an evaluation failure, not a read failure.
// Failures are rendered to the diagnostics stream before being returned.
class Program {
 public:
  static Result<Program, std::string> from_file(const std::filesystem::path& path,
                                                std::ostream& diagnostics);

  // `name` is used as the file name in diagnostics and as the base for
  // relative imports.
  static Program from_source(std::string source, std::string name, std::ostream& diagnostics);

  // Evaluates the program completely (every field, every array element)
  // and converts the result into a tree.
  Result<YAML::Node, EvalError> eval_full_for_export();

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

 private:
  Program(std::string source, std::string name, std::ostream& diagnostics);

  std::string source_;
  std::string name_;
  std::ostream* diagnostics_;
};

}  // namespace nick::lang
