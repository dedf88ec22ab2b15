// include/nick/core/loader.hpp
#pragma once

#include <filesystem>
#include <iostream>

#include "nick/core/decode.hpp"
#include "nick/core/error.hpp"
#include "nick/core/status.hpp"
#include "nick/lang/program.hpp"

namespace nick {

// Reads, evaluates and decodes the Nickel file at `path`.
// - the file cannot be read        -> Error::Kind::kReadFailure
// - the program fails to evaluate  -> Error::Kind::kEvaluationFailure
// - the result does not fit T      -> Error::Kind::kDecodeFailure
// The evaluator renders its diagnostics to `diagnostics`.
template <typename T>
Result<T> load(const std::filesystem::path& path, std::ostream& diagnostics = std::cerr) {
  auto program_r = lang::Program::from_file(path, diagnostics);
  if (!program_r.ok()) return Result<T>::err(Error::read_failure(program_r.take_error()));

  auto tree_r = program_r->eval_full_for_export();
  if (!tree_r.ok()) return Result<T>::err(Error::evaluation_failure(tree_r.take_error()));

  auto value_r = decode<T>(tree_r.value());
  if (!value_r.ok()) return Result<T>::err(Error::decode_failure(value_r.take_error()));

  return Result<T>::ok(value_r.take_value());
}

}  // namespace nick
