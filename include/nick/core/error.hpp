// include/nick/core/error.hpp
#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "nick/core/decode.hpp"
#include "nick/lang/eval_error.hpp"

namespace nick {

// The resolved (or explicit) path could not be opened or read.
struct ReadFailure {
  std::string message;
};

// The program was read but failed to evaluate (syntax, contract, runtime...).
struct EvaluationFailure {
  lang::EvalError error;
};

// Evaluation succeeded but the result does not have the shape of T.
struct DecodeFailure {
  DecodeError error;
};

// Everything that can go wrong loading a configuration file. Each stage keeps
// its own diagnostic shape; nothing is flattened.
class Error {
 public:
  enum class Kind : int {
    kReadFailure,
    kEvaluationFailure,
    kDecodeFailure,
  };

  using Payload = std::variant<ReadFailure, EvaluationFailure, DecodeFailure>;

  static Error read_failure(std::string message) { return Error(ReadFailure{std::move(message)}); }
  static Error evaluation_failure(lang::EvalError e) { return Error(EvaluationFailure{std::move(e)}); }
  static Error decode_failure(DecodeError e) { return Error(DecodeFailure{std::move(e)}); }

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(payload_.index()); }
  [[nodiscard]] const Payload& payload() const noexcept { return payload_; }

  [[nodiscard]] const ReadFailure* read() const noexcept { return std::get_if<ReadFailure>(&payload_); }
  [[nodiscard]] const EvaluationFailure* evaluation() const noexcept {
    return std::get_if<EvaluationFailure>(&payload_);
  }
  [[nodiscard]] const DecodeFailure* decode() const noexcept {
    return std::get_if<DecodeFailure>(&payload_);
  }

  // One line, prefixed with the stage: "evaluation failed: cfg.ncl:2:3: ..."
  [[nodiscard]] std::string message() const;

 private:
  explicit Error(Payload payload) : payload_(std::move(payload)) {}

  Payload payload_;
};

const char* to_string(Error::Kind kind) noexcept;

std::ostream& operator<<(std::ostream& os, const Error& e);

}  // namespace nick
