// src/core/error.cpp
#include "nick/core/error.hpp"

namespace nick {

const char* to_string(Error::Kind kind) noexcept {
  switch (kind) {
    case Error::Kind::kReadFailure: return "read failure";
    case Error::Kind::kEvaluationFailure: return "evaluation failure";
    case Error::Kind::kDecodeFailure: return "decode failure";
  }
  return "unknown failure";
}

std::string Error::message() const {
  if (const auto* r = read()) return "cannot read configuration: " + r->message;
  if (const auto* e = evaluation()) return "evaluation failed: " + lang::summary(e->error);
  if (const auto* d = decode()) return "configuration has the wrong shape: " + to_string(d->error);
  return to_string(kind());
}

std::ostream& operator<<(std::ostream& os, const Error& e) { return os << e.message(); }

}  // namespace nick
