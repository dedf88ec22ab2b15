// src/core/decode.cpp
#include "nick/core/decode.hpp"

#include <cstring>
#include <utility>

#include "nick/core/scalar_tags.hpp"

namespace nick {

// Trees built by the evaluator carry no source marks, so only the message is
// rendered; the mark stays available on the error itself.
std::string to_string(const DecodeError& e) { return e.message; }

namespace detail {

void expect_type(const YAML::Node& node, const char* expected) {
  const char* actual = tagged_type(node.Tag());
  if (actual != nullptr && std::strcmp(actual, expected) != 0) {
    throw YAML::RepresentationException(node.Mark(), std::string("expected a ") + expected +
                                                         ", got a " + actual);
  }
}

}  // namespace detail

FieldReader::FieldReader(YAML::Node node) : node_(std::move(node)) {
  if (!node_.IsMap()) {
    throw YAML::RepresentationException(node_.Mark(), "expected a record");
  }
}

YAML::Node FieldReader::lookup(const std::string& key) const {
  // const subscript: never inserts, yields an undefined node when absent.
  const YAML::Node& node = node_;
  return node[key];
}

}  // namespace nick
