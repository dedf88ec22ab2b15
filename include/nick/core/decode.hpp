// include/nick/core/decode.hpp
#pragma once

#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "nick/core/status.hpp"

namespace nick {

// Structural mismatch reported by yaml-cpp while converting a tree into T.
struct DecodeError {
  std::string message;
  YAML::Mark mark = YAML::Mark::null_mark();
};

std::string to_string(const DecodeError& e);

namespace detail {

template <typename T>
struct is_vector : std::false_type {};
template <typename U, typename A>
struct is_vector<std::vector<U, A>> : std::true_type {};

template <typename T>
struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};

// Throws YAML::RepresentationException when `node` carries a core tag naming
// a type other than `expected` ("Number", "Bool" or "String").
void expect_type(const YAML::Node& node, const char* expected);

// yaml-cpp converts any scalar to any scalar type ("42" into a std::string,
// "true" into an int...). Exported scalars are tagged, so the type of the
// value is checked against T before converting. Containers are checked
// element by element; user types check their own fields through FieldReader.
template <typename T>
void check_shape(const YAML::Node& node) {
  if constexpr (std::is_same_v<T, bool>) {
    expect_type(node, "Bool");
  } else if constexpr (std::is_arithmetic_v<T>) {
    expect_type(node, "Number");
  } else if constexpr (std::is_same_v<T, std::string>) {
    expect_type(node, "String");
  } else if constexpr (is_vector<T>::value) {
    if (!node.IsSequence()) return;
    for (const auto& item : node) check_shape<typename T::value_type>(item);
  } else if constexpr (is_map<T>::value) {
    if (!node.IsMap()) return;
    for (const auto& kv : node) check_shape<typename T::mapped_type>(kv.second);
  }
}

}  // namespace detail

// Decodes through YAML::convert<T>. Any type yaml-cpp can convert works
// (scalars, std::vector, std::map, ...); user types provide a convert<T>
// specialization, typically written with FieldReader.
template <typename T>
Result<T, DecodeError> decode(const YAML::Node& tree) {
  try {
    detail::check_shape<T>(tree);
    return Result<T, DecodeError>::ok(tree.as<T>());
  } catch (const YAML::Exception& e) {
    return Result<T, DecodeError>::err(DecodeError{e.msg, e.mark});
  }
}

// Field access for convert<T>::decode implementations. Failures throw
// YAML::RepresentationException carrying the field path, which decode<T>
// turns into a DecodeError:
//
//   static bool decode(const YAML::Node& node, Server& s) {
//     nick::FieldReader r(node);
//     r.required("host", s.host);
//     r.optional("port", s.port);
//     return true;
//   }
class FieldReader {
 public:
  explicit FieldReader(YAML::Node node);

  template <typename T>
  void required(const std::string& key, T& out) const {
    const YAML::Node value = lookup(key);
    if (!value.IsDefined()) {
      throw YAML::RepresentationException(node_.Mark(), "missing field `" + key + "`");
    }
    read(key, value, out);
  }

  // Leaves `out` untouched when the field is absent or null.
  template <typename T>
  bool optional(const std::string& key, T& out) const {
    const YAML::Node value = lookup(key);
    if (!value.IsDefined() || value.IsNull()) return false;
    read(key, value, out);
    return true;
  }

 private:
  [[nodiscard]] YAML::Node lookup(const std::string& key) const;

  template <typename T>
  static void read(const std::string& key, const YAML::Node& value, T& out) {
    try {
      detail::check_shape<T>(value);
      out = value.as<T>();
    } catch (const YAML::Exception& e) {
      throw YAML::RepresentationException(e.mark, "field `" + key + "`: " + e.msg);
    }
  }

  YAML::Node node_;
};

}  // namespace nick
