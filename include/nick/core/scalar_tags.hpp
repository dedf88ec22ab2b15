// include/nick/core/scalar_tags.hpp
#pragma once

#include <string>

namespace nick {

// YAML core-schema tags stamped on every scalar the evaluator exports, so the
// decoder can tell a Number from a String that happens to look like one.
inline constexpr const char* kIntTag = "tag:yaml.org,2002:int";
inline constexpr const char* kFloatTag = "tag:yaml.org,2002:float";
inline constexpr const char* kBoolTag = "tag:yaml.org,2002:bool";
inline constexpr const char* kStrTag = "tag:yaml.org,2002:str";

// Nickel type name for a core tag; nullptr for anything else (untagged nodes,
// "?" / "!" from parsed YAML, custom tags).
inline const char* tagged_type(const std::string& tag) {
  if (tag == kIntTag || tag == kFloatTag) return "Number";
  if (tag == kBoolTag) return "Bool";
  if (tag == kStrTag) return "String";
  return nullptr;
}

}  // namespace nick
