#pragma once
#include <set>
#include <string>
#include <vector>

#include "TransformPipeline.hpp"

namespace XmlJsonBridge {

// ---------------- Stock transformers -------------------

struct BooleanOptions {
  std::vector<std::string> true_values{"true", "yes", "1", "on"};
  std::vector<std::string> false_values{"false", "no", "0", "off"};
  bool ignore_case = true;
};

// Towards JSON: matching strings become booleans (surrounding whitespace
// ignored). Towards XML: booleans become "true"/"false".
ValueTransformer boolean_transform(BooleanOptions options = BooleanOptions());

struct NumberOptions {
  bool integers = true;
  bool decimals = true;
  bool scientific = true;
  char decimal_separator = '.';
  char thousands_separator = ',';
};

// Towards JSON: numeric strings become integers or doubles ("1,234.5" with
// the default separators). Towards XML: numbers become strings.
ValueTransformer number_transform(NumberOptions options = NumberOptions());

// ECMAScript regex replace over string values, every match. Throws
// ValidationError for an invalid pattern.
ValueTransformer regex_replace_transform(const std::string &pattern,
                                         const std::string &replacement);

// Node transformer removing every node whose name is in `names`.
NodeTransformer remove_nodes_named(std::set<std::string> names);

} // namespace XmlJsonBridge
