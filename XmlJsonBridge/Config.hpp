#pragma once
#include <map>
#include <string>

#include <rapidjson/document.h>

namespace XmlJsonBridge {

enum class NamespacePrefixHandling { Preserve, Strip, Label };
enum class AttributeHandling { Attributes, Fields };
enum class FieldVsValue { Auto, Field, Value };
enum class EmptyValueHandling { Null, Undefined, Remove };

struct XmlSourceConfig {
  bool preserve_namespaces = true;
  NamespacePrefixHandling namespace_prefix_handling =
      NamespacePrefixHandling::Preserve;
  bool preserve_cdata = true;
  bool preserve_comments = true;
  bool preserve_instructions = true;
  bool preserve_text_nodes = true;
  bool preserve_attributes = true;
  bool preserve_whitespace = false;
  AttributeHandling attribute_handling = AttributeHandling::Attributes;
};

struct XmlOutputConfig {
  bool pretty_print = true;
  bool declaration = true;
  std::string encoding = "UTF-8";
  int indent = 2;
  bool preserve_namespaces = true;
  NamespacePrefixHandling namespace_prefix_handling =
      NamespacePrefixHandling::Preserve;
};

struct JsonSourceConfig {
  // Item name for arrays found under a given parent property.
  std::map<std::string, std::string> array_item_names;
  std::string default_item_name = "item";
  FieldVsValue field_vs_value = FieldVsValue::Auto;
  EmptyValueHandling empty_value_handling = EmptyValueHandling::Null;
};

struct JsonOutputConfig {
  bool pretty_print = true;
  int indent = 2;
  bool high_fidelity = false;
};

struct XmlConfig {
  XmlSourceConfig source;
  XmlOutputConfig output;
};

struct JsonConfig {
  JsonSourceConfig source;
  JsonOutputConfig output;
};

// Passed explicitly to every codec and to the transform pipeline.
struct Configuration {
  XmlConfig xml;
  JsonConfig json;
};

Configuration default_configuration();

// Deep-merge a partial configuration document onto `base`. Keys follow the
// camelCase names of the JSON form, e.g.
//   {"xml": {"source": {"preserveCDATA": false}},
//    "json": {"source": {"arrayItemNames": {"books": "book"}}}}
// Unknown keys or values of the wrong type raise ValidationError.
Configuration merge_configuration(const Configuration &base,
                                  const rapidjson::Value &overrides);
Configuration merge_configuration(const Configuration &base,
                                  const std::string &overrides_json);

// Defaults merged with the JSON document stored at `path`.
Configuration load_configuration_file(const std::string &path);

enum class XmlEncoding { Utf8, Latin1 };

// Maps "UTF-8" or "ISO-8859-1" (any case) to `out`; false for other names.
bool parse_xml_encoding(const std::string &name, XmlEncoding &out);

// Throws ValidationError on an unusable configuration.
void validate_configuration(const Configuration &config);

// JSON form of a configuration, same key names as merge_configuration().
std::string configuration_to_json(const Configuration &config);

const char *to_string(NamespacePrefixHandling v);
const char *to_string(AttributeHandling v);
const char *to_string(FieldVsValue v);
const char *to_string(EmptyValueHandling v);

} // namespace XmlJsonBridge
