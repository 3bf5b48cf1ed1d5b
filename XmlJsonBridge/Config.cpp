#include "Config.hpp"

#include "Errors.hpp"
#include "Utility.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <cctype>
#include <string>

namespace XmlJsonBridge {

// ---------------------- Enum names ----------------------

template <typename E> struct EnumName {
  E value;
  const char *name;
};

static const EnumName<NamespacePrefixHandling> kPrefixHandling[] = {
    {NamespacePrefixHandling::Preserve, "preserve"},
    {NamespacePrefixHandling::Strip, "strip"},
    {NamespacePrefixHandling::Label, "label"},
};

static const EnumName<AttributeHandling> kAttributeHandling[] = {
    {AttributeHandling::Attributes, "attributes"},
    {AttributeHandling::Fields, "fields"},
};

static const EnumName<FieldVsValue> kFieldVsValue[] = {
    {FieldVsValue::Auto, "auto"},
    {FieldVsValue::Field, "field"},
    {FieldVsValue::Value, "value"},
};

static const EnumName<EmptyValueHandling> kEmptyValueHandling[] = {
    {EmptyValueHandling::Null, "null"},
    {EmptyValueHandling::Undefined, "undefined"},
    {EmptyValueHandling::Remove, "remove"},
};

template <typename E, std::size_t N>
static const char *enum_to_string(const EnumName<E> (&table)[N], E value) {
  for (const auto &e : table) {
    if (e.value == value)
      return e.name;
  }
  return "";
}

// ---------------------- Readers ----------------------

static std::string key_of(const rapidjson::Value::ConstMemberIterator &it) {
  return std::string(it->name.GetString(), it->name.GetStringLength());
}

static void require_object(const rapidjson::Value &v,
                           const std::string &where) {
  if (!v.IsObject())
    throw ValidationError("configuration: '" + where + "' must be an object");
}

static bool read_bool(const rapidjson::Value &v, const std::string &where) {
  if (!v.IsBool())
    throw ValidationError("configuration: '" + where + "' must be a boolean");
  return v.GetBool();
}

static int read_int(const rapidjson::Value &v, const std::string &where) {
  if (!v.IsInt())
    throw ValidationError("configuration: '" + where + "' must be an integer");
  return v.GetInt();
}

static std::string read_string(const rapidjson::Value &v,
                               const std::string &where) {
  if (!v.IsString())
    throw ValidationError("configuration: '" + where + "' must be a string");
  return std::string(v.GetString(), v.GetStringLength());
}

template <typename E, std::size_t N>
static E read_enum(const rapidjson::Value &v, const std::string &where,
                   const EnumName<E> (&table)[N]) {
  std::string s = read_string(v, where);
  std::string allowed;
  for (const auto &e : table) {
    if (s == e.name)
      return e.value;
    allowed += allowed.empty() ? "" : ", ";
    allowed += e.name;
  }
  throw ValidationError("configuration: '" + where + "' must be one of " +
                        allowed + " (got '" + s + "')");
}

[[noreturn]] static void unknown_key(const std::string &where) {
  throw ValidationError("configuration: unknown key '" + where + "'");
}

// ---------------------- Section merges ----------------------

static void merge_xml_source(XmlSourceConfig &c, const rapidjson::Value &v,
                             const std::string &where) {
  require_object(v, where);
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const std::string k = key_of(it);
    const std::string at = where + "." + k;
    if (k == "preserveNamespaces")
      c.preserve_namespaces = read_bool(it->value, at);
    else if (k == "namespacePrefixHandling")
      c.namespace_prefix_handling = read_enum(it->value, at, kPrefixHandling);
    else if (k == "preserveCDATA")
      c.preserve_cdata = read_bool(it->value, at);
    else if (k == "preserveComments")
      c.preserve_comments = read_bool(it->value, at);
    else if (k == "preserveInstructions")
      c.preserve_instructions = read_bool(it->value, at);
    else if (k == "preserveTextNodes")
      c.preserve_text_nodes = read_bool(it->value, at);
    else if (k == "preserveAttributes")
      c.preserve_attributes = read_bool(it->value, at);
    else if (k == "preserveWhitespace")
      c.preserve_whitespace = read_bool(it->value, at);
    else if (k == "attributeHandling")
      c.attribute_handling = read_enum(it->value, at, kAttributeHandling);
    else
      unknown_key(at);
  }
}

static void merge_xml_output(XmlOutputConfig &c, const rapidjson::Value &v,
                             const std::string &where) {
  require_object(v, where);
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const std::string k = key_of(it);
    const std::string at = where + "." + k;
    if (k == "prettyPrint")
      c.pretty_print = read_bool(it->value, at);
    else if (k == "declaration")
      c.declaration = read_bool(it->value, at);
    else if (k == "encoding")
      c.encoding = read_string(it->value, at);
    else if (k == "indent")
      c.indent = read_int(it->value, at);
    else if (k == "preserveNamespaces")
      c.preserve_namespaces = read_bool(it->value, at);
    else if (k == "namespacePrefixHandling")
      c.namespace_prefix_handling = read_enum(it->value, at, kPrefixHandling);
    else
      unknown_key(at);
  }
}

static void merge_json_source(JsonSourceConfig &c, const rapidjson::Value &v,
                              const std::string &where) {
  require_object(v, where);
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const std::string k = key_of(it);
    const std::string at = where + "." + k;
    if (k == "arrayItemNames") {
      require_object(it->value, at);
      // Entries are merged key by key, like every other section.
      for (auto m = it->value.MemberBegin(); m != it->value.MemberEnd(); ++m) {
        const std::string prop = key_of(m);
        c.array_item_names[prop] = read_string(m->value, at + "." + prop);
      }
    } else if (k == "defaultItemName") {
      c.default_item_name = read_string(it->value, at);
    } else if (k == "fieldVsValue") {
      c.field_vs_value = read_enum(it->value, at, kFieldVsValue);
    } else if (k == "emptyValueHandling") {
      c.empty_value_handling = read_enum(it->value, at, kEmptyValueHandling);
    } else {
      unknown_key(at);
    }
  }
}

static void merge_json_output(JsonOutputConfig &c, const rapidjson::Value &v,
                              const std::string &where) {
  require_object(v, where);
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const std::string k = key_of(it);
    const std::string at = where + "." + k;
    if (k == "prettyPrint")
      c.pretty_print = read_bool(it->value, at);
    else if (k == "indent")
      c.indent = read_int(it->value, at);
    else if (k == "highFidelity")
      c.high_fidelity = read_bool(it->value, at);
    else
      unknown_key(at);
  }
}

template <typename Source, typename Output, typename MergeSource,
          typename MergeOutput>
static void merge_side(Source &source, Output &output,
                       const rapidjson::Value &v, const std::string &where,
                       MergeSource merge_source, MergeOutput merge_output) {
  require_object(v, where);
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const std::string k = key_of(it);
    if (k == "source")
      merge_source(source, it->value, where + ".source");
    else if (k == "output")
      merge_output(output, it->value, where + ".output");
    else
      unknown_key(where + "." + k);
  }
}

// ---------------------- Public API ------------------------

const char *to_string(NamespacePrefixHandling v) {
  return enum_to_string(kPrefixHandling, v);
}
const char *to_string(AttributeHandling v) {
  return enum_to_string(kAttributeHandling, v);
}
const char *to_string(FieldVsValue v) {
  return enum_to_string(kFieldVsValue, v);
}
const char *to_string(EmptyValueHandling v) {
  return enum_to_string(kEmptyValueHandling, v);
}

Configuration default_configuration() { return Configuration{}; }

Configuration merge_configuration(const Configuration &base,
                                  const rapidjson::Value &overrides) {
  Configuration out = base;
  require_object(overrides, "<root>");
  for (auto it = overrides.MemberBegin(); it != overrides.MemberEnd(); ++it) {
    const std::string k = key_of(it);
    if (k == "xml")
      merge_side(out.xml.source, out.xml.output, it->value, "xml",
                 merge_xml_source, merge_xml_output);
    else if (k == "json")
      merge_side(out.json.source, out.json.output, it->value, "json",
                 merge_json_source, merge_json_output);
    else
      unknown_key(k);
  }
  validate_configuration(out);
  return out;
}

Configuration merge_configuration(const Configuration &base,
                                  const std::string &overrides_json) {
  rapidjson::Document d;
  d.Parse<rapidjson::kParseIterativeFlag |
          rapidjson::kParseValidateEncodingFlag>(overrides_json.c_str(),
                                                 overrides_json.size());
  if (d.HasParseError()) {
    throw ParseError(std::string("configuration JSON parse error: ") +
                     rapidjson::GetParseError_En(d.GetParseError()) +
                     " at offset " + std::to_string(d.GetErrorOffset()));
  }
  return merge_configuration(base, d);
}

Configuration load_configuration_file(const std::string &path) {
  return merge_configuration(default_configuration(), read_file(path));
}

bool parse_xml_encoding(const std::string &name, XmlEncoding &out) {
  std::string upper;
  for (unsigned char c : name)
    upper += static_cast<char>(std::toupper(c));
  if (upper == "UTF-8") {
    out = XmlEncoding::Utf8;
    return true;
  }
  if (upper == "ISO-8859-1") {
    out = XmlEncoding::Latin1;
    return true;
  }
  return false;
}

void validate_configuration(const Configuration &config) {
  if (config.json.source.default_item_name.empty())
    throw ValidationError("configuration: json.source.defaultItemName "
                          "must not be empty");
  for (const auto &kv : config.json.source.array_item_names) {
    if (kv.second.empty())
      throw ValidationError("configuration: json.source.arrayItemNames." +
                            kv.first + " must not be empty");
  }
  if (config.xml.output.indent < 0 || config.xml.output.indent > 16)
    throw ValidationError("configuration: xml.output.indent must be 0..16");
  if (config.json.output.indent < 0 || config.json.output.indent > 16)
    throw ValidationError("configuration: json.output.indent must be 0..16");
  XmlEncoding encoding;
  if (!parse_xml_encoding(config.xml.output.encoding, encoding))
    throw ValidationError("configuration: xml.output.encoding must be UTF-8 "
                          "or ISO-8859-1, got '" +
                          config.xml.output.encoding + "'");
}

std::string configuration_to_json(const Configuration &config) {
  rapidjson::StringBuffer sb;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
  const auto &xs = config.xml.source;
  const auto &xo = config.xml.output;
  const auto &js = config.json.source;
  const auto &jo = config.json.output;

  w.StartObject();
  w.Key("xml");
  w.StartObject();
  w.Key("source");
  w.StartObject();
  w.Key("preserveNamespaces");
  w.Bool(xs.preserve_namespaces);
  w.Key("namespacePrefixHandling");
  w.String(to_string(xs.namespace_prefix_handling));
  w.Key("preserveCDATA");
  w.Bool(xs.preserve_cdata);
  w.Key("preserveComments");
  w.Bool(xs.preserve_comments);
  w.Key("preserveInstructions");
  w.Bool(xs.preserve_instructions);
  w.Key("preserveTextNodes");
  w.Bool(xs.preserve_text_nodes);
  w.Key("preserveAttributes");
  w.Bool(xs.preserve_attributes);
  w.Key("preserveWhitespace");
  w.Bool(xs.preserve_whitespace);
  w.Key("attributeHandling");
  w.String(to_string(xs.attribute_handling));
  w.EndObject();
  w.Key("output");
  w.StartObject();
  w.Key("prettyPrint");
  w.Bool(xo.pretty_print);
  w.Key("declaration");
  w.Bool(xo.declaration);
  w.Key("encoding");
  w.String(xo.encoding.c_str(),
           static_cast<rapidjson::SizeType>(xo.encoding.size()));
  w.Key("indent");
  w.Int(xo.indent);
  w.Key("preserveNamespaces");
  w.Bool(xo.preserve_namespaces);
  w.Key("namespacePrefixHandling");
  w.String(to_string(xo.namespace_prefix_handling));
  w.EndObject();
  w.EndObject();

  w.Key("json");
  w.StartObject();
  w.Key("source");
  w.StartObject();
  w.Key("arrayItemNames");
  w.StartObject();
  for (const auto &kv : js.array_item_names) {
    w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
    w.String(kv.second.c_str(),
             static_cast<rapidjson::SizeType>(kv.second.size()));
  }
  w.EndObject();
  w.Key("defaultItemName");
  w.String(js.default_item_name.c_str(),
           static_cast<rapidjson::SizeType>(js.default_item_name.size()));
  w.Key("fieldVsValue");
  w.String(to_string(js.field_vs_value));
  w.Key("emptyValueHandling");
  w.String(to_string(js.empty_value_handling));
  w.EndObject();
  w.Key("output");
  w.StartObject();
  w.Key("prettyPrint");
  w.Bool(jo.pretty_print);
  w.Key("indent");
  w.Int(jo.indent);
  w.Key("highFidelity");
  w.Bool(jo.high_fidelity);
  w.EndObject();
  w.EndObject();
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace XmlJsonBridge
