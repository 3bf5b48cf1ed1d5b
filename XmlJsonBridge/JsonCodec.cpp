#include "JsonCodec.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace XmlJsonBridge {

using Allocator = rapidjson::Document::AllocatorType;

// ---------------------- Utility ----------------------

static std::string key_of(const rapidjson::Value::ConstMemberIterator &it) {
  return std::string(it->name.GetString(), it->name.GetStringLength());
}

static bool is_primitive(const rapidjson::Value &v) {
  return !v.IsObject() && !v.IsArray();
}

static Scalar json_scalar(const rapidjson::Value &v) {
  if (v.IsNull())
    return nullptr;
  if (v.IsBool())
    return v.GetBool();
  if (v.IsInt64())
    return v.GetInt64();
  if (v.IsNumber())
    return v.GetDouble();
  return std::string(v.GetString(), v.GetStringLength());
}

static std::string json_text(const rapidjson::Value &v) {
  if (v.IsNull())
    return std::string();
  return scalar_to_string(json_scalar(v));
}

// One tag per JSON type; numbers share a tag whatever their width.
static int json_type_tag(const rapidjson::Value &v) {
  if (v.IsNull())
    return 0;
  if (v.IsBool())
    return 1;
  if (v.IsNumber())
    return 2;
  if (v.IsString())
    return 3;
  if (v.IsArray())
    return 4;
  return 5;
}

static bool is_reserved_key(const std::string &key) {
  return !key.empty() && (key[0] == '@' || key[0] == '#' || key[0] == '?');
}

static rapidjson::Value json_string(const std::string &s, Allocator &alloc) {
  rapidjson::Value v;
  v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
  return v;
}

static rapidjson::Value scalar_to_json(const Scalar &value, Allocator &alloc) {
  rapidjson::Value v;
  if (const auto *b = std::get_if<bool>(&value)) {
    v.SetBool(*b);
  } else if (const auto *i = std::get_if<std::int64_t>(&value)) {
    v.SetInt64(*i);
  } else if (const auto *d = std::get_if<double>(&value)) {
    if (!std::isfinite(*d))
      throw ProcessingError("non-finite number " + scalar_to_string(value) +
                            " cannot be written as JSON");
    v.SetDouble(*d);
  } else if (const auto *s = std::get_if<std::string>(&value)) {
    v.SetString(s->c_str(), static_cast<rapidjson::SizeType>(s->size()),
                alloc);
  }
  return v;
}

static void check_no_cycles(
    const rapidjson::Value &v,
    std::unordered_set<const rapidjson::Value *> &active) {
  if (is_primitive(v))
    return;
  if (!active.insert(&v).second)
    throw ValidationError("JSON contains circular references");
  if (v.IsArray()) {
    for (const auto &item : v.GetArray())
      check_no_cycles(item, active);
  } else {
    for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it)
      check_no_cycles(it->value, active);
  }
  active.erase(&v);
}

// ---------------- JSON -> XNode core -------------------

// `depth` is the nesting depth of `v` below the document root (root = 0).
// `is_member` is set for object properties and array items.
static std::unique_ptr<XNode> read_value(const std::string &name,
                                         const rapidjson::Value &v,
                                         const JsonSourceConfig &config,
                                         int depth, bool is_member);

static bool promote_to_field(const JsonSourceConfig &config, int depth) {
  switch (config.field_vs_value) {
  case FieldVsValue::Field:
    return true;
  case FieldVsValue::Value:
    return false;
  case FieldVsValue::Auto:
    return depth > 1;
  }
  return false;
}

static std::unique_ptr<XNode> read_primitive(const std::string &name,
                                             const rapidjson::Value &v,
                                             const JsonSourceConfig &config,
                                             int depth, bool is_member) {
  if (v.IsNull()) {
    switch (config.empty_value_handling) {
    case EmptyValueHandling::Undefined:
      return make_field(name);
    case EmptyValueHandling::Remove:
      // Dropped again by remove_empty_values() once the tree is complete.
      return make_field(name, nullptr);
    case EmptyValueHandling::Null:
      break;
    }
  }
  auto node = make_value(name, json_scalar(v));
  if (is_member && promote_to_field(config, depth))
    node->kind = NodeKind::Field;
  return node;
}

static std::unique_ptr<XNode> read_array(const std::string &name,
                                         const rapidjson::Value &v,
                                         const JsonSourceConfig &config,
                                         int depth) {
  auto collection = make_collection(name);

  auto named = config.array_item_names.find(name);
  const std::string item_name = named != config.array_item_names.end()
                                    ? named->second
                                    : config.default_item_name;

  std::set<int> types;
  for (const auto &item : v.GetArray())
    types.insert(json_type_tag(item));
  const bool indexed = types.size() > 1;

  rapidjson::SizeType index = 0;
  for (const auto &item : v.GetArray()) {
    const std::string child_name =
        indexed ? item_name + "_" + std::to_string(index) : item_name;
    collection->add_child(
        read_value(child_name, item, config, depth + 1, true));
    ++index;
  }
  return collection;
}

// Calls `fn` once for a primitive, or once per item of an array of
// primitives.
template <typename Fn>
static void for_each_primitive(const rapidjson::Value &v,
                               const std::string &key, Fn fn) {
  if (v.IsArray()) {
    for (const auto &item : v.GetArray()) {
      if (!is_primitive(item))
        throw ValidationError("JSON member '" + key +
                              "' must hold primitives only");
      fn(item);
    }
    return;
  }
  if (!is_primitive(v))
    throw ValidationError("JSON member '" + key + "' must hold a primitive");
  fn(v);
}

static std::unique_ptr<XNode> read_object(const std::string &name,
                                          const rapidjson::Value &v,
                                          const JsonSourceConfig &config,
                                          int depth) {
  auto record = make_record(name);

  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const std::string key = key_of(it);
    const rapidjson::Value &member = it->value;

    if (key.size() > 1 && key[0] == '@') {
      if (!is_primitive(member))
        throw ValidationError("attribute '" + key + "' of '" + name +
                              "' must be a primitive");
      record->add_attribute(key.substr(1), json_scalar(member));
    } else if (key == "#value") {
      if (!is_primitive(member))
        throw ValidationError("'#value' of '" + name +
                              "' must be a primitive");
      record->value = json_scalar(member);
    } else if (key == "#text") {
      for_each_primitive(member, key, [&](const rapidjson::Value &item) {
        record->add_child(make_value("#text", json_scalar(item)));
      });
    } else if (key == "#cdata") {
      for_each_primitive(member, key, [&](const rapidjson::Value &item) {
        record->add_child(make_data(json_text(item)));
      });
    } else if (key == "#comment") {
      for_each_primitive(member, key, [&](const rapidjson::Value &item) {
        record->add_child(make_comment(json_text(item)));
      });
    } else if (key.size() > 1 && key[0] == '?') {
      const std::string target = key.substr(1);
      for_each_primitive(member, key, [&](const rapidjson::Value &item) {
        record->add_child(make_instruction(target, json_text(item)));
      });
    } else {
      record->add_child(read_value(key, member, config, depth + 1, true));
    }
  }
  return record;
}

static std::unique_ptr<XNode> read_value(const std::string &name,
                                         const rapidjson::Value &v,
                                         const JsonSourceConfig &config,
                                         int depth, bool is_member) {
  if (v.IsArray())
    return read_array(name, v, config, depth);
  if (v.IsObject())
    return read_object(name, v, config, depth);
  return read_primitive(name, v, config, depth, is_member);
}

static bool is_empty_terminal(const XNode &node) {
  return (node.kind == NodeKind::Field || node.kind == NodeKind::Value) &&
         node.children.empty() && (!node.value || is_null(*node.value));
}

// Second pass of the "remove" policy: drop null/absent terminals and any
// container this pass leaves empty. Containers that were empty in the
// input stay.
static void remove_empty_values(XNode &node) {
  std::vector<std::unique_ptr<XNode>> kept;
  for (auto &ch : node.children) {
    if (is_empty_terminal(*ch))
      continue;
    const bool was_filled = !ch->children.empty();
    remove_empty_values(*ch);
    if (was_filled && ch->children.empty() && !ch->has_value() &&
        ch->attributes.empty())
      continue;
    kept.push_back(std::move(ch));
  }
  node.set_children(std::move(kept));
}

static bool is_hifi_shape(const rapidjson::Value &v) {
  if (!v.IsObject())
    return false;
  auto type = v.FindMember("#type");
  auto name = v.FindMember("#name");
  return type != v.MemberEnd() && type->value.IsString() &&
         name != v.MemberEnd() && name->value.IsString();
}

static std::optional<std::string> hifi_string(const rapidjson::Value &v,
                                              const char *key,
                                              const std::string &where) {
  auto it = v.FindMember(key);
  if (it == v.MemberEnd())
    return std::nullopt;
  if (!it->value.IsString())
    throw ValidationError(std::string("high-fidelity JSON: '") + key +
                          "' of " + where + " must be a string");
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

static std::unique_ptr<XNode> read_hifi(const rapidjson::Value &v,
                                        const std::string &where) {
  if (!is_hifi_shape(v))
    throw ValidationError("high-fidelity JSON: " + where +
                          " is not an object with '#type' and '#name'");

  const std::string type = v["#type"].GetString();
  auto kind = parse_kind(type);
  if (!kind)
    throw ValidationError("high-fidelity JSON: unknown node type '" + type +
                          "' at " + where);

  auto node = std::make_unique<XNode>(
      *kind, std::string(v["#name"].GetString(), v["#name"].GetStringLength()));
  node->id = hifi_string(v, "#id", where);
  node->ns = hifi_string(v, "#ns", where);
  node->label = hifi_string(v, "#label", where);

  auto value = v.FindMember("#value");
  if (value != v.MemberEnd()) {
    if (!is_primitive(value->value))
      throw ValidationError("high-fidelity JSON: '#value' of " + where +
                            " must be a primitive");
    node->value = json_scalar(value->value);
  }

  auto attributes = v.FindMember("#attributes");
  if (attributes != v.MemberEnd()) {
    if (!attributes->value.IsArray())
      throw ValidationError("high-fidelity JSON: '#attributes' of " + where +
                            " must be an array");
    rapidjson::SizeType i = 0;
    for (const auto &a : attributes->value.GetArray())
      node->add_attribute(
          read_hifi(a, where + ".#attributes[" + std::to_string(i++) + "]"));
  }

  auto children = v.FindMember("#children");
  if (children != v.MemberEnd()) {
    if (!children->value.IsArray())
      throw ValidationError("high-fidelity JSON: '#children' of " + where +
                            " must be an array");
    rapidjson::SizeType i = 0;
    for (const auto &c : children->value.GetArray())
      node->add_child(
          read_hifi(c, where + ".#children[" + std::to_string(i++) + "]"));
  }
  return node;
}

// ---------------- XNode -> JSON core -------------------

static std::string output_key(const XNode &node) {
  switch (node.kind) {
  case NodeKind::Comment:
    return "#comment";
  case NodeKind::Data:
    return "#cdata";
  case NodeKind::Instruction:
    return "?" + node.name;
  case NodeKind::Attribute:
    return "@" + node.name;
  default:
    return node.name;
  }
}

static rapidjson::Value node_to_json_value(const XNode &node, Allocator &alloc);

static rapidjson::Value value_or_null(const XNode &node, Allocator &alloc) {
  if (!node.value)
    return rapidjson::Value();
  return scalar_to_json(*node.value, alloc);
}

static rapidjson::Value record_to_json_object(const XNode &node,
                                              Allocator &alloc) {
  rapidjson::Value obj(rapidjson::kObjectType);

  for (const auto &a : node.attributes) {
    rapidjson::Value k = json_string("@" + a->name, alloc);
    rapidjson::Value v = value_or_null(*a, alloc);
    obj.AddMember(k, v, alloc);
  }

  if (node.value) {
    rapidjson::Value k = json_string("#value", alloc);
    rapidjson::Value v = scalar_to_json(*node.value, alloc);
    obj.AddMember(k, v, alloc);
  }

  // Group same-named children, in order of first appearance
  std::vector<std::pair<std::string, std::vector<const XNode *>>> groups;
  std::map<std::string, std::size_t> index;
  for (const auto &ch : node.children) {
    const std::string key = output_key(*ch);
    auto found = index.find(key);
    if (found == index.end()) {
      index.emplace(key, groups.size());
      groups.emplace_back(key, std::vector<const XNode *>{ch.get()});
    } else {
      groups[found->second].second.push_back(ch.get());
    }
  }

  for (const auto &g : groups) {
    rapidjson::Value key = json_string(g.first, alloc);
    if (g.second.size() == 1u) {
      rapidjson::Value childVal = node_to_json_value(*g.second[0], alloc);
      obj.AddMember(key, childVal, alloc);
    } else {
      rapidjson::Value arr(rapidjson::kArrayType);
      arr.Reserve(static_cast<rapidjson::SizeType>(g.second.size()), alloc);
      for (const XNode *n : g.second) {
        rapidjson::Value childVal = node_to_json_value(*n, alloc);
        arr.PushBack(childVal, alloc);
      }
      obj.AddMember(key, arr, alloc);
    }
  }
  return obj;
}

static rapidjson::Value node_to_json_value(const XNode &node,
                                           Allocator &alloc) {
  switch (node.kind) {
  case NodeKind::Comment:
  case NodeKind::Data:
  case NodeKind::Instruction:
    return json_string(node.value ? scalar_to_string(*node.value) : "", alloc);
  case NodeKind::Attribute:
    return value_or_null(node, alloc);
  case NodeKind::Collection: {
    rapidjson::Value arr(rapidjson::kArrayType);
    arr.Reserve(static_cast<rapidjson::SizeType>(node.children.size()), alloc);
    for (const auto &ch : node.children) {
      rapidjson::Value item = node_to_json_value(*ch, alloc);
      arr.PushBack(item, alloc);
    }
    return arr;
  }
  case NodeKind::Record:
  case NodeKind::Field:
  case NodeKind::Value:
    break;
  }

  if (node.children.empty() && node.attributes.empty()) {
    if (node.value)
      return scalar_to_json(*node.value, alloc);
    if (node.kind == NodeKind::Record)
      return rapidjson::Value(rapidjson::kObjectType);
    return rapidjson::Value();
  }
  return record_to_json_object(node, alloc);
}

static void fill_hifi(const XNode &node, rapidjson::Value &obj,
                      Allocator &alloc) {
  obj.AddMember("#type", rapidjson::StringRef(kind_name(node.kind)), alloc);
  rapidjson::Value name = json_string(node.name, alloc);
  obj.AddMember("#name", name, alloc);

  if (node.id) {
    rapidjson::Value v = json_string(*node.id, alloc);
    obj.AddMember("#id", v, alloc);
  }
  if (node.ns) {
    rapidjson::Value v = json_string(*node.ns, alloc);
    obj.AddMember("#ns", v, alloc);
  }
  if (node.label) {
    rapidjson::Value v = json_string(*node.label, alloc);
    obj.AddMember("#label", v, alloc);
  }
  if (node.value) {
    rapidjson::Value v = scalar_to_json(*node.value, alloc);
    obj.AddMember("#value", v, alloc);
  }
  if (!node.attributes.empty()) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto &a : node.attributes) {
      rapidjson::Value item(rapidjson::kObjectType);
      fill_hifi(*a, item, alloc);
      arr.PushBack(item, alloc);
    }
    obj.AddMember("#attributes", arr, alloc);
  }
  if (!node.children.empty()) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto &ch : node.children) {
      rapidjson::Value item(rapidjson::kObjectType);
      fill_hifi(*ch, item, alloc);
      arr.PushBack(item, alloc);
    }
    obj.AddMember("#children", arr, alloc);
  }
}

// ---------------- Public API ------------------------

rapidjson::Document parse_json(const std::string &json) {
  rapidjson::Document d;
  d.Parse<rapidjson::kParseIterativeFlag |
          rapidjson::kParseValidateEncodingFlag>(json.c_str(), json.size());
  if (d.HasParseError()) {
    throw ParseError(std::string("JSON parse error: ") +
                     rapidjson::GetParseError_En(d.GetParseError()) +
                     " at offset " + std::to_string(d.GetErrorOffset()));
  }
  return d;
}

void check_json_structure(const rapidjson::Value &value) {
  std::unordered_set<const rapidjson::Value *> active;
  check_no_cycles(value, active);
}

std::unique_ptr<XNode> json_to_xnode(const rapidjson::Value &value,
                                     const Configuration &config) {
  check_json_structure(value);
  const JsonSourceConfig &source = config.json.source;

  // A single-property object names the root; anything else is wrapped.
  std::unique_ptr<XNode> root;
  if (value.IsObject() && value.MemberCount() == 1 &&
      !is_reserved_key(key_of(value.MemberBegin()))) {
    auto it = value.MemberBegin();
    root = read_value(key_of(it), it->value, source, 1, true);
  } else {
    root = read_value("root", value, source, 0, false);
  }

  if (source.empty_value_handling == EmptyValueHandling::Remove)
    remove_empty_values(*root);

  log_debug("json source: converted root '" + root->name + "' (" +
            kind_name(root->kind) + ")");
  return root;
}

std::unique_ptr<XNode> json_hifi_to_xnode(const rapidjson::Value &value,
                                          const Configuration &config) {
  check_json_structure(value);
  if (!is_hifi_shape(value)) {
    log_debug("json source: input is not high-fidelity, using standard "
              "mapping");
    return json_to_xnode(value, config);
  }
  auto root = read_hifi(value, "root");
  log_debug("json source: decoded high-fidelity root '" + root->name + "'");
  return root;
}

std::unique_ptr<XNode> json_string_to_xnode(const std::string &json,
                                            const Configuration &config) {
  rapidjson::Document d = parse_json(json);
  if (config.json.output.high_fidelity)
    return json_hifi_to_xnode(d, config);
  return json_to_xnode(d, config);
}

rapidjson::Document xnode_to_json(const XNode &node,
                                  const Configuration & /*config*/) {
  rapidjson::Document d;
  d.SetObject();
  auto &alloc = d.GetAllocator();

  // Wrap root under its name
  rapidjson::Value key = json_string(node.name, alloc);
  rapidjson::Value rootVal = node_to_json_value(node, alloc);
  d.AddMember(key, rootVal, alloc);
  return d;
}

rapidjson::Document xnode_to_json_hifi(const XNode &node) {
  rapidjson::Document d;
  d.SetObject();
  fill_hifi(node, d, d.GetAllocator());
  return d;
}

std::string write_json(const rapidjson::Value &value,
                       const JsonOutputConfig &output) {
  rapidjson::StringBuffer sb;
  if (output.pretty_print) {
    rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
    w.SetIndent(' ', static_cast<unsigned>(output.indent));
    value.Accept(w);
  } else {
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    value.Accept(w);
  }
  return std::string(sb.GetString(), sb.GetSize());
}

std::string xnode_to_json_string(const XNode &node,
                                 const Configuration &config) {
  rapidjson::Document d = config.json.output.high_fidelity
                              ? xnode_to_json_hifi(node)
                              : xnode_to_json(node, config);
  std::string json = write_json(d, config.json.output);
  log_debug("json output: wrote " + std::to_string(json.size()) + " bytes" +
            (config.json.output.high_fidelity ? " (high fidelity)" : ""));
  return json;
}

} // namespace XmlJsonBridge
