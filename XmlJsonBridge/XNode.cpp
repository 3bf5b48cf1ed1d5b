#include "XNode.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <utility>

namespace XmlJsonBridge {

// ---------------------- Kinds & scalars ----------------------

struct KindEntry {
  NodeKind kind;
  const char *name;
};

static const KindEntry kKinds[] = {
    {NodeKind::Record, "record"},
    {NodeKind::Collection, "collection"},
    {NodeKind::Field, "field"},
    {NodeKind::Value, "value"},
    {NodeKind::Attribute, "attribute"},
    {NodeKind::Comment, "comment"},
    {NodeKind::Instruction, "instruction"},
    {NodeKind::Data, "data"},
};

using NanInfWriter =
    rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>,
                      rapidjson::UTF8<>, rapidjson::CrtAllocator,
                      rapidjson::kWriteNanAndInfFlag>;

static bool contributes_text(const XNode &node) {
  switch (node.kind) {
  case NodeKind::Comment:
  case NodeKind::Instruction:
  case NodeKind::Attribute:
    return false;
  default:
    return node.name.empty() || node.name[0] != '@';
  }
}

static void collect_text(const XNode &node, std::string &out) {
  if (!contributes_text(node))
    return;
  if (node.value && !is_null(*node.value))
    out += scalar_to_string(*node.value);
  for (const auto &ch : node.children)
    collect_text(*ch, out);
}

static void collect_matches(const XNode &node,
                            const std::function<bool(const XNode &)> &pred,
                            std::vector<const XNode *> &out) {
  if (pred(node))
    out.push_back(&node);
  for (const auto &ch : node.children)
    collect_matches(*ch, pred, out);
}

static bool optional_equal(const std::optional<std::string> &a,
                           const std::optional<std::string> &b) {
  return a.has_value() == b.has_value() && (!a || *a == *b);
}

const char *kind_name(NodeKind kind) {
  for (const auto &e : kKinds) {
    if (e.kind == kind)
      return e.name;
  }
  return "record";
}

std::optional<NodeKind> parse_kind(const std::string &name) {
  for (const auto &e : kKinds) {
    if (name == e.name)
      return e.kind;
  }
  return std::nullopt;
}

bool is_string(const Scalar &value) {
  return std::holds_alternative<std::string>(value);
}

bool is_null(const Scalar &value) {
  return std::holds_alternative<std::nullptr_t>(value);
}

std::string scalar_to_string(const Scalar &value) {
  if (const auto *s = std::get_if<std::string>(&value))
    return *s;
  if (const auto *b = std::get_if<bool>(&value))
    return *b ? "true" : "false";
  if (is_null(value))
    return "null";
  rapidjson::StringBuffer sb;
  NanInfWriter w(sb);
  if (const auto *i = std::get_if<std::int64_t>(&value))
    w.Int64(*i);
  else
    w.Double(std::get<double>(value));
  return std::string(sb.GetString(), sb.GetSize());
}

// ---------------------- XNode ----------------------

XNode::XNode(NodeKind k, std::string n) : kind(k), name(std::move(n)) {}

XNode &XNode::add_child(std::unique_ptr<XNode> child) {
  child->parent = this;
  children.push_back(std::move(child));
  return *children.back();
}

XNode &XNode::insert_child(std::size_t index, std::unique_ptr<XNode> child) {
  child->parent = this;
  index = std::min(index, children.size());
  auto pos = children.begin() + static_cast<std::ptrdiff_t>(index);
  auto it = children.insert(pos, std::move(child));
  return **it;
}

XNode &XNode::add_attribute(std::unique_ptr<XNode> attribute) {
  attribute->parent = this;
  attributes.push_back(std::move(attribute));
  return *attributes.back();
}

XNode &XNode::add_attribute(const std::string &attr_name, Scalar attr_value) {
  return add_attribute(make_attribute(attr_name, std::move(attr_value)));
}

std::unique_ptr<XNode> XNode::take_child(std::size_t index) {
  if (index >= children.size())
    return nullptr;
  auto out = std::move(children[index]);
  children.erase(children.begin() + static_cast<std::ptrdiff_t>(index));
  out->parent = nullptr;
  return out;
}

bool XNode::remove_child(const XNode *child) {
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (children[i].get() == child) {
      take_child(i);
      return true;
    }
  }
  return false;
}

bool XNode::remove_attribute(const std::string &attr_name) {
  auto it = std::find_if(attributes.begin(), attributes.end(),
                         [&](const std::unique_ptr<XNode> &a) {
                           return a->name == attr_name;
                         });
  if (it == attributes.end())
    return false;
  attributes.erase(it);
  return true;
}

void XNode::set_children(std::vector<std::unique_ptr<XNode>> list) {
  children = std::move(list);
  for (auto &ch : children)
    ch->parent = this;
}

void XNode::set_attributes(std::vector<std::unique_ptr<XNode>> list) {
  attributes = std::move(list);
  for (auto &a : attributes)
    a->parent = this;
}

XNode *XNode::find_child(const std::string &child_name) {
  for (auto &ch : children) {
    if (ch->name == child_name)
      return ch.get();
  }
  return nullptr;
}

const XNode *XNode::find_child(const std::string &child_name) const {
  return const_cast<XNode *>(this)->find_child(child_name);
}

std::vector<const XNode *>
XNode::find_children(const std::string &child_name) const {
  std::vector<const XNode *> out;
  for (const auto &ch : children) {
    if (ch->name == child_name)
      out.push_back(ch.get());
  }
  return out;
}

XNode *XNode::find_attribute(const std::string &attr_name) {
  for (auto &a : attributes) {
    if (a->name == attr_name)
      return a.get();
  }
  return nullptr;
}

const XNode *XNode::find_attribute(const std::string &attr_name) const {
  return const_cast<XNode *>(this)->find_attribute(attr_name);
}

const XNode *
XNode::find_first(const std::function<bool(const XNode &)> &pred) const {
  if (pred(*this))
    return this;
  for (const auto &ch : children) {
    if (const XNode *hit = ch->find_first(pred))
      return hit;
  }
  return nullptr;
}

std::vector<const XNode *>
XNode::find_all(const std::function<bool(const XNode &)> &pred) const {
  std::vector<const XNode *> out;
  collect_matches(*this, pred, out);
  return out;
}

std::string XNode::text_content() const {
  std::string out;
  collect_text(*this, out);
  return out;
}

std::string XNode::path() const {
  std::vector<const XNode *> chain;
  for (const XNode *n = this; n; n = n->parent)
    chain.push_back(n);
  std::string out;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    if (!out.empty())
      out += '.';
    out += (*it)->name;
  }
  return out;
}

std::unique_ptr<XNode> XNode::clone_shallow() const {
  auto copy = std::make_unique<XNode>(kind, name);
  copy->value = value;
  copy->ns = ns;
  copy->label = label;
  copy->id = id;
  for (const auto &a : attributes)
    copy->add_attribute(a->clone_deep());
  return copy;
}

std::unique_ptr<XNode> XNode::clone_deep() const {
  auto copy = clone_shallow();
  for (const auto &ch : children)
    copy->add_child(ch->clone_deep());
  return copy;
}

// ---------------------- Factories ----------------------

std::unique_ptr<XNode> make_record(const std::string &name) {
  return std::make_unique<XNode>(NodeKind::Record, name);
}

std::unique_ptr<XNode> make_collection(const std::string &name) {
  return std::make_unique<XNode>(NodeKind::Collection, name);
}

std::unique_ptr<XNode> make_field(const std::string &name) {
  return std::make_unique<XNode>(NodeKind::Field, name);
}

std::unique_ptr<XNode> make_field(const std::string &name, Scalar value) {
  auto n = make_field(name);
  n->value = std::move(value);
  return n;
}

std::unique_ptr<XNode> make_value(const std::string &name, Scalar value) {
  auto n = std::make_unique<XNode>(NodeKind::Value, name);
  n->value = std::move(value);
  return n;
}

std::unique_ptr<XNode> make_attribute(const std::string &name, Scalar value,
                                      std::optional<std::string> ns,
                                      std::optional<std::string> label) {
  auto n = std::make_unique<XNode>(NodeKind::Attribute, name);
  n->value = std::move(value);
  n->ns = std::move(ns);
  n->label = std::move(label);
  return n;
}

std::unique_ptr<XNode> make_comment(const std::string &text) {
  auto n = std::make_unique<XNode>(NodeKind::Comment, "#comment");
  n->value = text;
  return n;
}

std::unique_ptr<XNode> make_instruction(const std::string &target,
                                        const std::string &data) {
  auto n = std::make_unique<XNode>(NodeKind::Instruction, target);
  n->value = data;
  return n;
}

std::unique_ptr<XNode> make_data(const std::string &text) {
  auto n = std::make_unique<XNode>(NodeKind::Data, "#cdata");
  n->value = text;
  return n;
}

// ---------------------- Equality ----------------------

bool nodes_equal(const XNode &a, const XNode &b) {
  if (a.kind != b.kind || a.name != b.name || a.value != b.value)
    return false;
  if (!optional_equal(a.ns, b.ns) || !optional_equal(a.label, b.label))
    return false;
  if (a.attributes.size() != b.attributes.size() ||
      a.children.size() != b.children.size())
    return false;

  for (const auto &attr : a.attributes) {
    bool matched = std::any_of(
        b.attributes.begin(), b.attributes.end(),
        [&](const std::unique_ptr<XNode> &other) {
          return nodes_equal(*attr, *other);
        });
    if (!matched)
      return false;
  }
  for (std::size_t i = 0; i < a.children.size(); ++i) {
    if (!nodes_equal(*a.children[i], *b.children[i]))
      return false;
  }
  return true;
}

} // namespace XmlJsonBridge
