#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace XmlJsonBridge {

// Scalar payload of a node. std::nullptr_t is an explicit JSON null, which
// is different from a node that carries no value at all.
using Scalar = std::variant<std::nullptr_t, bool, std::int64_t, double,
                            std::string>;

enum class NodeKind {
  Record,
  Collection,
  Field,
  Value,
  Attribute,
  Comment,
  Instruction,
  Data
};

// Lower-case names used by high-fidelity JSON ("record", "collection", ...).
const char *kind_name(NodeKind kind);
std::optional<NodeKind> parse_kind(const std::string &name);

// Text form of a scalar: strings verbatim, booleans as true/false, null as
// "null", numbers the way RapidJSON writes them.
std::string scalar_to_string(const Scalar &value);

bool is_string(const Scalar &value);
bool is_null(const Scalar &value);

// One node of the semantic tree. Children and attributes are owned through
// unique_ptr; `parent` is a plain back pointer and never owns anything.
// Nodes live on the heap and are neither copied nor moved, so the back
// pointers of their children stay valid. Use clone_shallow()/clone_deep()
// to duplicate.
struct XNode {
  NodeKind kind = NodeKind::Record;
  std::string name;
  std::optional<Scalar> value;
  std::vector<std::unique_ptr<XNode>> attributes;
  std::vector<std::unique_ptr<XNode>> children;
  std::optional<std::string> ns;
  std::optional<std::string> label;
  std::optional<std::string> id;
  XNode *parent = nullptr;

  XNode(NodeKind kind, std::string name);
  XNode(const XNode &) = delete;
  XNode &operator=(const XNode &) = delete;

  bool has_value() const { return value.has_value(); }

  // Take ownership and set the back pointer. Return the inserted node.
  XNode &add_child(std::unique_ptr<XNode> child);
  XNode &insert_child(std::size_t index, std::unique_ptr<XNode> child);
  XNode &add_attribute(std::unique_ptr<XNode> attribute);
  XNode &add_attribute(const std::string &attr_name, Scalar attr_value);

  // Release ownership of a child; the returned node has no parent.
  std::unique_ptr<XNode> take_child(std::size_t index);
  bool remove_child(const XNode *child);
  bool remove_attribute(const std::string &attr_name);

  // Replace the whole list, re-parenting every entry.
  void set_children(std::vector<std::unique_ptr<XNode>> list);
  void set_attributes(std::vector<std::unique_ptr<XNode>> list);

  XNode *find_child(const std::string &child_name);
  const XNode *find_child(const std::string &child_name) const;
  std::vector<const XNode *> find_children(const std::string &child_name) const;
  XNode *find_attribute(const std::string &attr_name);
  const XNode *find_attribute(const std::string &attr_name) const;

  // Depth-first, pre-order, starting with this node.
  const XNode *
  find_first(const std::function<bool(const XNode &)> &pred) const;
  std::vector<const XNode *>
  find_all(const std::function<bool(const XNode &)> &pred) const;

  // Concatenated values of this node and its descendants in document order.
  // Comments, instructions, attributes and "@" fields do not contribute.
  std::string text_content() const;

  // Dot-joined names from the root down to this node, rebuilt on every call.
  std::string path() const;

  // Copy of this node and its attributes, without children.
  std::unique_ptr<XNode> clone_shallow() const;
  // Copy of the whole subtree with fresh back pointers.
  std::unique_ptr<XNode> clone_deep() const;
};

std::unique_ptr<XNode> make_record(const std::string &name);
std::unique_ptr<XNode> make_collection(const std::string &name);
std::unique_ptr<XNode> make_field(const std::string &name);
std::unique_ptr<XNode> make_field(const std::string &name, Scalar value);
std::unique_ptr<XNode> make_value(const std::string &name, Scalar value);
std::unique_ptr<XNode>
make_attribute(const std::string &name, Scalar value,
               std::optional<std::string> ns = std::nullopt,
               std::optional<std::string> label = std::nullopt);
std::unique_ptr<XNode> make_comment(const std::string &text);
std::unique_ptr<XNode> make_instruction(const std::string &target,
                                        const std::string &data);
std::unique_ptr<XNode> make_data(const std::string &text);

// Structural equality: kind, name, value, ns, label, attributes (in any
// order) and children (in order). `id` and `parent` are not compared.
bool nodes_equal(const XNode &a, const XNode &b);

} // namespace XmlJsonBridge
