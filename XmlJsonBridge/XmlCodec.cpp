#include "XmlCodec.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "Utility.hpp"

#include <rapidjson/encodings.h>
#include <rapidjson/memorystream.h>

#include <cctype>
#include <map>
#include <sstream>
#include <string>

namespace XmlJsonBridge {

using NamespaceMap = std::map<std::string, std::string>;

static const char *const kXmlNamespace = "http://www.w3.org/XML/1998/namespace";

// ---------------------- Utility ----------------------

struct QName {
  std::string prefix;
  std::string local;
};

static QName split_qname(const std::string &name) {
  auto colon = name.find(':');
  if (colon == std::string::npos)
    return {"", name};
  return {name.substr(0, colon), name.substr(colon + 1)};
}

static std::string local_name(const std::string &name) {
  auto colon = name.rfind(':');
  return colon == std::string::npos ? name : name.substr(colon + 1);
}

static bool is_namespace_declaration(const std::string &name) {
  return name == "xmlns" || name.compare(0, 6, "xmlns:") == 0;
}

static bool is_name_start(unsigned char c) {
  return std::isalpha(c) || c == '_' || c == ':' || c >= 0x80;
}

static bool is_name_char(unsigned char c) {
  return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

// ---------------- XML -> XNode core -------------------

static std::string source_name(const QName &q, const XmlSourceConfig &config) {
  if (config.namespace_prefix_handling == NamespacePrefixHandling::Preserve &&
      !q.prefix.empty())
    return q.prefix + ":" + q.local;
  return q.local;
}

static void read_namespace_declarations(const pugi::xml_node &element,
                                        NamespaceMap &scope) {
  for (pugi::xml_attribute a = element.first_attribute(); a;
       a = a.next_attribute()) {
    const std::string name = a.name();
    if (name == "xmlns")
      scope[""] = a.value();
    else if (name.compare(0, 6, "xmlns:") == 0)
      scope[name.substr(6)] = a.value();
  }
}

static void apply_namespace(XNode &node, const QName &q, bool is_attribute,
                            const NamespaceMap &scope,
                            const XmlSourceConfig &config) {
  if (!config.preserve_namespaces)
    return;
  // Unprefixed attributes are in no namespace; unprefixed elements take the
  // default one.
  if (!q.prefix.empty() || !is_attribute) {
    auto it = scope.find(q.prefix);
    if (it != scope.end() && !it->second.empty())
      node.ns = it->second;
  }
  if (!q.prefix.empty() &&
      config.namespace_prefix_handling == NamespacePrefixHandling::Label)
    node.label = q.prefix;
}

static void convert_attributes(const pugi::xml_node &element, XNode &xnode,
                               const NamespaceMap &scope,
                               const XmlSourceConfig &config) {
  for (pugi::xml_attribute a = element.first_attribute(); a;
       a = a.next_attribute()) {
    const std::string raw = a.name();
    if (is_namespace_declaration(raw))
      continue;
    const QName q = split_qname(raw);
    const std::string name = source_name(q, config);

    std::unique_ptr<XNode> attr;
    if (config.attribute_handling == AttributeHandling::Attributes)
      attr = make_attribute(name, std::string(a.value()));
    else
      attr = make_field("@" + name, std::string(a.value()));
    apply_namespace(*attr, q, true, scope, config);

    if (config.attribute_handling == AttributeHandling::Attributes)
      xnode.add_attribute(std::move(attr));
    else
      xnode.add_child(std::move(attr));
  }
}

static bool keeps_special(const pugi::xml_node &child,
                          const XmlSourceConfig &config) {
  switch (child.type()) {
  case pugi::node_cdata:
    return config.preserve_cdata;
  case pugi::node_comment:
    return config.preserve_comments;
  case pugi::node_pi:
    return config.preserve_instructions;
  default:
    return false;
  }
}

static std::unique_ptr<XNode> element_to_xnode(const pugi::xml_node &element,
                                               NamespaceMap scope,
                                               const XmlSourceConfig &config);

// Text-only content collapses into the record's value; anything else keeps
// every child as its own node so document order survives.
static void convert_children(const pugi::xml_node &element, XNode &xnode,
                             const NamespaceMap &scope,
                             const XmlSourceConfig &config) {
  bool has_elements = false;
  bool has_special = false;
  for (pugi::xml_node ch = element.first_child(); ch; ch = ch.next_sibling()) {
    if (ch.type() == pugi::node_element)
      has_elements = true;
    else if (keeps_special(ch, config))
      has_special = true;
  }

  if (!has_elements && !has_special) {
    if (!config.preserve_text_nodes)
      return;
    std::string text;
    for (pugi::xml_node ch = element.first_child(); ch;
         ch = ch.next_sibling()) {
      if (ch.type() == pugi::node_pcdata)
        text += ch.value();
    }
    if (!config.preserve_whitespace)
      text = trim(text);
    if (!text.empty())
      xnode.value = text;
    return;
  }

  for (pugi::xml_node ch = element.first_child(); ch; ch = ch.next_sibling()) {
    switch (ch.type()) {
    case pugi::node_element:
      xnode.add_child(element_to_xnode(ch, scope, config));
      break;
    case pugi::node_pcdata: {
      if (!config.preserve_text_nodes)
        break;
      std::string text = ch.value();
      if (!config.preserve_whitespace)
        text = trim(text);
      if (!text.empty())
        xnode.add_child(make_value("#text", text));
      break;
    }
    case pugi::node_cdata:
      if (config.preserve_cdata)
        xnode.add_child(make_data(ch.value()));
      break;
    case pugi::node_comment:
      if (config.preserve_comments)
        xnode.add_child(make_comment(ch.value()));
      break;
    case pugi::node_pi:
      if (config.preserve_instructions)
        xnode.add_child(make_instruction(ch.name(), ch.value()));
      break;
    default:
      break;
    }
  }
}

static std::unique_ptr<XNode> element_to_xnode(const pugi::xml_node &element,
                                               NamespaceMap scope,
                                               const XmlSourceConfig &config) {
  read_namespace_declarations(element, scope);

  const QName q = split_qname(element.name());
  auto xnode = make_record(source_name(q, config));
  apply_namespace(*xnode, q, false, scope, config);

  if (config.preserve_attributes)
    convert_attributes(element, *xnode, scope, config);
  convert_children(element, *xnode, scope, config);
  return xnode;
}

// ---------------- XNode -> XML core -------------------

static pugi::xml_encoding output_encoding(const XmlOutputConfig &config) {
  XmlEncoding encoding;
  if (!parse_xml_encoding(config.encoding, encoding))
    throw ValidationError("unsupported XML output encoding '" +
                          config.encoding + "'");
  return encoding == XmlEncoding::Latin1 ? pugi::encoding_latin1
                                         : pugi::encoding_utf8;
}

static std::string hex_code(unsigned cp) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase;
  oss.width(4);
  oss.fill('0');
  oss << cp;
  return oss.str();
}

// Text must be well-formed UTF-8, hold only XML 1.0 characters and fit the
// output encoding.
static void check_chars(const std::string &text, const char *what,
                        const XmlOutputConfig &config) {
  XmlEncoding encoding = XmlEncoding::Utf8;
  parse_xml_encoding(config.encoding, encoding);
  const unsigned limit = encoding == XmlEncoding::Latin1 ? 0xFFu : 0x10FFFFu;

  rapidjson::MemoryStream is(text.data(), text.size());
  while (is.Tell() < text.size()) {
    const std::size_t offset = is.Tell();
    unsigned cp = 0;
    if (!rapidjson::UTF8<char>::Decode(is, &cp))
      throw ProcessingError(std::string("invalid UTF-8 in XML ") + what +
                            " at byte " + std::to_string(offset));
    const bool allowed = cp == 0x9 || cp == 0xA || cp == 0xD ||
                         (cp >= 0x20 && cp <= 0xD7FF) ||
                         (cp >= 0xE000 && cp <= 0xFFFD) ||
                         (cp >= 0x10000 && cp <= 0x10FFFF);
    if (!allowed)
      throw ProcessingError(std::string("character U+") + hex_code(cp) +
                            " not allowed in XML " + what);
    if (cp > limit)
      throw ProcessingError(std::string("character U+") + hex_code(cp) +
                            " in XML " + what + " cannot be written as " +
                            config.encoding);
  }
}

static void check_name(const std::string &name, const char *what,
                       const XmlOutputConfig &config) {
  if (!is_valid_xml_name(name))
    throw ProcessingError(std::string("invalid XML ") + what + " name '" +
                          name + "'");
  check_chars(name, what, config);
}

static std::string text_of(const XNode &node) {
  if (!node.value || is_null(*node.value))
    return std::string();
  return scalar_to_string(*node.value);
}

static bool is_attribute_child(const XNode &node) {
  if (node.kind == NodeKind::Attribute)
    return true;
  return (node.kind == NodeKind::Field || node.kind == NodeKind::Value) &&
         node.name.size() > 1 && node.name[0] == '@';
}

static bool is_text_child(const XNode &node) {
  return (node.kind == NodeKind::Value || node.kind == NodeKind::Field) &&
         node.name == "#text";
}

// A collection whose items all repeat its own name stands for a run of
// sibling elements rather than a wrapper.
static bool is_repeated_group(const XNode &node) {
  if (node.kind != NodeKind::Collection || node.children.empty())
    return false;
  for (const auto &ch : node.children) {
    if (ch->name != node.name)
      return false;
  }
  return true;
}

static std::string output_name(const XNode &node,
                               const XmlOutputConfig &config) {
  switch (config.namespace_prefix_handling) {
  case NamespacePrefixHandling::Strip:
    return local_name(node.name);
  case NamespacePrefixHandling::Label:
  case NamespacePrefixHandling::Preserve:
    if (config.preserve_namespaces && node.label &&
        node.name.find(':') == std::string::npos)
      return *node.label + ":" + node.name;
    return node.name;
  }
  return node.name;
}

// Emit an xmlns declaration on `element` when `uri` is not already bound to
// `prefix` in the enclosing scope.
static void declare_namespace(pugi::xml_node element, const std::string &prefix,
                              const std::string &uri, NamespaceMap &scope) {
  if (prefix == "xml" || prefix == "xmlns")
    return;
  auto it = scope.find(prefix);
  if (it != scope.end() && it->second == uri)
    return;
  const std::string attr = prefix.empty() ? "xmlns" : "xmlns:" + prefix;
  if (element.attribute(attr.c_str()))
    element.attribute(attr.c_str()).set_value(uri.c_str());
  else
    element.append_attribute(attr.c_str()).set_value(uri.c_str());
  scope[prefix] = uri;
}

static void set_attribute(pugi::xml_node element, const XNode &attr,
                          const std::string &name, NamespaceMap &scope,
                          const XmlOutputConfig &config) {
  std::string qname = name;
  if (config.namespace_prefix_handling == NamespacePrefixHandling::Strip)
    qname = local_name(qname);
  else if (config.preserve_namespaces && attr.label &&
           qname.find(':') == std::string::npos)
    qname = *attr.label + ":" + qname;
  check_name(qname, "attribute", config);

  if (config.preserve_namespaces && attr.ns) {
    const QName q = split_qname(qname);
    // Unprefixed attributes cannot carry a namespace.
    if (!q.prefix.empty())
      declare_namespace(element, q.prefix, *attr.ns, scope);
  }

  const std::string value = text_of(attr);
  check_chars(value, "attribute value", config);
  if (element.attribute(qname.c_str()))
    throw ProcessingError("duplicate attribute '" + qname + "' on element '" +
                          std::string(element.name()) + "'");
  element.append_attribute(qname.c_str()).set_value(value.c_str());
}

static void append_xnode(pugi::xml_node parent, const XNode &node,
                         NamespaceMap scope, const XmlOutputConfig &config);

static void append_text(pugi::xml_node element, const std::string &text,
                        const XmlOutputConfig &config) {
  check_chars(text, "text", config);
  element.append_child(pugi::node_pcdata).set_value(text.c_str());
}

static pugi::xml_node append_element(pugi::xml_node parent, const XNode &node,
                                     NamespaceMap &scope,
                                     const XmlOutputConfig &config) {
  const std::string qname = output_name(node, config);
  check_name(qname, "element", config);
  pugi::xml_node element = parent.append_child(qname.c_str());

  if (config.preserve_namespaces) {
    const QName q = split_qname(qname);
    if (node.ns) {
      declare_namespace(element, q.prefix, *node.ns, scope);
    } else if (q.prefix.empty()) {
      auto it = scope.find("");
      if (it != scope.end() && !it->second.empty())
        declare_namespace(element, "", "", scope);
    }
  }

  for (const auto &attr : node.attributes)
    set_attribute(element, *attr, attr->name, scope, config);

  if (node.value && !is_null(*node.value))
    append_text(element, text_of(node), config);

  for (const auto &ch : node.children) {
    if (is_attribute_child(*ch)) {
      const std::string name =
          ch->kind == NodeKind::Attribute ? ch->name : ch->name.substr(1);
      set_attribute(element, *ch, name, scope, config);
    } else {
      append_xnode(element, *ch, scope, config);
    }
  }
  return element;
}

static void append_xnode(pugi::xml_node parent, const XNode &node,
                         NamespaceMap scope, const XmlOutputConfig &config) {
  switch (node.kind) {
  case NodeKind::Comment: {
    const std::string text = text_of(node);
    check_chars(text, "comment", config);
    if (text.find("--") != std::string::npos ||
        (!text.empty() && text.back() == '-'))
      throw ProcessingError(
          "comment text may not contain '--' or end with '-'");
    parent.append_child(pugi::node_comment).set_value(text.c_str());
    return;
  }
  case NodeKind::Instruction: {
    const std::string data = text_of(node);
    check_name(node.name, "processing instruction target", config);
    check_chars(data, "processing instruction", config);
    if (data.find("?>") != std::string::npos)
      throw ProcessingError("processing instruction data may not contain '?>'");
    pugi::xml_node pi = parent.append_child(pugi::node_pi);
    pi.set_name(node.name.c_str());
    pi.set_value(data.c_str());
    return;
  }
  case NodeKind::Data: {
    const std::string text = text_of(node);
    check_chars(text, "CDATA section", config);
    if (text.find("]]>") != std::string::npos)
      throw ProcessingError("CDATA content may not contain ']]>'");
    parent.append_child(pugi::node_cdata).set_value(text.c_str());
    return;
  }
  case NodeKind::Attribute:
    // Attributes reach here only at the top level; the element branch
    // handles them for nested nodes.
    throw ProcessingError("attribute node '" + node.name +
                          "' has no element to attach to");
  case NodeKind::Collection:
    if (parent.type() == pugi::node_element && is_repeated_group(node)) {
      for (const auto &ch : node.children)
        append_xnode(parent, *ch, scope, config);
      return;
    }
    append_element(parent, node, scope, config);
    return;
  case NodeKind::Field:
  case NodeKind::Value:
    if (is_text_child(node)) {
      if (parent.type() != pugi::node_element)
        throw ProcessingError("text node cannot be the document root");
      append_text(parent, text_of(node), config);
      return;
    }
    append_element(parent, node, scope, config);
    return;
  case NodeKind::Record:
    append_element(parent, node, scope, config);
    return;
  }
}

// ---------------- Pretty printer -------------------

static std::string print_raw(const pugi::xml_node &node,
                             pugi::xml_encoding encoding) {
  std::ostringstream oss;
  node.print(oss, "", pugi::format_raw | pugi::format_no_declaration,
             encoding);
  return oss.str();
}

struct Tags {
  std::string open;
  std::string close;
};

// Start and end tag of `element`, printed from an attribute-only copy that
// holds a single empty text node.
static Tags print_tags(const pugi::xml_node &element,
                       pugi::xml_encoding encoding) {
  pugi::xml_document scratch;
  pugi::xml_node shell = scratch.append_child(element.name());
  for (pugi::xml_attribute a = element.first_attribute(); a;
       a = a.next_attribute())
    shell.append_copy(a);
  shell.append_child(pugi::node_pcdata);

  const std::string both = print_raw(shell, encoding);
  const std::size_t split = both.rfind("</");
  return {both.substr(0, split), both.substr(split)};
}

enum class ContentShape { Mixed, TextOnly, Structured };

// Any text or CDATA, blank or not, is content to keep verbatim.
static ContentShape classify(const pugi::xml_node &element) {
  bool has_elements = false;
  bool has_text = false;
  for (pugi::xml_node ch = element.first_child(); ch; ch = ch.next_sibling()) {
    switch (ch.type()) {
    case pugi::node_element:
      has_elements = true;
      break;
    case pugi::node_pcdata:
    case pugi::node_cdata:
      has_text = true;
      break;
    default:
      break;
    }
  }
  if (has_elements && has_text)
    return ContentShape::Mixed;
  if (has_text)
    return ContentShape::TextOnly;
  return ContentShape::Structured;
}

static void format_node(const pugi::xml_node &node, int level,
                        const std::string &unit, pugi::xml_encoding encoding,
                        std::string &out) {
  std::string pad;
  for (int i = 0; i < level; ++i)
    pad += unit;

  switch (node.type()) {
  case pugi::node_document:
    for (pugi::xml_node ch = node.first_child(); ch; ch = ch.next_sibling())
      format_node(ch, level, unit, encoding, out);
    return;
  case pugi::node_element:
    break;
  case pugi::node_comment:
  case pugi::node_pi:
    out += pad;
    out += print_raw(node, encoding);
    out += '\n';
    return;
  default:
    // Text and CDATA are written with their inline parent.
    return;
  }

  if (!node.first_child() || classify(node) != ContentShape::Structured) {
    out += pad;
    out += print_raw(node, encoding);
    out += '\n';
    return;
  }

  const Tags tags = print_tags(node, encoding);
  out += pad;
  out += tags.open;
  out += '\n';
  for (pugi::xml_node ch = node.first_child(); ch; ch = ch.next_sibling())
    format_node(ch, level + 1, unit, encoding, out);
  out += pad;
  out += tags.close;
  out += '\n';
}

// ---------------- Public API ------------------------

bool is_valid_xml_name(const std::string &name) {
  if (name.empty() || !is_name_start(static_cast<unsigned char>(name[0])))
    return false;
  for (unsigned char c : name) {
    if (!is_name_char(c))
      return false;
  }
  return name.front() != ':' && name.back() != ':';
}

std::unique_ptr<XNode> xml_document_to_xnode(const pugi::xml_document &doc,
                                             const Configuration &config) {
  // First element node is the root (declarations, comments, etc. skipped)
  pugi::xml_node root = doc.first_child();
  while (root && root.type() != pugi::node_element)
    root = root.next_sibling();
  if (!root)
    throw ValidationError("XML document has no root element");

  NamespaceMap scope;
  scope["xml"] = kXmlNamespace;
  auto result = element_to_xnode(root, scope, config.xml.source);
  log_debug("xml source: converted root '" + result->name + "' with " +
            std::to_string(result->children.size()) + " children");
  return result;
}

std::unique_ptr<XNode> xml_to_xnode(const std::string &xml,
                                    const Configuration &config) {
  unsigned int flags = pugi::parse_default | pugi::parse_declaration |
                       pugi::parse_comments | pugi::parse_pi;
  if (config.xml.source.preserve_whitespace)
    flags |= pugi::parse_ws_pcdata;

  // pugixml stops at a NUL byte and would accept the truncated document.
  const std::size_t nul = xml.find('\0');
  if (nul != std::string::npos)
    throw ParseError("XML parse error: NUL character at offset " +
                     std::to_string(nul));

  pugi::xml_document doc;
  pugi::xml_parse_result ok =
      doc.load_buffer(xml.data(), xml.size(), flags, pugi::encoding_auto);
  if (!ok)
    throw ParseError(std::string("XML parse error: ") + ok.description() +
                     " at offset " + std::to_string(ok.offset));
  return xml_document_to_xnode(doc, config);
}

void xnode_to_xml_document(const XNode &node, pugi::xml_document &doc,
                           const Configuration &config) {
  doc.reset();
  if (node.kind != NodeKind::Record && node.kind != NodeKind::Collection &&
      node.kind != NodeKind::Field && node.kind != NodeKind::Value)
    throw ProcessingError(std::string("root node of kind '") +
                          kind_name(node.kind) + "' cannot become an element");
  if (is_text_child(node) || is_attribute_child(node))
    throw ProcessingError("root node '" + node.name +
                          "' cannot become an element");

  NamespaceMap scope;
  scope["xml"] = kXmlNamespace;
  append_xnode(doc, node, scope, config.xml.output);
}

std::string serialize_xml(const pugi::xml_document &doc,
                          const XmlOutputConfig &output) {
  const pugi::xml_encoding encoding = output_encoding(output);
  std::string body;
  if (output.pretty_print) {
    body = format_xml(doc, output.indent, encoding);
  } else {
    std::ostringstream oss;
    doc.save(oss, "", pugi::format_raw | pugi::format_no_declaration,
             encoding);
    body = oss.str();
  }
  if (output.declaration)
    body = "<?xml version=\"1.0\" encoding=\"" + output.encoding + "\"?>\n" +
           body;
  return body;
}

std::string format_xml(const pugi::xml_node &node, int indent,
                       pugi::xml_encoding encoding) {
  std::string out;
  format_node(node, 0, std::string(static_cast<size_t>(indent), ' '), encoding,
              out);
  while (!out.empty() && out.back() == '\n')
    out.pop_back();
  return out;
}

std::string xnode_to_xml(const XNode &node, const Configuration &config) {
  pugi::xml_document doc;
  xnode_to_xml_document(node, doc, config);
  std::string xml = serialize_xml(doc, config.xml.output);
  log_debug("xml output: wrote " + std::to_string(xml.size()) + " bytes");
  return xml;
}

} // namespace XmlJsonBridge
