#pragma once
#include <memory>
#include <string>

#include <pugixml.hpp>

#include "Config.hpp"
#include "XNode.hpp"

namespace XmlJsonBridge {

// ---------------- XML -> XNode -------------------

// Parse `xml` and convert its root element. Throws ParseError on malformed
// input and ValidationError when the document has no element.
std::unique_ptr<XNode> xml_to_xnode(const std::string &xml,
                                    const Configuration &config);

// Same conversion starting from an already parsed document.
std::unique_ptr<XNode> xml_document_to_xnode(const pugi::xml_document &doc,
                                             const Configuration &config);

// ---------------- XNode -> XML -------------------

// Replace the content of `doc` with the element tree for `node`. Throws
// ProcessingError for names or character data that cannot be written as
// XML 1.0.
void xnode_to_xml_document(const XNode &node, pugi::xml_document &doc,
                           const Configuration &config);

// Convert and serialize according to config.xml.output.
std::string xnode_to_xml(const XNode &node, const Configuration &config);

// Serialize a document: pretty printed or compact, with an optional
// declaration, in output.encoding (UTF-8 or ISO-8859-1). Throws
// ValidationError for any other encoding.
std::string serialize_xml(const pugi::xml_document &doc,
                          const XmlOutputConfig &output);

// Pretty printer. Elements holding text or CDATA stay on one line with their
// whitespace untouched, even when the text is blank. Structured elements are
// indented `indent` spaces per level and elements without children
// self-close. Text is written by pugixml in `encoding`.
std::string format_xml(const pugi::xml_node &node, int indent,
                       pugi::xml_encoding encoding = pugi::encoding_utf8);

bool is_valid_xml_name(const std::string &name);

} // namespace XmlJsonBridge
