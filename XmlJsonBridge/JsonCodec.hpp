#pragma once
#include <memory>
#include <string>

#include <rapidjson/document.h>

#include "Config.hpp"
#include "XNode.hpp"

namespace XmlJsonBridge {

// Parse JSON text. Throws ParseError with RapidJSON's message and offset.
rapidjson::Document parse_json(const std::string &json);

// Throws ValidationError when a value is reachable twice from `value`.
void check_json_structure(const rapidjson::Value &value);

// ---------------- JSON -> XNode -------------------

// Standard mapping: objects to records, arrays to collections, primitives
// to values/fields according to config.json.source. Keys starting with '@',
// '#' or '?' are read back as attributes, text, CDATA, comments and
// processing instructions.
std::unique_ptr<XNode> json_to_xnode(const rapidjson::Value &value,
                                     const Configuration &config);

// Exact inverse of xnode_to_json_hifi(). A root without "#type"/"#name"
// falls back to json_to_xnode().
std::unique_ptr<XNode> json_hifi_to_xnode(const rapidjson::Value &value,
                                          const Configuration &config);

// Parse and convert; the high-fidelity reader is used when
// config.json.output.high_fidelity is set.
std::unique_ptr<XNode> json_string_to_xnode(const std::string &json,
                                            const Configuration &config);

// ---------------- XNode -> JSON -------------------

// Standard, lossy mapping wrapped as {"<root name>": ...}.
rapidjson::Document xnode_to_json(const XNode &node,
                                  const Configuration &config);

// One object per node with "#type", "#name" and the optional "#id", "#ns",
// "#label", "#value", "#attributes", "#children" members.
rapidjson::Document xnode_to_json_hifi(const XNode &node);

std::string write_json(const rapidjson::Value &value,
                       const JsonOutputConfig &output);

// Convert and write according to config.json.output.
std::string xnode_to_json_string(const XNode &node,
                                 const Configuration &config);

} // namespace XmlJsonBridge
