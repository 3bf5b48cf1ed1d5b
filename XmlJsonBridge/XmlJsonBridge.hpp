#pragma once
#include <functional>
#include <string>
#include <vector>

#include "Config.hpp"
#include "TransformContext.hpp"
#include "TransformPipeline.hpp"
#include "XNode.hpp"

namespace XmlJsonBridge {

// Optional callbacks around the source codec. Failures are logged and the
// unmodified input is kept.
struct SourceHooks {
  // Sees the raw input text before parsing.
  std::function<std::string(const std::string &)> before;
  // Sees the tree produced by the source codec.
  std::function<void(XNode &)> after;
};

// Optional callbacks around the output codec, same failure rules.
struct OutputHooks {
  std::function<void(XNode &)> before;
  std::function<std::string(const std::string &)> after;
};

struct ConversionOptions {
  Configuration config = default_configuration();
  TransformPipeline transforms;
  SourceHooks source_hooks;
  OutputHooks output_hooks;
};

// Each conversion: source hooks, source codec, transform pipeline (run for
// the output format), output hooks, output codec. Failures raise one of the
// ConversionError subclasses.
std::string xml_to_json(const std::string &xml,
                        const ConversionOptions &options = ConversionOptions());
std::string json_to_xml(const std::string &json,
                        const ConversionOptions &options = ConversionOptions());
std::string xml_to_xml(const std::string &xml,
                       const ConversionOptions &options = ConversionOptions());
std::string json_to_json(const std::string &json,
                         const ConversionOptions &options = ConversionOptions());

// File helpers
void xml_file_to_json_file(const std::string &in_xml_path,
                           const std::string &out_json_path,
                           const ConversionOptions &options = ConversionOptions());
void json_file_to_xml_file(const std::string &in_json_path,
                           const std::string &out_xml_path,
                           const ConversionOptions &options = ConversionOptions());

using ConversionFn = std::string (*)(const std::string &,
                                     const ConversionOptions &);

struct ConversionEntry {
  const char *name;
  ConversionFn fn;
  TargetFormat input;
  TargetFormat output;
};

// Named entry points: "xml-to-json", "json-to-xml", "xml-to-xml",
// "json-to-json". Returns nullptr for an unknown name.
const ConversionEntry *find_conversion(const std::string &name);
std::vector<std::string> conversion_names();

} // namespace XmlJsonBridge
