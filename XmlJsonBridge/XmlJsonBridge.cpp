#include "XmlJsonBridge.hpp"

#include "Errors.hpp"
#include "JsonCodec.hpp"
#include "Logging.hpp"
#include "Utility.hpp"
#include "XmlCodec.hpp"

#include <memory>
#include <string>
#include <utility>

namespace XmlJsonBridge {

// ---------------------- Hooks ----------------------

static std::string run_text_hook(
    const std::function<std::string(const std::string &)> &hook,
    const std::string &text, const char *which) {
  if (!hook)
    return text;
  try {
    return hook(text);
  } catch (const std::exception &ex) {
    log_warn(std::string(which) + " hook failed: " + ex.what() +
             "; keeping input");
    return text;
  }
}

// The hook edits a copy, adopted only when it returns normally.
static void run_tree_hook(const std::function<void(XNode &)> &hook,
                          std::unique_ptr<XNode> &tree, const char *which) {
  if (!hook)
    return;
  std::unique_ptr<XNode> work = tree->clone_deep();
  try {
    hook(*work);
  } catch (const std::exception &ex) {
    log_warn(std::string(which) + " hook failed: " + ex.what() +
             "; keeping input");
    return;
  }
  tree = std::move(work);
}

// ---------------------- Core ----------------------

static std::string convert(const std::string &input, TargetFormat from,
                           TargetFormat to, const ConversionOptions &options) {
  const Configuration &config = options.config;
  validate_configuration(config);
  log_debug(std::string("convert ") + to_string(from) + " -> " +
            to_string(to));

  const std::string raw =
      run_text_hook(options.source_hooks.before, input, "source before");
  std::unique_ptr<XNode> tree = from == TargetFormat::Xml
                                    ? xml_to_xnode(raw, config)
                                    : json_string_to_xnode(raw, config);
  run_tree_hook(options.source_hooks.after, tree, "source after");

  if (!options.transforms.empty()) {
    TransformResult result =
        options.transforms.run(std::move(tree), to, config);
    if (!result.root)
      throw ProcessingError("transformers removed the root node");
    tree = std::move(result.root);
  }

  run_tree_hook(options.output_hooks.before, tree, "output before");
  const std::string out = to == TargetFormat::Xml
                              ? xnode_to_xml(*tree, config)
                              : xnode_to_json_string(*tree, config);
  return run_text_hook(options.output_hooks.after, out, "output after");
}

static const ConversionEntry kConversions[] = {
    {"xml-to-json", &xml_to_json, TargetFormat::Xml, TargetFormat::Json},
    {"json-to-xml", &json_to_xml, TargetFormat::Json, TargetFormat::Xml},
    {"xml-to-xml", &xml_to_xml, TargetFormat::Xml, TargetFormat::Xml},
    {"json-to-json", &json_to_json, TargetFormat::Json, TargetFormat::Json},
};

// ---------------- Public API ------------------------

std::string xml_to_json(const std::string &xml,
                        const ConversionOptions &options) {
  return convert(xml, TargetFormat::Xml, TargetFormat::Json, options);
}

std::string json_to_xml(const std::string &json,
                        const ConversionOptions &options) {
  return convert(json, TargetFormat::Json, TargetFormat::Xml, options);
}

std::string xml_to_xml(const std::string &xml,
                       const ConversionOptions &options) {
  return convert(xml, TargetFormat::Xml, TargetFormat::Xml, options);
}

std::string json_to_json(const std::string &json,
                         const ConversionOptions &options) {
  return convert(json, TargetFormat::Json, TargetFormat::Json, options);
}

void xml_file_to_json_file(const std::string &in_xml_path,
                           const std::string &out_json_path,
                           const ConversionOptions &options) {
  auto xml = read_file(in_xml_path);
  auto js = xml_to_json(xml, options);
  write_file(out_json_path, js);
}

void json_file_to_xml_file(const std::string &in_json_path,
                           const std::string &out_xml_path,
                           const ConversionOptions &options) {
  auto js = read_file(in_json_path);
  auto xml = json_to_xml(js, options);
  write_file(out_xml_path, xml);
}

const ConversionEntry *find_conversion(const std::string &name) {
  for (const auto &e : kConversions) {
    if (name == e.name)
      return &e;
  }
  return nullptr;
}

std::vector<std::string> conversion_names() {
  std::vector<std::string> names;
  for (const auto &e : kConversions)
    names.emplace_back(e.name);
  return names;
}

} // namespace XmlJsonBridge
