#include "Config.hpp"
#include "Logging.hpp"
#include "Utility.hpp"
#include "XmlJsonBridge.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace XmlJsonBridge;

static std::string ltrim(const std::string &s) {
  size_t i = 0;
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
    ++i;
  return s.substr(i);
}

static bool looks_like_xml(const std::string &content) {
  std::string t = ltrim(content);
  return !t.empty() && t[0] == '<';
}

static bool looks_like_json(const std::string &content) {
  std::string t = ltrim(content);
  return !t.empty() && (t[0] == '{' || t[0] == '[');
}

static const char *extension_for(TargetFormat format) {
  return format == TargetFormat::Xml ? ".xml" : ".json";
}

// input.xml -> input.json; same-format conversions write input.out.xml
static std::string default_output(const fs::path &in,
                                   const ConversionEntry &entry) {
  fs::path p = in;
  if (entry.input == entry.output)
    p.replace_extension(std::string(".out") + extension_for(entry.output));
  else
    p.replace_extension(extension_for(entry.output));
  return p.string();
}

static void print_usage() {
  std::cerr << "Usage: xmljsonbridge [--config file] [--hifi] [--compact] "
               "[--verbose]\n"
               "                     [--conversion name] "
               "<input.(xml|json)> [output]\n"
               "Conversions:";
  for (const auto &n : conversion_names())
    std::cerr << " " << n;
  std::cerr << "\n";
}

int main(int argc, char **argv) {
  try {
    std::string configPath;
    std::string conversionName;
    bool hifi = false;
    bool compact = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        configPath = argv[++i];
      } else if (arg == "--conversion" && i + 1 < argc) {
        conversionName = argv[++i];
      } else if (arg == "--hifi") {
        hifi = true;
      } else if (arg == "--compact") {
        compact = true;
      } else if (arg == "--verbose") {
        set_log_level(LogLevel::Debug);
      } else if (!arg.empty() && arg[0] == '-') {
        print_usage();
        return 1;
      } else {
        positional.push_back(arg);
      }
    }

    if (positional.empty() || positional.size() > 2) {
      print_usage();
      return 1;
    }

    fs::path inPath(positional[0]);
    const bool hasOut = (positional.size() == 2);

    ConversionOptions options;
    if (!configPath.empty())
      options.config = load_configuration_file(configPath);
    if (hifi)
      options.config.json.output.high_fidelity = true;
    if (compact) {
      options.config.xml.output.pretty_print = false;
      options.config.json.output.pretty_print = false;
    }

    std::string content = read_file(inPath.string());

    const ConversionEntry *entry = nullptr;
    if (!conversionName.empty()) {
      entry = find_conversion(conversionName);
      if (!entry) {
        std::cerr << "Unknown conversion: " << conversionName << "\n";
        print_usage();
        return 1;
      }
    } else {
      // Determine input type by extension or sniff
      std::string ext =
          inPath.has_extension() ? inPath.extension().string() : "";
      std::transform(ext.begin(), ext.end(), ext.begin(),
                     [](unsigned char c) { return std::tolower(c); });

      if (ext == ".xml" || (ext != ".json" && looks_like_xml(content)))
        entry = find_conversion("xml-to-json");
      else if (ext == ".json" || looks_like_json(content))
        entry = find_conversion("json-to-xml");
      else {
        std::cerr
            << "Unable to detect input type (not XML/JSON by sniffing).\n";
        return 2;
      }
    }

    const std::string outPath =
        hasOut ? positional[1] : default_output(inPath, *entry);

    write_file(outPath, entry->fn(content, options));

    std::cout << "Wrote: " << outPath << "\n";
    return 0;

  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 3;
  }
}
