#include "Transforms.hpp"

#include "Errors.hpp"
#include "Utility.hpp"

#include <cctype>
#include <memory>
#include <regex>
#include <stdexcept>
#include <utility>

namespace XmlJsonBridge {

static std::string lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string regex_escape(char c) {
  static const std::string special = "\\^$.|?*+()[]{}";
  if (special.find(c) != std::string::npos)
    return std::string("\\") + c;
  return std::string(1, c);
}

// Whole-string pattern for the number shapes enabled in `options`.
static std::regex number_pattern(const NumberOptions &options) {
  const std::string dec = regex_escape(options.decimal_separator);
  const std::string th = regex_escape(options.thousands_separator);

  std::vector<std::string> alternatives;
  if (options.integers)
    alternatives.push_back("-?(?:\\d{1,3}(?:" + th + "\\d{3})+|\\d+)");
  if (options.decimals)
    alternatives.push_back("-?(?:\\d{1,3}(?:" + th + "\\d{3})+|\\d*)" + dec +
                           "\\d+");
  if (options.scientific)
    alternatives.push_back("-?(?:\\d+(?:" + dec + "\\d+)?|\\d*" + dec +
                           "\\d+)[eE][+-]?\\d+");

  std::string joined;
  for (const auto &a : alternatives) {
    if (!joined.empty())
      joined += '|';
    joined += a;
  }
  if (joined.empty())
    joined = "(?!)";
  return std::regex("^(?:" + joined + ")$");
}

static std::optional<Scalar> parse_number(const std::string &text,
                                          const NumberOptions &options,
                                          const std::regex &pattern) {
  if (!std::regex_match(text, pattern))
    return std::nullopt;

  std::string normalized;
  bool is_integer = true;
  for (char c : text) {
    if (c == options.thousands_separator)
      continue;
    if (c == options.decimal_separator) {
      normalized += '.';
      is_integer = false;
    } else {
      if (c == 'e' || c == 'E')
        is_integer = false;
      normalized += c;
    }
  }

  if (is_integer) {
    try {
      return Scalar(static_cast<std::int64_t>(std::stoll(normalized)));
    } catch (const std::out_of_range &) {
      // Too wide for int64; fall through to double.
    }
  }
  try {
    return Scalar(std::stod(normalized));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

ValueTransformer boolean_transform(BooleanOptions options) {
  auto opts = std::make_shared<BooleanOptions>(std::move(options));
  if (opts->ignore_case) {
    for (auto &v : opts->true_values)
      v = lower(v);
    for (auto &v : opts->false_values)
      v = lower(v);
  }

  return [opts](const Scalar &value,
                const TransformContext &ctx) -> std::optional<Scalar> {
    if (ctx.target_format == TargetFormat::Xml) {
      if (const auto *b = std::get_if<bool>(&value))
        return Scalar(std::string(*b ? "true" : "false"));
      return value;
    }

    const auto *s = std::get_if<std::string>(&value);
    if (!s)
      return value;
    std::string word = trim(*s);
    if (opts->ignore_case)
      word = lower(word);
    for (const auto &t : opts->true_values) {
      if (word == t)
        return Scalar(true);
    }
    for (const auto &f : opts->false_values) {
      if (word == f)
        return Scalar(false);
    }
    return value;
  };
}

ValueTransformer number_transform(NumberOptions options) {
  auto pattern = std::make_shared<std::regex>(number_pattern(options));

  return [options, pattern](const Scalar &value, const TransformContext &ctx)
             -> std::optional<Scalar> {
    if (ctx.target_format == TargetFormat::Xml) {
      if (std::holds_alternative<std::int64_t>(value) ||
          std::holds_alternative<double>(value))
        return Scalar(scalar_to_string(value));
      return value;
    }

    const auto *s = std::get_if<std::string>(&value);
    if (!s)
      return value;
    const std::string text = trim(*s);
    if (text.empty())
      return value;
    auto parsed = parse_number(text, options, *pattern);
    return parsed ? *parsed : value;
  };
}

ValueTransformer regex_replace_transform(const std::string &pattern,
                                         const std::string &replacement) {
  std::shared_ptr<std::regex> re;
  try {
    re = std::make_shared<std::regex>(pattern);
  } catch (const std::regex_error &ex) {
    throw ValidationError("invalid regex '" + pattern + "': " + ex.what());
  }

  return [re, replacement](const Scalar &value,
                           const TransformContext &) -> std::optional<Scalar> {
    const auto *s = std::get_if<std::string>(&value);
    if (!s)
      return value;
    return Scalar(std::regex_replace(*s, *re, replacement));
  };
}

NodeTransformer remove_nodes_named(std::set<std::string> names) {
  return [names = std::move(names)](std::unique_ptr<XNode> node,
                                    const TransformContext &)
             -> std::unique_ptr<XNode> {
    if (names.count(node->name))
      return nullptr;
    return node;
  };
}

} // namespace XmlJsonBridge
