#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "Config.hpp"
#include "XNode.hpp"

namespace XmlJsonBridge {

enum class TargetFormat { Xml, Json };

const char *to_string(TargetFormat format);

// State handed to every transformer call. One context exists per visited
// node or attribute; contexts chain through `parent` and live on the stack
// of the pipeline run that created them.
struct TransformContext {
  TargetFormat target_format = TargetFormat::Json;
  std::string node_name;
  NodeKind node_kind = NodeKind::Record;
  std::optional<std::string> ns;
  std::optional<std::string> label;
  std::string path;
  bool is_attribute = false;
  std::string attribute_name;
  const TransformContext *parent = nullptr;
  const Configuration *config = nullptr;

  const Configuration &configuration() const;

  // Nearest enclosing context (excluding this one) with the given node name.
  const TransformContext *find_ancestor(const std::string &name) const;

  // Number of parent links up to the root context.
  std::size_t depth() const;
};

TransformContext make_root_context(TargetFormat format, const XNode &root,
                                   const Configuration &config);
TransformContext make_child_context(const TransformContext &parent,
                                    const XNode &child);
// Attribute contexts keep the owning node's name/kind and extend the path
// with the attribute name.
TransformContext make_attribute_context(const TransformContext &parent,
                                        const XNode &attribute);

std::vector<std::string> split_path(const std::string &path);

// Compiled dot-path patterns. Segments:
//   name   exact match
//   *      exactly one segment
//   **     any number of segments, including none
//   @name  an attribute called `name` (final segment of an attribute path)
// A matcher with several patterns matches when any of them does.
class PathMatcher {
public:
  explicit PathMatcher(const std::string &pattern);
  explicit PathMatcher(const std::vector<std::string> &patterns);

  bool matches(const std::string &path) const;
  bool matches(const TransformContext &context) const;

  const std::vector<std::string> &patterns() const { return patterns_; }

private:
  enum class SegmentType { Exact, AnyOne, AnyDepth };
  struct Segment {
    SegmentType type;
    std::string text;
  };
  using Compiled = std::vector<Segment>;

  static Compiled compile(const std::string &pattern);
  static bool match_from(const Compiled &pattern, std::size_t pi,
                         const std::vector<std::string> &segments,
                         std::size_t si);
  bool matches_segments(const std::vector<std::string> &segments) const;

  std::vector<std::string> patterns_;
  std::vector<Compiled> compiled_;
};

} // namespace XmlJsonBridge
