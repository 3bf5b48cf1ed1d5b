#include "TransformContext.hpp"

#include "Errors.hpp"

namespace XmlJsonBridge {

const char *to_string(TargetFormat format) {
  return format == TargetFormat::Xml ? "xml" : "json";
}

// ---------------------- Contexts ----------------------

const Configuration &TransformContext::configuration() const {
  if (!config)
    throw ProcessingError("transform context has no configuration");
  return *config;
}

const TransformContext *
TransformContext::find_ancestor(const std::string &name) const {
  for (const TransformContext *c = parent; c; c = c->parent) {
    if (c->node_name == name)
      return c;
  }
  return nullptr;
}

std::size_t TransformContext::depth() const {
  std::size_t d = 0;
  for (const TransformContext *c = parent; c; c = c->parent)
    ++d;
  return d;
}

TransformContext make_root_context(TargetFormat format, const XNode &root,
                                   const Configuration &config) {
  TransformContext ctx;
  ctx.target_format = format;
  ctx.node_name = root.name;
  ctx.node_kind = root.kind;
  ctx.ns = root.ns;
  ctx.label = root.label;
  ctx.path = root.name;
  ctx.config = &config;
  return ctx;
}

TransformContext make_child_context(const TransformContext &parent,
                                    const XNode &child) {
  TransformContext ctx;
  ctx.target_format = parent.target_format;
  ctx.node_name = child.name;
  ctx.node_kind = child.kind;
  ctx.ns = child.ns;
  ctx.label = child.label;
  ctx.path = parent.path + "." + child.name;
  ctx.parent = &parent;
  ctx.config = parent.config;
  return ctx;
}

TransformContext make_attribute_context(const TransformContext &parent,
                                        const XNode &attribute) {
  TransformContext ctx;
  ctx.target_format = parent.target_format;
  ctx.node_name = parent.node_name;
  ctx.node_kind = parent.node_kind;
  ctx.ns = attribute.ns;
  ctx.label = attribute.label;
  ctx.path = parent.path + "." + attribute.name;
  ctx.is_attribute = true;
  ctx.attribute_name = attribute.name;
  ctx.parent = &parent;
  ctx.config = parent.config;
  return ctx;
}

std::vector<std::string> split_path(const std::string &path) {
  std::vector<std::string> out;
  if (path.empty())
    return out;
  std::size_t start = 0;
  while (true) {
    std::size_t dot = path.find('.', start);
    if (dot == std::string::npos) {
      out.push_back(path.substr(start));
      break;
    }
    out.push_back(path.substr(start, dot - start));
    start = dot + 1;
  }
  return out;
}

// ---------------------- PathMatcher ----------------------

PathMatcher::PathMatcher(const std::string &pattern)
    : PathMatcher(std::vector<std::string>{pattern}) {}

PathMatcher::PathMatcher(const std::vector<std::string> &patterns)
    : patterns_(patterns) {
  if (patterns_.empty())
    throw ValidationError("path matcher needs at least one pattern");
  for (const auto &p : patterns_)
    compiled_.push_back(compile(p));
}

PathMatcher::Compiled PathMatcher::compile(const std::string &pattern) {
  if (pattern.empty())
    throw ValidationError("empty path pattern");
  Compiled out;
  for (const auto &seg : split_path(pattern)) {
    if (seg.empty())
      throw ValidationError("empty segment in path pattern '" + pattern + "'");
    if (seg == "**") {
      // Consecutive ** collapse into one.
      if (out.empty() || out.back().type != SegmentType::AnyDepth)
        out.push_back({SegmentType::AnyDepth, seg});
    } else if (seg == "*") {
      out.push_back({SegmentType::AnyOne, seg});
    } else {
      out.push_back({SegmentType::Exact, seg});
    }
  }
  return out;
}

bool PathMatcher::match_from(const Compiled &pattern, std::size_t pi,
                             const std::vector<std::string> &segments,
                             std::size_t si) {
  while (pi < pattern.size()) {
    const Segment &seg = pattern[pi];
    if (seg.type == SegmentType::AnyDepth) {
      for (std::size_t k = si; k <= segments.size(); ++k) {
        if (match_from(pattern, pi + 1, segments, k))
          return true;
      }
      return false;
    }
    if (si >= segments.size())
      return false;
    if (seg.type == SegmentType::Exact && seg.text != segments[si])
      return false;
    ++pi;
    ++si;
  }
  return si == segments.size();
}

bool PathMatcher::matches_segments(
    const std::vector<std::string> &segments) const {
  for (const auto &c : compiled_) {
    if (match_from(c, 0, segments, 0))
      return true;
  }
  return false;
}

bool PathMatcher::matches(const std::string &path) const {
  return matches_segments(split_path(path));
}

bool PathMatcher::matches(const TransformContext &context) const {
  auto segments = split_path(context.path);
  if (context.is_attribute && !segments.empty())
    segments.back() = "@" + segments.back();
  return matches_segments(segments);
}

} // namespace XmlJsonBridge
