#pragma once
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Config.hpp"
#include "TransformContext.hpp"
#include "XNode.hpp"

namespace XmlJsonBridge {

enum class TransformStage { Node, Value, Attribute, Children };

const char *to_string(TransformStage stage);

using NodeList = std::vector<std::unique_ptr<XNode>>;

// Receives ownership of the node. Return it (modified or not) or a
// replacement to keep going, nullptr to remove it together with its subtree.
using NodeTransformer = std::function<std::unique_ptr<XNode>(
    std::unique_ptr<XNode>, const TransformContext &)>;

// Return the new value, or std::nullopt to delete it. A deleted value skips
// the remaining value transformers.
using ValueTransformer = std::function<std::optional<Scalar>(
    const Scalar &, const TransformContext &)>;

// NodeTransformer contract applied to one attribute: return it renamed or
// changed, or nullptr to drop it.
using AttributeTransformer = NodeTransformer;

// Edits the ordered child list in place.
using ChildrenTransformer =
    std::function<void(NodeList &, const TransformContext &)>;

// Recovery hooks get the failure and an untouched copy of what the failed
// transformer received; their result stands in for the failed step.
using NodeRecovery = std::function<std::unique_ptr<XNode>(
    const std::exception &, const XNode &, const TransformContext &)>;
using ValueRecovery = std::function<std::optional<Scalar>(
    const std::exception &, const Scalar &, const TransformContext &)>;
using AttributeRecovery = NodeRecovery;
using ChildrenRecovery = std::function<NodeList(
    const std::exception &, const NodeList &, const TransformContext &)>;

struct TransformResult {
  // Null when a node transformer removed the root.
  std::unique_ptr<XNode> root;
  // One entry per recovered failure.
  std::vector<std::string> warnings;
};

// Ordered transformer registry applied depth-first to a node tree. For each
// node: node stage, value stage, attribute stage (value transformers, then
// attribute transformers), children stage, then recursion into the
// surviving children. Same-stage transformers run in registration order.
class TransformPipeline {
public:
  TransformPipeline &add_node_transformer(NodeTransformer fn);
  TransformPipeline &add_node_transformer(NodeTransformer fn,
                                          const PathMatcher &scope);
  TransformPipeline &add_value_transformer(ValueTransformer fn);
  TransformPipeline &add_value_transformer(ValueTransformer fn,
                                           const PathMatcher &scope);
  TransformPipeline &add_attribute_transformer(AttributeTransformer fn);
  TransformPipeline &add_attribute_transformer(AttributeTransformer fn,
                                               const PathMatcher &scope);
  TransformPipeline &add_children_transformer(ChildrenTransformer fn);
  TransformPipeline &add_children_transformer(ChildrenTransformer fn,
                                              const PathMatcher &scope);

  TransformPipeline &on_node_error(NodeRecovery hook);
  TransformPipeline &on_value_error(ValueRecovery hook);
  TransformPipeline &on_attribute_error(AttributeRecovery hook);
  TransformPipeline &on_children_error(ChildrenRecovery hook);

  bool empty() const { return size() == 0; }
  std::size_t size() const;

  // Transform `root` in place for output as `target`. Throws ProcessingError
  // when a transformer fails and its stage has no recovery hook.
  TransformResult run(std::unique_ptr<XNode> root, TargetFormat target,
                      const Configuration &config) const;

private:
  template <typename Fn> struct Scoped {
    Fn fn;
    std::optional<PathMatcher> scope;

    bool applies(const TransformContext &ctx) const {
      return !scope || scope->matches(ctx);
    }
  };

  struct RunState;

  std::unique_ptr<XNode> process(std::unique_ptr<XNode> node,
                                 const TransformContext *parent,
                                 RunState &state) const;
  std::unique_ptr<XNode> apply_node_step(const NodeTransformer &fn,
                                         std::unique_ptr<XNode> node,
                                         const TransformContext &ctx,
                                         TransformStage stage,
                                         const NodeRecovery &recovery,
                                         RunState &state) const;
  std::optional<Scalar> apply_values(const Scalar &value,
                                     const TransformContext &ctx,
                                     RunState &state) const;
  void apply_attributes(XNode &node, const TransformContext &ctx,
                        RunState &state) const;
  void apply_children_step(const ChildrenTransformer &fn, NodeList &children,
                           const TransformContext &ctx,
                           RunState &state) const;

  std::vector<Scoped<NodeTransformer>> node_;
  std::vector<Scoped<ValueTransformer>> value_;
  std::vector<Scoped<AttributeTransformer>> attribute_;
  std::vector<Scoped<ChildrenTransformer>> children_;

  NodeRecovery node_recovery_;
  ValueRecovery value_recovery_;
  AttributeRecovery attribute_recovery_;
  ChildrenRecovery children_recovery_;
};

} // namespace XmlJsonBridge
