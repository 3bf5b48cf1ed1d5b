#include "TransformPipeline.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <utility>

namespace XmlJsonBridge {

struct TransformPipeline::RunState {
  TargetFormat target;
  const Configuration *config;
  std::vector<std::string> *warnings;
};

static std::string failure_message(TransformStage stage,
                                   const TransformContext &ctx,
                                   const std::exception &ex) {
  return std::string(to_string(stage)) + " transformer failed at '" +
         ctx.path + "': " + ex.what();
}

static void record_warning(std::vector<std::string> &warnings,
                           const std::string &msg) {
  log_warn(msg);
  warnings.push_back(msg);
}

static NodeList clone_list(const NodeList &list) {
  NodeList out;
  out.reserve(list.size());
  for (const auto &n : list) {
    if (n)
      out.push_back(n->clone_deep());
  }
  return out;
}

const char *to_string(TransformStage stage) {
  switch (stage) {
  case TransformStage::Node:
    return "node";
  case TransformStage::Value:
    return "value";
  case TransformStage::Attribute:
    return "attribute";
  case TransformStage::Children:
    return "children";
  }
  return "node";
}

// ---------------------- Registration ----------------------

TransformPipeline &TransformPipeline::add_node_transformer(NodeTransformer fn) {
  node_.push_back({std::move(fn), std::nullopt});
  return *this;
}

TransformPipeline &
TransformPipeline::add_node_transformer(NodeTransformer fn,
                                        const PathMatcher &scope) {
  node_.push_back({std::move(fn), scope});
  return *this;
}

TransformPipeline &
TransformPipeline::add_value_transformer(ValueTransformer fn) {
  value_.push_back({std::move(fn), std::nullopt});
  return *this;
}

TransformPipeline &
TransformPipeline::add_value_transformer(ValueTransformer fn,
                                         const PathMatcher &scope) {
  value_.push_back({std::move(fn), scope});
  return *this;
}

TransformPipeline &
TransformPipeline::add_attribute_transformer(AttributeTransformer fn) {
  attribute_.push_back({std::move(fn), std::nullopt});
  return *this;
}

TransformPipeline &
TransformPipeline::add_attribute_transformer(AttributeTransformer fn,
                                             const PathMatcher &scope) {
  attribute_.push_back({std::move(fn), scope});
  return *this;
}

TransformPipeline &
TransformPipeline::add_children_transformer(ChildrenTransformer fn) {
  children_.push_back({std::move(fn), std::nullopt});
  return *this;
}

TransformPipeline &
TransformPipeline::add_children_transformer(ChildrenTransformer fn,
                                            const PathMatcher &scope) {
  children_.push_back({std::move(fn), scope});
  return *this;
}

TransformPipeline &TransformPipeline::on_node_error(NodeRecovery hook) {
  node_recovery_ = std::move(hook);
  return *this;
}

TransformPipeline &TransformPipeline::on_value_error(ValueRecovery hook) {
  value_recovery_ = std::move(hook);
  return *this;
}

TransformPipeline &
TransformPipeline::on_attribute_error(AttributeRecovery hook) {
  attribute_recovery_ = std::move(hook);
  return *this;
}

TransformPipeline &
TransformPipeline::on_children_error(ChildrenRecovery hook) {
  children_recovery_ = std::move(hook);
  return *this;
}

std::size_t TransformPipeline::size() const {
  return node_.size() + value_.size() + attribute_.size() + children_.size();
}

// ---------------------- Steps ----------------------

std::unique_ptr<XNode> TransformPipeline::apply_node_step(
    const NodeTransformer &fn, std::unique_ptr<XNode> node,
    const TransformContext &ctx, TransformStage stage,
    const NodeRecovery &recovery, RunState &state) const {
  // The transformer owns the node once called, so keep a copy for the hook.
  std::unique_ptr<XNode> snapshot;
  if (recovery)
    snapshot = node->clone_deep();

  try {
    return fn(std::move(node), ctx);
  } catch (const std::exception &ex) {
    if (!recovery)
      throw ProcessingError(failure_message(stage, ctx, ex));
    record_warning(*state.warnings,
                   "recovered: " + failure_message(stage, ctx, ex));
    try {
      return recovery(ex, *snapshot, ctx);
    } catch (const std::exception &hook_ex) {
      log_warn(std::string(to_string(stage)) + " recovery hook failed at '" +
               ctx.path + "': " + hook_ex.what() + "; keeping input");
      return snapshot;
    }
  }
}

std::optional<Scalar>
TransformPipeline::apply_values(const Scalar &value,
                                const TransformContext &ctx,
                                RunState &state) const {
  std::optional<Scalar> current = value;
  for (const auto &t : value_) {
    if (!t.applies(ctx))
      continue;
    const Scalar input = *current;
    try {
      current = t.fn(input, ctx);
    } catch (const std::exception &ex) {
      if (!value_recovery_)
        throw ProcessingError(
            failure_message(TransformStage::Value, ctx, ex));
      record_warning(*state.warnings,
                     "recovered: " +
                         failure_message(TransformStage::Value, ctx, ex));
      try {
        current = value_recovery_(ex, input, ctx);
      } catch (const std::exception &hook_ex) {
        log_warn("value recovery hook failed at '" + ctx.path +
                 "': " + hook_ex.what() + "; keeping input");
        current = input;
      }
    }
    if (!current)
      break;
  }
  return current;
}

void TransformPipeline::apply_attributes(XNode &node,
                                         const TransformContext &ctx,
                                         RunState &state) const {
  NodeList attributes = std::move(node.attributes);
  node.attributes.clear();

  NodeList kept;
  for (auto &attr : attributes) {
    TransformContext actx = make_attribute_context(ctx, *attr);
    if (attr->value)
      attr->value = apply_values(*attr->value, actx, state);

    for (const auto &t : attribute_) {
      if (!attr)
        break;
      if (!t.applies(actx))
        continue;
      attr = apply_node_step(t.fn, std::move(attr), actx,
                             TransformStage::Attribute, attribute_recovery_,
                             state);
    }
    if (attr)
      kept.push_back(std::move(attr));
  }
  node.set_attributes(std::move(kept));
}

void TransformPipeline::apply_children_step(const ChildrenTransformer &fn,
                                            NodeList &children,
                                            const TransformContext &ctx,
                                            RunState &state) const {
  NodeList snapshot;
  if (children_recovery_)
    snapshot = clone_list(children);

  try {
    fn(children, ctx);
  } catch (const std::exception &ex) {
    if (!children_recovery_)
      throw ProcessingError(
          failure_message(TransformStage::Children, ctx, ex));
    record_warning(*state.warnings,
                   "recovered: " +
                       failure_message(TransformStage::Children, ctx, ex));
    try {
      children = children_recovery_(ex, snapshot, ctx);
    } catch (const std::exception &hook_ex) {
      log_warn("children recovery hook failed at '" + ctx.path +
               "': " + hook_ex.what() + "; keeping input");
      children = std::move(snapshot);
    }
  }
}

// ---------------------- Traversal ----------------------

std::unique_ptr<XNode>
TransformPipeline::process(std::unique_ptr<XNode> node,
                           const TransformContext *parent,
                           RunState &state) const {
  auto context_for = [&](const XNode &n) {
    return parent ? make_child_context(*parent, n)
                  : make_root_context(state.target, n, *state.config);
  };
  TransformContext ctx = context_for(*node);

  // 1. node stage
  for (const auto &t : node_) {
    if (!t.applies(ctx))
      continue;
    node = apply_node_step(t.fn, std::move(node), ctx, TransformStage::Node,
                           node_recovery_, state);
    if (!node)
      return nullptr;
    ctx = context_for(*node);
  }

  // 2. value stage
  if (node->value && !value_.empty())
    node->value = apply_values(*node->value, ctx, state);

  // 3. attribute stage
  if (!node->attributes.empty() && (!value_.empty() || !attribute_.empty()))
    apply_attributes(*node, ctx, state);

  // 4. children stage
  NodeList children = std::move(node->children);
  node->children.clear();
  for (const auto &t : children_) {
    if (t.applies(ctx))
      apply_children_step(t.fn, children, ctx, state);
  }

  // 5. recursion
  NodeList kept;
  for (auto &ch : children) {
    if (!ch)
      continue;
    ch->parent = node.get();
    auto out = process(std::move(ch), &ctx, state);
    if (out)
      kept.push_back(std::move(out));
  }
  node->set_children(std::move(kept));
  return node;
}

TransformResult TransformPipeline::run(std::unique_ptr<XNode> root,
                                       TargetFormat target,
                                       const Configuration &config) const {
  TransformResult result;
  if (!root)
    return result;

  RunState state{target, &config, &result.warnings};
  result.root = process(std::move(root), nullptr, state);
  if (result.root)
    result.root->parent = nullptr;

  log_debug(std::string("transform pipeline: ") + std::to_string(size()) +
            " transformers for " + to_string(target) + ", " +
            std::to_string(result.warnings.size()) + " warnings" +
            (result.root ? "" : ", root removed"));
  return result;
}

} // namespace XmlJsonBridge
