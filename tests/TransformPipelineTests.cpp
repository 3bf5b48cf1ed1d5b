#include <gtest/gtest.h>

#include "Errors.hpp"
#include "TransformPipeline.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace XmlJsonBridge;

namespace {

// <order id="7"><item>a</item><note>n</note><item>b</item></order>
std::unique_ptr<XNode> sample() {
  auto root = make_record("order");
  root->add_attribute("id", std::string("7"));
  root->add_child(make_field("item", std::string("a")));
  root->add_child(make_field("note", std::string("n")));
  root->add_child(make_field("item", std::string("b")));
  return root;
}

TransformResult run(const TransformPipeline &p, std::unique_ptr<XNode> root,
                    TargetFormat target = TargetFormat::Json) {
  static const Configuration config = default_configuration();
  return p.run(std::move(root), target, config);
}

std::string str(const XNode &n) {
  return n.value ? scalar_to_string(*n.value) : std::string("<none>");
}

} // namespace

TEST(TransformPipeline, EmptyPipelineKeepsTree) {
  TransformPipeline p;
  EXPECT_TRUE(p.empty());
  auto expected = sample();
  auto result = run(p, sample());
  ASSERT_TRUE(result.root);
  EXPECT_TRUE(nodes_equal(*result.root, *expected));
  EXPECT_TRUE(result.warnings.empty());
}

TEST(TransformPipeline, StagesRunInOrderPerNode) {
  std::vector<std::string> calls;
  TransformPipeline p;
  p.add_children_transformer([&](NodeList &, const TransformContext &ctx) {
     calls.push_back("children:" + ctx.path);
   })
      .add_attribute_transformer(
          [&](std::unique_ptr<XNode> a, const TransformContext &ctx) {
            calls.push_back("attribute:" + ctx.path);
            return a;
          })
      .add_value_transformer(
          [&](const Scalar &v, const TransformContext &ctx)
              -> std::optional<Scalar> {
            calls.push_back("value:" + ctx.path);
            return v;
          })
      .add_node_transformer(
          [&](std::unique_ptr<XNode> n, const TransformContext &ctx) {
            calls.push_back("node:" + ctx.path);
            return n;
          });
  EXPECT_EQ(p.size(), 4u);

  auto root = make_record("r");
  root->add_attribute("a", std::string("1"));
  root->add_child(make_field("f", std::string("x")));
  run(p, std::move(root));

  const std::vector<std::string> expected = {
      "node:r",    "value:r.a",      "attribute:r.a", "children:r",
      "node:r.f",  "value:r.f",      "children:r.f"};
  EXPECT_EQ(calls, expected);
}

TEST(TransformPipeline, NodeTransformerRemovesSubtree) {
  TransformPipeline p;
  p.add_node_transformer(
      [](std::unique_ptr<XNode> n,
         const TransformContext &) -> std::unique_ptr<XNode> {
        if (n->name == "item")
          return nullptr;
        return n;
      });
  auto result = run(p, sample());
  ASSERT_EQ(result.root->children.size(), 1u);
  EXPECT_EQ(result.root->children[0]->name, "note");
}

TEST(TransformPipeline, NodeTransformerReplacesNode) {
  TransformPipeline p;
  p.add_node_transformer(
      [](std::unique_ptr<XNode> n, const TransformContext &) {
        if (n->name == "note")
          return make_value("remark", std::string("r"));
        return n;
      });
  std::vector<std::string> seen;
  p.add_value_transformer(
      [&](const Scalar &v, const TransformContext &ctx) -> std::optional<Scalar> {
        seen.push_back(ctx.path);
        return v;
      });

  auto result = run(p, sample());
  const XNode *remark = result.root->find_child("remark");
  ASSERT_NE(remark, nullptr);
  EXPECT_EQ(remark->parent, result.root.get());
  EXPECT_NE(std::find(seen.begin(), seen.end(), "order.remark"), seen.end());
}

TEST(TransformPipeline, RootRemovalYieldsNullRoot) {
  TransformPipeline p;
  p.add_node_transformer(
      [](std::unique_ptr<XNode>, const TransformContext &)
          -> std::unique_ptr<XNode> { return nullptr; });
  auto result = run(p, sample());
  EXPECT_FALSE(result.root);
}

TEST(TransformPipeline, ValueDeletionStopsChain) {
  int later = 0;
  TransformPipeline p;
  p.add_value_transformer(
       [](const Scalar &v, const TransformContext &ctx) -> std::optional<Scalar> {
         if (ctx.node_name == "note")
           return std::nullopt;
         return v;
       })
      .add_value_transformer(
          [&](const Scalar &v, const TransformContext &ctx)
              -> std::optional<Scalar> {
            if (ctx.node_name == "note")
              ++later;
            return v;
          });
  auto result = run(p, sample());
  const XNode *note = result.root->find_child("note");
  ASSERT_NE(note, nullptr);
  EXPECT_FALSE(note->has_value());
  EXPECT_EQ(later, 0);
}

TEST(TransformPipeline, ValueTransformersChain) {
  TransformPipeline p;
  p.add_value_transformer(
       [](const Scalar &v, const TransformContext &) -> std::optional<Scalar> {
         return Scalar(scalar_to_string(v) + "1");
       })
      .add_value_transformer(
          [](const Scalar &v, const TransformContext &) -> std::optional<Scalar> {
            return Scalar(scalar_to_string(v) + "2");
          });
  auto result = run(p, sample());
  EXPECT_EQ(str(*result.root->children[0]), "a12");
  EXPECT_EQ(str(*result.root->find_attribute("id")), "712");
}

TEST(TransformPipeline, AttributeRenameAndRemove) {
  auto root = make_record("r");
  root->add_attribute("id", std::string("1"));
  root->add_attribute("secret", std::string("x"));

  TransformPipeline p;
  p.add_attribute_transformer(
      [](std::unique_ptr<XNode> a,
         const TransformContext &ctx) -> std::unique_ptr<XNode> {
        EXPECT_TRUE(ctx.is_attribute);
        if (a->name == "secret")
          return nullptr;
        a->name = "key";
        return a;
      });
  auto result = run(p, std::move(root));
  ASSERT_EQ(result.root->attributes.size(), 1u);
  EXPECT_EQ(result.root->attributes[0]->name, "key");
  EXPECT_EQ(result.root->attributes[0]->parent, result.root.get());
}

TEST(TransformPipeline, ChildrenReorderAndDrop) {
  TransformPipeline p;
  p.add_children_transformer([](NodeList &children, const TransformContext &) {
    children.erase(std::remove_if(children.begin(), children.end(),
                                  [](const std::unique_ptr<XNode> &n) {
                                    return n->name == "note";
                                  }),
                   children.end());
    std::reverse(children.begin(), children.end());
  });
  auto result = run(p, sample());
  ASSERT_EQ(result.root->children.size(), 2u);
  EXPECT_EQ(str(*result.root->children[0]), "b");
  EXPECT_EQ(str(*result.root->children[1]), "a");
}

TEST(TransformPipeline, ScopedTransformers) {
  TransformPipeline p;
  p.add_value_transformer(
      [](const Scalar &, const TransformContext &) -> std::optional<Scalar> {
        return Scalar(std::string("X"));
      },
      PathMatcher("order.item"));
  p.add_attribute_transformer(
      [](std::unique_ptr<XNode> a, const TransformContext &) {
        a->value = Scalar(std::string("99"));
        return a;
      },
      PathMatcher("**.@id"));

  auto result = run(p, sample());
  EXPECT_EQ(str(*result.root->children[0]), "X");
  EXPECT_EQ(str(*result.root->children[1]), "n");
  EXPECT_EQ(str(*result.root->children[2]), "X");
  EXPECT_EQ(str(*result.root->find_attribute("id")), "99");
}

TEST(TransformPipeline, ContextCarriesTargetAndParent) {
  std::vector<std::string> seen;
  TransformPipeline p;
  p.add_node_transformer(
      [&](std::unique_ptr<XNode> n, const TransformContext &ctx) {
        std::string parent = ctx.parent ? ctx.parent->node_name : "-";
        seen.push_back(std::string(to_string(ctx.target_format)) + ":" +
                       parent + ":" + std::to_string(ctx.depth()));
        return n;
      });
  auto root = make_record("a");
  root->add_child(make_record("b")).add_child(make_field("c"));
  run(p, std::move(root), TargetFormat::Xml);

  const std::vector<std::string> expected = {"xml:-:0", "xml:a:1", "xml:b:2"};
  EXPECT_EQ(seen, expected);
}

TEST(TransformPipeline, FailureWithoutHookIsProcessingError) {
  TransformPipeline p;
  p.add_value_transformer(
      [](const Scalar &, const TransformContext &) -> std::optional<Scalar> {
        throw std::runtime_error("boom");
      });
  try {
    run(p, sample());
    FAIL() << "expected ProcessingError";
  } catch (const ProcessingError &ex) {
    const std::string what = ex.what();
    EXPECT_NE(what.find("value transformer failed"), std::string::npos);
    EXPECT_NE(what.find("boom"), std::string::npos);
  }
}

TEST(TransformPipeline, NodeRecoveryHookReplacesResult) {
  TransformPipeline p;
  p.add_node_transformer(
       [](std::unique_ptr<XNode> n, const TransformContext &) {
         if (n->name == "note")
           throw std::runtime_error("bad note");
         return n;
       })
      .on_node_error([](const std::exception &ex, const XNode &input,
                        const TransformContext &) {
        auto fixed = input.clone_deep();
        fixed->value = Scalar(std::string(ex.what()));
        return fixed;
      });

  auto result = run(p, sample());
  const XNode *note = result.root->find_child("note");
  ASSERT_NE(note, nullptr);
  EXPECT_EQ(str(*note), "bad note");
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("order.note"), std::string::npos);
}

TEST(TransformPipeline, FailingHookKeepsInput) {
  TransformPipeline p;
  p.add_node_transformer(
       [](std::unique_ptr<XNode> n, const TransformContext &) {
         n->name = "changed";
         throw std::runtime_error("late failure");
         return n;
       },
       PathMatcher("order.note"))
      .on_node_error([](const std::exception &, const XNode &,
                        const TransformContext &) -> std::unique_ptr<XNode> {
        throw std::runtime_error("hook failure");
      });

  auto result = run(p, sample());
  const XNode *note = result.root->find_child("note");
  ASSERT_NE(note, nullptr);
  EXPECT_EQ(str(*note), "n");
  EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(TransformPipeline, ValueRecoveryHook) {
  TransformPipeline p;
  p.add_value_transformer(
       [](const Scalar &v, const TransformContext &) -> std::optional<Scalar> {
         if (scalar_to_string(v) == "b")
           throw std::invalid_argument("no b");
         return v;
       })
      .on_value_error([](const std::exception &, const Scalar &,
                         const TransformContext &) -> std::optional<Scalar> {
        return Scalar(std::string("recovered"));
      });

  auto result = run(p, sample());
  EXPECT_EQ(str(*result.root->children[2]), "recovered");
  EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(TransformPipeline, AttributeRecoveryHook) {
  TransformPipeline p;
  p.add_attribute_transformer(
       [](std::unique_ptr<XNode>, const TransformContext &)
           -> std::unique_ptr<XNode> { throw std::runtime_error("attr"); })
      .on_attribute_error([](const std::exception &, const XNode &attr,
                             const TransformContext &ctx) {
        EXPECT_TRUE(ctx.is_attribute);
        return attr.clone_deep();
      });

  auto result = run(p, sample());
  ASSERT_NE(result.root->find_attribute("id"), nullptr);
  EXPECT_EQ(str(*result.root->find_attribute("id")), "7");
  EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(TransformPipeline, ChildrenRecoveryHookGetsSnapshot) {
  TransformPipeline p;
  p.add_children_transformer(
       [](NodeList &children, const TransformContext &ctx) {
         if (ctx.node_name != "order")
           return;
         children.clear();
         throw std::runtime_error("halfway");
       })
      .on_children_error([](const std::exception &, const NodeList &snapshot,
                            const TransformContext &) {
        NodeList out;
        out.push_back(snapshot.back()->clone_deep());
        return out;
      });

  auto result = run(p, sample());
  ASSERT_EQ(result.root->children.size(), 1u);
  EXPECT_EQ(str(*result.root->children[0]), "b");
  EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(TransformPipeline, StageNames) {
  EXPECT_STREQ(to_string(TransformStage::Node), "node");
  EXPECT_STREQ(to_string(TransformStage::Value), "value");
  EXPECT_STREQ(to_string(TransformStage::Attribute), "attribute");
  EXPECT_STREQ(to_string(TransformStage::Children), "children");
}
