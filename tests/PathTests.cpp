#include <gtest/gtest.h>

#include "Errors.hpp"
#include "TransformContext.hpp"

using namespace XmlJsonBridge;

TEST(PathMatcher, SingleSegmentWildcard) {
  PathMatcher m("root.items.*.price");
  EXPECT_TRUE(m.matches("root.items.0.price"));
  EXPECT_TRUE(m.matches("root.items.9.price"));
  EXPECT_FALSE(m.matches("root.items.0.price.currency"));
  EXPECT_FALSE(m.matches("root.items.price"));
}

TEST(PathMatcher, AnyDepthWildcard) {
  PathMatcher m("root.**.price");
  EXPECT_TRUE(m.matches("root.price"));
  EXPECT_TRUE(m.matches("root.a.price"));
  EXPECT_TRUE(m.matches("root.a.b.c.price"));
  EXPECT_FALSE(m.matches("root.a.price.currency"));
  EXPECT_FALSE(m.matches("other.price"));
}

TEST(PathMatcher, LeadingAndRepeatedAnyDepth) {
  PathMatcher m("**.**.id");
  EXPECT_TRUE(m.matches("id"));
  EXPECT_TRUE(m.matches("a.b.id"));
  EXPECT_FALSE(m.matches("a.b.idx"));
}

TEST(PathMatcher, ExactMatchOnly) {
  PathMatcher m("root.child");
  EXPECT_TRUE(m.matches("root.child"));
  EXPECT_FALSE(m.matches("root"));
  EXPECT_FALSE(m.matches("root.child.x"));
}

TEST(PathMatcher, AnyOfSeveralPatterns) {
  PathMatcher m(std::vector<std::string>{"a.b", "c.*"});
  EXPECT_TRUE(m.matches("a.b"));
  EXPECT_TRUE(m.matches("c.z"));
  EXPECT_FALSE(m.matches("a.c"));
  EXPECT_EQ(m.patterns().size(), 2u);
}

TEST(PathMatcher, InvalidPatterns) {
  EXPECT_THROW(PathMatcher(""), ValidationError);
  EXPECT_THROW(PathMatcher("a..b"), ValidationError);
  EXPECT_THROW(PathMatcher(std::vector<std::string>{}), ValidationError);
}

TEST(PathMatcher, AttributeContexts) {
  Configuration config;
  auto item = make_record("item");
  item->add_attribute("id", std::string("1"));
  auto root = make_record("root");

  TransformContext rootCtx = make_root_context(TargetFormat::Json, *root, config);
  TransformContext itemCtx = make_child_context(rootCtx, *item);
  TransformContext attrCtx =
      make_attribute_context(itemCtx, *item->attributes[0]);

  EXPECT_EQ(attrCtx.path, "root.item.id");
  EXPECT_TRUE(attrCtx.is_attribute);
  EXPECT_EQ(attrCtx.attribute_name, "id");
  EXPECT_EQ(attrCtx.node_name, "item");

  EXPECT_TRUE(PathMatcher("root.item.@id").matches(attrCtx));
  EXPECT_TRUE(PathMatcher("**.@id").matches(attrCtx));
  EXPECT_FALSE(PathMatcher("root.item.@id").matches(itemCtx));
  EXPECT_FALSE(PathMatcher("root.item.id").matches(attrCtx));
}

TEST(TransformContext, ChainAndAncestors) {
  Configuration config;
  auto root = make_record("root");
  auto list = make_collection("list");
  auto entry = make_record("entry");

  TransformContext a = make_root_context(TargetFormat::Xml, *root, config);
  TransformContext b = make_child_context(a, *list);
  TransformContext c = make_child_context(b, *entry);

  EXPECT_EQ(c.path, "root.list.entry");
  EXPECT_EQ(c.depth(), 2u);
  EXPECT_EQ(c.target_format, TargetFormat::Xml);
  EXPECT_EQ(c.node_kind, NodeKind::Record);
  EXPECT_EQ(c.find_ancestor("root"), &a);
  EXPECT_EQ(c.find_ancestor("entry"), nullptr);
  EXPECT_EQ(&c.configuration(), &config);

  TransformContext detached;
  EXPECT_THROW(detached.configuration(), ProcessingError);
}

TEST(TransformContext, SplitPath) {
  EXPECT_EQ(split_path("a.b.c"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(split_path("").empty());
}
