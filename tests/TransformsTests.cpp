#include <gtest/gtest.h>

#include "Errors.hpp"
#include "Transforms.hpp"

using namespace XmlJsonBridge;

namespace {

TransformContext context(TargetFormat target) {
  static const Configuration config = default_configuration();
  static const auto node = make_field("f");
  return make_root_context(target, *node, config);
}

Scalar apply(const ValueTransformer &t, const Scalar &v,
             TargetFormat target = TargetFormat::Json) {
  auto out = t(v, context(target));
  EXPECT_TRUE(out.has_value());
  return out ? *out : Scalar(nullptr);
}

Scalar text(const char *s) { return Scalar(std::string(s)); }

} // namespace

TEST(BooleanTransform, RecognizedStrings) {
  auto t = boolean_transform();
  EXPECT_EQ(apply(t, text("true")), Scalar(true));
  EXPECT_EQ(apply(t, text(" YES ")), Scalar(true));
  EXPECT_EQ(apply(t, text("On")), Scalar(true));
  EXPECT_EQ(apply(t, text("0")), Scalar(false));
  EXPECT_EQ(apply(t, text("off")), Scalar(false));
}

TEST(BooleanTransform, OtherValuesPassThrough) {
  auto t = boolean_transform();
  EXPECT_EQ(apply(t, text("maybe")), text("maybe"));
  EXPECT_EQ(apply(t, Scalar(std::int64_t{1})), Scalar(std::int64_t{1}));
  EXPECT_EQ(apply(t, Scalar(nullptr)), Scalar(nullptr));
}

TEST(BooleanTransform, CaseSensitiveAndCustomWords) {
  BooleanOptions options;
  options.true_values = {"Y"};
  options.false_values = {"N"};
  options.ignore_case = false;
  auto t = boolean_transform(options);
  EXPECT_EQ(apply(t, text("Y")), Scalar(true));
  EXPECT_EQ(apply(t, text("y")), text("y"));
  EXPECT_EQ(apply(t, text("true")), text("true"));
}

TEST(BooleanTransform, TowardsXmlWritesWords) {
  auto t = boolean_transform();
  EXPECT_EQ(apply(t, Scalar(true), TargetFormat::Xml), text("true"));
  EXPECT_EQ(apply(t, Scalar(false), TargetFormat::Xml), text("false"));
  EXPECT_EQ(apply(t, text("yes"), TargetFormat::Xml), text("yes"));
}

TEST(NumberTransform, IntegersAndDecimals) {
  auto t = number_transform();
  EXPECT_EQ(apply(t, text("42")), Scalar(std::int64_t{42}));
  EXPECT_EQ(apply(t, text(" -7 ")), Scalar(std::int64_t{-7}));
  EXPECT_EQ(apply(t, text("1,234")), Scalar(std::int64_t{1234}));
  EXPECT_EQ(apply(t, text("1,234.5")), Scalar(1234.5));
  EXPECT_EQ(apply(t, text(".5")), Scalar(0.5));
  EXPECT_EQ(apply(t, text("2.5e3")), Scalar(2500.0));
}

TEST(NumberTransform, NonNumbersPassThrough) {
  auto t = number_transform();
  EXPECT_EQ(apply(t, text("12abc")), text("12abc"));
  EXPECT_EQ(apply(t, text("1,23")), text("1,23"));
  EXPECT_EQ(apply(t, text("")), text(""));
  EXPECT_EQ(apply(t, Scalar(true)), Scalar(true));
}

TEST(NumberTransform, WideIntegersBecomeDoubles) {
  auto t = number_transform();
  Scalar out = apply(t, text("123456789012345678901234"));
  ASSERT_TRUE(std::holds_alternative<double>(out));
  EXPECT_DOUBLE_EQ(std::get<double>(out), 1.23456789012345678901234e23);
}

TEST(NumberTransform, DisabledShapesAndSeparators) {
  NumberOptions options;
  options.decimals = false;
  options.scientific = false;
  auto integersOnly = number_transform(options);
  EXPECT_EQ(apply(integersOnly, text("3")), Scalar(std::int64_t{3}));
  EXPECT_EQ(apply(integersOnly, text("3.5")), text("3.5"));
  EXPECT_EQ(apply(integersOnly, text("1e3")), text("1e3"));

  NumberOptions european;
  european.decimal_separator = ',';
  european.thousands_separator = '.';
  auto eu = number_transform(european);
  EXPECT_EQ(apply(eu, text("1.234,5")), Scalar(1234.5));
}

TEST(NumberTransform, TowardsXmlWritesText) {
  auto t = number_transform();
  EXPECT_EQ(apply(t, Scalar(std::int64_t{5}), TargetFormat::Xml), text("5"));
  EXPECT_EQ(apply(t, Scalar(2.5), TargetFormat::Xml), text("2.5"));
  EXPECT_EQ(apply(t, text("5"), TargetFormat::Xml), text("5"));
}

TEST(RegexReplaceTransform, ReplacesEveryMatch) {
  auto t = regex_replace_transform("\\s+", " ");
  EXPECT_EQ(apply(t, text("a  b\t\tc")), text("a b c"));
  EXPECT_EQ(apply(t, Scalar(std::int64_t{3})), Scalar(std::int64_t{3}));

  auto groups = regex_replace_transform("(\\d+)-(\\d+)", "$2-$1");
  EXPECT_EQ(apply(groups, text("10-20")), text("20-10"));
}

TEST(RegexReplaceTransform, InvalidPattern) {
  EXPECT_THROW(regex_replace_transform("(", ""), ValidationError);
}

TEST(RemoveNodesNamed, DropsMatchingNodes) {
  auto t = remove_nodes_named({"secret", "tmp"});
  const auto ctx = context(TargetFormat::Json);
  EXPECT_EQ(t(make_field("secret"), ctx), nullptr);
  auto kept = t(make_field("public"), ctx);
  ASSERT_NE(kept, nullptr);
  EXPECT_EQ(kept->name, "public");
}
