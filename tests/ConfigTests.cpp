#include <gtest/gtest.h>

#include "Config.hpp"
#include "Errors.hpp"
#include "Utility.hpp"

#include <cstdio>

using namespace XmlJsonBridge;

TEST(Configuration, Defaults) {
  Configuration c = default_configuration();
  EXPECT_TRUE(c.xml.source.preserve_namespaces);
  EXPECT_EQ(c.xml.source.namespace_prefix_handling,
            NamespacePrefixHandling::Preserve);
  EXPECT_TRUE(c.xml.source.preserve_cdata);
  EXPECT_FALSE(c.xml.source.preserve_whitespace);
  EXPECT_EQ(c.xml.source.attribute_handling, AttributeHandling::Attributes);
  EXPECT_TRUE(c.xml.output.pretty_print);
  EXPECT_TRUE(c.xml.output.declaration);
  EXPECT_EQ(c.xml.output.encoding, "UTF-8");
  EXPECT_EQ(c.xml.output.indent, 2);
  EXPECT_TRUE(c.json.source.array_item_names.empty());
  EXPECT_EQ(c.json.source.default_item_name, "item");
  EXPECT_EQ(c.json.source.field_vs_value, FieldVsValue::Auto);
  EXPECT_EQ(c.json.source.empty_value_handling, EmptyValueHandling::Null);
  EXPECT_FALSE(c.json.output.high_fidelity);
  EXPECT_NO_THROW(validate_configuration(c));
}

TEST(Configuration, MergeKeepsUnspecifiedValues) {
  Configuration c = merge_configuration(
      default_configuration(),
      R"({"xml": {"source": {"preserveCDATA": false,
                             "namespacePrefixHandling": "label"},
                  "output": {"indent": 4}},
          "json": {"source": {"arrayItemNames": {"books": "book"},
                              "fieldVsValue": "field"},
                   "output": {"highFidelity": true}}})");

  EXPECT_FALSE(c.xml.source.preserve_cdata);
  EXPECT_TRUE(c.xml.source.preserve_comments);
  EXPECT_EQ(c.xml.source.namespace_prefix_handling,
            NamespacePrefixHandling::Label);
  EXPECT_EQ(c.xml.output.indent, 4);
  EXPECT_TRUE(c.xml.output.pretty_print);
  EXPECT_EQ(c.json.source.array_item_names.at("books"), "book");
  EXPECT_EQ(c.json.source.default_item_name, "item");
  EXPECT_EQ(c.json.source.field_vs_value, FieldVsValue::Field);
  EXPECT_TRUE(c.json.output.high_fidelity);
}

TEST(Configuration, MergeAddsArrayItemNamesKeyByKey) {
  Configuration base = default_configuration();
  base.json.source.array_item_names["a"] = "x";
  Configuration c = merge_configuration(
      base, R"({"json": {"source": {"arrayItemNames": {"b": "y"}}}})");
  EXPECT_EQ(c.json.source.array_item_names.size(), 2u);
  EXPECT_EQ(c.json.source.array_item_names.at("a"), "x");
}

TEST(Configuration, UnknownKeysAndBadTypesAreRejected) {
  const Configuration base = default_configuration();
  EXPECT_THROW(merge_configuration(base, R"({"yaml": {}})"), ValidationError);
  EXPECT_THROW(merge_configuration(base, R"({"xml": {"source": {"x": 1}}})"),
               ValidationError);
  EXPECT_THROW(
      merge_configuration(base, R"({"xml": {"output": {"indent": "2"}}})"),
      ValidationError);
  EXPECT_THROW(merge_configuration(
                   base, R"({"json": {"source": {"fieldVsValue": "maybe"}}})"),
               ValidationError);
  EXPECT_THROW(merge_configuration(base, R"([1, 2])"), ValidationError);
}

TEST(Configuration, MalformedOverridesAreParseErrors) {
  EXPECT_THROW(merge_configuration(default_configuration(), "{\"xml\": "),
               ParseError);
  EXPECT_THROW(merge_configuration(default_configuration(),
                                   "{\"json\": {\"source\": "
                                   "{\"defaultItemName\": \"\xFF\"}}}"),
               ParseError);
}

TEST(Configuration, Validation) {
  Configuration c = default_configuration();
  c.json.source.default_item_name.clear();
  EXPECT_THROW(validate_configuration(c), ValidationError);

  c = default_configuration();
  c.xml.output.indent = -1;
  EXPECT_THROW(validate_configuration(c), ValidationError);

  c = default_configuration();
  c.json.source.array_item_names["list"] = "";
  EXPECT_THROW(validate_configuration(c), ValidationError);

  c = default_configuration();
  c.xml.output.encoding = "UTF-16";
  EXPECT_THROW(validate_configuration(c), ValidationError);
  c.xml.output.encoding = "utf-8";
  EXPECT_NO_THROW(validate_configuration(c));
  EXPECT_THROW(merge_configuration(default_configuration(),
                                   R"({"xml": {"output": {"encoding": ""}}})"),
               ValidationError);

  EXPECT_THROW(merge_configuration(
                   default_configuration(),
                   R"({"json": {"source": {"defaultItemName": ""}}})"),
               ValidationError);
}

TEST(Configuration, JsonFormRoundTrips) {
  Configuration custom = default_configuration();
  custom.xml.source.attribute_handling = AttributeHandling::Fields;
  custom.xml.output.encoding = "ISO-8859-1";
  custom.json.source.empty_value_handling = EmptyValueHandling::Remove;
  custom.json.source.array_item_names["rows"] = "row";
  custom.json.output.pretty_print = false;

  Configuration back =
      merge_configuration(default_configuration(),
                          configuration_to_json(custom));
  EXPECT_EQ(back.xml.source.attribute_handling, AttributeHandling::Fields);
  EXPECT_EQ(back.xml.output.encoding, "ISO-8859-1");
  EXPECT_EQ(back.json.source.empty_value_handling, EmptyValueHandling::Remove);
  EXPECT_EQ(back.json.source.array_item_names.at("rows"), "row");
  EXPECT_FALSE(back.json.output.pretty_print);
}

TEST(Configuration, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "xjb_config_test.json";
  write_file(path, R"({"xml": {"output": {"declaration": false}}})");
  Configuration c = load_configuration_file(path);
  std::remove(path.c_str());
  EXPECT_FALSE(c.xml.output.declaration);
  EXPECT_TRUE(c.xml.output.pretty_print);

  EXPECT_THROW(load_configuration_file(path), std::runtime_error);
}

TEST(Configuration, EnumNames) {
  EXPECT_STREQ(to_string(NamespacePrefixHandling::Strip), "strip");
  EXPECT_STREQ(to_string(AttributeHandling::Fields), "fields");
  EXPECT_STREQ(to_string(FieldVsValue::Value), "value");
  EXPECT_STREQ(to_string(EmptyValueHandling::Undefined), "undefined");
}
