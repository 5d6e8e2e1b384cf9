#include <gtest/gtest.h>
#include "utils/json_utils.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace convo::utils;

TEST(JsonUtilsTest, ParsesNestedDocument) {
    auto root = JsonParser::parse(R"({"name": "test", "values": [1, 2.5, -3e2], "flag": true,
                                      "nested": {"empty": null}})");

    ASSERT_TRUE(root.isObject());
    EXPECT_EQ(root.getString("name", ""), "test");
    const auto& values = root.getProperty("values").asArray();
    ASSERT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values[1].asNumber(), 2.5);
    EXPECT_DOUBLE_EQ(values[2].asNumber(), -300.0);
    EXPECT_TRUE(root.getBool("flag", false));
    EXPECT_TRUE(root.getProperty("nested").getProperty("empty").isNull());
    EXPECT_TRUE(root.getProperty("missing").isNull());
}

TEST(JsonUtilsTest, DecodesEscapes) {
    auto value = JsonParser::parse(R"("line\nbreak \"quoted\" é")");
    EXPECT_EQ(value.asString(), "line\nbreak \"quoted\" \xc3\xa9");
}

TEST(JsonUtilsTest, RejectsInvalidInput) {
    EXPECT_THROW(JsonParser::parse(""), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("{\"a\": 1"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("{\"a\": 1} trailing"), std::runtime_error);
    EXPECT_THROW(JsonParser::parse("[1, 2,]"), std::runtime_error);
}

TEST(JsonUtilsTest, TypedLookupsUseFallbackOrThrow) {
    auto root = JsonParser::parse(R"({"n": 4, "s": "x"})");

    EXPECT_DOUBLE_EQ(root.getNumber("n", 0.0), 4.0);
    EXPECT_DOUBLE_EQ(root.getNumber("absent", 7.0), 7.0);
    EXPECT_EQ(root.getString("absent", "fallback"), "fallback");
    EXPECT_THROW(root.getNumber("s", 0.0), std::runtime_error);
    EXPECT_THROW(root.getString("n", ""), std::runtime_error);
}

TEST(JsonUtilsTest, StringifiesCompactly) {
    JsonValue root = JsonValue::object();
    root.set("count", JsonValue(3));
    root.set("ratio", JsonValue(0.25));
    root.set("label", JsonValue("a\"b"));
    JsonValue list = JsonValue::array();
    list.push(JsonValue(true));
    list.push(JsonValue());
    root.set("list", list);

    EXPECT_EQ(JsonParser::stringify(root),
              R"({"count":3,"label":"a\"b","list":[true,null],"ratio":0.25})");
}

TEST(JsonUtilsTest, NonFiniteNumbersBecomeNull) {
    JsonValue nan(std::numeric_limits<double>::quiet_NaN());
    JsonValue inf(std::numeric_limits<double>::infinity());
    EXPECT_EQ(JsonParser::stringify(nan), "null");
    EXPECT_EQ(JsonParser::stringify(inf), "null");
}

TEST(JsonUtilsTest, IndentedOutputParsesBack) {
    JsonValue root = JsonValue::object();
    JsonValue inner = JsonValue::object();
    inner.set("value", JsonValue(1.5));
    root.set("inner", inner);
    root.set("empty", JsonValue::array());

    const std::string text = JsonParser::stringify(root, 2);
    EXPECT_NE(text.find("\n  \"inner\": {"), std::string::npos);

    auto parsed = JsonParser::parse(text);
    EXPECT_DOUBLE_EQ(parsed.getProperty("inner").getNumber("value", 0.0), 1.5);
    EXPECT_TRUE(parsed.getProperty("empty").asArray().empty());
}
