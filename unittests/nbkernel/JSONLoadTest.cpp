#include "nbkernel/Node.h"

#include <cmath>

#include "gtest/gtest.h"

using namespace nbkernel;

namespace {

void test_load(llvm::StringRef json, const Node &expected) {
  auto actualOrErr = Node::loadFromJSON(json);
  ASSERT_TRUE(static_cast<bool>(actualOrErr))
      << json.str() << ": " << llvm::toString(actualOrErr.takeError());
  EXPECT_EQ(expected, *actualOrErr) << json.str();
}

void test_invalid(llvm::StringRef json) {
  auto actualOrErr = Node::loadFromJSON(json);
  ASSERT_FALSE(static_cast<bool>(actualOrErr)) << json.str();
  llvm::consumeError(actualOrErr.takeError());
}

TEST(JSONLoadTest, Integer) {
  test_load("0", Node(0));
  test_load("-0", Node(0));
  test_load("1", Node(1));
  test_load("1000000000000", Node(1000000000000));
  test_load("9223372036854775807", Node(9223372036854775807));
  test_load("18446744073709551615",
            Node(static_cast<uint64_t>(18446744073709551615ull)));
  test_load("-1", Node(-1));
  test_load("-9223372036854775808", Node(-9223372036854775807 - 1));
}

TEST(JSONLoadTest, Float) {
  test_load("1.5", Node(1.5));
  test_load("-4.5", Node(-4.5));
  test_load("1e3", Node(1000.0));
  test_load("2.5E-1", Node(0.25));
  test_load("0.1", Node(0x1.999999999999ap-4));
  // Too large for 64 bits.
  test_load("18446744073709551616", Node(0x1.0p+64));
}

TEST(JSONLoadTest, Scalars) {
  test_load("null", Node(nullptr));
  test_load("true", Node(true));
  test_load("false", Node(false));
  test_load("  \t\r\n true \n", Node(true));
}

TEST(JSONLoadTest, String) {
  test_load("\"\"", Node(""));
  test_load("\"hello\"", Node("hello"));
  test_load("\"a\\\"b\\\\c\\/d\"", Node("a\"b\\c/d"));
  test_load("\"\\n\\t\\r\\b\\f\"", Node("\n\t\r\b\f"));
  test_load("\"\\u00e9\"", Node("\xc3\xa9"));
  test_load("\"\\ud83d\\ude00\"", Node("\xf0\x9f\x98\x80"));
}

TEST(JSONLoadTest, List) {
  test_load("[]", Node(node_list_arg));
  test_load("[ 1 , \"x\" , null ]", Node(node_list_arg, {1, "x", nullptr}));
  test_load("[[],[[]]]", Node(node_list_arg,
                              {Node(node_list_arg),
                               Node(node_list_arg, {Node(node_list_arg)})}));
}

TEST(JSONLoadTest, Map) {
  test_load("{}", Node(node_map_arg));
  test_load("{\"b\":[true],\"a\":1}",
            Node(node_map_arg,
                 {{"a", 1}, {"b", Node(node_list_arg, {true})}}));
  // The last duplicate wins, like JSON.parse.
  test_load("{\"a\":1,\"a\":2}", Node(node_map_arg, {{"a", 2}}));
}

TEST(JSONLoadTest, Invalid) {
  test_invalid("");
  test_invalid("   ");
  test_invalid("nul");
  test_invalid("tru");
  test_invalid("01x");
  test_invalid("\"unterminated");
  test_invalid("[1,2");
  test_invalid("[1 2]");
  test_invalid("{\"a\" 1}");
  test_invalid("{1:2}");
  test_invalid("{\"a\":1,}");
  test_invalid("true false");
  test_invalid("'single'");
  test_invalid("-");
}

TEST(JSONLoadTest, DeepNesting) {
  std::string json(1000, '[');
  json += std::string(1000, ']');
  test_invalid(json);
}

} // end anonymous namespace
