#include "nbkernel/Node.h"

#include "gtest/gtest.h"
#include <cmath>
#include <sstream>

using namespace nbkernel;

namespace {

void test_print(llvm::StringRef expected, const Node &value) {
  std::stringstream out;
  out << value;
  EXPECT_EQ(expected, out.str());
}

TEST(JSONWriteTest, Integer) {
  test_print("0", Node(0));
  test_print("1", Node(1));
  test_print("1000000000000", Node(1000000000000));
  test_print("9223372036854775807", Node(9223372036854775807));
  test_print("18446744073709551615",
             Node(static_cast<uint64_t>(18446744073709551615ull)));
  test_print("-1", Node(-1));
  test_print("-9223372036854775808", Node(-9223372036854775807 - 1));
}

TEST(JSONWriteTest, Float) {
  // Number::toString, as used by JSON.stringify.
  test_print("0", Node(0.0));
  test_print("0", Node(-0.0));
  test_print("5e-324", Node(0x0.0000000000001p-1022));
  test_print("-5e-324", Node(-0x0.0000000000001p-1022));
  test_print("1.7976931348623157e+308", Node(0x1.fffffffffffffp+1023));
  test_print("9007199254740992", Node(0x1.0p+53));
  test_print("295147905179352830000", Node(0x1.0p+68));
  test_print("1e+23", Node(0x1.52d02c7e14af6p+76));
  test_print("1e+21", Node(0x1.b1ae4d6e2ef50p+69));
  test_print("0.000001", Node(0x1.0c6f7a0b5ed8dp-20));
  test_print("1e-7", Node(0x1.ad7f29abcaf48p-24));
  test_print("1.5", Node(1.5));
  test_print("-4.5", Node(-4.5));
  test_print("0.1", Node(0x1.999999999999ap-4));
  test_print("3.141592653589793", Node(0x1.921fb54442d18p+1));
}

TEST(JSONWriteTest, NonFiniteFloat) {
  test_print("null", Node(NAN));
  test_print("null", Node(INFINITY));
  test_print("null", Node(-INFINITY));
}

TEST(JSONWriteTest, Scalars) {
  test_print("null", Node(nullptr));
  test_print("true", Node(true));
  test_print("false", Node(false));
}

TEST(JSONWriteTest, String) {
  test_print("\"\"", Node(""));
  test_print("\"hello\"", Node("hello"));
  test_print("\"a\\\"b\\\\c\"", Node("a\"b\\c"));
  test_print("\"line\\nbreak\\ttab\"", Node("line\nbreak\ttab"));
  test_print("\"\\u0001\\u001f\"", Node("\x01\x1f"));
  test_print("\"\xc3\xa9\"", Node("\xc3\xa9"));
}

TEST(JSONWriteTest, Bytes) {
  test_print("\"\"", Node(byte_string_arg, llvm::StringRef("")));
  test_print("\"aGVsbG8=\"", Node(byte_string_arg, llvm::StringRef("hello")));
}

TEST(JSONWriteTest, List) {
  test_print("[]", Node(node_list_arg));
  test_print("[1,\"x\",null]", Node(node_list_arg, {1, "x", nullptr}));
  test_print("[[],[[]]]",
             Node(node_list_arg,
                  {Node(node_list_arg),
                   Node(node_list_arg, {Node(node_list_arg)})}));
}

TEST(JSONWriteTest, Map) {
  test_print("{}", Node(node_map_arg));
  test_print("{\"a\":1,\"b\":[true]}",
             Node(node_map_arg,
                  {{"b", Node(node_list_arg, {true})}, {"a", 1}}));
  test_print("{\"text/plain\":\"42\"}",
             Node(node_map_arg, {{"text/plain", "42"}}));
}

} // end anonymous namespace
