#include "nbkernel/Node.h"

#include <cmath>
#include <cstdint>
#include <vector>

#include "nbkernel/Support.h"
#include "gtest/gtest.h"

using namespace nbkernel;

namespace {

void test_cbor(const std::vector<std::uint8_t> &expected, const Node &value) {
  EXPECT_EQ(expected, value.saveAsCBOR());
  auto loaded = Node::loadFromCBOR(expected);
  ASSERT_TRUE(static_cast<bool>(loaded))
      << llvm::toString(loaded.takeError());
  EXPECT_EQ(value, *loaded);
}

void test_invalid_cbor(const std::vector<std::uint8_t> &bytes) {
  auto loaded = Node::loadFromCBOR(bytes);
  ASSERT_FALSE(static_cast<bool>(loaded));
  llvm::consumeError(loaded.takeError());
}

TEST(NodeTest, CBOREncoding) {
  test_cbor({0x00}, Node(0));
  test_cbor({0x17}, Node(23));
  test_cbor({0x18, 0x18}, Node(24));
  test_cbor({0x19, 0x03, 0xe8}, Node(1000));
  test_cbor({0x20}, Node(-1));
  test_cbor({0x38, 0x63}, Node(-100));
  test_cbor({0xf4}, Node(false));
  test_cbor({0xf5}, Node(true));
  test_cbor({0xf6}, Node(nullptr));
  test_cbor({0x60}, Node(""));
  test_cbor({0x61, 0x61}, Node("a"));
  // Floats are always 64-bit, even when a shorter form would be exact.
  test_cbor({0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a}, Node(1.1));
  test_cbor({0xfb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}, Node(1.5));
  EXPECT_EQ((std::vector<std::uint8_t>{0xfb, 0x7f, 0xf8, 0x00, 0x00, 0x00,
                                       0x00, 0x00, 0x00}),
            Node(std::nan("")).saveAsCBOR());
  test_cbor({0x43, 0x01, 0x02, 0x03},
            Node(byte_string_arg, std::vector<std::uint8_t>{1, 2, 3}));
  test_cbor({0x80}, Node(node_list_arg));
  test_cbor({0x82, 0x01, 0x61, 0x78}, Node(node_list_arg, {1, "x"}));
  test_cbor({0xa1, 0x61, 0x61, 0x01}, Node(node_map_arg, {{"a", 1}}));
}

TEST(NodeTest, CBORIndefiniteLength) {
  auto loaded =
      Node::loadFromCBOR(std::vector<std::uint8_t>{0x9f, 0x01, 0x02, 0xff});
  ASSERT_TRUE(static_cast<bool>(loaded));
  EXPECT_EQ(Node(node_list_arg, {1, 2}), *loaded);

  loaded = Node::loadFromCBOR(
      std::vector<std::uint8_t>{0x7f, 0x61, 0x61, 0x62, 0x62, 0x63, 0xff});
  ASSERT_TRUE(static_cast<bool>(loaded));
  EXPECT_EQ(Node("abc"), *loaded);
}

TEST(NodeTest, CBORErrors) {
  test_invalid_cbor({});
  // Truncated head, string and list.
  test_invalid_cbor({0x19, 0x01});
  test_invalid_cbor({0x63, 0x61, 0x62});
  test_invalid_cbor({0x82, 0x01});
  // Trailing bytes.
  test_invalid_cbor({0x01, 0x02});
  // Reserved minor type.
  test_invalid_cbor({0x1c});
  // Tags.
  test_invalid_cbor({0xc1, 0x01});
  // Non-string map key.
  test_invalid_cbor({0xa1, 0x01, 0x02});
  // Invalid UTF-8 in a text string.
  test_invalid_cbor({0x61, 0xff});
  // Indefinite-length string with a chunk of the wrong type.
  test_invalid_cbor({0x7f, 0x41, 0x61, 0xff});
}

TEST(NodeTest, CBORDeepNesting) {
  std::vector<std::uint8_t> bytes(1000, 0x81);
  bytes.push_back(0x80);
  test_invalid_cbor(bytes);
}

TEST(NodeTest, MapAccess) {
  Node value(node_map_arg,
             {{"name", "cell"}, {"count", 3}, {"list", Node(node_list_arg)}});
  EXPECT_TRUE(value.contains("name"));
  EXPECT_FALSE(value.contains("missing"));
  EXPECT_EQ(Node(nullptr), value.at_or_null("missing"));
  EXPECT_EQ("cell", value.get_value_or<std::string>("name", "default"));
  EXPECT_EQ("default", value.get_value_or<std::string>("count", "default"));
  EXPECT_EQ(3, value.get_value_or<int>("count", 0));
  EXPECT_EQ(Node(nullptr), Node(42).at_or_null("name"));
}

TEST(NodeTest, SanitizeUTF8) {
  EXPECT_EQ("hello", sanitizeUTF8("hello"));
  EXPECT_EQ("\xc3\xa9", sanitizeUTF8("\xc3\xa9"));
  EXPECT_EQ("a\xef\xbf\xbd"
            "b",
            sanitizeUTF8("a\xff"
                         "b"));
  EXPECT_EQ("\xef\xbf\xbd", sanitizeUTF8("\xc3"));
}

TEST(NodeTest, UTF8PrefixLength) {
  EXPECT_EQ(3u, utf8PrefixLength("abc", 10));
  EXPECT_EQ(2u, utf8PrefixLength("abc", 2));
  // Don't split the two-byte sequence for U+00E9.
  EXPECT_EQ(1u, utf8PrefixLength("a\xc3\xa9", 2));
  EXPECT_EQ(3u, utf8PrefixLength("a\xc3\xa9", 3));
}

} // end anonymous namespace
