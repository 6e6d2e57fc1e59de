#include "nbkernel/FrameCodec.h"

#include <cstdint>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace nbkernel;
using ::testing::ElementsAre;

namespace {

using Bytes = std::vector<std::uint8_t>;

Bytes varint(std::uint64_t value) {
  Bytes out;
  appendVarint(out, value);
  return out;
}

TEST(FrameCodecTest, Varint) {
  EXPECT_THAT(varint(0), ElementsAre(0x00));
  EXPECT_THAT(varint(1), ElementsAre(0x01));
  EXPECT_THAT(varint(127), ElementsAre(0x7f));
  EXPECT_THAT(varint(128), ElementsAre(0x80, 0x01));
  EXPECT_THAT(varint(300), ElementsAre(0xac, 0x02));
  EXPECT_EQ(kMaxVarintLength, varint(UINT64_MAX).size());
}

TEST(FrameCodecTest, Encode) {
  EXPECT_THAT(encodeFrame(FrameKind::Stdout, llvm::StringRef("hi")),
              ElementsAre(0x01, 0x02, 'h', 'i'));
  EXPECT_THAT(encodeFrame(FrameKind::Stderr, llvm::StringRef("")),
              ElementsAre(0x02, 0x00));
  Bytes payload(200, 'x');
  Bytes frame = encodeFrame(FrameKind::Display, payload);
  ASSERT_EQ(203u, frame.size());
  EXPECT_EQ(0x03, frame[0]);
  EXPECT_EQ(0xc8, frame[1]);
  EXPECT_EQ(0x01, frame[2]);
}

TEST(FrameCodecTest, TryDecode) {
  auto frame =
      tryDecodeFrame(encodeFrame(FrameKind::Stdout, llvm::StringRef("text")));
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(FrameKind::Stdout, frame->kind);
  EXPECT_EQ("text", frame->getText());
  EXPECT_TRUE(frame->isOutput());

  frame = tryDecodeFrame(Bytes{0x10, 0x00});
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(FrameKind::Message, frame->kind);
  EXPECT_TRUE(frame->payload.empty());
  EXPECT_FALSE(frame->isOutput());
}

TEST(FrameCodecTest, TryDecodeMalformed) {
  EXPECT_FALSE(tryDecodeFrame(Bytes{}).has_value());
  // No length.
  EXPECT_FALSE(tryDecodeFrame(Bytes{0x01}).has_value());
  // Truncated varint and payload.
  EXPECT_FALSE(tryDecodeFrame(Bytes{0x01, 0x80}).has_value());
  EXPECT_FALSE(tryDecodeFrame(Bytes{0x01, 0x03, 'a'}).has_value());
  // Unknown kind.
  EXPECT_FALSE(tryDecodeFrame(Bytes{0x07, 0x00}).has_value());
  // Trailing garbage.
  EXPECT_FALSE(tryDecodeFrame(Bytes{0x01, 0x01, 'a', 'b'}).has_value());
  // Overlong varint.
  Bytes overlong = {0x01};
  for (int i = 0; i < 11; ++i)
    overlong.push_back(0x80);
  overlong.push_back(0x00);
  EXPECT_FALSE(tryDecodeFrame(overlong).has_value());
  // Oversized length.
  Bytes oversized = {0x01};
  appendVarint(oversized, kMaxFrameLength + 1);
  EXPECT_FALSE(tryDecodeFrame(oversized).has_value());
}

TEST(FrameCodecTest, DecoderReassembles) {
  Bytes stream;
  for (llvm::StringRef text : {"one", "", "three"}) {
    Bytes frame = encodeFrame(FrameKind::Stdout, text);
    stream.insert(stream.end(), frame.begin(), frame.end());
  }
  Bytes last = encodeFrame(FrameKind::Stderr, llvm::StringRef("err"));
  stream.insert(stream.end(), last.begin(), last.end());

  // Feed one byte at a time.
  FrameDecoder decoder;
  std::vector<std::string> texts;
  for (std::uint8_t byte : stream) {
    decoder.feed(llvm::ArrayRef<std::uint8_t>(byte));
    while (auto frame = decoder.next())
      texts.push_back(std::to_string(static_cast<int>(frame->kind)) + ":" +
                      frame->getText().str());
  }
  EXPECT_THAT(texts, ElementsAre("1:one", "1:", "1:three", "2:err"));
  EXPECT_FALSE(decoder.isCorrupt());
  EXPECT_EQ(0u, decoder.getBufferedSize());
}

TEST(FrameCodecTest, DecoderSkipsUnknownKinds) {
  FrameDecoder decoder;
  decoder.feed(Bytes{0x09, 0x02, 'x', 'y'});
  decoder.feed(encodeFrame(FrameKind::Stdout, llvm::StringRef("ok")));
  auto frame = decoder.next();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ("ok", frame->getText());
  EXPECT_FALSE(decoder.next().has_value());
}

TEST(FrameCodecTest, DecoderLatchesCorruption) {
  FrameDecoder decoder;
  decoder.feed(encodeFrame(FrameKind::Stdout, llvm::StringRef("before")));
  Bytes bad = {0x01};
  appendVarint(bad, kMaxFrameLength + 1);
  decoder.feed(bad);
  decoder.feed(encodeFrame(FrameKind::Stdout, llvm::StringRef("after")));

  auto frame = decoder.next();
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ("before", frame->getText());
  EXPECT_FALSE(decoder.next().has_value());
  EXPECT_TRUE(decoder.isCorrupt());

  // Nothing gets through after that.
  decoder.feed(encodeFrame(FrameKind::Stdout, llvm::StringRef("later")));
  EXPECT_FALSE(decoder.next().has_value());
  EXPECT_EQ(0u, decoder.getBufferedSize());
}

} // end anonymous namespace
