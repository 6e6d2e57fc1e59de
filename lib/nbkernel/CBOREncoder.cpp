#include "nbkernel/CBOREncoder.h"

#include <cmath>
#include <cstring>

#include "nbkernel/Node.h"

using namespace nbkernel;

using std::uint64_t;
using std::uint8_t;

CBOREncoder::CBOREncoder(std::vector<uint8_t> &out) : out(out) {}

CBOREncoder::~CBOREncoder() {}

void CBOREncoder::appendBigEndian(uint64_t value, int num_bytes) {
  for (int i = num_bytes - 1; i >= 0; i--)
    out.push_back((value >> 8 * i) & 0xff);
}

void CBOREncoder::encodeHead(int major_type, uint64_t argument) {
  uint8_t initial = major_type << 5;
  if (argument < 24) {
    out.push_back(initial | argument);
  } else if (argument <= 0xff) {
    out.push_back(initial | 24);
    appendBigEndian(argument, 1);
  } else if (argument <= 0xffff) {
    out.push_back(initial | 25);
    appendBigEndian(argument, 2);
  } else if (argument <= 0xffffffff) {
    out.push_back(initial | 26);
    appendBigEndian(argument, 4);
  } else {
    out.push_back(initial | 27);
    appendBigEndian(argument, 8);
  }
}

void CBOREncoder::visitNull() { encodeHead(7, 22); }

void CBOREncoder::visitBoolean(bool value) { encodeHead(7, value ? 21 : 20); }

void CBOREncoder::visitUInt64(std::uint64_t value) { encodeHead(0, value); }

void CBOREncoder::visitInt64(std::int64_t value) {
  if (value < 0)
    encodeHead(1, -(value + 1));
  else
    encodeHead(0, value);
}

void CBOREncoder::visitFloat(double value) {
  static_assert(sizeof(double) == sizeof(uint64_t), "double must be 64-bit");
  uint64_t bits = 0x7ff8000000000000; // quiet NaN
  if (!std::isnan(value))
    std::memcpy(&bits, &value, sizeof(bits));
  out.push_back(7 << 5 | 27);
  appendBigEndian(bits, 8);
}

void CBOREncoder::visitString(llvm::StringRef value) {
  encodeHead(3, value.size());
  out.insert(out.end(), value.begin(), value.end());
}

void CBOREncoder::visitBytes(BytesRef value) {
  encodeHead(2, value.size());
  out.insert(out.end(), value.begin(), value.end());
}

void CBOREncoder::startList(const Node::List &value) {
  encodeHead(4, value.size());
}

void CBOREncoder::startMap(const Node::Map &value) {
  encodeHead(5, value.size());
}
