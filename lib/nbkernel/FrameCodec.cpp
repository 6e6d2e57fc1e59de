#include "nbkernel/FrameCodec.h"

#include <llvm/ADT/StringExtras.h>

using namespace nbkernel;

namespace {
enum class HeaderStatus { Complete, Incomplete, Malformed };

struct FrameHeader {
  std::uint8_t kind = 0;
  std::size_t header_size = 0;
  std::size_t length = 0;
};
} // end anonymous namespace

static HeaderStatus decodeHeader(llvm::ArrayRef<std::uint8_t> in,
                                 FrameHeader &header) {
  if (in.empty())
    return HeaderStatus::Incomplete;
  header.kind = in[0];
  std::uint64_t length = 0;
  for (std::size_t i = 0; i < kMaxVarintLength; ++i) {
    if (1 + i >= in.size())
      return HeaderStatus::Incomplete;
    std::uint8_t byte = in[1 + i];
    if (i == kMaxVarintLength - 1 && byte > 1)
      return HeaderStatus::Malformed; // more than 64 bits
    length |= std::uint64_t(byte & 0x7f) << (7 * i);
    if (!(byte & 0x80)) {
      if (length > kMaxFrameLength)
        return HeaderStatus::Malformed;
      header.header_size = 2 + i;
      header.length = static_cast<std::size_t>(length);
      return HeaderStatus::Complete;
    }
  }
  return HeaderStatus::Malformed;
}

bool nbkernel::isKnownFrameKind(std::uint8_t kind) {
  switch (static_cast<FrameKind>(kind)) {
  case FrameKind::Stdout:
  case FrameKind::Stderr:
  case FrameKind::Display:
  case FrameKind::Message:
    return true;
  }
  return false;
}

void nbkernel::appendVarint(std::vector<std::uint8_t> &out,
                            std::uint64_t value) {
  while (value >= 0x80) {
    out.push_back(static_cast<std::uint8_t>(value | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<std::uint8_t>(value));
}

std::vector<std::uint8_t>
nbkernel::encodeFrame(FrameKind kind, llvm::ArrayRef<std::uint8_t> payload) {
  std::vector<std::uint8_t> out;
  out.reserve(1 + kMaxVarintLength + payload.size());
  out.push_back(static_cast<std::uint8_t>(kind));
  appendVarint(out, payload.size());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::vector<std::uint8_t> nbkernel::encodeFrame(FrameKind kind,
                                                llvm::StringRef text) {
  return encodeFrame(kind, llvm::arrayRefFromStringRef(text));
}

std::optional<Frame>
nbkernel::tryDecodeFrame(llvm::ArrayRef<std::uint8_t> bytes) {
  FrameHeader header;
  if (decodeHeader(bytes, header) != HeaderStatus::Complete)
    return std::nullopt;
  if (!isKnownFrameKind(header.kind))
    return std::nullopt;
  if (bytes.size() != header.header_size + header.length)
    return std::nullopt;
  auto payload = bytes.drop_front(header.header_size);
  return Frame{static_cast<FrameKind>(header.kind),
               std::vector<std::uint8_t>(payload.begin(), payload.end())};
}

void FrameDecoder::feed(llvm::ArrayRef<std::uint8_t> bytes) {
  if (corrupt)
    return;
  // Compact before growing, so a long-lived channel doesn't keep every byte
  // it ever received.
  if (offset > 0 && offset >= buffer.size() / 2) {
    buffer.erase(buffer.begin(), buffer.begin() + offset);
    offset = 0;
  }
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

std::optional<Frame> FrameDecoder::next() {
  while (!corrupt) {
    auto available = llvm::ArrayRef<std::uint8_t>(buffer).drop_front(offset);
    FrameHeader header;
    switch (decodeHeader(available, header)) {
    case HeaderStatus::Incomplete:
      return std::nullopt;
    case HeaderStatus::Malformed:
      corrupt = true;
      buffer.clear();
      offset = 0;
      return std::nullopt;
    case HeaderStatus::Complete:
      break;
    }
    if (available.size() < header.header_size + header.length)
      return std::nullopt;
    auto payload = available.slice(header.header_size, header.length);
    offset += header.header_size + header.length;
    if (!isKnownFrameKind(header.kind))
      continue;
    return Frame{static_cast<FrameKind>(header.kind),
                 std::vector<std::uint8_t>(payload.begin(), payload.end())};
  }
  return std::nullopt;
}
