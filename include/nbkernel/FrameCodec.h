#ifndef NBKERNEL_FRAMECODEC_H
#define NBKERNEL_FRAMECODEC_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

namespace nbkernel {

/// Kinds of packet on the channel between the orchestrator and a worker.
///
/// Every packet is encoded as `[kind:byte][length:varint][payload]`, where
/// length is an unsigned LEB128 integer. Stdout and Stderr carry UTF-8 text,
/// Display carries a CBOR-encoded display object, and Message carries a
/// CBOR-encoded control or event message (see Protocol.h).
enum class FrameKind : std::uint8_t {
  Stdout = 1,
  Stderr = 2,
  Display = 3,
  Message = 16,
};

/// Frames longer than this are treated as corruption.
constexpr std::size_t kMaxFrameLength = 64 * 1024 * 1024;

/// A varint never needs more than this many bytes for a 64-bit value.
constexpr std::size_t kMaxVarintLength = 10;

struct Frame {
  FrameKind kind;
  std::vector<std::uint8_t> payload;

  llvm::StringRef getText() const {
    return llvm::StringRef(reinterpret_cast<const char *>(payload.data()),
                           payload.size());
  }

  /// Streamed output frames count against the per-job output cap.
  bool isOutput() const { return kind != FrameKind::Message; }
};

bool isKnownFrameKind(std::uint8_t kind);

void appendVarint(std::vector<std::uint8_t> &out, std::uint64_t value);

/// Encode a complete frame.
std::vector<std::uint8_t> encodeFrame(FrameKind kind,
                                      llvm::ArrayRef<std::uint8_t> payload);
std::vector<std::uint8_t> encodeFrame(FrameKind kind, llvm::StringRef text);

/// Decode exactly one frame. Returns std::nullopt if the input is truncated,
/// has an unknown kind, an overlong or oversized length, or extra bytes after
/// the frame. Never throws or aborts.
std::optional<Frame> tryDecodeFrame(llvm::ArrayRef<std::uint8_t> bytes);

/// Reassembles frames from a byte stream that arrives in arbitrary chunks.
///
/// Frames of unknown kind are skipped. A length that can't be parsed (an
/// overlong varint, or a length above kMaxFrameLength) leaves the decoder in
/// the corrupt state: the stream can't be resynchronized after that, and all
/// further input is ignored.
class FrameDecoder {
public:
  /// Append bytes received from the stream.
  void feed(llvm::ArrayRef<std::uint8_t> bytes);

  /// Return the next complete frame, if there is one.
  std::optional<Frame> next();

  bool isCorrupt() const { return corrupt; }

  /// Number of bytes received but not yet returned as frames.
  std::size_t getBufferedSize() const { return buffer.size() - offset; }

private:
  std::vector<std::uint8_t> buffer;
  std::size_t offset = 0;
  bool corrupt = false;
};

} // end namespace nbkernel

#endif // NBKERNEL_FRAMECODEC_H
