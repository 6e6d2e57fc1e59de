#ifndef NBKERNEL_FRAMEWRITER_H
#define NBKERNEL_FRAMEWRITER_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>

#include "FrameCodec.h"
#include "Node.h"
#include "Protocol.h"

namespace nbkernel {

/// Receives the output of a running job.
class OutputSink {
public:
  virtual ~OutputSink();

  /// kind is FrameKind::Stdout or FrameKind::Stderr.
  virtual void writeStream(FrameKind kind, llvm::StringRef text) = 0;

  /// output is a complete display_data record.
  virtual void writeDisplay(const Node &output) = 0;
};

/// Stream text frames are never longer than this.
constexpr std::size_t kMaxTextFrameLength = 1024 * 1024;

/// Writes frames to the orchestrator from the worker side of the socket.
///
/// Stdout and stderr text is coalesced for the batch interval before being
/// framed. Anything that must keep its place in the stream (text of the other
/// kind, a display frame, a message) flushes the pending text first. All
/// methods are thread-safe.
class FrameWriter : public OutputSink {
public:
  /// Takes ownership of fd.
  FrameWriter(int fd, std::chrono::milliseconds batchInterval);
  ~FrameWriter() override;

  FrameWriter(const FrameWriter &) = delete;
  FrameWriter &operator=(const FrameWriter &) = delete;

  void writeStream(FrameKind kind, llvm::StringRef text) override;
  void writeDisplay(const Node &output) override;
  void writeMessage(const EventMessage &message);

  /// Write any pending text now.
  void flush();

  /// Drop any pending text without writing it.
  void discardPending();

  /// True once a write has failed. Later writes are ignored.
  bool isBroken();

private:
  void flushLocked();
  void writeLocked(llvm::ArrayRef<std::uint8_t> bytes);
  void runFlusher();

  boost::asio::io_context ioContext;
  boost::asio::local::stream_protocol::socket socket;
  const std::chrono::milliseconds batchInterval;

  std::mutex mutex;
  std::condition_variable cv;
  FrameKind pendingKind = FrameKind::Stdout;
  std::string pendingText;
  std::chrono::steady_clock::time_point pendingSince;
  bool broken = false;
  bool stopping = false;
  std::thread flusher;
};

} // end namespace nbkernel

#endif // NBKERNEL_FRAMEWRITER_H
