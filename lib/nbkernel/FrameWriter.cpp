#include "nbkernel/FrameWriter.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <llvm/Support/raw_ostream.h>

#include "nbkernel/Support.h"

using namespace nbkernel;

OutputSink::~OutputSink() {}

FrameWriter::FrameWriter(int fd, std::chrono::milliseconds batchInterval)
    : socket(ioContext, boost::asio::local::stream_protocol(), fd),
      batchInterval(batchInterval) {
  if (batchInterval.count() > 0)
    flusher = std::thread([this] { runFlusher(); });
}

FrameWriter::~FrameWriter() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    stopping = true;
    flushLocked();
  }
  cv.notify_all();
  if (flusher.joinable())
    flusher.join();
}

void FrameWriter::writeStream(FrameKind kind, llvm::StringRef text) {
  if (text.empty())
    return;
  std::unique_lock<std::mutex> lock(mutex);
  if (!pendingText.empty() && pendingKind != kind)
    flushLocked();
  if (pendingText.empty()) {
    pendingKind = kind;
    pendingSince = std::chrono::steady_clock::now();
  }
  pendingText.append(text.data(), text.size());
  if (batchInterval.count() <= 0) {
    flushLocked();
    return;
  }
  lock.unlock();
  cv.notify_all();
}

void FrameWriter::writeDisplay(const Node &output) {
  std::lock_guard<std::mutex> lock(mutex);
  flushLocked();
  writeLocked(encodeFrame(FrameKind::Display, output.saveAsCBOR()));
}

void FrameWriter::writeMessage(const EventMessage &message) {
  std::lock_guard<std::mutex> lock(mutex);
  flushLocked();
  writeLocked(encodeMessage(message));
}

void FrameWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex);
  flushLocked();
}

void FrameWriter::discardPending() {
  std::lock_guard<std::mutex> lock(mutex);
  pendingText.clear();
}

bool FrameWriter::isBroken() {
  std::lock_guard<std::mutex> lock(mutex);
  return broken;
}

void FrameWriter::flushLocked() {
  llvm::StringRef text = pendingText;
  while (!text.empty()) {
    std::size_t length = utf8PrefixLength(text, kMaxTextFrameLength);
    writeLocked(encodeFrame(pendingKind, text.take_front(length)));
    text = text.drop_front(length);
  }
  pendingText.clear();
}

void FrameWriter::writeLocked(llvm::ArrayRef<std::uint8_t> bytes) {
  if (broken)
    return;
  boost::system::error_code ec;
  boost::asio::write(socket, boost::asio::buffer(bytes.data(), bytes.size()),
                     ec);
  if (ec) {
    llvm::errs() << "nbkernel-worker: write failed: " << ec.message() << "\n";
    broken = true;
  }
}

void FrameWriter::runFlusher() {
  std::unique_lock<std::mutex> lock(mutex);
  while (!stopping) {
    if (pendingText.empty()) {
      cv.wait(lock);
      continue;
    }
    auto due = pendingSince + batchInterval;
    if (std::chrono::steady_clock::now() < due) {
      cv.wait_until(lock, due);
      continue;
    }
    flushLocked();
  }
}
