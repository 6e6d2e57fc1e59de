#ifndef NBKERNEL_TESTINGSUPPORT_H
#define NBKERNEL_TESTINGSUPPORT_H

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_os_ostream.h>

#include "nbkernel/FrameWriter.h"
#include "nbkernel/Node.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

MATCHER_P(ErrorMessageIs, message, "") {
  return llvm::StringRef(message).equals(arg);
}

// A fresh directory, removed with everything in it at the end of the test.
class TempDir {
public:
  TempDir() {
    std::error_code ec =
        llvm::sys::fs::createUniqueDirectory("nbkernel-test", path);
    EXPECT_FALSE(ec) << ec.message();
  }

  ~TempDir() { llvm::sys::fs::remove_directories(path); }

  llvm::StringRef get() const { return path; }

private:
  llvm::SmallString<128> path;
};

// Collects the output of a job.
class RecordingSink : public nbkernel::OutputSink {
public:
  void writeStream(nbkernel::FrameKind kind, llvm::StringRef text) override {
    (kind == nbkernel::FrameKind::Stderr ? stderrText : stdoutText) += text;
  }

  void writeDisplay(const nbkernel::Node &output) override {
    displays.push_back(output);
  }

  std::string stdoutText;
  std::string stderrText;
  std::vector<nbkernel::Node> displays;
};

// Run handlers until pred() is true or the time runs out. Returns pred().
template <typename Pred>
bool runUntil(boost::asio::io_context &ioContext, Pred pred,
              std::chrono::milliseconds limit = std::chrono::seconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  ioContext.restart();
  while (!pred() && std::chrono::steady_clock::now() < deadline)
    ioContext.run_one_for(std::chrono::milliseconds(10));
  return pred();
}

} // end anonymous namespace

namespace llvm {

// Allow googletest to print values that only support llvm::raw_ostream.
template <typename T>
std::ostream &operator<<(std::ostream &os, const T &value) {
  llvm::raw_os_ostream raw_os(os);
  raw_os << '"' << value << '"';
  return os;
}

} // namespace llvm

#endif // NBKERNEL_TESTINGSUPPORT_H
