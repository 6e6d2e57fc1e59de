#include "nbkernel/WorkerServer.h"

#include <chrono>
#include <functional>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "TestingSupport.h"

using namespace nbkernel;

namespace {

class WorkerServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    peerFD = fds[1];
    WorkerOptions options;
    options.memoryMb = 64;
    options.batchInterval = std::chrono::milliseconds(5);
    options.workspaceRoot = dir.get().str();
    int workerFD = fds[0];
    server = std::thread([this, workerFD, options] {
      exitCode = WorkerServer(workerFD, options).serve();
    });
  }

  void TearDown() override {
    closePeer();
    if (server.joinable())
      server.join();
  }

  void closePeer() {
    if (peerFD >= 0)
      ::close(peerFD);
    peerFD = -1;
  }

  void sendBytes(llvm::ArrayRef<std::uint8_t> bytes) {
    ASSERT_EQ(ssize_t(bytes.size()),
              ::send(peerFD, bytes.data(), bytes.size(), MSG_NOSIGNAL));
  }

  void send(const ControlMessage &message) { sendBytes(encodeMessage(message)); }

  // Read frames until done() returns true for one of them.
  std::vector<Frame> readUntil(std::function<bool(const Frame &)> done) {
    std::vector<Frame> frames;
    std::vector<std::uint8_t> buffer(64 * 1024);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (std::chrono::steady_clock::now() < deadline) {
      while (auto frame = decoder.next()) {
        frames.push_back(*frame);
        if (done(*frame))
          return frames;
      }
      pollfd pfd = {peerFD, POLLIN, 0};
      if (::poll(&pfd, 1, 100) <= 0)
        continue;
      ssize_t size = ::read(peerFD, buffer.data(), buffer.size());
      if (size <= 0)
        break;
      decoder.feed(
          llvm::ArrayRef<std::uint8_t>(buffer.data(), std::size_t(size)));
    }
    ADD_FAILURE() << "timed out waiting for frames";
    return frames;
  }

  static std::optional<EventMessage> getMessage(const Frame &frame) {
    if (frame.kind != FrameKind::Message)
      return std::nullopt;
    return decodeEventMessage(frame.payload);
  }

  // Read until the Result of jobId arrives.
  std::vector<Frame> readResult(llvm::StringRef jobId, Result &out) {
    return readUntil([&](const Frame &frame) {
      auto message = getMessage(frame);
      if (!message || !std::holds_alternative<Result>(*message) ||
          std::get<Result>(*message).jobId != jobId)
        return false;
      out = std::get<Result>(*message);
      return true;
    });
  }

  static RunCell makeCell(llvm::StringRef jobId, llvm::StringRef code,
                          std::uint32_t timeoutMs = 5000) {
    RunCell job;
    job.jobId = jobId.str();
    job.cell = Node(node_map_arg, {{"id", "c"}});
    job.code = code.str();
    job.notebookId = "nb";
    job.timeoutMs = timeoutMs;
    return job;
  }

  TempDir dir;
  int peerFD = -1;
  int exitCode = -1;
  std::thread server;
  FrameDecoder decoder;
};

TEST_F(WorkerServerTest, RunCell) {
  send(makeCell("j1", "console.log('hi'); 1 + 1"));
  Result result;
  auto frames = readResult("j1", result);
  ASSERT_GE(frames.size(), 3u);

  auto first = getMessage(frames[0]);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(std::holds_alternative<Ack>(*first));
  EXPECT_EQ("j1", std::get<Ack>(*first).jobId);

  std::string text;
  for (const Frame &frame : frames)
    if (frame.kind == FrameKind::Stdout)
      text += frame.getText();
  EXPECT_EQ("hi\n", text);

  EXPECT_EQ(ExecutionStatus::Ok, result.result.execution.status);
  ASSERT_EQ(1u, result.result.outputs.size());
  EXPECT_EQ(Node("2"), result.result.outputs[0]["data"]["text/plain"]);
}

TEST_F(WorkerServerTest, Display) {
  send(makeCell("j1", "display([1, 2]);"));
  Result result;
  auto frames = readResult("j1", result);
  std::vector<Node> displays;
  for (const Frame &frame : frames) {
    if (frame.kind != FrameKind::Display)
      continue;
    auto output = Node::loadFromCBOR(frame.payload);
    ASSERT_TRUE(static_cast<bool>(output)) << llvm::toString(output.takeError());
    displays.push_back(*output);
  }
  ASSERT_EQ(1u, displays.size());
  EXPECT_EQ(Node("display_data"), displays[0]["type"]);
  EXPECT_EQ(Node("[1, 2]"), displays[0]["data"]["text/plain"]);
}

TEST_F(WorkerServerTest, StatePersistsBetweenJobs) {
  send(makeCell("j1", "var total = 10;"));
  send(makeCell("j2", "total * 2"));
  Result result;
  readResult("j2", result);
  ASSERT_EQ(1u, result.result.outputs.size());
  EXPECT_EQ(Node("20"), result.result.outputs[0]["data"]["text/plain"]);
}

TEST_F(WorkerServerTest, Ping) {
  send(Ping{});
  auto frames = readUntil([](const Frame &frame) {
    auto message = getMessage(frame);
    return message && std::holds_alternative<Pong>(*message);
  });
  EXPECT_EQ(1u, frames.size());
}

TEST_F(WorkerServerTest, PingWhileBusy) {
  send(makeCell("slow", "new Promise(function (r) { setTimeout(r, 300); })"));
  send(Ping{});
  bool sawResult = false;
  readUntil([&](const Frame &frame) {
    auto message = getMessage(frame);
    if (message && std::holds_alternative<Result>(*message))
      sawResult = true;
    return message && std::holds_alternative<Pong>(*message);
  });
  // Pings are answered by the reader, without waiting for the job.
  EXPECT_FALSE(sawResult);
}

TEST_F(WorkerServerTest, CancelRunningAndQueued) {
  send(makeCell("j1",
                "setInterval(function () { console.log('tick'); }, 5);\n"
                "new Promise(function () {})",
                60000));
  send(makeCell("j2", "'never'"));
  readUntil([](const Frame &frame) {
    auto message = getMessage(frame);
    return message && std::holds_alternative<Ack>(*message);
  });

  send(Cancel{"j2"});
  Result result;
  readResult("j2", result);
  EXPECT_EQ(ExecutionStatus::Aborted, result.result.execution.status);
  EXPECT_TRUE(result.result.outputs.empty());

  send(Cancel{"j1"});
  readResult("j1", result);
  EXPECT_EQ(ExecutionStatus::Aborted, result.result.execution.status);
  ASSERT_TRUE(result.result.execution.error.has_value());
  EXPECT_EQ("AbortError", result.result.execution.error->name);

  // Cancelling something unknown does nothing, and the worker carries on.
  send(Cancel{"j3"});
  send(makeCell("j4", "'after'"));
  readResult("j4", result);
  EXPECT_EQ(ExecutionStatus::Ok, result.result.execution.status);
}

TEST_F(WorkerServerTest, CancelRightAfterSubmit) {
  // The Cancel lands while the job moves from the queue to the sandbox. It
  // must be honoured wherever the job is at that moment.
  for (int i = 0; i < 20; ++i) {
    std::string jobId = "j" + std::to_string(i);
    std::vector<std::uint8_t> bytes =
        encodeMessage(makeCell(jobId, "new Promise(function () {})", 60000));
    std::vector<std::uint8_t> cancel = encodeMessage(Cancel{jobId});
    bytes.insert(bytes.end(), cancel.begin(), cancel.end());
    auto start = std::chrono::steady_clock::now();
    sendBytes(bytes);

    Result result;
    readResult(jobId, result);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(ExecutionStatus::Aborted, result.result.execution.status)
        << jobId;
  }
}

TEST_F(WorkerServerTest, Timeout) {
  send(makeCell("j1", "new Promise(function (r) { setTimeout(r, 5000); })",
                100));
  Result result;
  auto frames = readResult("j1", result);
  EXPECT_EQ(ExecutionStatus::Aborted, result.result.execution.status);
  EXPECT_EQ("TimeoutError", result.result.execution.error->name);
  std::string text;
  for (const Frame &frame : frames)
    if (frame.kind == FrameKind::Stderr)
      text += frame.getText();
  EXPECT_EQ("[timeout] Execution exceeded 100ms and was stopped.\n", text);
}

TEST_F(WorkerServerTest, IgnoresInvalidInput) {
  // Not CBOR, the wrong schema, a frame of an unknown kind, and output
  // frames, which only flow the other way.
  sendBytes(encodeFrame(FrameKind::Message, llvm::StringRef("\xff\xff")));
  sendBytes(encodeFrame(FrameKind::Message,
                        Node(node_map_arg, {{"type", "RunCell"}}).saveAsCBOR()));
  sendBytes(std::vector<std::uint8_t>{0x09, 0x01, 0x00});
  sendBytes(encodeFrame(FrameKind::Stdout, llvm::StringRef("x")));
  send(Ping{});
  auto frames = readUntil([](const Frame &frame) {
    auto message = getMessage(frame);
    return message && std::holds_alternative<Pong>(*message);
  });
  EXPECT_EQ(1u, frames.size());
}

TEST_F(WorkerServerTest, ExitsWhenClosed) {
  closePeer();
  server.join();
  EXPECT_EQ(0, exitCode);
}

} // end anonymous namespace
